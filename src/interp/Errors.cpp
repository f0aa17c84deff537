//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Errors.cpp
// Purpose: Names and formatting for evaluator exceptions.
// Key invariants: Class names match the language's built-in error classes.
// Ownership/Lifetime: Not applicable.
//
//===----------------------------------------------------------------------===//

#include "interp/Errors.hpp"

#include <utility>

namespace garnet::interp
{

std::string_view toString(ErrorClass cls) noexcept
{
    switch (cls)
    {
        case ErrorClass::StandardError:
            return "StandardError";
        case ErrorClass::TypeError:
            return "TypeError";
        case ErrorClass::NameError:
            return "NameError";
        case ErrorClass::NoMethodError:
            return "NoMethodError";
        case ErrorClass::ArgumentError:
            return "ArgumentError";
        case ErrorClass::LocalJumpError:
            return "LocalJumpError";
        case ErrorClass::SystemStackError:
            return "SystemStackError";
    }
    return "StandardError";
}

LanguageError::LanguageError(ErrorClass cls, std::string message, SourceLoc loc)
    : std::runtime_error(std::string(toString(cls)) + ": " + message), cls_(cls),
      message_(std::move(message)), loc_(loc)
{
}

std::string LanguageError::describe() const
{
    return what();
}

std::string_view toString(JumpKind kind) noexcept
{
    switch (kind)
    {
        case JumpKind::Break:
            return "break";
        case JumpKind::Next:
            return "next";
        case JumpKind::Return:
            return "return";
    }
    return "jump";
}

JumpSignal::JumpSignal(JumpKind k, Value v, SourceLoc l) : kind(k), value(std::move(v)), loc(l) {}

const char *JumpSignal::what() const noexcept
{
    switch (kind)
    {
        case JumpKind::Break:
            return "break signal";
        case JumpKind::Next:
            return "next signal";
        case JumpKind::Return:
            return "return signal";
    }
    return "jump signal";
}

} // namespace garnet::interp
