//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Errors.hpp
// Purpose: Exception types thrown through the evaluator.
// Key invariants: InternalError marks a malformed tree or API misuse and is
//                 never caught by the evaluator. LanguageError is a user-level
//                 failure that an embedding may report. JumpSignal is control
//                 flow, not an error.
// Ownership/Lifetime: Exceptions own their messages and carried values.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/Value.hpp"
#include "support/source_location.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace garnet::interp
{

using garnet::support::SourceLoc;

/// @brief Structural misuse: evaluating a structural-only node, assigning to
///        a node that is not a target, or a value accessed as the wrong kind.
class InternalError : public std::logic_error
{
  public:
    using std::logic_error::logic_error;
};

/// @brief Classification of user-level failures.
enum class ErrorClass : uint8_t
{
    StandardError,
    TypeError,
    NameError,
    NoMethodError,
    ArgumentError,
    LocalJumpError,
    SystemStackError,
};

/// @brief Class name of @p cls, e.g. "TypeError".
std::string_view toString(ErrorClass cls) noexcept;

/// @brief Catchable failure raised by evaluation.
class LanguageError : public std::runtime_error
{
  public:
    LanguageError(ErrorClass cls, std::string message, SourceLoc loc = {});

    ErrorClass errorClass() const noexcept
    {
        return cls_;
    }

    /// @brief Location of the node that raised the error.
    const SourceLoc &loc() const noexcept
    {
        return loc_;
    }

    /// @brief Message without the class prefix.
    const std::string &message() const noexcept
    {
        return message_;
    }

    /// @brief "ErrorClass: message".
    std::string describe() const;

  private:
    ErrorClass cls_;
    std::string message_;
    SourceLoc loc_;
};

/// @brief Non-local control transfers raised by break, next and return.
enum class JumpKind : uint8_t
{
    Break,
    Next,
    Return,
};

std::string_view toString(JumpKind kind) noexcept;

/// @brief Exception used to unwind to the construct handling a jump.
struct JumpSignal : std::exception
{
    JumpSignal(JumpKind kind, Value value, SourceLoc loc = {});

    JumpKind kind;

    /// @brief Value carried by the jump; nil when none was given.
    Value value;

    SourceLoc loc;

    const char *what() const noexcept override;
};

} // namespace garnet::interp
