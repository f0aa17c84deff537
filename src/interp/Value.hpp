//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Value.hpp
// Purpose: Runtime values produced by evaluating syntax nodes.
// Key invariants: The payload always matches kind(); arrays are immutable
//                 once built and shared between copies.
// Ownership/Lifetime: Strings and arrays are owned; Scope values borrow a
//                     DefinitionScope owned by the ExecContext.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace garnet::interp
{

class DefinitionScope;

/// @brief Tagged runtime value.
class Value
{
  public:
    enum class Kind : uint8_t
    {
        Nil,
        True,
        False,
        Integer,
        String,
        Symbol,
        Array,
        Scope,
    };

    /// @brief Construct nil.
    Value() = default;

    static Value nil()
    {
        return Value();
    }

    static Value boolean(bool b);
    static Value integer(int64_t i);
    static Value string(std::string s);
    static Value symbol(std::string name);
    static Value array(std::vector<Value> elements);
    static Value scope(DefinitionScope &scope);

    Kind kind() const noexcept
    {
        return kind_;
    }

    bool isNil() const noexcept
    {
        return kind_ == Kind::Nil;
    }

    /// @brief Everything except nil and false is truthy.
    bool isTruthy() const noexcept
    {
        return kind_ != Kind::Nil && kind_ != Kind::False;
    }

    /// @pre kind() == Integer.
    int64_t asInteger() const;

    /// @brief Text of a String or Symbol value.
    /// @pre kind() is String or Symbol.
    const std::string &text() const;

    /// @pre kind() == Array.
    const std::vector<Value> &elements() const;

    /// @pre kind() == Scope.
    DefinitionScope &asScope() const;

    /// @brief Source-like rendering: `nil`, `42`, `"s"`, `:sym`, `[1, 2]`.
    std::string inspect() const;

    /// @brief Rendering used for interpolation: nil is empty, strings and
    ///        symbols are their bare text.
    std::string toDisplayString() const;

    friend bool operator==(const Value &lhs, const Value &rhs);

  private:
    using ArrayRef = std::shared_ptr<const std::vector<Value>>;

    Kind kind_ = Kind::Nil;
    std::variant<std::monostate, int64_t, std::string, ArrayRef, DefinitionScope *> payload_;
};

/// @brief Lowercase name of @p kind, e.g. "symbol".
std::string_view toString(Value::Kind kind) noexcept;

} // namespace garnet::interp
