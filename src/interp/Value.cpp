//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/Value.cpp
// Purpose: Construction, accessors and rendering of runtime values.
// Key invariants: Accessors throw InternalError on a kind mismatch.
// Ownership/Lifetime: See Value.hpp.
//
//===----------------------------------------------------------------------===//

#include "interp/Value.hpp"

#include "interp/DefinitionScope.hpp"
#include "interp/Errors.hpp"

#include <sstream>

namespace garnet::interp
{

namespace
{
[[noreturn]] void kindMismatch(Value::Kind want, Value::Kind got)
{
    throw InternalError("expected " + std::string(toString(want)) + " value, got " +
                        std::string(toString(got)));
}

void appendEscaped(std::ostringstream &os, const std::string &s)
{
    os << '"';
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                os << "\\\"";
                break;
            case '\\':
                os << "\\\\";
                break;
            case '\n':
                os << "\\n";
                break;
            case '\t':
                os << "\\t";
                break;
            default:
                os << c;
                break;
        }
    }
    os << '"';
}
} // namespace

Value Value::boolean(bool b)
{
    Value v;
    v.kind_ = b ? Kind::True : Kind::False;
    return v;
}

Value Value::integer(int64_t i)
{
    Value v;
    v.kind_ = Kind::Integer;
    v.payload_ = i;
    return v;
}

Value Value::string(std::string s)
{
    Value v;
    v.kind_ = Kind::String;
    v.payload_ = std::move(s);
    return v;
}

Value Value::symbol(std::string name)
{
    Value v;
    v.kind_ = Kind::Symbol;
    v.payload_ = std::move(name);
    return v;
}

Value Value::array(std::vector<Value> elements)
{
    Value v;
    v.kind_ = Kind::Array;
    v.payload_ = std::make_shared<const std::vector<Value>>(std::move(elements));
    return v;
}

Value Value::scope(DefinitionScope &scope)
{
    Value v;
    v.kind_ = Kind::Scope;
    v.payload_ = &scope;
    return v;
}

int64_t Value::asInteger() const
{
    if (kind_ != Kind::Integer)
        kindMismatch(Kind::Integer, kind_);
    return std::get<int64_t>(payload_);
}

const std::string &Value::text() const
{
    if (kind_ != Kind::String && kind_ != Kind::Symbol)
        kindMismatch(Kind::String, kind_);
    return std::get<std::string>(payload_);
}

const std::vector<Value> &Value::elements() const
{
    if (kind_ != Kind::Array)
        kindMismatch(Kind::Array, kind_);
    return *std::get<ArrayRef>(payload_);
}

DefinitionScope &Value::asScope() const
{
    if (kind_ != Kind::Scope)
        kindMismatch(Kind::Scope, kind_);
    return *std::get<DefinitionScope *>(payload_);
}

std::string Value::inspect() const
{
    std::ostringstream os;
    switch (kind_)
    {
        case Kind::Nil:
            os << "nil";
            break;
        case Kind::True:
            os << "true";
            break;
        case Kind::False:
            os << "false";
            break;
        case Kind::Integer:
            os << asInteger();
            break;
        case Kind::String:
            appendEscaped(os, text());
            break;
        case Kind::Symbol:
            os << ':' << text();
            break;
        case Kind::Array:
        {
            os << '[';
            const char *sep = "";
            for (const auto &e : elements())
            {
                os << sep << e.inspect();
                sep = ", ";
            }
            os << ']';
            break;
        }
        case Kind::Scope:
            os << asScope().name();
            break;
    }
    return os.str();
}

std::string Value::toDisplayString() const
{
    switch (kind_)
    {
        case Kind::Nil:
            return {};
        case Kind::String:
        case Kind::Symbol:
            return text();
        case Kind::True:
        case Kind::False:
        case Kind::Integer:
        case Kind::Array:
        case Kind::Scope:
            return inspect();
    }
    return inspect();
}

bool operator==(const Value &lhs, const Value &rhs)
{
    if (lhs.kind_ != rhs.kind_)
        return false;
    switch (lhs.kind_)
    {
        case Value::Kind::Nil:
        case Value::Kind::True:
        case Value::Kind::False:
            return true;
        case Value::Kind::Integer:
            return lhs.asInteger() == rhs.asInteger();
        case Value::Kind::String:
        case Value::Kind::Symbol:
            return lhs.text() == rhs.text();
        case Value::Kind::Array:
            return lhs.elements() == rhs.elements();
        case Value::Kind::Scope:
            return &lhs.asScope() == &rhs.asScope();
    }
    return false;
}

std::string_view toString(Value::Kind kind) noexcept
{
    switch (kind)
    {
        case Value::Kind::Nil:
            return "nil";
        case Value::Kind::True:
            return "true";
        case Value::Kind::False:
            return "false";
        case Value::Kind::Integer:
            return "integer";
        case Value::Kind::String:
            return "string";
        case Value::Kind::Symbol:
            return "symbol";
        case Value::Kind::Array:
            return "array";
        case Value::Kind::Scope:
            return "scope";
    }
    return "unknown";
}

} // namespace garnet::interp
