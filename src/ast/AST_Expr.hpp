//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Expr.hpp
/// @brief Expression nodes: literals, names, assignment and calls.
///
/// @details Fields are public and const; a node's structure cannot change
/// once built. Optional sub-nodes are represented by a null NodePtr.
///
/// Ownership/Lifetime: Sub-nodes are owned through NodePtr.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "ast/AST_Node.hpp"

#include <cstdint>
#include <string>
#include <utility>

namespace garnet::ast
{

//===----------------------------------------------------------------------===//
/// @name Literals
/// @{
//===----------------------------------------------------------------------===//

/// @brief `nil`.
struct NilNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Nil;

    explicit NilNode(SourceLoc l) : Node(kKind, l) {}
};

/// @brief `true`.
struct TrueNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::True;

    explicit TrueNode(SourceLoc l) : Node(kKind, l) {}
};

/// @brief `false`.
struct FalseNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::False;

    explicit FalseNode(SourceLoc l) : Node(kKind, l) {}
};

/// @brief Integer literal: `42`.
struct FixnumNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Fixnum;

    const int64_t value;

    FixnumNode(SourceLoc l, int64_t v) : Node(kKind, l), value(v) {}
};

/// @brief Plain string literal: `"abc"`.
struct StrNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Str;

    const std::string value;

    StrNode(SourceLoc l, std::string v) : Node(kKind, l), value(std::move(v)) {}
};

/// @brief Symbol literal: `:foo`.
struct SymbolNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Symbol;

    const std::string name;

    SymbolNode(SourceLoc l, std::string n) : Node(kKind, l), name(std::move(n)) {}
};

/// @brief Interpolated symbol: `:"foo#{x}"`.
/// @details The symbol text is the concatenation of every part's display
///          string.
struct DSymbolNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::DSymbol;

    const NodeList parts;

    DSymbolNode(SourceLoc l, NodeList p) : Node(kKind, l), parts(std::move(p)) {}
};

/// @brief Array literal: `[a, b, c]`.
struct ArrayNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Array;

    const NodeList elements;

    ArrayNode(SourceLoc l, NodeList e) : Node(kKind, l), elements(std::move(e)) {}
};

/// @}
//===----------------------------------------------------------------------===//
/// @name Names and assignment
/// @{
//===----------------------------------------------------------------------===//

/// @brief `self`.
struct SelfNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Self;

    explicit SelfNode(SourceLoc l) : Node(kKind, l) {}
};

/// @brief Local variable read: `x`.
struct LocalVarNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::LocalVar;

    const std::string name;

    LocalVarNode(SourceLoc l, std::string n) : Node(kKind, l), name(std::move(n)) {}
};

/// @brief Local variable assignment: `x = value`.
/// @details Inside a multiple-assignment pattern the value is null and the
///          node acts purely as a binding target.
struct LocalAsgnNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::LocalAsgn;

    const std::string name;

    /// @brief Assigned expression; null when used as a pattern target.
    const NodePtr value;

    LocalAsgnNode(SourceLoc l, std::string n, NodePtr v = nullptr)
        : Node(kKind, l), name(std::move(n)), value(std::move(v))
    {
    }
};

/// @brief Destructuring assignment: `a, (b, c) = value`.
/// @details Targets are LocalAsgnNode or nested MultipleAsgnNode patterns.
struct MultipleAsgnNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::MultipleAsgn;

    const NodeList targets;

    /// @brief Right-hand side; null for a nested pattern.
    const NodePtr value;

    MultipleAsgnNode(SourceLoc l, NodeList t, NodePtr v = nullptr)
        : Node(kKind, l), targets(std::move(t)), value(std::move(v))
    {
    }
};

/// @}
//===----------------------------------------------------------------------===//
/// @name Calls and queries
/// @{
//===----------------------------------------------------------------------===//

/// @brief Receiverless method call: `foo(a, b)`.
struct FCallNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::FCall;

    const std::string name;

    const NodeList args;

    FCallNode(SourceLoc l, std::string n, NodeList a = {})
        : Node(kKind, l), name(std::move(n)), args(std::move(a))
    {
    }
};

/// @brief `defined?(expr)`.
struct DefinedNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Defined;

    const NodePtr expression;

    DefinedNode(SourceLoc l, NodePtr e);
};

/// @}

} // namespace garnet::ast
