//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Decl.hpp
/// @brief Declaration nodes: classes, method definitions and `undef`.
///
/// @details ArgsNode and ArgumentNode are structural only: they describe a
/// method's parameter list and are never evaluated on their own.
///
/// @invariant DefnNode::args and UndefNode::name are never null.
///
/// Ownership/Lifetime: Sub-nodes are owned through unique pointers. Method
/// tables refer to DefnNode by address, so the tree must outlive any context
/// that evaluated it.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "ast/AST_Node.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace garnet::ast
{

/// @brief `class Name [< Super]; body; end`.
struct ClassNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Class;

    const std::string name;

    /// @brief Superclass name when one was written.
    const std::optional<std::string> superName;

    /// @brief Class body; null for an empty body.
    const NodePtr body;

    ClassNode(SourceLoc l, std::string n, std::optional<std::string> super, NodePtr b = nullptr)
        : Node(kKind, l), name(std::move(n)), superName(std::move(super)), body(std::move(b))
    {
    }
};

/// @brief One required positional parameter.
struct ArgumentNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Argument;

    const std::string name;

    ArgumentNode(SourceLoc l, std::string n) : Node(kKind, l), name(std::move(n)) {}
};

/// @brief Parameter list of a method definition.
struct ArgsNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Args;

    const std::vector<std::unique_ptr<ArgumentNode>> arguments;

    ArgsNode(SourceLoc l, std::vector<std::unique_ptr<ArgumentNode>> a)
        : Node(kKind, l), arguments(std::move(a))
    {
    }

    /// @brief Number of required arguments.
    std::size_t arity() const noexcept
    {
        return arguments.size();
    }
};

/// @brief `def name(args); body; end`.
struct DefnNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Defn;

    const std::string name;

    const std::unique_ptr<ArgsNode> args;

    /// @brief Method body; null for an empty body.
    const NodePtr body;

    DefnNode(SourceLoc l, std::string n, std::unique_ptr<ArgsNode> a, NodePtr b = nullptr);
};

/// @brief `undef name`.
/// @details The name node is usually a SymbolNode; an interpolated name
///          (DSymbolNode) or any expression yielding a symbol or string is
///          evaluated at run time.
struct UndefNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Undef;

    const NodePtr name;

    UndefNode(SourceLoc l, NodePtr n);
};

} // namespace garnet::ast
