//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Stmt.hpp
/// @brief Statement sequencing and control-transfer nodes.
///
/// Ownership/Lifetime: Sub-nodes are owned through NodePtr.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "ast/AST_Node.hpp"

#include <utility>

namespace garnet::ast
{

/// @brief Statement list evaluated in order.
struct BlockNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Block;

    const NodeList statements;

    BlockNode(SourceLoc l, NodeList s) : Node(kKind, l), statements(std::move(s)) {}
};

/// @brief Line marker wrapping one statement.
/// @details Has no surface syntax and renders as an empty debug string.
struct NewlineNode final : Node
{
    static constexpr NodeKind kKind = NodeKind::Newline;

    const NodePtr statement;

    NewlineNode(SourceLoc l, NodePtr s);
};

/// @brief Shared shape of `break`, `next` and `return`.
struct JumpNode : Node
{
    /// @brief Carried value expression; null means nil.
    const NodePtr value;

  protected:
    JumpNode(NodeKind k, SourceLoc l, NodePtr v) : Node(k, l), value(std::move(v)) {}
};

/// @brief `break [value]`.
struct BreakNode final : JumpNode
{
    static constexpr NodeKind kKind = NodeKind::Break;

    explicit BreakNode(SourceLoc l, NodePtr v = nullptr) : JumpNode(kKind, l, std::move(v)) {}
};

/// @brief `next [value]`.
struct NextNode final : JumpNode
{
    static constexpr NodeKind kKind = NodeKind::Next;

    explicit NextNode(SourceLoc l, NodePtr v = nullptr) : JumpNode(kKind, l, std::move(v)) {}
};

/// @brief `return [value]`.
struct ReturnNode final : JumpNode
{
    static constexpr NodeKind kKind = NodeKind::Return;

    explicit ReturnNode(SourceLoc l, NodePtr v = nullptr) : JumpNode(kKind, l, std::move(v)) {}
};

} // namespace garnet::ast
