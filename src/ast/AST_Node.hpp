//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Node.hpp
/// @brief Base class shared by every Garnet syntax node.
///
/// @details A Node carries its kind discriminant and source location. The
/// per-kind behaviour (children, name attribute, debug rendering, evaluation)
/// lives in passes that switch over NodeKind rather than in virtual overrides.
///
/// @invariant kind() never changes and always agrees with the concrete class.
/// @invariant loc() always has a line number.
/// @invariant The child structure is fixed at construction; only the
///            location can be rewritten afterwards.
///
/// Ownership/Lifetime: Nodes are neither copyable nor movable; they live
/// behind NodePtr owned by their parent.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "ast/AST_Fwd.hpp"
#include "ast/ChildList.hpp"
#include "ast/NodeKind.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace garnet::ast
{

/// @brief Abstract base of the closed node hierarchy.
class Node
{
  public:
    Node(const Node &) = delete;
    Node &operator=(const Node &) = delete;

    virtual ~Node() = default;

    /// @brief Discriminant identifying the concrete variant.
    NodeKind kind() const noexcept
    {
        return kind_;
    }

    /// @brief Location of the first source line of this construct.
    const SourceLoc &loc() const noexcept
    {
        return loc_;
    }

    /// @brief Reposition the node, e.g. after macro expansion.
    /// @pre @p loc has a line number.
    /// @note Must not run concurrently with evaluation of the same tree.
    void setLoc(SourceLoc loc);

    /// @brief Direct sub-nodes in source order; empty for leaves.
    ChildList children() const;

    /// @brief View of this node as a one-element sequence.
    ChildList asSequence() const
    {
        return ChildList::single(*this);
    }

    /// @brief True only for the `nil` literal.
    bool isNilLiteral() const noexcept
    {
        return kind_ == NodeKind::Nil;
    }

    /// @brief Name attribute for kinds that carry one, otherwise nullopt.
    std::optional<std::string_view> nameAttribute() const;

    /// @brief Render as `(KindName[:name] line, child, ...)`.
    std::string toDebugString() const;

  protected:
    /// @pre @p loc has a line number.
    Node(NodeKind kind, SourceLoc loc);

  private:
    const NodeKind kind_;
    SourceLoc loc_;
};

/// @brief Downcast @p node to its concrete class.
/// @pre node.kind() == T::kKind.
template <typename T> const T &nodeCast(const Node &node)
{
    return static_cast<const T &>(node);
}

/// @brief Downcast to @p T when the kind matches, otherwise nullptr.
template <typename T> const T *nodeDynCast(const Node &node) noexcept
{
    return node.kind() == T::kKind ? static_cast<const T *>(&node) : nullptr;
}

} // namespace garnet::ast
