//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ast/ChildList.hpp
// Purpose: Read-only ordered view over the direct children of a node.
// Key invariants: A list is exactly one of Empty, Single or Many. Elements are
//                 never null. Equality and membership compare by identity.
// Ownership/Lifetime: Borrows node pointers; the viewed tree must outlive the
//                     list.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ast/AST_Fwd.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

namespace garnet::ast
{

/// @brief Tagged sequence of child nodes: Empty, Single(node) or Many(nodes).
/// @details A lone node and a statement list can be handed to the same
///          generic walker through this type. There are no mutating members.
class ChildList
{
  public:
    enum class Shape : uint8_t
    {
        Empty,
        Single,
        Many,
    };

    using value_type = const Node *;
    using const_iterator = const Node *const *;

    /// @brief Construct the canonical empty list.
    ChildList() = default;

    /// @brief List containing exactly @p node.
    static ChildList single(const Node &node);

    /// @brief List over @p nodes in order; null entries are dropped.
    /// @details An input with no non-null entries yields the empty list.
    static ChildList many(std::vector<const Node *> nodes);

    [[nodiscard]] Shape shape() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept;

    [[nodiscard]] bool empty() const noexcept
    {
        return size() == 0;
    }

    /// @brief Element at @p index.
    /// @throws std::out_of_range when @p index >= size().
    [[nodiscard]] const Node &at(std::size_t index) const;

    /// @brief Unchecked element access; @p index must be < size().
    const Node &operator[](std::size_t index) const noexcept
    {
        return *begin()[index];
    }

    /// @brief First element; the list must not be empty.
    [[nodiscard]] const Node &front() const;

    /// @brief Whether @p node itself (not a structurally equal node) is listed.
    [[nodiscard]] bool contains(const Node &node) const noexcept;

    /// @brief Position of @p node by identity, or nullopt.
    [[nodiscard]] std::optional<std::size_t> indexOf(const Node &node) const noexcept;

    /// @brief Elements in the half-open range [@p from, @p to).
    /// @details An empty range yields the canonical empty list; the full range
    ///          of a Single list yields that same single-element list.
    /// @throws std::out_of_range when from > to or to > size().
    [[nodiscard]] ChildList slice(std::size_t from, std::size_t to) const;

    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    friend bool operator==(const ChildList &lhs, const ChildList &rhs) noexcept;

  private:
    explicit ChildList(const Node *node) : storage_(node) {}

    explicit ChildList(std::vector<const Node *> nodes) : storage_(std::move(nodes)) {}

    std::variant<std::monostate, const Node *, std::vector<const Node *>> storage_;
};

} // namespace garnet::ast
