//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ast/ChildList.cpp
// Purpose: Implements the read-only child sequence view.
// Key invariants: Many storage never contains null pointers.
// Ownership/Lifetime: Borrowed pointers only.
//
//===----------------------------------------------------------------------===//

#include "ast/ChildList.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace garnet::ast
{

ChildList ChildList::single(const Node &node)
{
    return ChildList(&node);
}

ChildList ChildList::many(std::vector<const Node *> nodes)
{
    nodes.erase(std::remove(nodes.begin(), nodes.end(), nullptr), nodes.end());
    if (nodes.empty())
        return ChildList();
    return ChildList(std::move(nodes));
}

ChildList::Shape ChildList::shape() const noexcept
{
    switch (storage_.index())
    {
        case 1:
            return Shape::Single;
        case 2:
            return Shape::Many;
        default:
            return Shape::Empty;
    }
}

std::size_t ChildList::size() const noexcept
{
    return static_cast<std::size_t>(end() - begin());
}

const Node &ChildList::at(std::size_t index) const
{
    if (index >= size())
    {
        throw std::out_of_range("child index " + std::to_string(index) +
                                " out of range for list of size " + std::to_string(size()));
    }
    return *begin()[index];
}

const Node &ChildList::front() const
{
    return at(0);
}

bool ChildList::contains(const Node &node) const noexcept
{
    return indexOf(node).has_value();
}

std::optional<std::size_t> ChildList::indexOf(const Node &node) const noexcept
{
    auto it = std::find(begin(), end(), &node);
    if (it == end())
        return std::nullopt;
    return static_cast<std::size_t>(it - begin());
}

ChildList ChildList::slice(std::size_t from, std::size_t to) const
{
    const std::size_t n = size();
    if (from > to || to > n)
    {
        throw std::out_of_range("slice [" + std::to_string(from) + ", " + std::to_string(to) +
                                ") out of range for list of size " + std::to_string(n));
    }
    if (from == to)
        return ChildList();
    if (from == 0 && to == n)
        return *this;
    return ChildList(std::vector<const Node *>(begin() + from, begin() + to));
}

ChildList::const_iterator ChildList::begin() const noexcept
{
    if (const auto *one = std::get_if<const Node *>(&storage_))
        return one;
    if (const auto *list = std::get_if<std::vector<const Node *>>(&storage_))
        return list->data();
    return nullptr;
}

ChildList::const_iterator ChildList::end() const noexcept
{
    if (const auto *one = std::get_if<const Node *>(&storage_))
        return one + 1;
    if (const auto *list = std::get_if<std::vector<const Node *>>(&storage_))
        return list->data() + list->size();
    return nullptr;
}

bool operator==(const ChildList &lhs, const ChildList &rhs) noexcept
{
    return std::equal(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
}

} // namespace garnet::ast
