//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ast/NodeKind.hpp
// Purpose: Declares the closed enumeration of syntax node variants.
// Key invariants: Enumerators mirror NodeKinds.def one-to-one; a node's kind
//                 always matches its concrete class.
// Ownership/Lifetime: Returned strings point to static storage.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace garnet::ast
{

/// @brief Per-kind attribute bits recorded in NodeKinds.def.
enum NodeFlag : uint8_t
{
    kNodeFlagNone = 0,
    /// The variant carries a name attribute shown as `Kind:name` in debug output.
    kNodeFlagNamed = 1U << 0,
    /// The variant is a structural placeholder with no surface syntax.
    kNodeFlagInvisible = 1U << 1,
};

/// @brief Discriminant identifying the concrete variant of a syntax node.
/// @details Passes switch over this enumeration instead of relying on virtual
///          overrides, so every pass handles every kind explicitly.
enum class NodeKind : uint8_t
{
#define GARNET_NODE(KIND, CLASS, FLAGS) KIND,
#include "ast/NodeKinds.def"
#undef GARNET_NODE
};

/// @brief Total number of node kinds.
inline constexpr std::size_t kNumNodeKinds = 0
#define GARNET_NODE(KIND, CLASS, FLAGS) +1
#include "ast/NodeKinds.def"
#undef GARNET_NODE
    ;

/// @brief Display name of @p kind, e.g. "UndefNode".
[[nodiscard]] std::string_view toString(NodeKind kind) noexcept;

/// @brief Whether nodes of @p kind carry a name attribute.
[[nodiscard]] bool hasNameAttribute(NodeKind kind) noexcept;

/// @brief Whether nodes of @p kind render as an empty debug string.
[[nodiscard]] bool isInvisible(NodeKind kind) noexcept;

} // namespace garnet::ast
