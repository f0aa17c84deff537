//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST_Fwd.hpp
/// @brief Forward declarations and shared aliases for Garnet syntax nodes.
///
/// @details Declares the Node base and every concrete variant listed in
/// NodeKinds.def so that headers can refer to nodes through pointers without
/// pulling in the full definitions.
///
/// @invariant All owning pointer aliases use std::unique_ptr. Nodes form a
///            tree, not a graph.
///
/// Ownership/Lifetime: Each node is owned by its parent. The root is owned by
/// whoever built the tree and must outlive every context that evaluates it.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <memory>
#include <vector>

namespace garnet::ast
{

class Node;

#define GARNET_NODE(KIND, CLASS, FLAGS) struct CLASS;
#include "ast/NodeKinds.def"
#undef GARNET_NODE

/// @brief Unique pointer to a syntax node of any kind.
using NodePtr = std::unique_ptr<Node>;

/// @brief Ordered list of owned child nodes.
using NodeList = std::vector<NodePtr>;

/// @brief Source location attached to every node.
using SourceLoc = garnet::support::SourceLoc;

} // namespace garnet::ast
