//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstDebugPrinter.hpp
/// @brief Single-line s-expression rendering of a syntax tree.
///
/// @details Example output for `undef :foo` on line 3:
/// @code
///   (UndefNode 3, (SymbolNode:foo 3))
/// @endcode
/// A Newline marker prints as nothing, but its parent still writes the
/// separator in front of it.
///
/// @invariant Rendering never mutates the tree and is deterministic.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "ast/AST_Fwd.hpp"

#include <ostream>
#include <string>

namespace garnet::ast
{

/// @brief Render @p node as `(KindName[:name] line, child, ...)`.
std::string toDebugString(const Node &node);

/// @brief Stream form of toDebugString().
void printDebug(const Node &node, std::ostream &os);

} // namespace garnet::ast
