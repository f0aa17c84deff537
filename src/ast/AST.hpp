//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Umbrella header for the Garnet syntax tree.
///
/// @details Include this header to get every node definition:
/// - AST_Node.hpp: Node base, nodeCast helpers
/// - AST_Expr.hpp: literals, variables, assignment, calls, defined?
/// - AST_Stmt.hpp: blocks, line markers, break/next/return
/// - AST_Decl.hpp: class, def, parameter lists, undef
///
//===----------------------------------------------------------------------===//

#pragma once

#include "ast/AST_Decl.hpp"
#include "ast/AST_Expr.hpp"
#include "ast/AST_Fwd.hpp"
#include "ast/AST_Node.hpp"
#include "ast/AST_Stmt.hpp"
