//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstDebugPrinter.cpp
/// @brief Implements the s-expression debug rendering of syntax nodes.
///
//===----------------------------------------------------------------------===//

#include "ast/AstDebugPrinter.hpp"

#include "ast/AST.hpp"

#include <sstream>

namespace garnet::ast
{

void printDebug(const Node &node, std::ostream &os)
{
    if (isInvisible(node.kind()))
        return;

    os << '(' << toString(node.kind());
    if (auto name = node.nameAttribute())
        os << ':' << *name;
    os << ' ' << node.loc().line;
    for (const Node *child : node.children())
    {
        os << ", ";
        printDebug(*child, os);
    }
    os << ')';
}

std::string toDebugString(const Node &node)
{
    std::ostringstream os;
    printDebug(node, os);
    return os.str();
}

} // namespace garnet::ast
