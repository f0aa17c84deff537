//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file NodeVisitor.hpp
/// @brief Double-dispatch interface for passes over the syntax tree.
///
/// @details NodeVisitor<R> declares one pure virtual method per entry in
/// NodeKinds.def, named `visit<Kind>`. A pass that forgets a kind cannot be
/// instantiated. dispatch() routes a node to the method for its kind and
/// returns that method's result unchanged.
///
/// @code
///   struct Counter final : NodeVisitor<int>
///   {
///       int visitNil(const NilNode &) override { return 0; }
///       // ... one override per kind
///   };
///   int n = dispatch(node, counter);
/// @endcode
///
//===----------------------------------------------------------------------===//

#pragma once

#include "ast/AST.hpp"

#include <stdexcept>
#include <string>

namespace garnet::ast
{

/// @brief Pass interface with one handler per node kind.
/// @tparam R Result type produced by every handler.
template <typename R> class NodeVisitor
{
  public:
    virtual ~NodeVisitor() = default;

#define GARNET_NODE(KIND, CLASS, FLAGS) virtual R visit##KIND(const CLASS &node) = 0;
#include "ast/NodeKinds.def"
#undef GARNET_NODE
};

/// @brief Invoke the handler of @p visitor matching @p node's kind.
/// @return Whatever the handler returned.
template <typename R> R dispatch(const Node &node, NodeVisitor<R> &visitor)
{
    switch (node.kind())
    {
#define GARNET_NODE(KIND, CLASS, FLAGS)                                                            \
    case NodeKind::KIND:                                                                           \
        return visitor.visit##KIND(nodeCast<CLASS>(node));
#include "ast/NodeKinds.def"
#undef GARNET_NODE
    }
    throw std::logic_error("node kind out of range: " +
                           std::to_string(static_cast<unsigned>(node.kind())));
}

} // namespace garnet::ast
