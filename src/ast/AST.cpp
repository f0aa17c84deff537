//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.cpp
/// @brief Node construction contracts and the structural queries shared by
///        every pass (children, name attribute).
///
/// @details Both queries switch over NodeKind without a default label; adding
/// a kind to NodeKinds.def without handling it here is a -Wswitch warning.
///
//===----------------------------------------------------------------------===//

#include "ast/AST.hpp"
#include "ast/AstDebugPrinter.hpp"

#include <cassert>

namespace garnet::ast
{

namespace
{
std::vector<const Node *> borrow(const NodeList &nodes)
{
    std::vector<const Node *> out;
    out.reserve(nodes.size());
    for (const auto &n : nodes)
        out.push_back(n.get());
    return out;
}

ChildList optionalChild(const NodePtr &node)
{
    return node ? ChildList::single(*node) : ChildList();
}
} // namespace

Node::Node(NodeKind kind, SourceLoc loc) : kind_(kind), loc_(loc)
{
    assert(loc.hasLine() && "syntax nodes require a source line");
}

void Node::setLoc(SourceLoc loc)
{
    assert(loc.hasLine() && "syntax nodes require a source line");
    loc_ = loc;
}

DefinedNode::DefinedNode(SourceLoc l, NodePtr e) : Node(kKind, l), expression(std::move(e))
{
    assert(expression && "defined? requires an operand");
}

NewlineNode::NewlineNode(SourceLoc l, NodePtr s) : Node(kKind, l), statement(std::move(s))
{
    assert(statement && "newline marker requires a statement");
}

DefnNode::DefnNode(SourceLoc l, std::string n, std::unique_ptr<ArgsNode> a, NodePtr b)
    : Node(kKind, l), name(std::move(n)), args(std::move(a)), body(std::move(b))
{
    assert(args && "method definition requires a parameter list");
}

UndefNode::UndefNode(SourceLoc l, NodePtr n) : Node(kKind, l), name(std::move(n))
{
    assert(name && "undef requires a method name");
}

ChildList Node::children() const
{
    switch (kind_)
    {
        case NodeKind::Nil:
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Fixnum:
        case NodeKind::Str:
        case NodeKind::Symbol:
        case NodeKind::Self:
        case NodeKind::LocalVar:
        case NodeKind::Argument:
            return ChildList();
        case NodeKind::DSymbol:
            return ChildList::many(borrow(nodeCast<DSymbolNode>(*this).parts));
        case NodeKind::Array:
            return ChildList::many(borrow(nodeCast<ArrayNode>(*this).elements));
        case NodeKind::LocalAsgn:
            return optionalChild(nodeCast<LocalAsgnNode>(*this).value);
        case NodeKind::MultipleAsgn:
        {
            const auto &masgn = nodeCast<MultipleAsgnNode>(*this);
            auto nodes = borrow(masgn.targets);
            nodes.push_back(masgn.value.get());
            return ChildList::many(std::move(nodes));
        }
        case NodeKind::Block:
            return ChildList::many(borrow(nodeCast<BlockNode>(*this).statements));
        case NodeKind::Newline:
            return ChildList::single(*nodeCast<NewlineNode>(*this).statement);
        case NodeKind::Break:
        case NodeKind::Next:
        case NodeKind::Return:
            return optionalChild(static_cast<const JumpNode &>(*this).value);
        case NodeKind::Defined:
            return ChildList::single(*nodeCast<DefinedNode>(*this).expression);
        case NodeKind::FCall:
            return ChildList::many(borrow(nodeCast<FCallNode>(*this).args));
        case NodeKind::Class:
            return optionalChild(nodeCast<ClassNode>(*this).body);
        case NodeKind::Defn:
        {
            const auto &defn = nodeCast<DefnNode>(*this);
            return ChildList::many({defn.args.get(), defn.body.get()});
        }
        case NodeKind::Args:
        {
            std::vector<const Node *> nodes;
            for (const auto &arg : nodeCast<ArgsNode>(*this).arguments)
                nodes.push_back(arg.get());
            return ChildList::many(std::move(nodes));
        }
        case NodeKind::Undef:
            return nodeCast<UndefNode>(*this).name->asSequence();
    }
    return ChildList();
}

std::optional<std::string_view> Node::nameAttribute() const
{
    switch (kind_)
    {
        case NodeKind::Symbol:
            return nodeCast<SymbolNode>(*this).name;
        case NodeKind::LocalVar:
            return nodeCast<LocalVarNode>(*this).name;
        case NodeKind::LocalAsgn:
            return nodeCast<LocalAsgnNode>(*this).name;
        case NodeKind::FCall:
            return nodeCast<FCallNode>(*this).name;
        case NodeKind::Class:
            return nodeCast<ClassNode>(*this).name;
        case NodeKind::Defn:
            return nodeCast<DefnNode>(*this).name;
        case NodeKind::Argument:
            return nodeCast<ArgumentNode>(*this).name;
        case NodeKind::Nil:
        case NodeKind::True:
        case NodeKind::False:
        case NodeKind::Fixnum:
        case NodeKind::Str:
        case NodeKind::DSymbol:
        case NodeKind::Array:
        case NodeKind::Self:
        case NodeKind::MultipleAsgn:
        case NodeKind::Block:
        case NodeKind::Newline:
        case NodeKind::Break:
        case NodeKind::Next:
        case NodeKind::Return:
        case NodeKind::Defined:
        case NodeKind::Args:
        case NodeKind::Undef:
            return std::nullopt;
    }
    return std::nullopt;
}

std::string Node::toDebugString() const
{
    return ast::toDebugString(*this);
}

} // namespace garnet::ast
