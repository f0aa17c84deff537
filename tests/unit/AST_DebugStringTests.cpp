// File: tests/unit/AST_DebugStringTests.cpp
// Purpose: Verify kind metadata and the s-expression debug rendering.
// Key invariants: Output starts with the kind name, an optional `:name`, and
//                 the first line; invisible nodes render as nothing.
// Ownership: Each test owns the trees it builds.
#include <gtest/gtest.h>

#include "AstBuilders.hpp"
#include "ast/AstDebugPrinter.hpp"

#include <sstream>

using namespace garnet::test;

TEST(NodeKindTable, NamesAndFlags)
{
    EXPECT_EQ(toString(NodeKind::Undef), "UndefNode");
    EXPECT_EQ(toString(NodeKind::Nil), "NilNode");
    EXPECT_EQ(toString(NodeKind::MultipleAsgn), "MultipleAsgnNode");

    EXPECT_TRUE(isInvisible(NodeKind::Newline));
    EXPECT_FALSE(isInvisible(NodeKind::Block));

    EXPECT_TRUE(hasNameAttribute(NodeKind::LocalVar));
    EXPECT_TRUE(hasNameAttribute(NodeKind::Defn));
    EXPECT_FALSE(hasNameAttribute(NodeKind::Undef));
    EXPECT_FALSE(hasNameAttribute(NodeKind::Fixnum));
}

TEST(DebugString, LeafWithoutName)
{
    EXPECT_EQ(nil(4)->toDebugString(), "(NilNode 4)");
    EXPECT_EQ(fix(10, 2)->toDebugString(), "(FixnumNode 2)");
}

TEST(DebugString, LeafWithName)
{
    EXPECT_EQ(lvar("x", 5)->toDebugString(), "(LocalVarNode:x 5)");
    EXPECT_EQ(sym("foo", 1)->toDebugString(), "(SymbolNode:foo 1)");
}

TEST(DebugString, NestedChildren)
{
    auto node = undef("foo", 3);
    EXPECT_EQ(node->toDebugString(), "(UndefNode 3, (SymbolNode:foo 3))");

    auto asgn = lasgn("y", fix(1, 2), 2);
    EXPECT_EQ(asgn->toDebugString(), "(LocalAsgnNode:y 2, (FixnumNode 2))");
}

TEST(DebugString, InvisibleNodeRendersEmpty)
{
    auto marker = std::make_unique<NewlineNode>(at(6), fix(1, 6));
    EXPECT_EQ(marker->toDebugString(), "");

    NodeList stmts;
    stmts.push_back(std::move(marker));
    stmts.push_back(fix(2, 7));
    auto b = block(std::move(stmts), 6);
    EXPECT_EQ(b->toDebugString(), "(BlockNode 6, , (FixnumNode 7))");
}

TEST(DebugString, StreamFormMatches)
{
    auto d = defn("run", {"a", "b"}, nullptr, 9);
    std::ostringstream os;
    printDebug(*d, os);
    EXPECT_EQ(os.str(), d->toDebugString());
    EXPECT_EQ(os.str(),
              "(DefnNode:run 9, (ArgsNode 9, (ArgumentNode:a 9), (ArgumentNode:b 9)))");
}

TEST(DebugString, NilLiteralQuery)
{
    EXPECT_TRUE(nil()->isNilLiteral());
    EXPECT_FALSE(fix(0)->isNilLiteral());
    EXPECT_FALSE(std::make_unique<FalseNode>(at(1))->isNilLiteral());
}
