// File: tests/unit/Interp_ConcurrencyTests.cpp
// Purpose: Verify one syntax tree can be evaluated from several threads, each
//          with its own ExecContext.
// Key invariants: Nodes are read-only after construction; all evaluation
//                 state lives in the context, so concurrent runs agree and
//                 leave the tree unchanged.
// Ownership: The tree is built before the threads start and outlives them;
//            each thread owns its contexts.
#include <gtest/gtest.h>

#include "AstBuilders.hpp"
#include "interp/Interpreter.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace garnet::test;
using namespace garnet::interp;

namespace
{
constexpr int kRunsPerThread = 200;

/// class Greeter
///   def hello(who) = who
///   def bye; end
///   undef bye
///   [hello("x"), defined?(bye), defined?(hello("y"))]
/// end
NodePtr buildGreeter()
{
    auto result = std::make_unique<ArrayNode>(
        at(6),
        list(fcall("hello", list(str("x", 6)), 6),
             std::make_unique<DefinedNode>(at(6), fcall("bye", {}, 6)),
             std::make_unique<DefinedNode>(at(6), fcall("hello", list(str("y", 6)), 6))));
    auto body = block(list(defn("hello", {"who"}, lvar("who", 2), 2),
                           defn("bye", {}, nullptr, 3),
                           undef("bye", 4),
                           std::move(result)),
                      2);
    return klass("Greeter", std::nullopt, std::move(body), 1);
}

struct RunRecord
{
    std::string value;
    std::string debug;
};

std::vector<RunRecord> runRepeatedly(const Node &tree)
{
    std::vector<RunRecord> out;
    out.reserve(kRunsPerThread);
    for (int i = 0; i < kRunsPerThread; ++i)
    {
        ExecContext ctx;
        Value v = evaluate(tree, ctx);
        out.push_back({v.inspect(), tree.toDebugString()});
    }
    return out;
}
} // namespace

TEST(Concurrency, SeparateContextsShareOneTree)
{
    NodePtr tree = buildGreeter();
    const std::string debugBefore = tree->toDebugString();
    const ChildList childrenBefore = tree->children();
    const ChildList bodyBefore = childrenBefore.front().children();

    std::string expected;
    {
        ExecContext ctx;
        expected = evaluate(*tree, ctx).inspect();
    }
    ASSERT_EQ(expected, "[\"x\", nil, \"method\"]");

    std::vector<RunRecord> first;
    std::vector<RunRecord> second;
    std::thread a([&] { first = runRepeatedly(*tree); });
    std::thread b([&] { second = runRepeatedly(*tree); });
    a.join();
    b.join();

    ASSERT_EQ(first.size(), static_cast<std::size_t>(kRunsPerThread));
    ASSERT_EQ(second.size(), static_cast<std::size_t>(kRunsPerThread));
    for (int i = 0; i < kRunsPerThread; ++i)
    {
        EXPECT_EQ(first[i].value, expected);
        EXPECT_EQ(second[i].value, expected);
        EXPECT_EQ(first[i].debug, debugBefore);
        EXPECT_EQ(second[i].debug, debugBefore);
    }

    EXPECT_EQ(tree->toDebugString(), debugBefore);
    EXPECT_EQ(tree->children(), childrenBefore);
    EXPECT_EQ(tree->children().front().children(), bodyBefore);
}

TEST(Concurrency, ContextsDoNotShareScopes)
{
    NodePtr tree = buildGreeter();
    ExecContext one;
    ExecContext two;
    evaluate(*tree, one);

    DefinitionScope *greeter = one.findScope("Greeter");
    ASSERT_NE(greeter, nullptr);
    EXPECT_TRUE(greeter->hasMethod("hello"));
    EXPECT_FALSE(greeter->hasMethod("bye"));
    EXPECT_EQ(two.findScope("Greeter"), nullptr);

    EXPECT_EQ(evaluate(*tree, two).inspect(), "[\"x\", nil, \"method\"]");
    EXPECT_NE(two.findScope("Greeter"), greeter);
}
