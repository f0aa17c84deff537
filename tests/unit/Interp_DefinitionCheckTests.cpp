// File: tests/unit/Interp_DefinitionCheckTests.cpp
// Purpose: Verify the definedness probe and `defined?` evaluation.
// Key invariants: A successful probe classifies as an expression, a control
//                 transfer yields no classification, and any other failure
//                 is rethrown unchanged. Probe side effects are kept.
// Ownership: Each test owns its trees and context; trees outlive contexts.
#include <gtest/gtest.h>

#include "AstBuilders.hpp"
#include "interp/Interpreter.hpp"

using namespace garnet::test;
using namespace garnet::interp;

TEST(Probe, OutcomeShapes)
{
    ExecContext ctx;

    EvalOutcome ok = probe(*fix(2), ctx);
    ASSERT_EQ(ok.kind(), EvalOutcome::Kind::Value);
    EXPECT_EQ(ok.value(), Value::integer(2));

    EvalOutcome jump = probe(*std::make_unique<NextNode>(at(1), fix(5)), ctx);
    ASSERT_EQ(jump.kind(), EvalOutcome::Kind::ControlTransfer);
    EXPECT_EQ(jump.transfer().kind, JumpKind::Next);
    EXPECT_EQ(jump.transfer().value, Value::integer(5));

    EvalOutcome bad = probe(*lvar("nope"), ctx);
    ASSERT_EQ(bad.kind(), EvalOutcome::Kind::Failure);
    EXPECT_THROW(bad.rethrow(), LanguageError);
}

TEST(DefinitionCheck, SuccessfulEvaluationIsExpression)
{
    ExecContext ctx;
    EXPECT_EQ(definitionCheck(*fix(1), ctx), DefinitionKind::Expression);
    EXPECT_EQ(definitionCheck(*str("s"), ctx), DefinitionKind::Expression);
    EXPECT_EQ(definitionCheck(*nil(), ctx), DefinitionKind::Expression);
}

TEST(DefinitionCheck, ControlTransferIsUndefined)
{
    ExecContext ctx;
    EXPECT_FALSE(definitionCheck(*std::make_unique<BreakNode>(at(1)), ctx).has_value());
    EXPECT_FALSE(definitionCheck(*std::make_unique<ReturnNode>(at(1), fix(1)), ctx).has_value());
}

TEST(DefinitionCheck, OtherFailuresPropagateUnchanged)
{
    ExecContext ctx;
    auto stmt = undef("foo", 9);
    try
    {
        (void)definitionCheck(*stmt, ctx);
        FAIL() << "probe swallowed a language error";
    }
    catch (const LanguageError &err)
    {
        EXPECT_EQ(err.errorClass(), ErrorClass::TypeError);
        EXPECT_EQ(err.message(), "no class to undef method in");
        EXPECT_EQ(err.loc().line, 9u);
    }

    auto args = std::make_unique<ArgsNode>(at(1), std::vector<std::unique_ptr<ArgumentNode>>{});
    EXPECT_THROW((void)definitionCheck(*args, ctx), InternalError);
}

TEST(DefinitionCheck, ProbeKeepsSideEffects)
{
    ExecContext ctx;
    auto stmts = block(list(lasgn("seen", fix(1)), fix(2)));
    EXPECT_EQ(definitionCheck(*stmts, ctx), DefinitionKind::Expression);
    ASSERT_TRUE(ctx.hasLocal("seen"));
    EXPECT_EQ(*ctx.lookupLocal("seen"), Value::integer(1));
}

TEST(DefinitionCheck, NameKindsAreClassifiedWithoutEvaluation)
{
    ExecContext ctx;
    EXPECT_FALSE(definitionCheck(*lvar("x"), ctx).has_value());
    ctx.setLocal("x", Value::nil());
    EXPECT_EQ(definitionCheck(*lvar("x"), ctx), DefinitionKind::LocalVariable);

    EXPECT_EQ(definitionCheck(*std::make_unique<SelfNode>(at(1)), ctx), DefinitionKind::SelfRef);

    auto asgn = lasgn("y", fix(1));
    EXPECT_EQ(definitionCheck(*asgn, ctx), DefinitionKind::Assignment);
    EXPECT_FALSE(ctx.hasLocal("y"));

    auto marker = std::make_unique<NewlineNode>(at(1), lvar("x"));
    EXPECT_EQ(definitionCheck(*marker, ctx), DefinitionKind::LocalVariable);
}

TEST(DefinitionCheck, MethodCalls)
{
    auto m = defn("m", {"a"});
    ExecContext ctx;
    EXPECT_FALSE(definitionCheck(*fcall("m"), ctx).has_value());

    DefinitionScope &top = ctx.defineScope("Object");
    top.defineMethod("m", nodeCast<DefnNode>(*m));
    DefiningScopeGuard open(ctx, top);

    // Arity is not checked by the probe; only resolvability.
    EXPECT_EQ(definitionCheck(*fcall("m"), ctx), DefinitionKind::Method);
    EXPECT_EQ(definitionCheck(*fcall("m", list(fix(1))), ctx), DefinitionKind::Method);
    EXPECT_FALSE(definitionCheck(*fcall("m", list(lvar("unbound"))), ctx).has_value());
    EXPECT_FALSE(definitionCheck(*fcall("other"), ctx).has_value());
}

TEST(DefinedNode, EvaluatesToClassificationText)
{
    ExecContext ctx;
    ctx.setLocal("x", Value::integer(1));

    auto known = std::make_unique<DefinedNode>(at(1), lvar("x"));
    auto unknown = std::make_unique<DefinedNode>(at(1), lvar("z"));
    auto self = std::make_unique<DefinedNode>(at(1), std::make_unique<SelfNode>(at(1)));
    auto expr = std::make_unique<DefinedNode>(at(1), fix(3));

    EXPECT_EQ(evaluate(*known, ctx), Value::string("local-variable"));
    EXPECT_TRUE(evaluate(*unknown, ctx).isNil());
    EXPECT_EQ(evaluate(*self, ctx), Value::string("self"));
    EXPECT_EQ(evaluate(*expr, ctx), Value::string("expression"));
}

TEST(DefinitionKindNames, Text)
{
    EXPECT_EQ(toString(DefinitionKind::Expression), "expression");
    EXPECT_EQ(toString(DefinitionKind::LocalVariable), "local-variable");
    EXPECT_EQ(toString(DefinitionKind::Assignment), "assignment");
    EXPECT_EQ(toString(DefinitionKind::Method), "method");
    EXPECT_EQ(toString(DefinitionKind::SelfRef), "self");
}
