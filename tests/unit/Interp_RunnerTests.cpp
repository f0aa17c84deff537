// File: tests/unit/Interp_RunnerTests.cpp
// Purpose: Verify the Runner facade turns evaluation failures into
//          diagnostics and honours its configuration.
// Key invariants: Language errors and escaped jumps come back as error
//                 diagnostics; internal errors still throw.
// Ownership: Trees are declared before runners so they outlive them.
#include <gtest/gtest.h>

#include "AstBuilders.hpp"
#include "garnet/interp/Runner.hpp"
#include "interp/Errors.hpp"
#include "support/source_manager.hpp"

#include <sstream>

using namespace garnet::test;
using namespace garnet::interp;
using garnet::support::printDiag;
using garnet::support::SourceManager;

TEST(Runner, ReturnsValueOfTree)
{
    auto prog = block(list(defn("twice", {"a"}, std::make_unique<ArrayNode>(
                                                    at(1), list(lvar("a"), lvar("a")))),
                           fcall("twice", list(fix(4)))));
    Runner runner;
    auto result = runner.run(*prog);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().inspect(), "[4, 4]");
    EXPECT_EQ(runner.diagnostics().errorCount(), 0u);
    EXPECT_FALSE(runner.lastError().has_value());
}

TEST(Runner, TopLevelScopeIsOpenAndNamed)
{
    auto prog = block(list(defn("m", {}), std::make_unique<SelfNode>(at(1))));
    Runner runner(RunConfig{{}, 100, true, "Main"});
    auto result = runner.run(*prog);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().inspect(), "Main");
    DefinitionScope *top = runner.context().findScope("Main");
    ASSERT_NE(top, nullptr);
    EXPECT_TRUE(top->hasMethod("m"));
}

TEST(Runner, LanguageErrorBecomesDiagnostic)
{
    auto prog = block(list(fix(1), fcall("nope", {}, 5)));
    Runner runner;
    auto result = runner.run(*prog);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "NoMethodError: undefined method 'nope'");
    EXPECT_EQ(result.error().loc.line, 5u);
    EXPECT_EQ(runner.diagnostics().errorCount(), 1u);
    EXPECT_EQ(runner.lastError(), "NoMethodError: undefined method 'nope'");
}

TEST(Runner, WithoutTopLevelScopeUndefFails)
{
    auto stmt = undef("foo", 2);
    RunConfig cfg;
    cfg.openTopLevelScope = false;
    Runner runner(cfg);
    auto result = runner.run(*stmt);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "TypeError: no class to undef method in");
}

TEST(Runner, EscapedJumpsAreLocalJumpErrors)
{
    auto brk = std::make_unique<BreakNode>(at(3));
    auto nxt = std::make_unique<NextNode>(at(4));
    auto ret = std::make_unique<ReturnNode>(at(5), fix(1));

    Runner runner;
    auto r1 = runner.run(*brk);
    auto r2 = runner.run(*nxt);
    auto r3 = runner.run(*ret);
    ASSERT_FALSE(r1);
    ASSERT_FALSE(r2);
    ASSERT_FALSE(r3);
    EXPECT_EQ(r1.error().message, "LocalJumpError: break from proc-closure");
    EXPECT_EQ(r2.error().message, "LocalJumpError: unexpected next");
    EXPECT_EQ(r3.error().message, "LocalJumpError: unexpected return");
    EXPECT_EQ(r3.error().loc.line, 5u);
    EXPECT_EQ(runner.diagnostics().diagnostics().size(), 3u);
}

TEST(Runner, InternalErrorsAreNotIntercepted)
{
    auto arg = std::make_unique<ArgumentNode>(at(1), "a");
    Runner runner;
    EXPECT_THROW((void)runner.run(*arg), InternalError);
    EXPECT_EQ(runner.diagnostics().errorCount(), 0u);
}

TEST(Runner, StateCarriesAcrossRuns)
{
    auto define = defn("k", {}, str("kept"));
    auto call = fcall("k");
    Runner runner;
    ASSERT_TRUE(runner.run(*define));
    auto result = runner.run(*call);
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value(), Value::string("kept"));
}

TEST(Runner, DepthLimitIsConfigurable)
{
    auto prog = block(list(defn("r", {}, fcall("r")), fcall("r")));
    RunConfig cfg;
    EXPECT_EQ(cfg.maxDepth, kDefaultMaxDepth);
    cfg.maxDepth = 64;
    Runner runner(cfg);
    auto result = runner.run(*prog);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "SystemStackError: stack level too deep");
}

TEST(Runner, TraceWritesOneLinePerNode)
{
    SourceManager sm;
    const uint32_t fid = sm.addFile("scripts/../scripts/a.gt");
    ASSERT_EQ(fid, 1u);

    auto prog = block(list(fix(1, 2), lvar("x", 3)), 1);
    std::ostringstream trace;
    RunConfig cfg;
    cfg.trace.mode = TraceConfig::Nodes;
    cfg.trace.sm = &sm;
    cfg.trace.out = &trace;

    Runner runner(cfg);
    auto result = runner.run(*prog);
    ASSERT_FALSE(result);
    EXPECT_EQ(trace.str(),
              "[eval] BlockNode scripts/a.gt:1:1\n"
              "[eval] FixnumNode scripts/a.gt:2:1\n"
              "[eval] LocalVarNode scripts/a.gt:3:1\n");

    std::ostringstream diag;
    printDiag(result.error(), diag, &sm);
    EXPECT_EQ(diag.str(),
              "scripts/a.gt:3:1: error: NameError: undefined local variable or method 'x'\n");
}
