//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Runner.cpp
// Purpose: Implement the public runner facade over the tree-walking
//          interpreter.
// Key invariants: Every failed run records exactly one error diagnostic.
// Ownership/Lifetime: Runner owns its context and diagnostics while
//                     borrowing the trees passed to run().
//
//===----------------------------------------------------------------------===//

#include "garnet/interp/Runner.hpp"

#include "ast/AST_Node.hpp"
#include "interp/Errors.hpp"
#include "interp/Interpreter.hpp"

#include <utility>

namespace garnet::interp
{

using garnet::support::Diag;
using garnet::support::Expected;

namespace
{
std::string escapedJumpMessage(JumpKind kind)
{
    switch (kind)
    {
        case JumpKind::Break:
            return "break from proc-closure";
        case JumpKind::Next:
            return "unexpected next";
        case JumpKind::Return:
            return "unexpected return";
    }
    return "unexpected jump";
}
} // namespace

/// @brief Private implementation owning the execution context.
class Runner::Impl
{
  public:
    explicit Impl(const RunConfig &config)
        : ctx(EvalOptions{config.maxDepth, config.trace})
    {
        if (config.openTopLevelScope)
        {
            DefinitionScope &top = ctx.defineScope(config.topLevelScopeName);
            ctx.pushDefiningScope(top);
            ctx.pushFrame(Value::scope(top));
        }
    }

    Expected<Value> run(const garnet::ast::Node &root)
    {
        try
        {
            return evaluate(root, ctx);
        }
        catch (const LanguageError &err)
        {
            return fail(garnet::support::makeError(err.loc(), err.describe()));
        }
        catch (const JumpSignal &jump)
        {
            const LanguageError err(ErrorClass::LocalJumpError, escapedJumpMessage(jump.kind));
            return fail(garnet::support::makeError(root.loc(), err.describe()));
        }
    }

    ExecContext ctx;
    garnet::support::DiagnosticEngine diags;
    std::optional<std::string> lastError;

  private:
    Diag fail(Diag diag)
    {
        lastError = diag.message;
        diags.report(diag);
        return diag;
    }
};

Runner::Runner(RunConfig config) : impl(std::make_unique<Impl>(config)) {}

Runner::~Runner() = default;

Runner::Runner(Runner &&) noexcept = default;

Runner &Runner::operator=(Runner &&) noexcept = default;

Expected<Value> Runner::run(const garnet::ast::Node &root)
{
    return impl->run(root);
}

ExecContext &Runner::context()
{
    return impl->ctx;
}

const garnet::support::DiagnosticEngine &Runner::diagnostics() const
{
    return impl->diags;
}

std::optional<std::string> Runner::lastError() const
{
    return impl->lastError;
}

} // namespace garnet::interp
