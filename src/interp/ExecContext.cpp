//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/ExecContext.cpp
// Purpose: Scope registry, frame stack and depth accounting.
// Key invariants: frames_ is never empty.
// Ownership/Lifetime: See ExecContext.hpp.
//
//===----------------------------------------------------------------------===//

#include "interp/ExecContext.hpp"

#include "ast/AST_Node.hpp"
#include "interp/Errors.hpp"

#include <cassert>
#include <utility>

namespace garnet::interp
{

ExecContext::ExecContext(EvalOptions options) : options_(options), trace_(options.trace)
{
    frames_.push_back(Frame{});
}

DefinitionScope *ExecContext::currentDefiningScope() const noexcept
{
    return definingStack_.empty() ? nullptr : definingStack_.back();
}

void ExecContext::pushDefiningScope(DefinitionScope &scope)
{
    definingStack_.push_back(&scope);
}

void ExecContext::popDefiningScope()
{
    if (definingStack_.empty())
        throw InternalError("defining scope stack underflow");
    definingStack_.pop_back();
}

void ExecContext::dropDefiningScope() noexcept
{
    assert(!definingStack_.empty() && "defining scope guard outlived its scope");
    if (!definingStack_.empty())
        definingStack_.pop_back();
}

DefinitionScope &ExecContext::defineScope(const std::string &name, DefinitionScope *superScope)
{
    if (findScope(name))
        throw InternalError("scope '" + name + "' is already defined");
    scopes_.push_back(std::make_unique<DefinitionScope>(name, superScope));
    return *scopes_.back();
}

DefinitionScope *ExecContext::findScope(std::string_view name) const
{
    for (const auto &scope : scopes_)
    {
        if (scope->name() == name)
            return scope.get();
    }
    return nullptr;
}

void ExecContext::pushFrame(Value self)
{
    frames_.push_back(Frame{std::move(self), {}});
}

void ExecContext::popFrame()
{
    if (frames_.size() <= 1)
        throw InternalError("cannot pop the top frame");
    frames_.pop_back();
}

void ExecContext::dropFrame() noexcept
{
    assert(frames_.size() > 1 && "frame guard outlived its frame");
    if (frames_.size() > 1)
        frames_.pop_back();
}

const Value &ExecContext::self() const noexcept
{
    return frames_.back().self;
}

const Value *ExecContext::lookupLocal(std::string_view name) const
{
    const auto &locals = frames_.back().locals;
    auto it = locals.find(name);
    return it == locals.end() ? nullptr : &it->second;
}

void ExecContext::setLocal(const std::string &name, Value value)
{
    frames_.back().locals[name] = std::move(value);
}

DepthGuard::DepthGuard(ExecContext &ctx, const garnet::ast::Node &node) : ctx_(ctx)
{
    const uint32_t limit = ctx_.options_.maxDepth;
    if (limit != 0 && ctx_.depth_ >= limit)
        throw LanguageError(ErrorClass::SystemStackError, "stack level too deep", node.loc());
    ++ctx_.depth_;
}

} // namespace garnet::interp
