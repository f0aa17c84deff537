//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: interp/ExecContext.hpp
// Purpose: Mutable state of one logical thread of evaluation.
// Key invariants: There is always at least one frame. Guards restore the
//                 scope stack, frame stack and depth counter on every exit
//                 path, including exceptions.
// Ownership/Lifetime: The context owns its scopes and frames. It borrows the
//                     syntax tree through method tables; the tree must
//                     outlive the context.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/DefinitionScope.hpp"
#include "interp/Trace.hpp"
#include "interp/Value.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace garnet::ast
{
class Node;
} // namespace garnet::ast

namespace garnet::interp
{

/// @brief Default evaluation nesting limit.
/// @details Each level costs a few hundred bytes of native stack in an
///          optimized build and a few KiB under AddressSanitizer; 2000 levels
///          fit an 8 MiB thread stack either way. Lower it when evaluating on
///          threads or fibers with smaller stacks.
inline constexpr uint32_t kDefaultMaxDepth = 2000;

/// @brief Tunables applied to an ExecContext.
struct EvalOptions
{
    /// @brief Maximum evaluation nesting depth; zero disables the limit.
    uint32_t maxDepth = kDefaultMaxDepth;

    /// @brief Tracing configuration.
    TraceConfig trace;
};

/// @brief Execution context threaded through evaluate/assign/definitionCheck.
/// @details Nodes hold no evaluation state; everything mutable lives here, so
///          one tree may be evaluated by several contexts at once.
class ExecContext
{
  public:
    /// @brief Create a context with a single top frame whose self is nil and
    ///        no defining scope open.
    explicit ExecContext(EvalOptions options = {});

    ExecContext(const ExecContext &) = delete;
    ExecContext &operator=(const ExecContext &) = delete;

    const EvalOptions &options() const noexcept
    {
        return options_;
    }

    TraceSink &trace() noexcept
    {
        return trace_;
    }

    //===------------------------------------------------------------------===//
    // Defining scopes
    //===------------------------------------------------------------------===//

    /// @brief Innermost open defining scope, or nullptr when none is open.
    DefinitionScope *currentDefiningScope() const noexcept;

    void pushDefiningScope(DefinitionScope &scope);

    /// @throws InternalError when no scope is open.
    void popDefiningScope();

    /// @brief Create and register a scope named @p name.
    /// @throws InternalError when the name is already registered.
    DefinitionScope &defineScope(const std::string &name, DefinitionScope *superScope = nullptr);

    /// @brief Registered scope named @p name, or nullptr.
    DefinitionScope *findScope(std::string_view name) const;

    //===------------------------------------------------------------------===//
    // Frames and locals
    //===------------------------------------------------------------------===//

    void pushFrame(Value self);

    /// @throws InternalError when only the top frame remains.
    void popFrame();

    std::size_t frameCount() const noexcept
    {
        return frames_.size();
    }

    /// @brief Receiver of the current frame.
    const Value &self() const noexcept;

    /// @brief Value bound to @p name in the current frame, or nullptr.
    const Value *lookupLocal(std::string_view name) const;

    bool hasLocal(std::string_view name) const
    {
        return lookupLocal(name) != nullptr;
    }

    /// @brief Bind @p name in the current frame.
    void setLocal(const std::string &name, Value value);

    //===------------------------------------------------------------------===//
    // Depth accounting
    //===------------------------------------------------------------------===//

    uint32_t depth() const noexcept
    {
        return depth_;
    }

  private:
    friend class DefiningScopeGuard;
    friend class FrameGuard;
    friend class DepthGuard;

    // Non-throwing pops for guard destructors; the matching push happened in
    // the guard's constructor.
    void dropDefiningScope() noexcept;
    void dropFrame() noexcept;

    struct Frame
    {
        Value self;
        std::map<std::string, Value, std::less<>> locals;
    };

    EvalOptions options_;
    TraceSink trace_;
    std::vector<std::unique_ptr<DefinitionScope>> scopes_;
    std::vector<DefinitionScope *> definingStack_;
    std::vector<Frame> frames_;
    uint32_t depth_ = 0;
};

/// @brief Opens a defining scope for the guard's lifetime.
class DefiningScopeGuard
{
  public:
    DefiningScopeGuard(ExecContext &ctx, DefinitionScope &scope) : ctx_(ctx)
    {
        ctx_.pushDefiningScope(scope);
    }

    ~DefiningScopeGuard()
    {
        ctx_.dropDefiningScope();
    }

    DefiningScopeGuard(const DefiningScopeGuard &) = delete;
    DefiningScopeGuard &operator=(const DefiningScopeGuard &) = delete;

  private:
    ExecContext &ctx_;
};

/// @brief Pushes a frame for the guard's lifetime.
class FrameGuard
{
  public:
    FrameGuard(ExecContext &ctx, Value self) : ctx_(ctx)
    {
        ctx_.pushFrame(std::move(self));
    }

    ~FrameGuard()
    {
        ctx_.dropFrame();
    }

    FrameGuard(const FrameGuard &) = delete;
    FrameGuard &operator=(const FrameGuard &) = delete;

  private:
    ExecContext &ctx_;
};

/// @brief Counts one level of evaluation nesting.
/// @throws LanguageError SystemStackError from the constructor when the
///         context's depth limit would be exceeded.
class DepthGuard
{
  public:
    DepthGuard(ExecContext &ctx, const garnet::ast::Node &node);

    ~DepthGuard()
    {
        --ctx_.depth_;
    }

    DepthGuard(const DepthGuard &) = delete;
    DepthGuard &operator=(const DepthGuard &) = delete;

  private:
    ExecContext &ctx_;
};

} // namespace garnet::interp
