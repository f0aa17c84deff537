//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/garnet/interp/Runner.hpp
// Purpose: Declare a lightweight facade for evaluating a syntax tree and
//          reporting failures as diagnostics.
// Invariants: The runner owns its execution context; language errors and
//             escaped jumps never leave run() as exceptions.
// Ownership: Callers own the syntax tree, which must outlive the runner.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/ExecContext.hpp"
#include "interp/Trace.hpp"
#include "interp/Value.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace garnet::ast
{
class Node;
} // namespace garnet::ast

namespace garnet::interp
{

/// @brief Configuration parameters for evaluating a tree.
struct RunConfig
{
    TraceConfig trace;          ///< Tracing configuration.
    uint32_t maxDepth = kDefaultMaxDepth;  ///< Nesting limit; zero disables the limit.
    bool openTopLevelScope = true;             ///< Open a scope for top-level defs.
    std::string topLevelScopeName = "Object";  ///< Name of that scope.
};

/// @brief Facade owning an ExecContext for running syntax trees.
class Runner
{
  public:
    /// @brief Build a context from @p config, opening the top-level scope
    ///        when requested.
    explicit Runner(RunConfig config = {});

    ~Runner();

    Runner(const Runner &) = delete;
    Runner &operator=(const Runner &) = delete;
    Runner(Runner &&) noexcept;
    Runner &operator=(Runner &&) noexcept;

    /// @brief Evaluate @p root.
    /// @return The tree's value, or an error diagnostic for a language error
    ///         or a break/next/return that escaped the tree.
    /// @note InternalError is not intercepted.
    [[nodiscard]] garnet::support::Expected<Value> run(const garnet::ast::Node &root);

    /// @brief Context shared by every run() on this runner.
    ExecContext &context();

    /// @brief Diagnostics reported by previous runs, in order.
    const garnet::support::DiagnosticEngine &diagnostics() const;

    /// @brief Message of the most recent failed run, if any.
    [[nodiscard]] std::optional<std::string> lastError() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace garnet::interp
