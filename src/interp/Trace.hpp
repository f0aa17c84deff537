//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Trace.hpp
// Purpose: Declare tracing configuration and sink for node evaluation.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows the
//                     output stream and source manager.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>

namespace garnet::ast
{
class Node;
} // namespace garnet::ast

namespace garnet::support
{
class SourceManager;
} // namespace garnet::support

namespace garnet::interp
{

/// @brief Configuration for evaluation tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,  ///< Tracing disabled
        Nodes ///< One line per evaluated node
    } mode{Off};

    /// @brief Optional source manager for resolving file paths.
    const garnet::support::SourceManager *sm = nullptr;

    /// @brief Destination stream; std::cerr when null.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record that @p node is about to be evaluated.
    /// @details Emits `[eval] KindName location`.
    void onEval(const garnet::ast::Node &node);

    const TraceConfig &config() const
    {
        return cfg;
    }

  private:
    TraceConfig cfg; ///< Active configuration
};

} // namespace garnet::interp
