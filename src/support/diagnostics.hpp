//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Diagnostic record and the log a Runner keeps of failed runs.
// Key invariants: Diagnostics are kept in report order.
// Ownership/Lifetime: The engine owns its diagnostics.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/source_location.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace garnet::support
{

enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief One message, optionally located at a node's start line.
struct Diagnostic
{
    Severity severity;
    std::string message;
    SourceLoc loc;
};

/// @brief Append-only log of diagnostics.
class DiagnosticEngine
{
  public:
    void report(Diagnostic d);

    /// @brief Number of diagnostics with Severity::Error.
    std::size_t errorCount() const;

    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
};

} // namespace garnet::support
