//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/**
 * @file diagnostics.cpp
 * @brief Diagnostic log kept by the Runner facade.
 * @details
 *     Rendering is left to `printDiag` so that logged and ad-hoc diagnostics
 *     share one format.
 */

#include "support/diagnostics.hpp"

#include <algorithm>
#include <utility>

namespace garnet::support
{

void DiagnosticEngine::report(Diagnostic d)
{
    diags_.push_back(std::move(d));
}

std::size_t DiagnosticEngine::errorCount() const
{
    return static_cast<std::size_t>(std::count_if(
        diags_.begin(), diags_.end(), [](const Diagnostic &d) { return d.severity == Severity::Error; }));
}

} // namespace garnet::support
