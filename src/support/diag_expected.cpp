//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used by the evaluation
// facade.  Severity-to-string mapping and diagnostic printing live here so
// every report, whether collected by a DiagnosticEngine or printed directly,
// uses the same "path:line:column: severity: message" layout.
//
//===----------------------------------------------------------------------===//

#include "support/diag_expected.hpp"

namespace garnet::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag)) {}

/// @brief Success is indicated by the absence of a stored diagnostic.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must ensure the Expected represents an error.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic with the provided location and message.
Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), loc};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When the source manager resolves the file identifier the message
///          is prefixed with "<path>:<line>[:<column>]: ".  A location with a
///          line but no known file is prefixed with "line <n>: " so that
///          diagnostics for synthesized trees still point somewhere.  The
///          function always emits a trailing newline.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
/// @param sm Optional source manager for mapping file identifiers to paths.
void printDiag(const Diag &diag, std::ostream &os, const SourceManager *sm)
{
    if (diag.loc.hasLine())
        os << formatLoc(diag.loc, sm) << ": ";
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace garnet::support
