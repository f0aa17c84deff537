//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the out-of-line helpers for the SourceLoc value type.  A location
// is valid when it names a registered file and a line; columns are optional
// because the tree-walking interpreter only reports start lines.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements validity queries and formatting for `SourceLoc`.

#include "support/source_location.hpp"
#include "support/source_manager.hpp"

namespace garnet::support
{
/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses monotonically increasing identifiers for
///          every registered file and the default-constructed location uses
///          zero for both file and line.  Synthesized nodes built by rewriting
///          passes usually keep a line but no file, so both components are
///          required before a location counts as valid.
///
/// @return True when the location has both a file and a line.
bool SourceLoc::isValid() const
{
    return file_id != 0 && line != 0;
}

/// @brief Render a location for trace output and diagnostics.
///
/// @details When the source manager can resolve the file identifier the
///          result follows the compiler convention "path:line[:column]".
///          Otherwise only the line is reported, since every syntax node is
///          guaranteed to carry one.
///
/// @param loc Location to render.
/// @param sm Optional source manager for path resolution.
/// @return Human-readable location string.
std::string formatLoc(const SourceLoc &loc, const SourceManager *sm)
{
    std::string out;
    if (sm && loc.hasFile())
    {
        auto path = sm->getPath(loc.file_id);
        if (!path.empty())
        {
            out.append(path);
            out += ':';
            out += std::to_string(loc.line);
            if (loc.hasColumn())
            {
                out += ':';
                out += std::to_string(loc.column);
            }
            return out;
        }
    }
    out = "line ";
    out += std::to_string(loc.line);
    return out;
}
} // namespace garnet::support
