//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source location value attached to every syntax node.
// Key invariants: file_id == 0 denotes an unregistered file; line/column are
//                 1-based when present and 0 when unknown.
// Ownership/Lifetime: Value type with no dynamic ownership.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace garnet::support
{

class SourceManager;

/// @brief Represents an absolute position within a source file.
/// @invariant file_id == 0 indicates a file unknown to the SourceManager.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes an unknown file.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a registered file and line.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a concrete file identifier is attached.
    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    /// @brief Determine whether a 1-based column number is available.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }

    friend bool operator==(const SourceLoc &, const SourceLoc &) = default;
};

/// @brief Render @p loc as "path:line[:column]" or "line N" when no path is known.
/// @param loc Location to render.
/// @param sm Optional source manager used to resolve the file path.
std::string formatLoc(const SourceLoc &loc, const SourceManager *sm = nullptr);

} // namespace garnet::support
