//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Resolves the file ids carried by node locations to script paths
//          for trace lines and diagnostics.
// Key invariants: Id 0 is never issued; id N names the Nth distinct
//                 normalized path.
// Ownership/Lifetime: Owns the path strings; returned views live as long as
//                     the manager.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace garnet::support
{

/// @brief Registry of script paths referenced by SourceLoc::file_id.
class SourceManager
{
  public:
    /// @brief Register @p path, normalized lexically.
    /// @return The path's id; the same id for a path already registered, or 0
    ///         when no id is left.
    uint32_t addFile(std::string_view path);

    /// @brief Path registered under @p file_id, or an empty view.
    std::string_view getPath(uint32_t file_id) const;

  private:
    std::map<std::string, uint32_t, std::less<>> ids_;
    std::vector<const std::string *> paths_; ///< Keys of ids_, by id - 1.
};

} // namespace garnet::support
