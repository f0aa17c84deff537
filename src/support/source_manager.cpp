//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Script path registry.  A path reached through different relative spellings
// ("lib/../src/a.gt", "src/a.gt") maps to one id, so trace lines and
// diagnostics print the same location text for the same script.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace garnet::support
{

uint32_t SourceManager::addFile(std::string_view path)
{
    std::string key = std::filesystem::path(path).lexically_normal().generic_string();
    if (auto it = ids_.find(key); it != ids_.end())
        return it->second;

    if (paths_.size() >= std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, "too many source files registered"), std::cerr);
        return 0;
    }

    const auto id = static_cast<uint32_t>(paths_.size() + 1);
    auto pos = ids_.emplace(std::move(key), id).first;
    paths_.push_back(&pos->first);
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > paths_.size())
        return {};
    return *paths_[file_id - 1];
}

} // namespace garnet::support
