//===----------------------------------------------------------------------===//
//
// Part of the Garnet project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/**
 * @file NodeKind.cpp
 * @brief Lookup tables for syntax node kind names and attributes.
 * @details
 *     Both tables are generated from `NodeKinds.def` and indexed by the
 *     enumerator value, so adding a kind to the table updates every query.
 */

#include "ast/NodeKind.hpp"

#include <array>

namespace garnet::ast
{
namespace
{
struct KindInfo
{
    std::string_view name;
    uint8_t flags;
};

constexpr std::array<KindInfo, kNumNodeKinds> kKindInfo = {{
#define GARNET_NODE(KIND, CLASS, FLAGS) {#CLASS, FLAGS},
#include "ast/NodeKinds.def"
#undef GARNET_NODE
}};

const KindInfo &info(NodeKind kind) noexcept
{
    return kKindInfo[static_cast<std::size_t>(kind)];
}
} // namespace

std::string_view toString(NodeKind kind) noexcept
{
    return info(kind).name;
}

bool hasNameAttribute(NodeKind kind) noexcept
{
    return (info(kind).flags & kNodeFlagNamed) != 0;
}

bool isInvisible(NodeKind kind) noexcept
{
    return (info(kind).flags & kNodeFlagInvisible) != 0;
}

} // namespace garnet::ast
