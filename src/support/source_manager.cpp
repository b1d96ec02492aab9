//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief File identifier registry used by diagnostics.
/// @details Paths are normalized lexically so `dir/../a.xp` and `a.xp` share
///          one identifier and diagnostics print forward slashes everywhere.

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <iostream>
#include <limits>

namespace xpresso::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a path, reusing the identifier of an equal normalized path.
/// @details Exhaustion of the 32-bit identifier space is reported on stderr
///          and signalled to the caller with the sentinel 0.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        printDiag(makeError({}, std::string{kSourceManagerFileIdOverflowMessage}), std::cerr);
        return 0;
    }

    const auto fileId = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), fileId);
    return fileId;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}
} // namespace xpresso::support
