//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps file identifiers used in SourceLoc back to file paths.
// Key invariants: Identifier 0 is never assigned; a path registered twice
//                 keeps its first identifier.
// Ownership/Lifetime: Owns the normalized path strings; views returned by
//                     getPath() live as long as the manager.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace xpresso::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// @brief Registry of the files a run has opened.
class SourceManager
{
  public:
    /// @brief Register @p path and return its identifier.
    /// @return Identifier > 0, or 0 when the identifier space is exhausted.
    uint32_t addFile(std::string path);

    /// @brief Path registered under @p file_id, or an empty view.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Number of registered files.
    [[nodiscard]] std::size_t fileCount() const
    {
        return files_.size();
    }

  private:
    /// Paths indexed by identifier - 1. A deque keeps views stable on growth.
    std::deque<std::string> files_;

    /// Next identifier; 64-bit so overflow of the 32-bit space is detectable.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace xpresso::support
