//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_loader.hpp
// Purpose: Load source files into memory for the front end and tools.
// Key invariants: A successful load holds the complete file contents and a
//                 non-zero SourceManager id.
// Ownership/Lifetime: The caller owns the returned LoadedSource. The file
//                     handle never outlives the call.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace xpresso::support
{

/// @brief Largest source file the loader accepts.
inline constexpr unsigned long long kMaxSourceBytes = 256ULL * 1024 * 1024;

/// @brief Stable code attached to loader failures.
inline constexpr const char *kIoFailureCode = "X0001";

/// @brief Result of loading a source file into memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the source file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager.
};

/// @brief Read @p path and register it with @p sm.
/// @return The loaded buffer, or a diagnostic for an unreadable file, a file
///         over kMaxSourceBytes, memory exhaustion or SourceManager overflow.
Expected<LoadedSource> loadSourceBuffer(const std::string &path, SourceManager &sm);

} // namespace xpresso::support
