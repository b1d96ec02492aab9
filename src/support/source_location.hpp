//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the source position carried by tokens, tree nodes and
//          diagnostics.
// Key invariants: Lines and columns are 1-based; 0 means "unknown".
// Ownership/Lifetime: Plain value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace xpresso::support
{

/// @brief Position of a character within a registered source buffer.
/// @invariant file_id == 0 means the buffer was never registered with a
///            SourceManager (in-memory sources used by tests and tools).
struct SourceLoc
{
    /// @brief Identifier handed out by SourceManager::addFile; 0 when absent.
    uint32_t file_id = 0;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number; 0 when unknown.
    uint32_t column = 0;

    /// @brief True when a line number is attached.
    [[nodiscard]] bool isValid() const;

    /// @brief True when the location names a registered file.
    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    /// @brief True when a column is attached in addition to the line.
    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace xpresso::support
