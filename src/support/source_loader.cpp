//===----------------------------------------------------------------------===//
//
// Part of the Xpresso project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_loader.cpp
// Purpose: Read source files into memory as a scoped resource.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The ifstream is scoped to the call and closed on every
//                     return path.
// Links: src/support/source_loader.hpp, docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "support/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace xpresso::support
{

namespace
{

Diag ioError(std::string message)
{
    return makeError({}, std::move(message), kIoFailureCode);
}

} // namespace

Expected<LoadedSource> loadSourceBuffer(const std::string &path, SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return ioError("unable to open " + path);

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    const auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    if (fileSize < 0 || static_cast<unsigned long long>(fileSize) > kMaxSourceBytes)
        return ioError("source file too large: " + path + " (limit: 256 MB)");

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return ioError("out of memory reading " + path);
    }
    if (in.bad())
        return ioError("error while reading " + path);

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
        return ioError(std::string{kSourceManagerFileIdOverflowMessage});

    LoadedSource source{};
    source.buffer = std::move(contents);
    source.fileId = fileId;
    return source;
}

} // namespace xpresso::support
