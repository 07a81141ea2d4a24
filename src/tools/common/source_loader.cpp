//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Standardise how command-line tools load input files into memory.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: The returned LoadedSource owns its buffer.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Provides the input file loading helper for the CLI tools.

#include "tools/common/source_loader.hpp"

#include <fstream>
#include <new>
#include <sstream>

namespace movetext::tools::common
{

support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return support::makeError({}, "unable to open " + path);
    }

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(64ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return support::makeError({}, "input file too large: " + path + " (limit: 64 MB)");
    }

    std::string contents;
    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        contents = ss.str();
    }
    catch (const std::bad_alloc &)
    {
        return support::makeError({}, "out of memory reading " + path);
    }

    const uint32_t fileId = sm.addFile(path);
    if (fileId == 0)
    {
        return support::makeError({}, std::string{support::kSourceManagerFileIdOverflowMessage});
    }

    LoadedSource source{};
    source.buffer = std::move(contents);
    source.fileId = fileId;
    return source;
}

} // namespace movetext::tools::common
