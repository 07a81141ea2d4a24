//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: Shared helper for loading input files used by the command-line tools.
// Key invariants: LoadedSource accurately captures file contents and SourceManager registration.
// Ownership/Lifetime: The caller owns the returned LoadedSource and may use it after the call.
// Links: docs/grammar.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <string>

namespace movetext::tools::common
{

/// @brief Result of loading an input file into memory.
struct LoadedSource
{
    std::string buffer; ///< Full contents of the file.
    uint32_t fileId{0}; ///< Identifier assigned by SourceManager (0 indicates failure).
};

/// @brief Load an input file into memory and register it with the source manager.
///
/// Opens @p path, reads the entire file into a string buffer, and registers the
/// file with @p sm so diagnostics can resolve the location later.
///
/// @param path Filesystem path to the input file.
/// @param sm Source manager tracking file identifiers for diagnostics.
/// @return Loaded source buffer on success; otherwise a diagnostic describing
///         the I/O failure or SourceManager overflow.
support::Expected<LoadedSource> loadSourceBuffer(const std::string &path,
                                                 support::SourceManager &sm);

} // namespace movetext::tools::common
