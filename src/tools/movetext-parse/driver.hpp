//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the helpers powering the `movetext-parse` CLI.  The entry point is
// factored into a separate unit so tests can run the tool in-process with
// string streams and a SourceManager they inspect afterwards.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Exposes the reusable pipeline behind the `movetext-parse` executable.

#pragma once

#include "support/diag_expected.hpp"
#include "support/options.hpp"
#include "support/source_manager.hpp"
#include "tools/common/ArgvView.hpp"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace movetext::tools::textparse
{

/// @brief Exit status when every input parsed.
inline constexpr int kExitOk = 0;
/// @brief Exit status for usage errors and unreadable files.
inline constexpr int kExitUsage = 1;
/// @brief Exit status when at least one input failed to parse.
inline constexpr int kExitParseFailure = 2;

/// @brief Version banner printed by `--version`.
inline constexpr std::string_view kVersionBanner = "movetext-parse v0.1.0";

/// @brief Translate the arguments after the program name into options.
/// @return Parsed options, or a diagnostic describing the usage error.
support::Expected<support::Options> parseCommandLine(ArgvView args);

/// @brief Parse @p text with the grammar selected by @p mode.
/// @return One output line per parsed item, or the parse diagnostic.
support::Expected<std::vector<std::string>> renderInput(support::ParseMode mode,
                                                        std::string_view text);

/// @brief Execute the movetext-parse CLI workflow with injectable streams.
/// @param argc Argument count including the program name.
/// @param argv Argument vector including the program name.
/// @param out Stream receiving rendered results and trace lines.
/// @param err Stream receiving usage text and diagnostics.
/// @param sm Source manager that registers the `--file` input.
/// @return kExitOk, kExitUsage or kExitParseFailure.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm);

} // namespace movetext::tools::textparse
