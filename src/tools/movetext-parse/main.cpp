//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the standalone `movetext-parse` CLI.  The executable parses type
// tags, struct tags, transaction arguments or name lists given inline or one
// per line in a file, prints their canonical rendering to stdout and reports
// failures on stderr.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"
#include "tools/movetext-parse/driver.hpp"

#include <iostream>

/// @brief Entry point for the `movetext-parse` binary.
/// @return 0 when every input parsed, 1 on usage or I/O errors, 2 when an
///         input was rejected.
int main(int argc, char **argv)
{
    movetext::support::SourceManager sm;
    return movetext::tools::textparse::runCLI(argc, argv, std::cout, std::cerr, sm);
}
