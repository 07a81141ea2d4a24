/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The engine aggregates the failures produced while a tool parses several
 *     inputs and counts the errors among them.  Diagnostics are stored until
 *     callers explicitly print or inspect them.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"
#include "source_manager.hpp"

namespace movetext::support
{
/**
 * @brief Adds a diagnostic to the engine and updates the error counter.
 *
 * Notes and warnings are stored but not counted.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag`, which knows how to incorporate
 * optional source locations when a `SourceManager` is supplied.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate file identifiers.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

/// @return Number of stored diagnostics with severity `Error`.
size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}
} // namespace movetext::support
