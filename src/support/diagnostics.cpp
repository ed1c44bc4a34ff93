/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The diagnostic engine aggregates messages emitted while a session is
 *     configured and keeps track of severity counts.  Diagnostics are stored
 *     until the driver explicitly prints or inspects them.
 */

#include "diagnostics.hpp"
#include "diag_expected.hpp"

namespace clingkit::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * The diagnostic is appended to the internal vector for later inspection.  The
 * method increments the error or warning counter depending on the diagnostic's
 * severity, leaving notes unchanged.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

void DiagnosticEngine::note(std::string msg)
{
    report(Diagnostic{Severity::Note, std::move(msg)});
}

void DiagnosticEngine::warning(std::string msg)
{
    report(Diagnostic{Severity::Warning, std::move(msg)});
}

/**
 * @brief Writes the stored diagnostics to the provided output stream.
 *
 * Notes carry progress information and are suppressed unless the caller asks
 * for them, mirroring a quiet-by-default command-line tool.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param includeNotes Print note-severity entries as well.
 */
void DiagnosticEngine::printAll(std::ostream &os, bool includeNotes) const
{
    for (const auto &d : diags_)
    {
        if (d.severity == Severity::Note && !includeNotes)
            continue;
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

} // namespace clingkit::support
