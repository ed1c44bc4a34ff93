//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares the diagnostic record, error taxonomy and the engine that
//          collects messages for the command-line driver.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

/// @brief Records diagnostics and prints them later.
/// @invariant Counts reflect reported diagnostics.
/// @ownership Owns stored diagnostic messages.
namespace clingkit::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Classifies why an operation failed.
/// @details Every fatal condition of a session pass maps onto exactly one code
///          so callers and tests can branch without parsing message text.
enum class ErrorCode
{
    None,                 ///< Not an error (notes and warnings).
    PrerequisiteMissing,  ///< Interpreter absent while the session is required.
    UnknownTarget,        ///< Target name not present in the build graph.
    TargetKind,           ///< Target is not a shared library.
    StandardMismatch,     ///< Target needs a newer standard than the session.
    UnsupportedStandard,  ///< Requested standard outside {11, 14, 17}.
    PairingLength,        ///< Documentation URL and tag-file lists differ in size.
    InsecureUrl,          ///< Documentation URL does not use https://.
    IllegalAssetName,     ///< Logo file name is not one of the allowed names.
    TagFetch,             ///< Remote tag file could not be downloaded.
    Registration,         ///< External registration tool reported failure.
    InvalidConfiguration, ///< Malformed session file, graph or expression.
    Io                    ///< File system operation failed.
};

/// @brief Single diagnostic message.
struct Diagnostic
{
    Severity severity;                ///< Message severity
    std::string message;              ///< Human-readable text
    ErrorCode code = ErrorCode::None; ///< Failure class for errors
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    /// @param d Diagnostic to store.
    void report(Diagnostic d);

    /// @brief Record a note with message @p msg.
    void note(std::string msg);

    /// @brief Record a warning with message @p msg.
    void warning(std::string msg);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    /// @param includeNotes Whether note-severity entries are printed.
    void printAll(std::ostream &os, bool includeNotes = false) const;

    /// @brief All diagnostics recorded so far, in report order.
    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace clingkit::support
