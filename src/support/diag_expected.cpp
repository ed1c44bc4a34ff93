//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library.  The utilities defined here wrap structured diagnostics around an
// Expected<void> type, provide consistent severity-to-string mapping, and print
// diagnostics in the compiler-style "severity: message" form.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.
/// @details Every stage of a session pass leans on `Expected` to propagate
///          recoverable failures.  This translation unit gathers constructors,
///          severity conversions, and printers so the driver reports errors
///          from disparate stages uniformly.

#include "diag_expected.hpp"

namespace clingkit::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
///
/// @details A default-constructed `Expected` contains no diagnostic payload and
///          represents success.
///
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

/// @brief Allow Expected<void> to participate directly in boolean tests.
Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
///
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
///
/// @return Reference to the stored diagnostic payload.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace detail
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

/// @brief Build an error diagnostic with the provided classification.
///
/// @param code Failure class recorded for programmatic inspection.
/// @param msg Human-readable description of the problem.
/// @return Diagnostic populated with error severity.
Diag makeError(ErrorCode code, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), code};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details The formatted severity string comes from
///          `detail::diagSeverityToString()` to keep wording consistent.  The
///          function always emits a trailing newline so multiple diagnostics
///          appear as a contiguous block.
void printDiag(const Diag &diag, std::ostream &os)
{
    os << detail::diagSeverityToString(diag.severity) << ": " << diag.message << '\n';
}
} // namespace clingkit::support
