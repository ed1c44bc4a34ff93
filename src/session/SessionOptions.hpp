//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/SessionOptions.hpp
// Purpose: Raw session definition exactly as the user wrote it, plus the
//          parsers for the session file and the keyword-argument form.
// Key invariants: Values are stored unvalidated; ConstraintValidator checks them.
// Ownership/Lifetime: Caller owns the returned options.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clingkit::session
{

/// @brief One interpreter session definition.
struct SessionOptions
{
    std::vector<std::string> targets;
    std::vector<std::string> includeDirectories;
    std::vector<std::string> linkLibraries;
    std::vector<std::string> libraryDirectories;
    std::vector<std::string> compileFlags;
    std::vector<std::string> compileDefinitions;
    std::vector<std::string> setupHeaders;
    std::vector<std::string> doxygenUrls;
    std::vector<std::string> doxygenTagfiles;
    std::vector<std::string> kernelLogoFiles;

    /// @brief Display name; defaults to "C++<N> (<project>)".
    std::optional<std::string> kernelName;

    /// @brief Requested standard as written; defaults to 17.
    std::optional<std::string> cxxStandard;

    /// @brief Fail when the interpreter is not installed.
    bool required = false;

    /// @brief Never register the session with the external tool.
    bool noInstall = false;
};

/// @brief Parse keyword arguments with `cmake_parse_arguments` semantics.
///
/// Option keywords (REQUIRED, NO_INSTALL) set flags; single-value keywords
/// (CXX_STANDARD, KERNEL_NAME) take the next token, the last occurrence
/// winning; every other keyword collects tokens until the next keyword.
/// Tokens before the first keyword are reported as a warning in @p diags.
SessionOptions parseSessionArguments(const std::vector<std::string> &tokens,
                                     support::DiagnosticEngine &diags);

/// @brief Split one session-file line into tokens.
/// @details Whitespace separates tokens, double quotes group text containing
///          whitespace (with `\"` and `\\` escapes) and `#` outside quotes
///          starts a comment.
/// @return Tokens, or an error message for an unterminated quote.
support::Expected<std::vector<std::string>> tokenizeSessionLine(const std::string &line);

/// @brief Read the keyword tokens of a session file.
///
/// Lines beginning with an unknown keyword produce a `path:line:` warning and
/// are skipped. The tokens of the remaining lines are returned in file order.
support::Expected<std::vector<std::string>> readSessionFile(const std::filesystem::path &path,
                                                            support::DiagnosticEngine &diags);

/// @brief Whether @p token is one of the recognised configuration keywords.
bool isSessionKeyword(const std::string &token);

} // namespace clingkit::session
