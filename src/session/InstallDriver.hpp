//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/InstallDriver.hpp
// Purpose: Prerequisite discovery, documentation installation and kernel
//          registration with the notebook server.
// Key invariants: Registration is keyed by the session identifier, so running
//                 it repeatedly replaces the same registration.
// Ownership/Lifetime: HostTools and DiagnosticEngine are borrowed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/HostTools.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clingkit::session
{

/// @brief Name of the interpreter executable.
inline constexpr std::string_view kInterpreterProgram = "xcpp";

/// @brief Name of the registration tool.
inline constexpr std::string_view kRegistrationProgram = "jupyter";

/// @brief Host programs located before a pipeline run.
struct Prerequisites
{
    std::optional<std::string> interpreter;
    std::optional<std::string> registrar;
};

/// @brief Locate the interpreter and the registration tool.
/// @param required When true a missing interpreter is an error.
/// @return PrerequisiteMissing when @p required and the interpreter is absent.
support::Expected<Prerequisites> checkPrerequisites(const HostTools &tools, bool required);

/// @brief Installation prefix of @p interpreter: the parent of its bin directory.
std::filesystem::path interpreterPrefix(const std::filesystem::path &interpreter);

/// @brief Destination directories below an installation prefix.
struct InstallLayout
{
    std::filesystem::path fragmentDir; ///< <prefix>/etc/xeus-cling/tags.d
    std::filesystem::path tagFileDir;  ///< <prefix>/share/xeus-cling/tagfiles
};

InstallLayout installLayout(const std::filesystem::path &prefix);

/// @brief Copy fragments and tag files into the interpreter's documentation
///        directories, creating them when needed.
support::Expected<void> installDocumentation(const std::vector<std::filesystem::path> &fragments,
                                             const std::vector<std::filesystem::path> &tagFiles,
                                             const std::filesystem::path &prefix,
                                             support::DiagnosticEngine &diags);

/// @brief Command line registering the kernel in @p binaryDir as @p sessionId.
std::vector<std::string> registrationCommand(const std::string &registrar,
                                             const std::filesystem::path &binaryDir,
                                             const std::string &sessionId);

/// @brief Register the kernel in @p binaryDir with the notebook server.
/// @details A missing registration tool only warns; a non-zero exit is a
///          Registration error carrying the tool's output.
support::Expected<void> registerKernel(const std::filesystem::path &binaryDir,
                                       const std::string &sessionId,
                                       HostTools &tools,
                                       support::DiagnosticEngine &diags);

} // namespace clingkit::session
