//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/clingkit/cli.hpp
// Purpose: Option parsing and subcommand handlers for the clingkit driver.
// Key invariants: Paths in CliOptions are exactly as given on the command line.
// Ownership/Lifetime: Handlers own every object they create for one run.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/HostTools.hpp"
#include "session/ResourceRegistry.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace clingkit::cli
{

/// @brief Options shared by the generate, install and install-docs commands.
struct CliOptions
{
    std::optional<std::filesystem::path> sessionFile;
    std::optional<std::filesystem::path> graphFile;
    std::optional<std::filesystem::path> sourceDir;
    std::optional<std::filesystem::path> binaryDir;
    std::optional<std::filesystem::path> prefix;
    std::optional<std::string> project;
    bool verbose = false;

    /// @brief Session keywords and values following `--`.
    std::vector<std::string> sessionArgs;
};

/// @brief Result of parsing the command line of a subcommand.
enum class CliParseResult
{
    Ok,      ///< Options parsed; run the command.
    Help,    ///< -h/--help was given.
    Version, ///< --version was given.
    Error    ///< Malformed command line; see the error text.
};

/// @brief Parse subcommand options from @p argv.
/// @param error Receives a one-line description when Error is returned.
CliParseResult parseCliOptions(int argc, char **argv, CliOptions &opts, std::string &error);

/// @brief Pipeline entry selected by the subcommand.
enum class SessionAction
{
    Generate,
    Install,
    InstallDocs
};

/// @brief Run @p action with explicit host collaborators.
/// @return Process exit status: 0 on success, 1 on any error.
int runSessionAction(SessionAction action,
                     const CliOptions &opts,
                     session::HostTools &tools,
                     session::TagFetcher &fetcher,
                     std::ostream &err);

/// @brief Handle `clingkit generate`.
int cmdGenerate(int argc, char **argv);

/// @brief Handle `clingkit install`.
int cmdInstall(int argc, char **argv);

/// @brief Handle `clingkit install-docs`.
int cmdInstallDocs(int argc, char **argv);

} // namespace clingkit::cli
