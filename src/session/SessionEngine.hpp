//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/SessionEngine.hpp
// Purpose: Drives one session definition through collection, validation,
//          composition, documentation resolution, materialization and the
//          optional install steps.
// Key invariants: Validation failures leave the binary directory untouched;
//                 generation is repeatable and produces identical bytes.
// Ownership/Lifetime: The engine borrows its collaborators, which must outlive
//                     every call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/BuildGraph.hpp"
#include "session/HostTools.hpp"
#include "session/ResourceRegistry.hpp"
#include "session/SessionOptions.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clingkit::session
{

/// @brief Where a session is generated and installed.
struct EngineSettings
{
    std::filesystem::path sourceDir;
    std::filesystem::path binaryDir;
    std::optional<std::string> projectName;     ///< Overrides the graph's project name.
    std::optional<std::filesystem::path> prefix; ///< Overrides the interpreter prefix.
};

/// @brief What a pipeline run produced.
struct SessionOutcome
{
    /// @brief Set when the interpreter is absent and the session is optional.
    bool skipped = false;
    std::string displayName;
    std::string sessionId;
    std::string interpreter;
    std::vector<std::filesystem::path> written;
    std::vector<std::filesystem::path> fragments;
    std::vector<std::filesystem::path> tagFiles;
    bool noInstall = false;
};

class SessionEngine
{
  public:
    SessionEngine(const BuildGraph &graph,
                  HostTools &tools,
                  TagFetcher &fetcher,
                  support::DiagnosticEngine &diags);

    /// @brief Generate the header, manifest, logos and documentation fragments.
    support::Expected<SessionOutcome> generate(const SessionOptions &opts, const EngineSettings &settings);

    /// @brief Generate, install documentation when configured, then register.
    support::Expected<SessionOutcome> install(const SessionOptions &opts, const EngineSettings &settings);

    /// @brief Generate, then install the documentation fragments and tag files.
    support::Expected<SessionOutcome> installDocs(const SessionOptions &opts, const EngineSettings &settings);

  private:
    std::string projectNameFor(const EngineSettings &settings) const;
    std::filesystem::path prefixFor(const SessionOutcome &outcome, const EngineSettings &settings) const;
    support::Expected<void> installDocsFor(const SessionOutcome &outcome, const EngineSettings &settings);

    const BuildGraph &graph_;
    HostTools &tools_;
    TagFetcher &fetcher_;
    support::DiagnosticEngine &diags_;
};

} // namespace clingkit::session
