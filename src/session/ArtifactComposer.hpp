//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/ArtifactComposer.hpp
// Purpose: Turns a validated SessionRequest into the bootstrap header and the
//          session manifest, kept as templates over deferred values until the
//          host build graph renders them.
// Key invariants: Composition never resolves a deferred value; rendering
//                 resolves each value exactly once through the BuildGraph.
// Ownership/Lifetime: Templates own copies of every value they reference.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/BuildGraph.hpp"
#include "session/SessionRequest.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace clingkit::session
{

/// @brief File name of the generated bootstrap header.
inline constexpr std::string_view kHeaderFileName = "xeus_cling.hh";

/// @brief File name of the generated session manifest.
inline constexpr std::string_view kManifestFileName = "kernel.json";

/// @brief Placeholder the notebook server substitutes with its connection file.
inline constexpr std::string_view kConnectionFilePlaceholder = "{connection_file}";

/// @brief One templated run of text: every resolved item of @p value is
///        emitted as `before + item + after`.
struct TemplatePiece
{
    PropertyValue value;
    std::string before;
    std::string after;
};

/// @brief Text whose content depends on deferred values.
struct TextTemplate
{
    std::vector<TemplatePiece> pieces;
};

/// @brief Argument list entry: each resolved item becomes `prefix + item`.
struct ArgumentTemplate
{
    PropertyValue value;
    std::string prefix;
};

/// @brief Session manifest before deferred arguments are resolved.
struct ManifestTemplate
{
    std::string displayName;
    std::vector<ArgumentTemplate> argv;
    std::string language;
};

/// @brief File copied verbatim into the output directory.
struct AssetCopy
{
    std::filesystem::path source;
    std::filesystem::path destination;
};

/// @brief Facts about the environment a session is composed for.
struct ComposeContext
{
    std::string interpreter;          ///< Absolute path of the interpreter binary.
    std::string projectName;          ///< Enclosing project, used in the default name.
    std::filesystem::path sourceDir;  ///< Directory relative inputs resolve against.
    std::filesystem::path binaryDir;  ///< Directory artifacts are written to.
};

/// @brief Everything one session produces, prior to rendering.
struct ComposedSession
{
    std::string displayName;
    std::string sessionId;
    std::filesystem::path headerPath;
    TextTemplate header;
    std::filesystem::path manifestPath;
    ManifestTemplate manifest;
    std::vector<AssetCopy> logos;
};

/// @brief "C++<N> (<project>)".
std::string defaultDisplayName(CxxStandard standard, std::string_view project);

/// @brief Stable identifier of a session: UUIDv5 of @p displayName.
std::string deriveSessionId(std::string_view displayName);

/// @brief Compose the header and manifest templates for @p request.
ComposedSession composeSession(const SessionRequest &request, const ComposeContext &ctx);

/// @brief Resolve every piece of @p text through @p graph.
support::Expected<std::string> renderText(const TextTemplate &text, const BuildGraph &graph);

/// @brief Resolve the manifest arguments and serialise it as JSON.
support::Expected<std::string> renderManifest(const ManifestTemplate &manifest, const BuildGraph &graph);

} // namespace clingkit::session
