//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/SessionRequest.hpp
// Purpose: Aggregated configuration of one interpreter session, the value
//          threaded from collection through validation to composition.
// Key invariants: Manual entries precede target-derived entries in every
//                 property sequence; documentation pairs are index aligned.
// Ownership/Lifetime: Value type; stages take it by const reference and never
//                     mutate it after PropertyCollector returns it.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/BuildGraph.hpp"
#include "session/CxxStandard.hpp"
#include "session/PropertyValue.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clingkit::session
{

/// @brief Snapshot of a target taken when the session was collected.
struct CollectedTarget
{
    std::string name;
    TargetKind kind = TargetKind::SharedLibrary;
    std::optional<CxxStandard> standard;
};

/// @brief One (documentation URL, tag-file identifier) pair.
struct TagPair
{
    std::string url; ///< As given; normalized by ResourceRegistry.
    std::string tag; ///< Absolute path, source-relative path or bare file name.
};

/// @brief Fully aggregated session configuration.
struct SessionRequest
{
    std::vector<CollectedTarget> targets;
    std::vector<PropertyValue> includeDirectories;
    std::vector<PropertyValue> libraryDirectories;
    std::vector<PropertyValue> linkLibraries;
    std::vector<PropertyValue> compileFlags;
    std::vector<PropertyValue> compileDefinitions;
    std::vector<std::string> setupHeaders;
    std::optional<std::string> kernelName;
    CxxStandard standard = kDefaultStandard;
    bool required = false;
    bool noInstall = false;
    std::vector<std::string> logoFiles;
    std::vector<TagPair> documentation;
};

/// @brief File content destined for the binary directory.
struct GeneratedArtifact
{
    std::filesystem::path path;
    std::string text;
};

} // namespace clingkit::session
