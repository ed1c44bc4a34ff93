//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/ResourceRegistry.hpp
// Purpose: Pairs documentation URLs with tag files, locates or fetches each
//          tag file and prepares the per-pair documentation fragments.
// Key invariants: Fragments and tag files are index-aligned with the input
//                 pairs. Fetched files land in the staging directory and are
//                 only moved to the binary directory by the output transaction.
// Ownership/Lifetime: The TagFetcher is borrowed for the duration of a call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/HostTools.hpp"
#include "session/SessionRequest.hpp"
#include "support/diag_expected.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace clingkit::session
{

/// @brief Downloads a single remote tag file.
class TagFetcher
{
  public:
    virtual ~TagFetcher() = default;

    /// @brief Download @p url into @p destination, overwriting it.
    /// @return TagFetch error carrying the transport message on failure.
    virtual support::Expected<void> fetch(const std::string &url,
                                          const std::filesystem::path &destination) = 0;
};

/// @brief TagFetcher that shells out to curl through HostTools.
class CurlTagFetcher final : public TagFetcher
{
  public:
    explicit CurlTagFetcher(HostTools &tools);

    support::Expected<void> fetch(const std::string &url,
                                  const std::filesystem::path &destination) override;

  private:
    HostTools &tools_;
};

/// @brief A fetched file waiting in the staging area.
struct StagedDownload
{
    std::filesystem::path staged;
    std::filesystem::path destination;
};

/// @brief Result of resolving all documentation pairs.
struct DocumentationBundle
{
    std::vector<GeneratedArtifact> fragments;    ///< One per pair, same order.
    std::vector<std::filesystem::path> tagFiles; ///< Final location of each tag file.
    std::vector<StagedDownload> downloads;       ///< Fetched files to commit.
};

/// @brief Directories consulted while resolving tag files.
struct RegistryContext
{
    std::filesystem::path sourceDir;
    std::filesystem::path binaryDir;
    std::filesystem::path stagingDir;
};

/// @brief Append a trailing '/' to @p url unless it already has one.
std::string normalizeUrl(std::string_view url);

/// @brief JSON text of the fragment describing one documentation pair.
/// @return The text, or InvalidConfiguration when a value is not valid UTF-8.
support::Expected<std::string> renderFragment(const std::string &url, const std::string &tagName);

/// @brief Resolve every pair of @p pairs in order.
/// @details A tag given as an absolute path is used as-is, then a path
///          relative to the source directory is tried, otherwise the file is
///          fetched from `url + tag`. The first failed fetch aborts the call.
support::Expected<DocumentationBundle> resolveDocumentation(const std::vector<TagPair> &pairs,
                                                            const RegistryContext &ctx,
                                                            TagFetcher &fetcher,
                                                            support::DiagnosticEngine &diags);

} // namespace clingkit::session
