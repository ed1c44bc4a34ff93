//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "session/ResourceRegistry.hpp"

#include "support/path_utils.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{

CurlTagFetcher::CurlTagFetcher(HostTools &tools) : tools_(tools) {}

Expected<void> CurlTagFetcher::fetch(const std::string &url, const fs::path &destination)
{
    auto curl = tools_.findProgram("curl");
    if (!curl)
        return makeError(ErrorCode::TagFetch, "cannot fetch " + url + ": curl not found on PATH");

    RunResult result =
        tools_.run({*curl, "-fsSL", "-o", destination.string(), url});
    if (result.exit_code != 0)
    {
        std::string reason = result.out.empty() ? result.err : result.out;
        while (!reason.empty() && (reason.back() == '\n' || reason.back() == '\r'))
            reason.pop_back();
        if (reason.empty())
            reason = "curl exited with status " + std::to_string(result.exit_code);
        return makeError(ErrorCode::TagFetch, "error downloading tag file " + url + ": " + reason);
    }
    return {};
}

std::string normalizeUrl(std::string_view url)
{
    std::string out(url);
    if (out.empty() || out.back() != '/')
        out.push_back('/');
    return out;
}

Expected<std::string> renderFragment(const std::string &url, const std::string &tagName)
{
    nlohmann::ordered_json json;
    json["url"] = url;
    json["tagfile"] = tagName;
    try
    {
        return json.dump(2) + "\n";
    }
    catch (const nlohmann::json::exception &e)
    {
        return makeError(ErrorCode::InvalidConfiguration,
                         "cannot encode documentation fragment for " + tagName + ": " + e.what());
    }
}

Expected<DocumentationBundle> resolveDocumentation(const std::vector<TagPair> &pairs,
                                                   const RegistryContext &ctx,
                                                   TagFetcher &fetcher,
                                                   support::DiagnosticEngine &diags)
{
    DocumentationBundle bundle;
    std::set<std::string> names;
    for (const auto &pair : pairs)
    {
        const std::string url = normalizeUrl(pair.url);
        const std::string name = support::basename(pair.tag);
        if (name.empty())
            return makeError(ErrorCode::InvalidConfiguration, "empty documentation tag file name");
        // Fragments and fetched tag files are named after the tag's file name.
        if (!names.insert(name).second)
            return makeError(ErrorCode::InvalidConfiguration,
                             "documentation tag file name '" + name + "' is used more than once");

        fs::path tagFile;
        std::error_code ec;
        if (fs::path(pair.tag).is_absolute())
        {
            tagFile = support::normalizePath(pair.tag);
        }
        else if (fs::path local = support::absolutePath(pair.tag, ctx.sourceDir); fs::exists(local, ec))
        {
            tagFile = local;
        }
        else
        {
            const std::string remote = url + pair.tag;
            const fs::path staged = ctx.stagingDir / name;
            diags.note("fetching tag file from " + remote);
            if (auto fetched = fetcher.fetch(remote, staged); !fetched)
                return fetched.error();
            tagFile = ctx.binaryDir / name;
            bundle.downloads.push_back(StagedDownload{staged, tagFile});
        }

        auto fragment = renderFragment(url, name);
        if (!fragment)
            return fragment.error();
        bundle.fragments.push_back(GeneratedArtifact{ctx.binaryDir / (name + ".json"), std::move(fragment.value())});
        bundle.tagFiles.push_back(std::move(tagFile));
    }
    return bundle;
}

} // namespace clingkit::session
