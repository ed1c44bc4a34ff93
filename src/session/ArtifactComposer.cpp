//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/ArtifactComposer.cpp
// Purpose: Header and manifest composition plus rendering.
//
// The header is a sequence of interpreter pragmas:
//
//   #pragma cling add_include_path("<dir>")     one per include item
//   #pragma cling add_library_path("<dir>")     one per library directory
//   #pragma cling load("<lib>")                 one per link item
//   #include<<header>>                          one per setup header
//
// The manifest argv is: interpreter, -f, {connection_file}, -std=c++N, the
// compile flags, -D<definition> per definition, -include <header path>.
//
//===----------------------------------------------------------------------===//

#include "session/ArtifactComposer.hpp"

#include "support/path_utils.hpp"
#include "support/uuid.hpp"

#include <nlohmann/json.hpp>

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{
namespace
{

void addPieces(TextTemplate &text,
               const std::vector<PropertyValue> &values,
               const std::string &before,
               const std::string &after)
{
    for (const auto &value : values)
        text.pieces.push_back(TemplatePiece{value, before, after});
}

TextTemplate composeHeader(const SessionRequest &request)
{
    TextTemplate text;
    addPieces(text, request.includeDirectories, "#pragma cling add_include_path(\"", "\")\n");
    addPieces(text, request.libraryDirectories, "#pragma cling add_library_path(\"", "\")\n");
    addPieces(text, request.linkLibraries, "#pragma cling load(\"", "\")\n");
    for (const auto &header : request.setupHeaders)
        text.pieces.push_back(TemplatePiece{LiteralValue{header}, "#include<", ">\n"});
    return text;
}

ArgumentTemplate literalArgument(std::string text)
{
    return ArgumentTemplate{LiteralValue{std::move(text)}, ""};
}

ManifestTemplate composeManifest(const SessionRequest &request,
                                 const ComposeContext &ctx,
                                 const std::string &displayName,
                                 const std::filesystem::path &headerPath)
{
    const std::string level = toNumber(request.standard);

    ManifestTemplate manifest;
    manifest.displayName = displayName;
    manifest.language = "C++" + level;

    manifest.argv.push_back(literalArgument(ctx.interpreter));
    manifest.argv.push_back(literalArgument("-f"));
    manifest.argv.push_back(literalArgument(std::string(kConnectionFilePlaceholder)));
    manifest.argv.push_back(literalArgument("-std=c++" + level));
    for (const auto &flag : request.compileFlags)
        manifest.argv.push_back(ArgumentTemplate{flag, ""});
    for (const auto &definition : request.compileDefinitions)
        manifest.argv.push_back(ArgumentTemplate{definition, "-D"});
    manifest.argv.push_back(literalArgument("-include"));
    manifest.argv.push_back(literalArgument(headerPath.generic_string()));
    return manifest;
}

} // namespace

std::string defaultDisplayName(CxxStandard standard, std::string_view project)
{
    return "C++" + toNumber(standard) + " (" + std::string(project) + ")";
}

std::string deriveSessionId(std::string_view displayName)
{
    return support::formatUuid(support::uuidV5(support::kNilUuid, displayName));
}

ComposedSession composeSession(const SessionRequest &request, const ComposeContext &ctx)
{
    ComposedSession session;
    session.displayName =
        request.kernelName ? *request.kernelName : defaultDisplayName(request.standard, ctx.projectName);
    session.sessionId = deriveSessionId(session.displayName);

    session.headerPath = ctx.binaryDir / std::string(kHeaderFileName);
    session.manifestPath = ctx.binaryDir / std::string(kManifestFileName);
    session.header = composeHeader(request);
    session.manifest = composeManifest(request, ctx, session.displayName, session.headerPath);

    for (const auto &logo : request.logoFiles)
    {
        std::filesystem::path source(support::absolutePath(logo, ctx.sourceDir));
        session.logos.push_back(AssetCopy{source, ctx.binaryDir / support::basename(logo)});
    }
    return session;
}

Expected<std::string> renderText(const TextTemplate &text, const BuildGraph &graph)
{
    std::string out;
    for (const auto &piece : text.pieces)
    {
        auto items = graph.resolve(piece.value);
        if (!items)
            return items.error();
        for (const auto &item : items.value())
            out += piece.before + item + piece.after;
    }
    return out;
}

Expected<std::string> renderManifest(const ManifestTemplate &manifest, const BuildGraph &graph)
{
    nlohmann::ordered_json argv = nlohmann::ordered_json::array();
    for (const auto &arg : manifest.argv)
    {
        auto items = graph.resolve(arg.value);
        if (!items)
            return items.error();
        for (const auto &item : items.value())
            argv.push_back(arg.prefix + item);
    }

    nlohmann::ordered_json json;
    json["display_name"] = manifest.displayName;
    json["argv"] = std::move(argv);
    json["language"] = manifest.language;
    try
    {
        return json.dump(2) + "\n";
    }
    catch (const nlohmann::json::exception &e)
    {
        // dump() rejects strings that are not valid UTF-8.
        return makeError(ErrorCode::InvalidConfiguration, std::string("cannot encode kernel manifest: ") + e.what());
    }
}

} // namespace clingkit::session
