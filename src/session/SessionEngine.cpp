//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/SessionEngine.cpp
// Purpose: Pipeline ordering for generate/install/install-docs.
//
// Order of work in generate():
//   1. prerequisites (a missing optional interpreter ends the run quietly)
//   2. option validation (standard, pairing, URLs, asset names)
//   3. property collection and request validation
//   4. composition and rendering of deferred values
//   5. documentation resolution (may fetch into the staging area)
//   6. a single output transaction
// Nothing is written to the binary directory before step 6.
//
//===----------------------------------------------------------------------===//

#include "session/SessionEngine.hpp"

#include "session/ArtifactComposer.hpp"
#include "session/ConstraintValidator.hpp"
#include "session/InstallDriver.hpp"
#include "session/OutputTransaction.hpp"
#include "session/PropertyCollector.hpp"

#include <system_error>

namespace fs = std::filesystem;

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{

SessionEngine::SessionEngine(const BuildGraph &graph,
                             HostTools &tools,
                             TagFetcher &fetcher,
                             support::DiagnosticEngine &diags)
    : graph_(graph), tools_(tools), fetcher_(fetcher), diags_(diags)
{
}

std::string SessionEngine::projectNameFor(const EngineSettings &settings) const
{
    if (settings.projectName)
        return *settings.projectName;
    std::string name = graph_.projectName();
    if (name.empty())
        name = settings.sourceDir.lexically_normal().filename().string();
    return name;
}

fs::path SessionEngine::prefixFor(const SessionOutcome &outcome, const EngineSettings &settings) const
{
    if (settings.prefix)
        return *settings.prefix;
    return interpreterPrefix(outcome.interpreter);
}

Expected<SessionOutcome> SessionEngine::generate(const SessionOptions &opts, const EngineSettings &settings)
{
    SessionOutcome outcome;

    auto prereqs = checkPrerequisites(tools_, opts.required);
    if (!prereqs)
        return prereqs.error();
    if (!prereqs.value().interpreter)
    {
        diags_.note("interpreter '" + std::string(kInterpreterProgram) +
                    "' not found; skipping session generation");
        outcome.skipped = true;
        return outcome;
    }
    outcome.interpreter = *prereqs.value().interpreter;

    auto standard = validateOptions(opts);
    if (!standard)
        return standard.error();

    auto request = collectProperties(opts, standard.value(), graph_);
    if (!request)
        return request.error();
    if (auto valid = validateRequest(request.value()); !valid)
        return valid.error();

    ComposeContext ctx{outcome.interpreter, projectNameFor(settings), settings.sourceDir, settings.binaryDir};
    ComposedSession composed = composeSession(request.value(), ctx);
    outcome.displayName = composed.displayName;
    outcome.sessionId = composed.sessionId;
    outcome.noInstall = request.value().noInstall;

    auto header = renderText(composed.header, graph_);
    if (!header)
        return header.error();
    auto manifest = renderManifest(composed.manifest, graph_);
    if (!manifest)
        return manifest.error();

    for (const auto &logo : composed.logos)
    {
        std::error_code ec;
        if (!fs::is_regular_file(logo.source, ec))
            return makeError(ErrorCode::Io, "kernel logo " + logo.source.string() + " does not exist");
    }

    std::error_code ec;
    fs::create_directories(settings.binaryDir, ec);
    if (ec)
    {
        return makeError(ErrorCode::Io,
                         "unable to create " + settings.binaryDir.string() + ": " + ec.message());
    }

    auto staging = StagingArea::create(settings.binaryDir);
    if (!staging)
        return staging.error();

    DocumentationBundle docs;
    if (!request.value().documentation.empty())
    {
        RegistryContext registry{settings.sourceDir, settings.binaryDir, staging.value().fetchDir()};
        auto resolved = resolveDocumentation(request.value().documentation, registry, fetcher_, diags_);
        if (!resolved)
            return resolved.error();
        docs = std::move(resolved.value());
    }

    OutputTransaction txn(staging.value());
    txn.write(composed.headerPath, std::move(header.value()));
    txn.write(composed.manifestPath, std::move(manifest.value()));
    for (const auto &logo : composed.logos)
        txn.copy(logo.source, logo.destination);
    for (auto &fragment : docs.fragments)
    {
        outcome.fragments.push_back(fragment.path);
        txn.write(fragment.path, std::move(fragment.text));
    }
    for (const auto &download : docs.downloads)
        txn.adopt(download.staged, download.destination);
    outcome.tagFiles = docs.tagFiles;

    auto committed = txn.commit();
    if (!committed)
        return committed.error();
    outcome.written = std::move(committed.value());
    diags_.note("generated session '" + outcome.displayName + "' in " + settings.binaryDir.string());
    return outcome;
}

Expected<void> SessionEngine::installDocsFor(const SessionOutcome &outcome, const EngineSettings &settings)
{
    return installDocumentation(outcome.fragments, outcome.tagFiles, prefixFor(outcome, settings), diags_);
}

Expected<SessionOutcome> SessionEngine::installDocs(const SessionOptions &opts, const EngineSettings &settings)
{
    auto outcome = generate(opts, settings);
    if (!outcome || outcome.value().skipped)
        return outcome;

    if (outcome.value().fragments.empty())
    {
        diags_.note("no documentation configured; nothing to install");
        return outcome;
    }
    if (auto installed = installDocsFor(outcome.value(), settings); !installed)
        return installed.error();
    return outcome;
}

Expected<SessionOutcome> SessionEngine::install(const SessionOptions &opts, const EngineSettings &settings)
{
    auto outcome = generate(opts, settings);
    if (!outcome || outcome.value().skipped)
        return outcome;

    if (!outcome.value().fragments.empty())
    {
        if (auto installed = installDocsFor(outcome.value(), settings); !installed)
            return installed.error();
    }

    if (outcome.value().noInstall)
    {
        diags_.note("NO_INSTALL is set; skipping kernel registration");
        return outcome;
    }
    if (auto registered = registerKernel(settings.binaryDir, outcome.value().sessionId, tools_, diags_);
        !registered)
    {
        return registered.error();
    }
    return outcome;
}

} // namespace clingkit::session
