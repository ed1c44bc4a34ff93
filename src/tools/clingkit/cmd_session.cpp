//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/clingkit/cmd_session.cpp
// Purpose: Implements the generate, install and install-docs subcommands.
// Key invariants: Diagnostics are printed once, after the pipeline finishes.
// Ownership/Lifetime: The build graph and diagnostic engine live for one run.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "session/GraphDatabase.hpp"
#include "session/InstallDriver.hpp"
#include "session/SessionEngine.hpp"
#include "session/SessionOptions.hpp"

#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

using clingkit::support::Expected;

namespace clingkit::cli
{
namespace
{

Expected<session::SessionOptions> loadSessionOptions(const CliOptions &opts, support::DiagnosticEngine &diags)
{
    std::vector<std::string> tokens;
    if (opts.sessionFile)
    {
        auto fromFile = session::readSessionFile(*opts.sessionFile, diags);
        if (!fromFile)
            return fromFile.error();
        tokens = std::move(fromFile.value());
    }
    tokens.insert(tokens.end(), opts.sessionArgs.begin(), opts.sessionArgs.end());
    return session::parseSessionArguments(tokens, diags);
}

Expected<session::GraphDatabase> loadGraph(const CliOptions &opts)
{
    if (opts.graphFile)
        return session::GraphDatabase::load(*opts.graphFile);
    return session::GraphDatabase(opts.project.value_or(std::string()));
}

fs::path absoluteOrCurrent(const std::optional<fs::path> &given, const fs::path &fallback)
{
    std::error_code ec;
    fs::path path = given ? *given : fallback;
    fs::path absolute = fs::absolute(path, ec);
    return ec ? path.lexically_normal() : absolute.lexically_normal();
}

session::EngineSettings makeSettings(const CliOptions &opts)
{
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);

    fs::path sourceFallback = cwd;
    if (opts.sessionFile && opts.sessionFile->has_parent_path())
        sourceFallback = opts.sessionFile->parent_path();

    session::EngineSettings settings;
    settings.sourceDir = absoluteOrCurrent(opts.sourceDir, sourceFallback);
    settings.binaryDir = absoluteOrCurrent(opts.binaryDir, cwd);
    settings.projectName = opts.project;
    if (opts.prefix)
        settings.prefix = absoluteOrCurrent(opts.prefix, cwd);
    return settings;
}

int finish(support::DiagnosticEngine &diags, const CliOptions &opts, std::ostream &err)
{
    diags.printAll(err, opts.verbose);
    return diags.errorCount() == 0 ? 0 : 1;
}

int runCommand(SessionAction action, int argc, char **argv)
{
    CliOptions opts;
    std::string error;
    switch (parseCliOptions(argc, argv, opts, error))
    {
        case CliParseResult::Help:
            printUsage();
            return 0;
        case CliParseResult::Version:
            printVersion();
            return 0;
        case CliParseResult::Error:
            std::cerr << "error: " << error << "\n";
            printUsage();
            return 1;
        case CliParseResult::Ok:
            break;
    }

    session::SystemHostTools tools;
    session::CurlTagFetcher fetcher(tools);
    return runSessionAction(action, opts, tools, fetcher, std::cerr);
}

} // namespace

int runSessionAction(SessionAction action,
                     const CliOptions &opts,
                     session::HostTools &tools,
                     session::TagFetcher &fetcher,
                     std::ostream &err)
{
    support::DiagnosticEngine diags;

    auto sessionOpts = loadSessionOptions(opts, diags);
    if (!sessionOpts)
    {
        diags.report(sessionOpts.error());
        return finish(diags, opts, err);
    }

    // A missing interpreter skips the session before the graph is read.
    auto prereqs = session::checkPrerequisites(tools, sessionOpts.value().required);
    if (!prereqs)
    {
        diags.report(prereqs.error());
        return finish(diags, opts, err);
    }
    if (!prereqs.value().interpreter)
    {
        diags.note("interpreter '" + std::string(session::kInterpreterProgram) +
                   "' not found; skipping session generation");
        return finish(diags, opts, err);
    }

    auto graph = loadGraph(opts);
    if (!graph)
    {
        diags.report(graph.error());
        return finish(diags, opts, err);
    }

    session::SessionEngine engine(graph.value(), tools, fetcher, diags);
    const session::EngineSettings settings = makeSettings(opts);

    Expected<session::SessionOutcome> outcome = [&]() {
        switch (action)
        {
            case SessionAction::Install:
                return engine.install(sessionOpts.value(), settings);
            case SessionAction::InstallDocs:
                return engine.installDocs(sessionOpts.value(), settings);
            case SessionAction::Generate:
                break;
        }
        return engine.generate(sessionOpts.value(), settings);
    }();

    if (!outcome)
        diags.report(outcome.error());
    return finish(diags, opts, err);
}

int cmdGenerate(int argc, char **argv)
{
    return runCommand(SessionAction::Generate, argc, argv);
}

int cmdInstall(int argc, char **argv)
{
    return runCommand(SessionAction::Install, argc, argv);
}

int cmdInstallDocs(int argc, char **argv)
{
    return runCommand(SessionAction::InstallDocs, argc, argv);
}

} // namespace clingkit::cli
