//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "session/PropertyCollector.hpp"

#include <algorithm>

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{
namespace
{

std::vector<PropertyValue> classifyAll(const std::vector<std::string> &entries)
{
    std::vector<PropertyValue> values;
    values.reserve(entries.size());
    for (const auto &entry : entries)
        values.push_back(makeProperty(entry));
    return values;
}

DeferredValue interfaceProperty(const std::string &target, const char *property)
{
    return DeferredValue{"$<TARGET_PROPERTY:" + target + "," + property + ">"};
}

} // namespace

Expected<void> checkTarget(const CollectedTarget &target, CxxStandard session)
{
    if (!isLoadable(target.kind))
    {
        return makeError(ErrorCode::TargetKind,
                         "target " + target.name + " is a " + targetKindName(target.kind) +
                             ", but the interpreter can only load shared libraries");
    }
    if (target.standard && !isCompatible(*target.standard, session))
    {
        return makeError(ErrorCode::StandardMismatch,
                         "target " + target.name + " requires C++" + toNumber(*target.standard) +
                             ", although the session is configured for C++" + toNumber(session));
    }
    return {};
}

Expected<SessionRequest> collectProperties(const SessionOptions &opts,
                                           CxxStandard standard,
                                           const BuildGraph &graph)
{
    SessionRequest request;
    request.standard = standard;
    request.kernelName = opts.kernelName;
    request.required = opts.required;
    request.noInstall = opts.noInstall;
    request.setupHeaders = opts.setupHeaders;
    request.logoFiles = opts.kernelLogoFiles;

    request.includeDirectories = classifyAll(opts.includeDirectories);
    request.libraryDirectories = classifyAll(opts.libraryDirectories);
    request.linkLibraries = classifyAll(opts.linkLibraries);
    request.compileFlags = classifyAll(opts.compileFlags);
    request.compileDefinitions = classifyAll(opts.compileDefinitions);

    // Callers validate pairing before collection; extra entries on either side
    // are never silently paired.
    const size_t pairs = std::min(opts.doxygenUrls.size(), opts.doxygenTagfiles.size());
    for (size_t i = 0; i < pairs; ++i)
        request.documentation.push_back(TagPair{opts.doxygenUrls[i], opts.doxygenTagfiles[i]});

    for (const auto &name : opts.targets)
    {
        const TargetInfo *info = graph.findTarget(name);
        if (info == nullptr)
        {
            return makeError(ErrorCode::UnknownTarget,
                             "session was passed a target " + name + ", but it does not exist");
        }

        CollectedTarget target{info->name, info->kind, info->standard};
        if (auto ok = checkTarget(target, standard); !ok)
            return ok.error();

        request.includeDirectories.push_back(interfaceProperty(name, "INTERFACE_INCLUDE_DIRECTORIES"));
        request.compileFlags.push_back(interfaceProperty(name, "INTERFACE_COMPILE_FLAGS"));
        request.compileDefinitions.push_back(interfaceProperty(name, "INTERFACE_COMPILE_DEFINITIONS"));
        request.linkLibraries.push_back(DeferredValue{"$<TARGET_FILE:" + name + ">"});
        request.targets.push_back(std::move(target));
    }

    return request;
}

} // namespace clingkit::session
