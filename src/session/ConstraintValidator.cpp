//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "session/ConstraintValidator.hpp"

#include "session/PropertyCollector.hpp"
#include "support/path_utils.hpp"

#include <algorithm>

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{

Expected<CxxStandard> resolveStandard(const SessionOptions &opts)
{
    if (!opts.cxxStandard)
        return kDefaultStandard;

    auto standard = parseCxxStandard(*opts.cxxStandard);
    if (!standard)
    {
        return makeError(ErrorCode::UnsupportedStandard,
                         "expected a C++ standard from {11, 14, 17}, got '" + *opts.cxxStandard + "'");
    }
    if (!isInterpreterSupported(*standard))
    {
        return makeError(ErrorCode::UnsupportedStandard,
                         "C++" + toNumber(*standard) + " is not supported by the interpreter");
    }
    return *standard;
}

Expected<CxxStandard> validateOptions(const SessionOptions &opts)
{
    auto standard = resolveStandard(opts);
    if (!standard)
        return standard;

    if (opts.doxygenUrls.size() != opts.doxygenTagfiles.size())
    {
        return makeError(ErrorCode::PairingLength,
                         "got " + std::to_string(opts.doxygenUrls.size()) + " DOXYGEN_URLS but " +
                             std::to_string(opts.doxygenTagfiles.size()) +
                             " DOXYGEN_TAGFILES; the lists are paired one by one");
    }

    for (const auto &url : opts.doxygenUrls)
    {
        if (url.rfind("https://", 0) != 0)
        {
            return makeError(ErrorCode::InsecureUrl,
                             "expected an https:// URL for Doxygen documentation, got " + url);
        }
    }

    for (const auto &logo : opts.kernelLogoFiles)
    {
        const std::string name = support::basename(logo);
        if (std::find(kAllowedLogoNames.begin(), kAllowedLogoNames.end(), name) == kAllowedLogoNames.end())
        {
            return makeError(ErrorCode::IllegalAssetName,
                             "illegal logo file name '" + name +
                                 "'; expected logo-32x32.png or logo-64x64.png");
        }
    }

    return standard;
}

Expected<void> validateRequest(const SessionRequest &request)
{
    if (!isInterpreterSupported(request.standard))
    {
        return makeError(ErrorCode::UnsupportedStandard,
                         "C++" + toNumber(request.standard) + " is not supported by the interpreter");
    }
    for (const auto &target : request.targets)
    {
        if (auto ok = checkTarget(target, request.standard); !ok)
            return ok;
    }
    return {};
}

} // namespace clingkit::session
