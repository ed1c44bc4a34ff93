//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/ConstraintValidator.hpp
// Purpose: Gate that checks every session invariant before anything is
//          generated.
// Key invariants: A request that passes validation can be composed without
//                 further checks; nothing is written for a failing request.
// Ownership/Lifetime: Stateless free functions.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/CxxStandard.hpp"
#include "session/SessionOptions.hpp"
#include "session/SessionRequest.hpp"
#include "support/diag_expected.hpp"

#include <array>
#include <string_view>

namespace clingkit::session
{

/// @brief Logo file names the notebook front end recognises.
inline constexpr std::array<std::string_view, 2> kAllowedLogoNames{"logo-32x32.png", "logo-64x64.png"};

/// @brief Resolve and check the requested standard level.
/// @return The level (17 when unset) or UnsupportedStandard.
support::Expected<CxxStandard> resolveStandard(const SessionOptions &opts);

/// @brief Checks on raw options that do not need the build graph.
///
/// In order: standard membership, documentation list pairing, https:// URLs
/// and logo file names.
support::Expected<CxxStandard> validateOptions(const SessionOptions &opts);

/// @brief Re-assert per-target compatibility on a collected request.
support::Expected<void> validateRequest(const SessionRequest &request);

} // namespace clingkit::session
