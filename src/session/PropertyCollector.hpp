//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/PropertyCollector.hpp
// Purpose: Aggregates manual entries and target usage requirements into a
//          SessionRequest.
// Key invariants: Target-derived values are always deferred; the graph is only
//                 queried, never modified.
// Ownership/Lifetime: Returns a new SessionRequest owned by the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/BuildGraph.hpp"
#include "session/SessionOptions.hpp"
#include "session/SessionRequest.hpp"
#include "support/diag_expected.hpp"

namespace clingkit::session
{

/// @brief Build the session request for @p opts at level @p standard.
///
/// Each target must exist in @p graph (UnknownTarget), be a shared library
/// (TargetKind) and not declare a standard newer than @p standard
/// (StandardMismatch).  For every target the collector appends
/// `$<TARGET_PROPERTY:t,INTERFACE_INCLUDE_DIRECTORIES>`,
/// `$<TARGET_PROPERTY:t,INTERFACE_COMPILE_FLAGS>`,
/// `$<TARGET_PROPERTY:t,INTERFACE_COMPILE_DEFINITIONS>` and `$<TARGET_FILE:t>`
/// after the manual entries.
support::Expected<SessionRequest> collectProperties(const SessionOptions &opts,
                                                    CxxStandard standard,
                                                    const BuildGraph &graph);

/// @brief Check one target against the session level.
/// @details Shared by the collector and the validator's re-assertion.
support::Expected<void> checkTarget(const CollectedTarget &target, CxxStandard session);

} // namespace clingkit::session
