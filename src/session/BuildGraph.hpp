//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/BuildGraph.hpp
// Purpose: Interface to the host build graph: target lookup and the deferred
//          value resolution performed at generation time.
// Key invariants: Implementations are read-only from the session's point of
//                 view; lookups never mutate the graph.
// Ownership/Lifetime: The graph outlives every session pass that queries it;
//                     returned TargetInfo pointers borrow graph storage.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/CxxStandard.hpp"
#include "session/PropertyValue.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clingkit::session
{

/// @brief Artifact kind of a build target.
enum class TargetKind
{
    SharedLibrary,
    ModuleLibrary,
    StaticLibrary,
    ObjectLibrary,
    InterfaceLibrary,
    Executable,
    Utility
};

/// @brief Parse the build-system spelling ("SHARED_LIBRARY", "EXECUTABLE").
std::optional<TargetKind> parseTargetKind(std::string_view text);

/// @brief Build-system spelling of @p kind.
const char *targetKindName(TargetKind kind);

/// @brief Whether the interpreter can `dlopen` artifacts of @p kind.
bool isLoadable(TargetKind kind);

/// @brief Static facts about one target.
struct TargetInfo
{
    std::string name;
    TargetKind kind = TargetKind::SharedLibrary;
    std::optional<CxxStandard> standard; ///< Declared CXX_STANDARD, if any.
};

/// @brief Read-only view of the host build graph.
class BuildGraph
{
  public:
    virtual ~BuildGraph() = default;

    /// @brief Name of the enclosing project.
    virtual std::string projectName() const = 0;

    /// @brief Look up target @p name.
    /// @return Target facts, or nullptr when no such target exists.
    virtual const TargetInfo *findTarget(std::string_view name) const = 0;

    /// @brief Evaluate @p value at generation time.
    /// @return Flattened list of items; an empty value yields an empty list.
    virtual support::Expected<std::vector<std::string>> resolve(const PropertyValue &value) const = 0;
};

} // namespace clingkit::session
