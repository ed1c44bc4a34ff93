//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/GraphDatabase.hpp
// Purpose: BuildGraph backed by a JSON export of the host build graph.
// Key invariants: INTERFACE_* properties evaluate transitively over interface
//                 link dependencies, keeping the first occurrence of each item.
// Ownership/Lifetime: Owns all target records; TargetInfo pointers handed out
//                     stay valid while the database lives and is not moved.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/BuildGraph.hpp"
#include "session/GeneratorExpression.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace clingkit::session
{

/// @brief Everything the graph export records about one target.
struct TargetRecord
{
    TargetInfo info;
    std::string file; ///< Final artifact path, empty for non-artifact targets.
    std::map<std::string, std::vector<std::string>> properties;
    std::vector<std::string> interfaceLinks; ///< INTERFACE_LINK_LIBRARIES entries.
};

/// @brief Build graph read from a JSON document.
///
/// Document shape:
/// @code
/// { "project": "adder",
///   "targets": {
///     "adder": { "type": "SHARED_LIBRARY", "file": "/b/libadder.so",
///                "cxx_standard": 17,
///                "properties": { "INTERFACE_INCLUDE_DIRECTORIES": ["..."] },
///                "interface_link_libraries": ["base"] } } }
/// @endcode
class GraphDatabase final : public BuildGraph, private GenexContext
{
  public:
    /// @brief Empty graph for sessions that reference no targets.
    explicit GraphDatabase(std::string projectName);

    /// @brief Parse a graph document from @p text; @p origin names it in errors.
    static support::Expected<GraphDatabase> parse(std::string_view text, const std::string &origin);

    /// @brief Read and parse the graph document at @p path.
    static support::Expected<GraphDatabase> load(const std::filesystem::path &path);

    /// @brief Add or replace the record for @p record.info.name.
    void addTarget(TargetRecord record);

    std::string projectName() const override;
    const TargetInfo *findTarget(std::string_view name) const override;
    support::Expected<std::vector<std::string>> resolve(const PropertyValue &value) const override;

  private:
    support::Expected<std::string> targetFile(std::string_view target) const override;
    support::Expected<std::string> targetProperty(std::string_view target,
                                                  std::string_view property) const override;

    /// @brief Append the evaluated items of @p property on @p target to @p out.
    support::Expected<void> collect(const TargetRecord &record,
                                    std::string_view property,
                                    bool transitive,
                                    std::vector<std::string> &out) const;

    std::string project_;
    std::map<std::string, TargetRecord, std::less<>> targets_;

    /// Target/property pairs under evaluation, used to reject cycles.
    mutable std::vector<std::string> evaluationStack_;
};

} // namespace clingkit::session
