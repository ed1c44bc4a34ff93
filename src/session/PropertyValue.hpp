//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/PropertyValue.hpp
// Purpose: Tagged value that is either known while a session is aggregated or
//          deferred to the host build graph's generation stage.
// Key invariants: Deferred expressions are carried verbatim; nothing in the
//                 session pipeline evaluates them except a BuildGraph.
// Ownership/Lifetime: Value type owning its text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace clingkit::session
{

/// @brief A value known at aggregation time.
struct LiteralValue
{
    std::string text;

    bool operator==(const LiteralValue &) const = default;
};

/// @brief A host build-graph expression such as `$<TARGET_FILE:foo>`.
struct DeferredValue
{
    std::string expression;

    bool operator==(const DeferredValue &) const = default;
};

/// @brief Either a literal or a deferred value.
using PropertyValue = std::variant<LiteralValue, DeferredValue>;

/// @brief Classify a manually supplied entry.
/// @details Text containing a `$<` generator-expression opener is deferred,
///          anything else is literal.
PropertyValue makeProperty(std::string text);

/// @brief Whether @p value must be resolved by the host build graph.
inline bool isDeferred(const PropertyValue &value)
{
    return std::holds_alternative<DeferredValue>(value);
}

/// @brief Source text of @p value for messages and debugging output.
const std::string &spelling(const PropertyValue &value);

/// @brief Split a resolved `;`-separated list, dropping empty items.
/// @details This is the join-then-split flattening applied to every resolved
///          value, so empty values contribute zero items.
std::vector<std::string> splitList(std::string_view joined);

} // namespace clingkit::session
