//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/uuid.hpp
// Purpose: Name-based (version 5, SHA-1) UUID derivation per RFC 4122.
// Key invariants: The same namespace and name always yield the same UUID.
// Ownership/Lifetime: Value types only.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace clingkit::support
{

/// @brief 128-bit UUID stored in network byte order.
using Uuid = std::array<uint8_t, 16>;

/// @brief The all-zero namespace 00000000-0000-0000-0000-000000000000.
inline constexpr Uuid kNilUuid{};

/// @brief Format @p uuid in lowercase canonical form.
std::string formatUuid(const Uuid &uuid);

/// @brief Derive the version 5 UUID of @p name within @p ns.
Uuid uuidV5(const Uuid &ns, std::string_view name);

} // namespace clingkit::support
