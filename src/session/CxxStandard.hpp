//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/CxxStandard.hpp
// Purpose: Closed enumeration of C++ language standard levels and the subset
//          the interpreter accepts.
// Key invariants: Enumerators are declared oldest first so ordering comparisons
//                 follow language chronology (98 < 11 < ... < 23).
// Ownership/Lifetime: Value type.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace clingkit::session
{

/// @brief Every standard level the host build graph may declare.
enum class CxxStandard
{
    Cxx98,
    Cxx11,
    Cxx14,
    Cxx17,
    Cxx20,
    Cxx23
};

/// @brief Level used when a session does not request one explicitly.
inline constexpr CxxStandard kDefaultStandard = CxxStandard::Cxx17;

/// @brief Map the numeric spelling used by build systems ("98", "17") to a level.
/// @return The level, or std::nullopt for values outside the known universe.
std::optional<CxxStandard> parseCxxStandard(std::string_view text);

/// @brief Map an integer such as 14 to a level.
std::optional<CxxStandard> cxxStandardFromNumber(int number);

/// @brief Numeric spelling of @p standard ("11", "17").
std::string toNumber(CxxStandard standard);

/// @brief Whether the interpreter runtime can run sessions at @p standard.
/// @details Only C++11, C++14 and C++17 are accepted.
bool isInterpreterSupported(CxxStandard standard);

/// @brief Whether code written for @p required runs in a session at @p session.
inline bool isCompatible(CxxStandard required, CxxStandard session)
{
    return static_cast<int>(required) <= static_cast<int>(session);
}

} // namespace clingkit::session
