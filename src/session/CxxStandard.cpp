//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "session/CxxStandard.hpp"

#include <charconv>

namespace clingkit::session
{

std::optional<CxxStandard> parseCxxStandard(std::string_view text)
{
    int number = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, number);
    if (text.empty() || ec != std::errc() || ptr != last)
        return std::nullopt;
    return cxxStandardFromNumber(number);
}

std::optional<CxxStandard> cxxStandardFromNumber(int number)
{
    switch (number)
    {
        case 98:
            return CxxStandard::Cxx98;
        case 11:
            return CxxStandard::Cxx11;
        case 14:
            return CxxStandard::Cxx14;
        case 17:
            return CxxStandard::Cxx17;
        case 20:
            return CxxStandard::Cxx20;
        case 23:
            return CxxStandard::Cxx23;
        default:
            return std::nullopt;
    }
}

std::string toNumber(CxxStandard standard)
{
    switch (standard)
    {
        case CxxStandard::Cxx98:
            return "98";
        case CxxStandard::Cxx11:
            return "11";
        case CxxStandard::Cxx14:
            return "14";
        case CxxStandard::Cxx17:
            return "17";
        case CxxStandard::Cxx20:
            return "20";
        case CxxStandard::Cxx23:
            return "23";
    }
    return {};
}

bool isInterpreterSupported(CxxStandard standard)
{
    switch (standard)
    {
        case CxxStandard::Cxx11:
        case CxxStandard::Cxx14:
        case CxxStandard::Cxx17:
            return true;
        case CxxStandard::Cxx98:
        case CxxStandard::Cxx20:
        case CxxStandard::Cxx23:
            return false;
    }
    return false;
}

} // namespace clingkit::session
