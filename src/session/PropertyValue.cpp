//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "session/PropertyValue.hpp"

namespace clingkit::session
{

PropertyValue makeProperty(std::string text)
{
    if (text.find("$<") != std::string::npos)
        return DeferredValue{std::move(text)};
    return LiteralValue{std::move(text)};
}

const std::string &spelling(const PropertyValue &value)
{
    if (const auto *literal = std::get_if<LiteralValue>(&value))
        return literal->text;
    return std::get<DeferredValue>(value).expression;
}

std::vector<std::string> splitList(std::string_view joined)
{
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= joined.size())
    {
        size_t end = joined.find(';', start);
        if (end == std::string_view::npos)
            end = joined.size();
        if (end > start)
            items.emplace_back(joined.substr(start, end - start));
        start = end + 1;
    }
    return items;
}

} // namespace clingkit::session
