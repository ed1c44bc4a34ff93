//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements a small recursive evaluator for generator expressions.  The text
// is scanned for `$<` openers; each expression body is located by counting
// nested openers against `>` closers, split at its top-level `:` into a name
// and an argument part, and dispatched on the (itself expanded) name.  Arguments
// are split on top-level commas only where the expression takes several.
//
//===----------------------------------------------------------------------===//

#include "session/GeneratorExpression.hpp"

#include "session/PropertyValue.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>
#include <vector>

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{
namespace
{

using Range = std::pair<size_t, size_t>;

class Evaluator
{
  public:
    Evaluator(std::string_view text, const GenexContext &ctx) : text_(text), ctx_(ctx) {}

    Expected<std::string> run()
    {
        return expandRange(0, text_.size());
    }

  private:
    bool opensAt(size_t i, size_t end) const
    {
        return i + 1 < end && text_[i] == '$' && text_[i + 1] == '<';
    }

    /// @brief Index of the `>` closing the body that starts at @p begin.
    std::optional<size_t> findClose(size_t begin, size_t end) const
    {
        int depth = 0;
        for (size_t i = begin; i < end; ++i)
        {
            if (opensAt(i, end))
            {
                ++depth;
                ++i;
                continue;
            }
            if (text_[i] == '>')
            {
                if (depth == 0)
                    return i;
                --depth;
            }
        }
        return std::nullopt;
    }

    /// @brief Split [begin, end) at top-level @p sep into at most @p maxParts.
    std::vector<Range> splitTopLevel(size_t begin, size_t end, char sep, size_t maxParts) const
    {
        std::vector<Range> parts;
        int depth = 0;
        size_t partStart = begin;
        for (size_t i = begin; i < end; ++i)
        {
            if (opensAt(i, end))
            {
                ++depth;
                ++i;
                continue;
            }
            if (text_[i] == '>' && depth > 0)
            {
                --depth;
                continue;
            }
            if (depth == 0 && text_[i] == sep && parts.size() + 1 < maxParts)
            {
                parts.emplace_back(partStart, i);
                partStart = i + 1;
            }
        }
        parts.emplace_back(partStart, end);
        return parts;
    }

    Expected<std::string> expandRange(size_t begin, size_t end)
    {
        std::string out;
        size_t i = begin;
        while (i < end)
        {
            if (!opensAt(i, end))
            {
                out.push_back(text_[i]);
                ++i;
                continue;
            }

            const size_t bodyBegin = i + 2;
            auto close = findClose(bodyBegin, end);
            if (!close)
            {
                return makeError(ErrorCode::InvalidConfiguration,
                                 "unterminated generator expression in '" + std::string(text_) + "'");
            }

            auto value = evaluate(bodyBegin, *close);
            if (!value)
                return value;
            out += value.value();
            i = *close + 1;
        }
        return out;
    }

    Expected<std::string> evaluate(size_t begin, size_t end)
    {
        auto pieces = splitTopLevel(begin, end, ':', 2);
        auto name = expandRange(pieces[0].first, pieces[0].second);
        if (!name)
            return name;

        const std::string &id = name.value();
        const bool hasArgs = pieces.size() == 2;
        const size_t argBegin = hasArgs ? pieces[1].first : end;
        const size_t argEnd = end;

        if (id == "SEMICOLON")
            return std::string(";");
        if (id == "COMMA")
            return std::string(",");
        if (id == "ANGLE-R")
            return std::string(">");

        if (!hasArgs)
            return unsupported(begin, end);

        if (id == "0" || id == "INSTALL_INTERFACE")
            return std::string();
        if (id == "1" || id == "BUILD_INTERFACE")
            return expandRange(argBegin, argEnd);
        if (id == "BOOL")
        {
            auto arg = expandRange(argBegin, argEnd);
            if (!arg)
                return arg;
            return std::string(isTruthy(arg.value()) ? "1" : "0");
        }
        if (id == "TARGET_FILE")
        {
            auto target = expandRange(argBegin, argEnd);
            if (!target)
                return target;
            return ctx_.targetFile(target.value());
        }
        if (id == "TARGET_PROPERTY")
        {
            auto args = splitTopLevel(argBegin, argEnd, ',', 2);
            if (args.size() != 2)
            {
                return makeError(ErrorCode::InvalidConfiguration,
                                 "$<TARGET_PROPERTY:...> requires a target and a property name");
            }
            auto target = expandRange(args[0].first, args[0].second);
            if (!target)
                return target;
            auto property = expandRange(args[1].first, args[1].second);
            if (!property)
                return property;
            return ctx_.targetProperty(target.value(), property.value());
        }
        if (id == "JOIN")
        {
            auto args = splitTopLevel(argBegin, argEnd, ',', 2);
            if (args.size() != 2)
            {
                return makeError(ErrorCode::InvalidConfiguration,
                                 "$<JOIN:...> requires a list and a separator");
            }
            auto list = expandRange(args[0].first, args[0].second);
            if (!list)
                return list;
            auto sep = expandRange(args[1].first, args[1].second);
            if (!sep)
                return sep;

            std::string joined;
            bool first = true;
            for (const auto &item : splitList(list.value()))
            {
                if (!first)
                    joined += sep.value();
                joined += item;
                first = false;
            }
            return joined;
        }

        return unsupported(begin, end);
    }

    support::Diag unsupported(size_t begin, size_t end) const
    {
        return makeError(ErrorCode::InvalidConfiguration,
                         "unsupported generator expression '$<" +
                             std::string(text_.substr(begin, end - begin)) + ">'");
    }

    std::string_view text_;
    const GenexContext &ctx_;
};

} // namespace

Expected<std::string> evaluateGeneratorExpression(std::string_view text, const GenexContext &ctx)
{
    Evaluator evaluator(text, ctx);
    return evaluator.run();
}

bool isTruthy(std::string_view value)
{
    std::string upper(value);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });

    if (upper.empty() || upper == "0" || upper == "OFF" || upper == "NO" || upper == "FALSE" ||
        upper == "N" || upper == "IGNORE" || upper == "NOTFOUND")
        return false;

    constexpr std::string_view kNotFoundSuffix = "-NOTFOUND";
    if (upper.size() >= kNotFoundSuffix.size() &&
        upper.compare(upper.size() - kNotFoundSuffix.size(), kNotFoundSuffix.size(), kNotFoundSuffix) == 0)
        return false;

    return true;
}

} // namespace clingkit::session
