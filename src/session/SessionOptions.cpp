//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/SessionOptions.cpp
// Purpose: Session definition parsing for both configuration surfaces.
//
//===----------------------------------------------------------------------===//

#include "session/SessionOptions.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <string_view>

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{
namespace
{

constexpr std::array<std::string_view, 2> kOptionKeywords{"REQUIRED", "NO_INSTALL"};
constexpr std::array<std::string_view, 2> kSingleKeywords{"CXX_STANDARD", "KERNEL_NAME"};
constexpr std::array<std::string_view, 10> kMultiKeywords{
    "TARGETS",
    "INCLUDE_DIRECTORIES",
    "LINK_LIBRARIES",
    "COMPILE_FLAGS",
    "LIBRARY_DIRECTORIES",
    "SETUP_HEADERS",
    "DOXYGEN_URLS",
    "DOXYGEN_TAGFILES",
    "COMPILE_DEFINITIONS",
    "KERNEL_LOGO_FILES",
};

template <size_t N> bool contains(const std::array<std::string_view, N> &set, std::string_view token)
{
    return std::find(set.begin(), set.end(), token) != set.end();
}

std::vector<std::string> *multiSlot(SessionOptions &opts, std::string_view keyword)
{
    if (keyword == "TARGETS")
        return &opts.targets;
    if (keyword == "INCLUDE_DIRECTORIES")
        return &opts.includeDirectories;
    if (keyword == "LINK_LIBRARIES")
        return &opts.linkLibraries;
    if (keyword == "COMPILE_FLAGS")
        return &opts.compileFlags;
    if (keyword == "LIBRARY_DIRECTORIES")
        return &opts.libraryDirectories;
    if (keyword == "SETUP_HEADERS")
        return &opts.setupHeaders;
    if (keyword == "DOXYGEN_URLS")
        return &opts.doxygenUrls;
    if (keyword == "DOXYGEN_TAGFILES")
        return &opts.doxygenTagfiles;
    if (keyword == "COMPILE_DEFINITIONS")
        return &opts.compileDefinitions;
    if (keyword == "KERNEL_LOGO_FILES")
        return &opts.kernelLogoFiles;
    return nullptr;
}

std::string trim(const std::string &text)
{
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

} // namespace

bool isSessionKeyword(const std::string &token)
{
    return contains(kOptionKeywords, token) || contains(kSingleKeywords, token) ||
           contains(kMultiKeywords, token);
}

SessionOptions parseSessionArguments(const std::vector<std::string> &tokens,
                                     support::DiagnosticEngine &diags)
{
    SessionOptions opts;
    std::vector<std::string> unparsed;

    // Keyword currently collecting values; empty before the first keyword and
    // after an option keyword.
    std::string active;
    std::optional<std::string> *pendingSingle = nullptr;

    for (const auto &token : tokens)
    {
        if (contains(kOptionKeywords, token))
        {
            if (token == "REQUIRED")
                opts.required = true;
            else
                opts.noInstall = true;
            active.clear();
            pendingSingle = nullptr;
            continue;
        }
        if (contains(kSingleKeywords, token))
        {
            active = token;
            pendingSingle = token == "CXX_STANDARD" ? &opts.cxxStandard : &opts.kernelName;
            continue;
        }
        if (contains(kMultiKeywords, token))
        {
            active = token;
            pendingSingle = nullptr;
            continue;
        }

        if (pendingSingle != nullptr)
        {
            // An empty value resets the keyword to its default.
            if (token.empty())
                pendingSingle->reset();
            else
                *pendingSingle = token;
            pendingSingle = nullptr;
            active.clear();
            continue;
        }
        if (auto *slot = multiSlot(opts, active))
        {
            slot->push_back(token);
            continue;
        }
        unparsed.push_back(token);
    }

    if (!unparsed.empty())
    {
        std::string msg = "unparsed arguments in session definition: this often indicates typos:";
        for (const auto &arg : unparsed)
            msg += " " + arg;
        diags.warning(std::move(msg));
    }

    return opts;
}

Expected<std::vector<std::string>> tokenizeSessionLine(const std::string &line)
{
    std::vector<std::string> tokens;
    std::string current;
    bool inToken = false;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i)
    {
        const char ch = line[i];
        if (quoted)
        {
            if (ch == '\\' && i + 1 < line.size() && (line[i + 1] == '"' || line[i + 1] == '\\'))
            {
                current.push_back(line[++i]);
                continue;
            }
            if (ch == '"')
            {
                quoted = false;
                continue;
            }
            current.push_back(ch);
            continue;
        }

        if (ch == '#')
            break;
        if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n')
        {
            if (inToken)
            {
                tokens.push_back(std::move(current));
                current.clear();
                inToken = false;
            }
            continue;
        }
        if (ch == '"')
        {
            quoted = true;
            inToken = true;
            continue;
        }
        current.push_back(ch);
        inToken = true;
    }

    if (quoted)
        return makeError(ErrorCode::InvalidConfiguration, "unterminated quoted value");
    if (inToken)
        tokens.push_back(std::move(current));
    return tokens;
}

Expected<std::vector<std::string>> readSessionFile(const std::filesystem::path &path,
                                                   support::DiagnosticEngine &diags)
{
    std::ifstream file(path);
    if (!file.is_open())
        return makeError(ErrorCode::Io, "cannot open session file: " + path.string());

    std::vector<std::string> tokens;
    std::string line;
    int lineNum = 0;
    while (std::getline(file, line))
    {
        ++lineNum;
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        auto lineTokens = tokenizeSessionLine(line);
        if (!lineTokens)
        {
            return makeError(ErrorCode::InvalidConfiguration,
                             path.string() + ":" + std::to_string(lineNum) + ": " +
                                 lineTokens.error().message);
        }
        if (lineTokens.value().empty())
            continue;

        const std::string &keyword = lineTokens.value().front();
        if (!isSessionKeyword(keyword))
        {
            diags.warning(path.string() + ":" + std::to_string(lineNum) + ": unknown configuration key '" +
                          keyword + "' ignored");
            continue;
        }
        for (auto &token : lineTokens.value())
            tokens.push_back(std::move(token));
    }

    return tokens;
}

} // namespace clingkit::session
