//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the helpers used to launch external processes and to locate
// programs on PATH.  The launcher builds a shell command line from argv
// fragments, invokes the platform's `popen` facility, and collects stdout for
// diagnostic reporting.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Subprocess launcher and PATH lookup shared by the install driver and
///        the tag-file fetcher.

#include "common/RunProcess.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#    define POPEN _popen
#    define PCLOSE _pclose
#else
#    include <sys/wait.h>
#    include <unistd.h>
#    define POPEN popen
#    define PCLOSE pclose
#endif

namespace clingkit
{
namespace
{
#if defined(_WIN32)
constexpr char kPathListSeparator = ';';

std::string quote_argument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('"');

    std::size_t backslashCount = 0;
    for (const char ch : arg)
    {
        if (ch == '\\')
        {
            ++backslashCount;
            continue;
        }

        if (ch == '"')
        {
            quoted.append(backslashCount * 2 + 1, '\\');
            quoted.push_back('"');
            backslashCount = 0;
            continue;
        }

        if (backslashCount != 0)
        {
            quoted.append(backslashCount, '\\');
            backslashCount = 0;
        }

        quoted.push_back(ch);
    }

    if (backslashCount != 0)
    {
        quoted.append(backslashCount * 2, '\\');
    }

    quoted.push_back('"');
    return quoted;
}

bool is_executable(const std::filesystem::path &candidate)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(candidate, ec);
}
#else
constexpr char kPathListSeparator = ':';

// Single quotes disable every shell expansion; embedded quotes are spliced.
std::string quote_argument(const std::string &arg)
{
    std::string quoted;
    quoted.reserve(arg.size() + 2);
    quoted.push_back('\'');

    for (const char ch : arg)
    {
        if (ch == '\'')
        {
            quoted += "'\\''";
            continue;
        }
        quoted.push_back(ch);
    }

    quoted.push_back('\'');
    return quoted;
}

bool is_executable(const std::filesystem::path &candidate)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(candidate, ec))
    {
        return false;
    }
    return ::access(candidate.c_str(), X_OK) == 0;
}
#endif
} // namespace

/// @brief Launch a subprocess using the host shell and capture its output.
/// @details Joins the provided @p argv fragments into a quoted command string,
///          spawns it via @c popen, and streams stdout into @ref RunResult::out
///          while recording the exit status when available.
RunResult run_process(const std::vector<std::string> &argv)
{
    std::string cmd;
    for (std::size_t i = 0; i < argv.size(); ++i)
    {
        if (i != 0)
        {
            cmd += ' ';
        }
        cmd += quote_argument(argv[i]);
    }
#ifndef _WIN32
    cmd += " 2>&1";
#endif

    RunResult rr{0, "", ""};
    FILE *pipe = POPEN(cmd.c_str(), "r");
    if (!pipe)
    {
        rr.exit_code = -1;
        rr.err = "failed to popen";
        return rr;
    }

    char buffer[4096];
    while (fgets(buffer, sizeof(buffer), pipe))
    {
        rr.out += buffer;
    }

    const int status = PCLOSE(pipe);
#ifdef _WIN32
    rr.exit_code = status;
#else
    if (WIFEXITED(status))
    {
        rr.exit_code = WEXITSTATUS(status);
    }
    else
    {
        rr.exit_code = status;
    }
    // When stderr is redirected to stdout the captured text lives in `out`.
    rr.err = rr.out;
#endif
    return rr;
}

std::optional<std::string> find_program(std::string_view name, std::optional<std::string> searchPath)
{
    if (name.empty())
    {
        return std::nullopt;
    }

    if (!searchPath)
    {
        const char *env = std::getenv("PATH");
        if (env == nullptr)
        {
            return std::nullopt;
        }
        searchPath = std::string(env);
    }

    std::size_t start = 0;
    while (start <= searchPath->size())
    {
        std::size_t end = searchPath->find(kPathListSeparator, start);
        if (end == std::string::npos)
        {
            end = searchPath->size();
        }

        const std::string dir = searchPath->substr(start, end - start);
        if (!dir.empty())
        {
            std::filesystem::path candidate = std::filesystem::path(dir) / std::string(name);
#ifdef _WIN32
            if (!candidate.has_extension())
            {
                candidate += ".exe";
            }
#endif
            if (is_executable(candidate))
            {
                std::error_code ec;
                auto absolute = std::filesystem::absolute(candidate, ec);
                return ec ? candidate.string() : absolute.lexically_normal().string();
            }
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace clingkit

#undef POPEN
#undef PCLOSE
