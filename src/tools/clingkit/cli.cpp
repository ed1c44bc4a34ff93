//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line parsing shared by the clingkit subcommands. Every
// subcommand accepts the same options; everything after `--` is handed to the
// session keyword parser untouched.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"

#include <string_view>

namespace clingkit::cli
{
namespace
{

/// @brief Fetch the value following option @p arg, advancing @p index.
bool takeValue(int &index, int argc, char **argv, std::string_view arg, std::string &out, std::string &error)
{
    if (index + 1 >= argc)
    {
        error = "missing value for " + std::string(arg);
        return false;
    }
    out = argv[++index];
    return true;
}

} // namespace

CliParseResult parseCliOptions(int argc, char **argv, CliOptions &opts, std::string &error)
{
    for (int i = 0; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "--")
        {
            for (int j = i + 1; j < argc; ++j)
                opts.sessionArgs.emplace_back(argv[j]);
            break;
        }
        if (arg == "-h" || arg == "--help")
            return CliParseResult::Help;
        if (arg == "--version")
            return CliParseResult::Version;
        if (arg == "-v" || arg == "--verbose")
        {
            opts.verbose = true;
            continue;
        }

        std::string value;
        if (arg == "--session" || arg == "--graph" || arg == "--source-dir" || arg == "--binary-dir" ||
            arg == "--prefix" || arg == "--project")
        {
            if (!takeValue(i, argc, argv, arg, value, error))
                return CliParseResult::Error;
            if (arg == "--session")
                opts.sessionFile = value;
            else if (arg == "--graph")
                opts.graphFile = value;
            else if (arg == "--source-dir")
                opts.sourceDir = value;
            else if (arg == "--binary-dir")
                opts.binaryDir = value;
            else if (arg == "--prefix")
                opts.prefix = value;
            else
                opts.project = value;
            continue;
        }

        error = "unknown option '" + std::string(arg) + "'";
        return CliParseResult::Error;
    }
    return CliParseResult::Ok;
}

} // namespace clingkit::cli
