//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the top-level `clingkit` driver. The first argument names the
// subcommand; the remaining arguments are handed to its handler.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include <string_view>

/// @brief Program entry for the `clingkit` command-line tool.
/// @return Exit status of the selected subcommand or `1` on usage errors.
int main(int argc, char **argv)
{
    using namespace clingkit::cli;

    if (argc < 2)
    {
        printUsage();
        return 1;
    }
    const std::string_view cmd = argv[1];
    if (cmd == "--version")
    {
        printVersion();
        return 0;
    }
    if (cmd == "-h" || cmd == "--help")
    {
        printUsage();
        return 0;
    }
    if (cmd == "generate")
        return cmdGenerate(argc - 2, argv + 2);
    if (cmd == "install")
        return cmdInstall(argc - 2, argv + 2);
    if (cmd == "install-docs")
        return cmdInstallDocs(argc - 2, argv + 2);

    printUsage();
    return 1;
}
