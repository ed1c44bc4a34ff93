//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"
#include "clingkit/version.hpp"
#include <iostream>

namespace clingkit::cli
{

void printVersion()
{
    std::cout << "clingkit v" << CLINGKIT_VERSION_STR << "\n";
    std::cout << "Interpreter session generator for xeus-cling\n";
}

void printUsage()
{
    std::cerr << "clingkit v" << CLINGKIT_VERSION_STR << " - xeus-cling session generator\n"
              << "\n"
              << "Usage: clingkit <command> [options] [-- KEYWORD values...]\n"
              << "\n"
              << "Commands:\n"
              << "  generate                       Write xeus_cling.hh, kernel.json and fragments\n"
              << "  install                        Generate, install documentation and register\n"
              << "  install-docs                   Generate and install documentation only\n"
              << "\n"
              << "Options:\n"
              << "  --session FILE                 Session definition file\n"
              << "  --graph FILE                   Build graph export (JSON)\n"
              << "  --source-dir DIR               Directory relative inputs resolve against\n"
              << "  --binary-dir DIR               Directory generated files are written to\n"
              << "  --project NAME                 Project name used in the default display name\n"
              << "  --prefix DIR                   Interpreter installation prefix\n"
              << "  -v, --verbose                  Print progress notes\n"
              << "  -h, --help                     Show this help message\n"
              << "  --version                      Show version information\n"
              << "\n"
              << "Session keywords:\n"
              << "  TARGETS INCLUDE_DIRECTORIES LINK_LIBRARIES LIBRARY_DIRECTORIES\n"
              << "  COMPILE_FLAGS COMPILE_DEFINITIONS SETUP_HEADERS DOXYGEN_URLS\n"
              << "  DOXYGEN_TAGFILES KERNEL_LOGO_FILES KERNEL_NAME CXX_STANDARD\n"
              << "  REQUIRED NO_INSTALL\n"
              << "\n"
              << "Examples:\n"
              << "  clingkit generate --graph graph.json -- TARGETS adder CXX_STANDARD 14\n"
              << "  clingkit install --session adder.session --binary-dir build\n"
              << "\n";
}

} // namespace clingkit::cli
