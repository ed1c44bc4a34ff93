//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "session/HostTools.hpp"

namespace clingkit::session
{

std::optional<std::string> SystemHostTools::findProgram(std::string_view name) const
{
    return find_program(name);
}

RunResult SystemHostTools::run(const std::vector<std::string> &argv)
{
    return run_process(argv);
}

} // namespace clingkit::session
