//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#pragma once

namespace clingkit::cli
{

void printVersion();
void printUsage();

} // namespace clingkit::cli
