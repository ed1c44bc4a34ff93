//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/HostTools.hpp
// Purpose: Seam between the session pipeline and the host system for program
//          lookup and subprocess launches.
// Key invariants: All external commands issued by the pipeline go through a
//                 HostTools instance.
// Ownership/Lifetime: Callers own the instance and keep it alive for the
//                     duration of a pipeline run.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "common/RunProcess.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clingkit::session
{

/// @brief Host facilities used by the fetch and install steps.
class HostTools
{
  public:
    virtual ~HostTools() = default;

    /// @brief Locate executable @p name; empty when it is not installed.
    virtual std::optional<std::string> findProgram(std::string_view name) const = 0;

    /// @brief Run @p argv to completion and capture its output.
    virtual RunResult run(const std::vector<std::string> &argv) = 0;
};

/// @brief HostTools backed by PATH lookup and real subprocesses.
class SystemHostTools final : public HostTools
{
  public:
    std::optional<std::string> findProgram(std::string_view name) const override;
    RunResult run(const std::vector<std::string> &argv) override;
};

} // namespace clingkit::session
