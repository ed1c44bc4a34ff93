//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.hpp
// Purpose: Declare process execution and program lookup helpers for the
//          install and fetch steps.
// Key invariants: RunResult captures exit codes and aggregated stdout/stderr text.
// Ownership/Lifetime: Callers own argument buffers; helper copies command text as needed.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clingkit
{

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exit_code;   ///< Normalised process exit code (or -1 on launch failure).
    std::string out; ///< Captured standard output text.
    std::string err; ///< Captured standard error text (may be merged with stdout).
};

/// @brief Spawn a subprocess using the provided argument vector.
/// @param argv Command-line arguments including the executable at index zero.
/// @return Captured process result including exit code and output streams.
RunResult run_process(const std::vector<std::string> &argv);

/// @brief Search the directories of @p searchPath for an executable @p name.
/// @param name Program name without directory components.
/// @param searchPath PATH-style list; defaults to the PATH environment variable.
/// @return Absolute path of the first executable match, if any.
std::optional<std::string> find_program(std::string_view name,
                                        std::optional<std::string> searchPath = std::nullopt);

} // namespace clingkit
