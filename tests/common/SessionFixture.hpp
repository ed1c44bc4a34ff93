//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/SessionFixture.hpp
// Purpose: Shared helpers for session tests: scratch directories, fake host
//          tools and a fake tag fetcher, plus build graph builders.
// Key invariants: Temporary artefacts are confined to a unique directory below
//                 std::filesystem::temp_directory_path and are removed when the
//                 owning TempDir is destroyed.
// Ownership/Lifetime: Fakes record every call they receive by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "session/GraphDatabase.hpp"
#include "session/HostTools.hpp"
#include "session/ResourceRegistry.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clingkit::tests
{

/// @brief Unique scratch directory removed on destruction.
class TempDir
{
  public:
    TempDir();
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;
    ~TempDir();

    const std::filesystem::path &path() const
    {
        return root_;
    }

    /// @brief Write @p text to @p relative below the root, creating parents.
    std::filesystem::path write(const std::string &relative, std::string_view text) const;

    /// @brief Number of directory entries below the root, recursively.
    size_t entryCount() const;

  private:
    std::filesystem::path root_;
};

/// @brief Contents of @p path, or an empty string when unreadable.
std::string readFile(const std::filesystem::path &path);

/// @brief HostTools that resolves programs from a table and records commands.
class FakeHostTools final : public session::HostTools
{
  public:
    std::map<std::string, std::string, std::less<>> programs;
    std::vector<std::vector<std::string>> commands;
    RunResult nextResult{0, "", ""};

    /// @brief Table with both the interpreter and the registration tool.
    static FakeHostTools withInterpreter(const std::string &binDir = "/opt/xeus/bin");

    std::optional<std::string> findProgram(std::string_view name) const override;
    RunResult run(const std::vector<std::string> &argv) override;
};

/// @brief TagFetcher serving canned documents.
class FakeTagFetcher final : public session::TagFetcher
{
  public:
    std::map<std::string, std::string> documents; ///< URL to body.
    std::vector<std::string> requests;

    support::Expected<void> fetch(const std::string &url, const std::filesystem::path &destination) override;
};

/// @brief Shared library record with optional declared standard.
session::TargetRecord sharedLibrary(const std::string &name,
                                    const std::string &file,
                                    std::optional<session::CxxStandard> standard = std::nullopt);

} // namespace clingkit::tests
