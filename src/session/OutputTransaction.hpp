//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/OutputTransaction.hpp
// Purpose: All-or-nothing materialization of generated files.
// Key invariants: Nothing reaches a destination until every entry has been
//                 prepared successfully in the staging area.
// Ownership/Lifetime: StagingArea owns its directory and removes it on
//                     destruction; OutputTransaction only records paths.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace clingkit::session
{

/// @brief Private scratch directory below the binary directory.
class StagingArea
{
  public:
    /// @brief Create a fresh staging directory inside @p binaryDir.
    static support::Expected<StagingArea> create(const std::filesystem::path &binaryDir);

    StagingArea(StagingArea &&other) noexcept;
    StagingArea &operator=(StagingArea &&) = delete;
    StagingArea(const StagingArea &) = delete;
    StagingArea &operator=(const StagingArea &) = delete;
    ~StagingArea();

    const std::filesystem::path &path() const
    {
        return dir_;
    }

    /// @brief Subdirectory where downloads are placed.
    std::filesystem::path fetchDir() const
    {
        return dir_ / "fetch";
    }

  private:
    explicit StagingArea(std::filesystem::path dir);

    std::filesystem::path dir_;
};

/// @brief Collects file operations and applies them together.
class OutputTransaction
{
  public:
    explicit OutputTransaction(const StagingArea &staging);

    /// @brief Write @p text to @p destination.
    void write(std::filesystem::path destination, std::string text);

    /// @brief Copy the existing file @p source to @p destination.
    void copy(std::filesystem::path source, std::filesystem::path destination);

    /// @brief Move a file already placed in the staging area to @p destination.
    void adopt(std::filesystem::path staged, std::filesystem::path destination);

    /// @brief Prepare every entry in the staging area, then move them into place.
    /// @return Destinations in the order they were added, InvalidConfiguration when
    ///         two entries share a destination, or an Io error.
    support::Expected<std::vector<std::filesystem::path>> commit();

  private:
    enum class EntryKind
    {
        Text,
        Copy,
        Staged,
    };

    struct Entry
    {
        EntryKind kind;
        std::filesystem::path source;
        std::filesystem::path destination;
        std::string text;
    };

    std::filesystem::path outDir_;
    std::vector<Entry> entries_;
};

} // namespace clingkit::session
