//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: session/OutputTransaction.cpp
// Purpose: Staging directory lifetime and the two-phase commit of outputs.
//
// Phase one writes text entries and copies assets into the staging area.
// Phase two renames staged files over their destinations; both live below the
// binary directory so each rename stays on one file system. Nothing is
// prepared when two entries share a destination.
//
//===----------------------------------------------------------------------===//

#include "session/OutputTransaction.hpp"

#include "support/path_utils.hpp"

#include <fstream>
#include <set>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif

namespace fs = std::filesystem;

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{
namespace
{

support::Diag ioError(const std::string &what, const fs::path &path, const std::error_code &ec)
{
    return makeError(ErrorCode::Io, what + " " + path.string() + ": " + ec.message());
}

Expected<void> writeFile(const fs::path &path, const std::string &text)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return makeError(ErrorCode::Io, "unable to open " + path.string() + " for writing");
    out << text;
    if (!out)
        return makeError(ErrorCode::Io, "failed to write " + path.string());
    return {};
}

} // namespace

StagingArea::StagingArea(fs::path dir) : dir_(std::move(dir)) {}

StagingArea::StagingArea(StagingArea &&other) noexcept : dir_(std::exchange(other.dir_, fs::path())) {}

StagingArea::~StagingArea()
{
    if (dir_.empty())
        return;
    std::error_code ec;
    fs::remove_all(dir_, ec);
}

Expected<StagingArea> StagingArea::create(const fs::path &binaryDir)
{
#ifdef _WIN32
    auto pid = _getpid();
#else
    auto pid = getpid();
#endif
    fs::path dir = binaryDir / (".clingkit-staging-" + std::to_string(pid));

    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir / "out", ec);
    if (!ec)
        fs::create_directories(dir / "fetch", ec);
    if (ec)
        return makeError(ErrorCode::Io, "unable to create staging directory " + dir.string() + ": " + ec.message());
    return StagingArea(std::move(dir));
}

OutputTransaction::OutputTransaction(const StagingArea &staging) : outDir_(staging.path() / "out") {}

void OutputTransaction::write(fs::path destination, std::string text)
{
    entries_.push_back(Entry{EntryKind::Text, fs::path(), std::move(destination), std::move(text)});
}

void OutputTransaction::copy(fs::path source, fs::path destination)
{
    entries_.push_back(Entry{EntryKind::Copy, std::move(source), std::move(destination), std::string()});
}

void OutputTransaction::adopt(fs::path staged, fs::path destination)
{
    entries_.push_back(Entry{EntryKind::Staged, std::move(staged), std::move(destination), std::string()});
}

Expected<std::vector<fs::path>> OutputTransaction::commit()
{
    std::set<std::string> destinations;
    for (const Entry &entry : entries_)
    {
        if (!destinations.insert(support::normalizePath(entry.destination.string())).second)
            return makeError(ErrorCode::InvalidConfiguration,
                             "output " + entry.destination.string() + " would be written more than once");
    }

    std::vector<fs::path> prepared;
    prepared.reserve(entries_.size());

    for (size_t i = 0; i < entries_.size(); ++i)
    {
        const Entry &entry = entries_[i];
        const fs::path slot = outDir_ / std::to_string(i);
        std::error_code ec;
        switch (entry.kind)
        {
            case EntryKind::Text:
                if (auto written = writeFile(slot, entry.text); !written)
                    return written.error();
                prepared.push_back(slot);
                break;
            case EntryKind::Copy:
                fs::copy_file(entry.source, slot, fs::copy_options::overwrite_existing, ec);
                if (ec)
                    return ioError("unable to copy", entry.source, ec);
                prepared.push_back(slot);
                break;
            case EntryKind::Staged:
                if (!fs::is_regular_file(entry.source, ec))
                    return makeError(ErrorCode::Io, "staged file " + entry.source.string() + " is missing");
                prepared.push_back(entry.source);
                break;
        }
    }

    std::vector<fs::path> committed;
    committed.reserve(entries_.size());
    for (size_t i = 0; i < entries_.size(); ++i)
    {
        const fs::path &destination = entries_[i].destination;
        std::error_code ec;
        if (destination.has_parent_path())
        {
            fs::create_directories(destination.parent_path(), ec);
            if (ec)
                return ioError("unable to create", destination.parent_path(), ec);
        }
        fs::rename(prepared[i], destination, ec);
        if (ec)
            return ioError("unable to move output to", destination, ec);
        committed.push_back(destination);
    }
    entries_.clear();
    return committed;
}

} // namespace clingkit::session
