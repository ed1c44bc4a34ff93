//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "session/InstallDriver.hpp"

#include <system_error>

namespace fs = std::filesystem;

using clingkit::support::ErrorCode;
using clingkit::support::Expected;
using clingkit::support::makeError;

namespace clingkit::session
{
namespace
{

Expected<void> copyInto(const std::vector<fs::path> &files, const fs::path &dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        return makeError(ErrorCode::Io, "cannot create " + dir.string() + ": " + ec.message());

    for (const auto &file : files)
    {
        fs::copy_file(file, dir / file.filename(), fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            return makeError(ErrorCode::Io,
                             "cannot copy " + file.string() + " to " + dir.string() + ": " + ec.message());
        }
    }
    return {};
}

std::string trimTrailingNewlines(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        text.pop_back();
    return text;
}

} // namespace

Expected<Prerequisites> checkPrerequisites(const HostTools &tools, bool required)
{
    Prerequisites found;
    found.interpreter = tools.findProgram(kInterpreterProgram);
    if (!found.interpreter && required)
    {
        return makeError(ErrorCode::PrerequisiteMissing,
                         "required interpreter '" + std::string(kInterpreterProgram) + "' was not found");
    }
    found.registrar = tools.findProgram(kRegistrationProgram);
    return found;
}

fs::path interpreterPrefix(const fs::path &interpreter)
{
    return interpreter.lexically_normal().parent_path().parent_path();
}

InstallLayout installLayout(const fs::path &prefix)
{
    return InstallLayout{prefix / "etc" / "xeus-cling" / "tags.d",
                         prefix / "share" / "xeus-cling" / "tagfiles"};
}

Expected<void> installDocumentation(const std::vector<fs::path> &fragments,
                                    const std::vector<fs::path> &tagFiles,
                                    const fs::path &prefix,
                                    support::DiagnosticEngine &diags)
{
    const InstallLayout layout = installLayout(prefix);
    diags.note("installing documentation into " + prefix.string());
    if (auto copied = copyInto(fragments, layout.fragmentDir); !copied)
        return copied;
    return copyInto(tagFiles, layout.tagFileDir);
}

std::vector<std::string> registrationCommand(const std::string &registrar,
                                             const fs::path &binaryDir,
                                             const std::string &sessionId)
{
    return {registrar, "kernelspec", "install", binaryDir.string(), "--sys-prefix", "--name=" + sessionId};
}

Expected<void> registerKernel(const fs::path &binaryDir,
                              const std::string &sessionId,
                              HostTools &tools,
                              support::DiagnosticEngine &diags)
{
    auto registrar = tools.findProgram(kRegistrationProgram);
    if (!registrar)
    {
        diags.warning("'" + std::string(kRegistrationProgram) +
                      "' was not found; the kernel was not registered");
        return {};
    }

    RunResult result = tools.run(registrationCommand(*registrar, binaryDir, sessionId));
    if (result.exit_code != 0)
    {
        std::string detail = trimTrailingNewlines(result.out.empty() ? result.err : result.out);
        return makeError(ErrorCode::Registration,
                         "kernel registration failed with status " + std::to_string(result.exit_code) +
                             (detail.empty() ? std::string() : ": " + detail));
    }
    diags.note("registered kernel " + sessionId);
    return {};
}

} // namespace clingkit::session
