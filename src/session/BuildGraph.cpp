//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "session/BuildGraph.hpp"

namespace clingkit::session
{

std::optional<TargetKind> parseTargetKind(std::string_view text)
{
    if (text == "SHARED_LIBRARY")
        return TargetKind::SharedLibrary;
    if (text == "MODULE_LIBRARY")
        return TargetKind::ModuleLibrary;
    if (text == "STATIC_LIBRARY")
        return TargetKind::StaticLibrary;
    if (text == "OBJECT_LIBRARY")
        return TargetKind::ObjectLibrary;
    if (text == "INTERFACE_LIBRARY")
        return TargetKind::InterfaceLibrary;
    if (text == "EXECUTABLE")
        return TargetKind::Executable;
    if (text == "UTILITY")
        return TargetKind::Utility;
    return std::nullopt;
}

const char *targetKindName(TargetKind kind)
{
    switch (kind)
    {
        case TargetKind::SharedLibrary:
            return "SHARED_LIBRARY";
        case TargetKind::ModuleLibrary:
            return "MODULE_LIBRARY";
        case TargetKind::StaticLibrary:
            return "STATIC_LIBRARY";
        case TargetKind::ObjectLibrary:
            return "OBJECT_LIBRARY";
        case TargetKind::InterfaceLibrary:
            return "INTERFACE_LIBRARY";
        case TargetKind::Executable:
            return "EXECUTABLE";
        case TargetKind::Utility:
            return "UTILITY";
    }
    return "";
}

bool isLoadable(TargetKind kind)
{
    switch (kind)
    {
        case TargetKind::SharedLibrary:
            return true;
        case TargetKind::ModuleLibrary:
        case TargetKind::StaticLibrary:
        case TargetKind::ObjectLibrary:
        case TargetKind::InterfaceLibrary:
        case TargetKind::Executable:
        case TargetKind::Utility:
            return false;
    }
    return false;
}

} // namespace clingkit::session
