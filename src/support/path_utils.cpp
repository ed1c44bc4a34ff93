// File: src/support/path_utils.cpp
// Purpose: Implement helpers for normalizing file system paths.
// Key invariants: Normalization always yields forward slashes and resolves dot
// segments.
// Ownership/Lifetime: Stateless.

#include "support/path_utils.hpp"

#include <algorithm>

namespace clingkit::support
{

std::string normalizePath(std::string_view path)
{
    std::string sanitized(path);
    std::replace(sanitized.begin(), sanitized.end(), '\\', '/');

    if (sanitized.empty())
        return std::string{"."};

    std::filesystem::path fsPath(sanitized);
    std::string generic = fsPath.lexically_normal().generic_string();

    if (generic.empty())
        generic = sanitized.front() == '/' ? std::string{"/"} : std::string{"."};

    // lexically_normal keeps a trailing separator for directory paths.
    if (generic.size() > 1 && generic.back() == '/')
        generic.pop_back();

    return generic;
}

std::string absolutePath(std::string_view path, const std::filesystem::path &base)
{
    std::filesystem::path p{std::string(path)};
    if (p.is_absolute())
        return normalizePath(p.generic_string());
    return normalizePath((base / p).generic_string());
}

std::string basename(std::string_view path)
{
    if (path.empty())
        return {};
    std::string normalized = normalizePath(path);
    size_t pos = normalized.find_last_of('/');
    if (pos == std::string::npos)
        return normalized == "." ? std::string{} : normalized;
    if (pos + 1 >= normalized.size())
        return {};
    return normalized.substr(pos + 1);
}

} // namespace clingkit::support
