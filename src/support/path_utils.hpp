// File: src/support/path_utils.hpp
// Purpose: Declare helpers for normalizing file system paths and extracting
// their components.
// Key invariants: Normalized paths always use forward slashes and have dot
// segments resolved.
// Ownership/Lifetime: Free functions returning owned strings.
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace clingkit::support
{

/// @brief Normalize @p path lexically.
/// @param path Arbitrary file system path, possibly using backslashes.
/// @return Normalized path with dot segments collapsed and forward slashes.
[[nodiscard]] std::string normalizePath(std::string_view path);

/// @brief Make @p path absolute against @p base and normalize it.
/// @param path Absolute path returned as-is (normalized) or a relative path.
/// @param base Directory relative paths are interpreted against.
[[nodiscard]] std::string absolutePath(std::string_view path, const std::filesystem::path &base);

/// @brief Compute basename component of @p path after normalization.
/// @param path Path expressed with forward slashes.
/// @return Last path component or empty string when none exists.
[[nodiscard]] std::string basename(std::string_view path);

} // namespace clingkit::support
