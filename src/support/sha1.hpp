//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/sha1.hpp
// Purpose: Declares an incremental SHA-1 digest (FIPS 180-4) used to derive
//          name-based session identifiers.
// Key invariants: finish() may be called once; the digest is 20 bytes.
// Ownership/Lifetime: Value type; no dynamic allocation.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace clingkit::support
{

/// @brief Incremental SHA-1 hasher.
class Sha1
{
  public:
    using Digest = std::array<uint8_t, 20>;

    Sha1();

    /// @brief Feed @p size bytes starting at @p data into the hash state.
    void update(const uint8_t *data, size_t size);

    /// @brief Feed the bytes of @p text into the hash state.
    void update(std::string_view text);

    /// @brief Apply padding and return the final digest.
    Digest finish();

  private:
    void processBlock(const uint8_t *block);

    std::array<uint32_t, 5> state_;
    std::array<uint8_t, 64> buffer_{};
    size_t buffered_ = 0;
    uint64_t totalBytes_ = 0;
};

} // namespace clingkit::support
