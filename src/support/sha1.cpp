//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Straightforward SHA-1 implementation.  Input is buffered into 64-byte blocks;
// the final block carries the 0x80 terminator and the big-endian bit length.
//
//===----------------------------------------------------------------------===//

#include "support/sha1.hpp"

#include <algorithm>

namespace clingkit::support
{
namespace
{
constexpr uint32_t rotl(uint32_t value, unsigned bits)
{
    return (value << bits) | (value >> (32U - bits));
}
} // namespace

Sha1::Sha1() : state_{0x67452301U, 0xEFCDAB89U, 0x98BADCFEU, 0x10325476U, 0xC3D2E1F0U} {}

void Sha1::update(const uint8_t *data, size_t size)
{
    totalBytes_ += size;
    while (size > 0)
    {
        const size_t take = std::min(size, buffer_.size() - buffered_);
        std::copy(data, data + take, buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_));
        buffered_ += take;
        data += take;
        size -= take;
        if (buffered_ == buffer_.size())
        {
            processBlock(buffer_.data());
            buffered_ = 0;
        }
    }
}

void Sha1::update(std::string_view text)
{
    update(reinterpret_cast<const uint8_t *>(text.data()), text.size());
}

Sha1::Digest Sha1::finish()
{
    const uint64_t bitLength = totalBytes_ * 8U;

    const uint8_t terminator = 0x80;
    update(&terminator, 1);
    const uint8_t zero = 0;
    while (buffered_ != 56)
        update(&zero, 1);

    std::array<uint8_t, 8> length{};
    for (int i = 0; i < 8; ++i)
        length[static_cast<size_t>(i)] = static_cast<uint8_t>(bitLength >> (56 - 8 * i));
    update(length.data(), length.size());

    Digest digest{};
    for (size_t i = 0; i < state_.size(); ++i)
    {
        digest[i * 4 + 0] = static_cast<uint8_t>(state_[i] >> 24);
        digest[i * 4 + 1] = static_cast<uint8_t>(state_[i] >> 16);
        digest[i * 4 + 2] = static_cast<uint8_t>(state_[i] >> 8);
        digest[i * 4 + 3] = static_cast<uint8_t>(state_[i]);
    }
    return digest;
}

void Sha1::processBlock(const uint8_t *block)
{
    std::array<uint32_t, 80> w{};
    for (size_t i = 0; i < 16; ++i)
    {
        w[i] = (static_cast<uint32_t>(block[i * 4]) << 24) |
               (static_cast<uint32_t>(block[i * 4 + 1]) << 16) |
               (static_cast<uint32_t>(block[i * 4 + 2]) << 8) |
               static_cast<uint32_t>(block[i * 4 + 3]);
    }
    for (size_t i = 16; i < 80; ++i)
        w[i] = rotl(w[i - 3] ^ w[i - 8] ^ w[i - 14] ^ w[i - 16], 1);

    uint32_t a = state_[0];
    uint32_t b = state_[1];
    uint32_t c = state_[2];
    uint32_t d = state_[3];
    uint32_t e = state_[4];

    for (size_t i = 0; i < 80; ++i)
    {
        uint32_t f = 0;
        uint32_t k = 0;
        if (i < 20)
        {
            f = (b & c) | (~b & d);
            k = 0x5A827999U;
        }
        else if (i < 40)
        {
            f = b ^ c ^ d;
            k = 0x6ED9EBA1U;
        }
        else if (i < 60)
        {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8F1BBCDCU;
        }
        else
        {
            f = b ^ c ^ d;
            k = 0xCA62C1D6U;
        }

        const uint32_t temp = rotl(a, 5) + f + e + k + w[i];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = temp;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
}

} // namespace clingkit::support
