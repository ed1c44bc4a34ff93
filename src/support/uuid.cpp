//===----------------------------------------------------------------------===//
//
// Part of the ClingKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "support/uuid.hpp"

#include "support/sha1.hpp"

namespace clingkit::support
{
std::string formatUuid(const Uuid &uuid)
{
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < uuid.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            out.push_back('-');
        out.push_back(kHex[uuid[i] >> 4]);
        out.push_back(kHex[uuid[i] & 0x0F]);
    }
    return out;
}

Uuid uuidV5(const Uuid &ns, std::string_view name)
{
    Sha1 hasher;
    hasher.update(ns.data(), ns.size());
    hasher.update(name);
    const auto digest = hasher.finish();

    Uuid out{};
    for (size_t i = 0; i < out.size(); ++i)
        out[i] = digest[i];

    // Version 5 in the high nibble of byte 6, RFC 4122 variant in byte 8.
    out[6] = static_cast<uint8_t>((out[6] & 0x0F) | 0x50);
    out[8] = static_cast<uint8_t>((out[8] & 0x3F) | 0x80);
    return out;
}

} // namespace clingkit::support
