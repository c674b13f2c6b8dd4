#include "crypto/name_uuid.hpp"

#include <openssl/evp.h>

#include <array>
#include <cstdint>
#include <vector>

namespace bundler {

namespace {

// 6ba7b811-9dad-11d1-80b4-00c04fd430c8
constexpr std::array<std::uint8_t, 16> kUrlNamespace = {
    0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8,
};

} // namespace

std::string NameBasedUuid(std::string_view name) {
    std::vector<std::uint8_t> input(kUrlNamespace.begin(), kUrlNamespace.end());
    input.insert(input.end(), name.begin(), name.end());

    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_Digest(input.data(), input.size(), digest.data(), &len, EVP_sha1(), nullptr) != 1 ||
        len < 16) {
        return {};
    }

    digest[6] = static_cast<std::uint8_t>((digest[6] & 0x0F) | 0x50);
    digest[8] = static_cast<std::uint8_t>((digest[8] & 0x3F) | 0x80);

    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0xF]);
    }
    return out;
}

} // namespace bundler
