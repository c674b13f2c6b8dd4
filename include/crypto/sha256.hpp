#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bundler {

// Lowercase hex SHA-256 of `data`; empty string if the digest could not be
// computed.
std::string Sha256Hex(std::span<const std::uint8_t> data);

std::string HexEncode(std::span<const std::uint8_t> bytes);

// Accepts upper and lower case. nullopt on odd length or a non-hex character.
std::optional<std::vector<std::uint8_t>> HexDecode(std::string_view hex);

} // namespace bundler
