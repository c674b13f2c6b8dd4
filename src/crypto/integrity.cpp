#include "crypto/integrity.hpp"

#include "crypto/sha256.hpp"

#include <string>

namespace bundler {

const char* ToString(IntegrityError::Kind kind) {
    switch (kind) {
        case IntegrityError::Kind::Mismatch:          return "digest mismatch";
        case IntegrityError::Kind::MalformedExpected: return "malformed expected digest";
    }
    return "integrity error";
}

std::expected<void, IntegrityError> VerifySha256(std::span<const std::uint8_t> bytes,
                                                 std::string_view expected_hex) {
    if (expected_hex.empty()) {
        return std::unexpected(IntegrityError{IntegrityError::Kind::MalformedExpected,
                                              "expected sha256 is empty"});
    }

    const auto expected = HexDecode(expected_hex);
    if (!expected) {
        return std::unexpected(IntegrityError{
            IntegrityError::Kind::MalformedExpected,
            "expected sha256 is not valid hex: " + std::string(expected_hex)});
    }

    const std::string actual_hex = Sha256Hex(bytes);
    if (actual_hex.empty()) {
        return std::unexpected(IntegrityError{IntegrityError::Kind::Mismatch,
                                              "sha256 compute failed"});
    }

    // Compare raw digests so the expected string may use either case.
    const auto actual = HexDecode(actual_hex);
    if (!actual || *actual != *expected) {
        return std::unexpected(IntegrityError{
            IntegrityError::Kind::Mismatch,
            "sha256 mismatch: expected=" + std::string(expected_hex) + " actual=" + actual_hex});
    }

    return {};
}

} // namespace bundler
