#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace bundler {

struct IntegrityError {
    enum class Kind {
        Mismatch,
        MalformedExpected,
    };

    Kind kind = Kind::Mismatch;
    std::string msg;
};

const char* ToString(IntegrityError::Kind kind);

// Gate that must pass before downloaded bytes are extracted or executed.
std::expected<void, IntegrityError> VerifySha256(std::span<const std::uint8_t> bytes,
                                                 std::string_view expected_hex);

} // namespace bundler
