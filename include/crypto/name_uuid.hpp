#pragma once

#include <string>
#include <string_view>

namespace bundler {

// RFC 4122 version 5 UUID of `name` in the URL namespace, formatted as an
// uppercase registry GUID (8-4-4-4-12). Empty string if SHA-1 is unavailable.
std::string NameBasedUuid(std::string_view name);

} // namespace bundler
