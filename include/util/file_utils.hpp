#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace bundler {

Result ReadFileToString(const std::string& path, std::string& out);

// Writes path.tmp, then renames it over path. On failure path is untouched.
Result WriteFileAtomic(const std::string& path, std::string_view content);

// Removes path if it exists. Missing files are not an error.
Result RemoveIfExists(const std::string& path);

} // namespace bundler
