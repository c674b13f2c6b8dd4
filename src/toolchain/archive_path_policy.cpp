#include "toolchain/archive_path_policy.hpp"

#include "util/path_utils.hpp"

#include <filesystem>

namespace bundler {

bool ArchivePathPolicy::IsSafeRelativePath(const std::string& p) {
    if (p.empty() || p.front() == '/') return false;
    // Windows separators and drive prefixes ("C:tools") from zips built on Windows.
    if (p.find('\\') != std::string::npos) return false;
    if (p.size() >= 2 && p[1] == ':') return false;

    for (const auto& part : std::filesystem::path(p)) {
        if (part == "..") return false;
    }
    return true;
}

Result ArchivePathPolicy::Normalize(const char* raw_path,
                                    const char* what,
                                    std::string& out_relative) const {
    const std::string raw = raw_path ? std::string(raw_path) : std::string();
    // Normalizing drops a leading '/', so absolute names are caught first.
    if (safe_paths_only_ && !raw.empty() && raw.front() == '/') {
        out_relative.clear();
        return Result::Fail(-1, std::string("Unsafe ") + what + " in archive: " + raw);
    }

    out_relative = NormalizeArchivePath(raw);
    if (out_relative == ".") out_relative.clear();
    if (out_relative.empty()) return Result::Ok();

    if (safe_paths_only_ && !IsSafeRelativePath(out_relative)) {
        return Result::Fail(-1, std::string("Unsafe ") + what + " in archive: " + out_relative);
    }
    return Result::Ok();
}

Result ArchivePathPolicy::NormalizeEntryPath(const char* raw_path, std::string& out_relative) const {
    return Normalize(raw_path, "path", out_relative);
}

Result ArchivePathPolicy::NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const {
    return Normalize(raw_path, "hardlink target", out_relative);
}

} // namespace bundler
