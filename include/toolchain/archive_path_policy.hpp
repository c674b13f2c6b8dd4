#pragma once

#include "util/result.hpp"

#include <string>

namespace bundler {

// Maps raw archive entry names onto paths relative to the extraction root and
// rejects names that would land outside it.
class ArchivePathPolicy {
  public:
    explicit ArchivePathPolicy(bool safe_paths_only) : safe_paths_only_(safe_paths_only) {}

    // out_relative is left empty for entries that name the root itself.
    Result NormalizeEntryPath(const char* raw_path, std::string& out_relative) const;
    Result NormalizeHardlinkPath(const char* raw_path, std::string& out_relative) const;

    static bool IsSafeRelativePath(const std::string& p);

  private:
    Result Normalize(const char* raw_path, const char* what, std::string& out_relative) const;

    bool safe_paths_only_ = true;
};

} // namespace bundler
