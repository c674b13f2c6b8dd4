#pragma once

#include "util/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace bundler {

// Extracts an in-memory archive (zip, tar, optionally compressed) into a
// directory, entry by entry. Existing files are overwritten. There is no
// rollback: on failure the entries written so far stay on disk.
class ArchiveExtractor {
  public:
    struct Options {
        bool safe_paths_only = true;
        bool restore_permissions = true;
    };

    struct Stats {
        std::size_t entries = 0;
        std::uint64_t bytes = 0;
    };

    ArchiveExtractor() = default;
    explicit ArchiveExtractor(const Options& opt) : opt_(opt) {}

    Result ExtractToDir(std::span<const std::uint8_t> archive_bytes,
                        const std::string& dst_dir,
                        Stats* stats = nullptr) const;

  private:
    Options opt_{};
};

} // namespace bundler
