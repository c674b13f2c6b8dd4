#include "toolchain/archive_extractor.hpp"

#include "toolchain/archive_path_policy.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <memory>

namespace bundler {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

std::string ArchiveErr(archive* a) {
    const char* s = archive_error_string(a);
    return s ? std::string(s) : std::string("unknown libarchive error");
}

} // namespace

Result ArchiveExtractor::ExtractToDir(std::span<const std::uint8_t> archive_bytes,
                                      const std::string& dst_dir,
                                      Stats* stats) const {
    namespace fs = std::filesystem;

    const fs::path base_dir(dst_dir);

    std::error_code ec;
    fs::create_directories(base_dir, ec);
    if (ec) {
        return Result::Fail(ec.value(), "create_directories failed: " + dst_dir + ": " + ec.message());
    }
    if (!fs::is_directory(base_dir, ec) || ec) {
        return Result::Fail(-1, "Destination path is not a directory: " + dst_dir);
    }

    std::unique_ptr<archive, ArchiveReadDeleter> ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_all(ar.get());
    archive_read_support_format_all(ar.get());

    if (archive_read_open_memory(ar.get(), archive_bytes.data(), archive_bytes.size()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_read_open_memory: " + ArchiveErr(ar.get()));
    }

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_disk_new());
    if (!aw) return Result::Fail(-1, "archive_write_disk_new failed");

    int flags = 0;
    flags |= ARCHIVE_EXTRACT_UNLINK;
    flags |= ARCHIVE_EXTRACT_TIME;
    flags |= ARCHIVE_EXTRACT_SECURE_NODOTDOT;
    flags |= ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (opt_.restore_permissions) flags |= ARCHIVE_EXTRACT_PERM;
    // Entry paths are rewritten to absolute paths under dst_dir, so
    // NOABSOLUTEPATHS would reject every valid target.

    archive_write_disk_set_options(aw.get(), flags);
    archive_write_disk_set_standard_lookup(aw.get());

    ArchivePathPolicy path_policy(opt_.safe_paths_only);
    Stats local{};

    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return Result::Fail(-1, "archive_read_next_header: " + ArchiveErr(ar.get()));
        }

        std::string rel;
        auto path_res = path_policy.NormalizeEntryPath(archive_entry_pathname(entry), rel);
        if (!path_res.is_ok()) return path_res;
        if (rel.empty()) {
            (void)archive_read_data_skip(ar.get());
            continue;
        }

        const std::string target_path = (base_dir / fs::path(rel)).string();
        archive_entry_set_pathname(entry, target_path.c_str());

        std::string rel_hl;
        auto hl_res = path_policy.NormalizeHardlinkPath(archive_entry_hardlink(entry), rel_hl);
        if (!hl_res.is_ok()) return hl_res;
        if (!rel_hl.empty()) {
            const std::string hardlink_target = (base_dir / fs::path(rel_hl)).string();
            archive_entry_set_hardlink(entry, hardlink_target.c_str());
        }

        LogDebug("extract: %s", rel.c_str());

        const int wh = archive_write_header(aw.get(), entry);
        if (wh != ARCHIVE_OK && wh != ARCHIVE_WARN) {
            return Result::Fail(-1, "archive_write_header: " + rel + ": " + ArchiveErr(aw.get()));
        }

        const void* buff = nullptr;
        size_t size = 0;
        la_int64_t offset = 0;

        while (true) {
            const int rr = archive_read_data_block(ar.get(), &buff, &size, &offset);
            if (rr == ARCHIVE_EOF) break;
            if (rr != ARCHIVE_OK) {
                return Result::Fail(-1, "archive_read_data_block: " + rel + ": " + ArchiveErr(ar.get()));
            }

            const la_ssize_t ww = archive_write_data_block(aw.get(), buff, size, offset);
            if (ww != ARCHIVE_OK) {
                return Result::Fail(-1, "archive_write_data_block: " + rel + ": " + ArchiveErr(aw.get()));
            }

            local.bytes += static_cast<std::uint64_t>(size);
        }

        const int wf = archive_write_finish_entry(aw.get());
        if (wf != ARCHIVE_OK && wf != ARCHIVE_WARN) {
            return Result::Fail(-1, "archive_write_finish_entry: " + rel + ": " + ArchiveErr(aw.get()));
        }
        ++local.entries;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get()));
    }

    if (stats) *stats = local;
    return Result::Ok();
}

} // namespace bundler
