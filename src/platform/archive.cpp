#include "archive.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <fmt/format.h>
#include <fstream>
#include <chrono>
#include <cstring>

namespace fs = std::filesystem;

namespace platform {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_archive_name(const std::string& filename) {
    return ends_with(filename, ".tar.gz") || ends_with(filename, ".tgz") ||
           ends_with(filename, ".zip") || ends_with(filename, ".tar");
}

Result<void> create_tar_gz(const fs::path& tar_path,
                           const fs::path& base_dir,
                           const std::vector<std::string>& files) {
    struct archive* a = archive_write_new();
    if (!a) return Result<void>::Err(ErrorKind::IO, "Failed to create archive writer");

    archive_write_add_filter_gzip(a);
    archive_write_set_format_pax_restricted(a);

    if (archive_write_open_filename(a, tar_path.string().c_str()) != ARCHIVE_OK) {
        std::string err = archive_error_string(a);
        archive_write_free(a);
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Failed to open {}: {}", tar_path.string(), err));
    }

    struct archive_entry* entry = archive_entry_new();

    for (const auto& rel_path : files) {
        fs::path full_path = base_dir / rel_path;

        std::error_code ec;
        if (!fs::is_regular_file(full_path, ec)) {
            archive_entry_free(entry);
            archive_write_free(a);
            return Result<void>::Err(ErrorKind::IO, "Not a regular file: " + full_path.string());
        }

        auto file_size = fs::file_size(full_path);
        // file_time_type has its own epoch; rebase onto the system clock
        auto mtime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            fs::last_write_time(full_path) - fs::file_time_type::clock::now() +
            std::chrono::system_clock::now());
        auto mtime_sec = std::chrono::system_clock::to_time_t(mtime);
        auto perms = fs::status(full_path).permissions();

        archive_entry_clear(entry);
        archive_entry_set_pathname(entry, rel_path.c_str());
        archive_entry_set_size(entry, static_cast<int64_t>(file_size));
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, static_cast<int>(perms & fs::perms::mask));
        archive_entry_set_mtime(entry, mtime_sec, 0);

        if (archive_write_header(a, entry) != ARCHIVE_OK) {
            std::string err = archive_error_string(a);
            archive_entry_free(entry);
            archive_write_free(a);
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("Failed to add {}: {}", rel_path, err));
        }

        // Write file contents in chunks
        std::ifstream in(full_path, std::ios::binary);
        char buf[65536];
        while (in) {
            in.read(buf, sizeof(buf));
            auto bytes_read = in.gcount();
            if (bytes_read > 0) {
                archive_write_data(a, buf, static_cast<size_t>(bytes_read));
            }
        }
    }

    archive_entry_free(entry);
    if (archive_write_close(a) != ARCHIVE_OK) {
        std::string err = archive_error_string(a);
        archive_write_free(a);
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Failed to finish {}: {}", tar_path.string(), err));
    }
    archive_write_free(a);
    return Result<void>::Ok();
}

static int copy_data(struct archive* ar, struct archive* aw) {
    const void* buff;
    size_t size;
    la_int64_t offset;

    for (;;) {
        int r = archive_read_data_block(ar, &buff, &size, &offset);
        if (r == ARCHIVE_EOF) return ARCHIVE_OK;
        if (r < ARCHIVE_OK) return r;
        r = archive_write_data_block(aw, buff, size, offset);
        if (r < ARCHIVE_OK) return r;
    }
}

// Relative and free of ".." components
static bool is_contained(const fs::path& rel) {
    if (rel.is_absolute() || rel.has_root_name()) return false;
    for (const auto& part : rel) {
        if (part == "..") return false;
    }
    return true;
}

Result<void> extract_archive(const fs::path& archive_path, const fs::path& dest_dir) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Extract,
            fmt::format("Failed to create {}: {}", dest_dir.string(), ec.message()));
    }

    // Entries are written below an absolute, link-free prefix
    fs::path dest = fs::canonical(dest_dir, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Extract,
            fmt::format("Failed to resolve {}: {}", dest_dir.string(), ec.message()));
    }

    struct archive* ar = archive_read_new();
    archive_read_support_format_tar(ar);
    archive_read_support_format_zip(ar);
    archive_read_support_filter_gzip(ar);

    struct archive* aw = archive_write_disk_new();
    archive_write_disk_set_options(aw,
        ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
        ARCHIVE_EXTRACT_SECURE_NODOTDOT | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(aw);

    auto fail = [&](const std::string& what, struct archive* src) {
        std::string err = fmt::format("{} {}: {}", what, archive_path.string(),
                                      archive_error_string(src) ? archive_error_string(src) : "unknown");
        archive_read_free(ar);
        archive_write_free(aw);
        return Result<void>::Err(ErrorKind::Extract, err);
    };

    if (archive_read_open_filename(ar, archive_path.string().c_str(), 10240) != ARCHIVE_OK) {
        return fail("Failed to open", ar);
    }

    size_t entries = 0;
    struct archive_entry* entry;
    for (;;) {
        int r = archive_read_next_header(ar, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) return fail("Failed to read", ar);

        const char* name = archive_entry_pathname(entry);
        if (!name || std::strlen(name) == 0) continue;

        fs::path rel(name);
        if (!is_contained(rel)) return fail("Unsafe path " + rel.string() + " in", ar);
        archive_entry_set_pathname(entry, (dest / rel).string().c_str());

        const char* link = archive_entry_hardlink(entry);
        if (link && std::strlen(link) > 0) {
            if (!is_contained(fs::path(link))) return fail("Unsafe link in", ar);
            archive_entry_set_hardlink(entry, (dest / link).string().c_str());
        }

        const char* target = archive_entry_symlink(entry);
        if (target && std::strlen(target) > 0 && !is_contained(fs::path(target))) {
            return fail("Unsafe symlink " + rel.string() + " -> " + target + " in", ar);
        }

        r = archive_write_header(aw, entry);
        if (r < ARCHIVE_WARN) return fail("Failed to extract entry from", aw);
        if (archive_entry_size(entry) > 0) {
            r = copy_data(ar, aw);
            if (r < ARCHIVE_WARN) return fail("Failed to write data from", aw);
        }
        if (archive_write_finish_entry(aw) < ARCHIVE_WARN) {
            return fail("Failed to finish entry from", aw);
        }
        ++entries;
    }

    archive_read_close(ar);
    archive_read_free(ar);
    archive_write_close(aw);
    archive_write_free(aw);

    if (entries == 0) {
        return Result<void>::Err(ErrorKind::Extract, "Archive is empty: " + archive_path.string());
    }
    return Result<void>::Ok();
}

} // namespace platform
