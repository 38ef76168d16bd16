#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Create a gzip-compressed tar archive at tar_path containing the specified
// files from base_dir. Each entry in files is a relative path from base_dir;
// file permission bits are preserved.
Result<void> create_tar_gz(const std::filesystem::path& tar_path,
                           const std::filesystem::path& base_dir,
                           const std::vector<std::string>& files);

// True if the file name looks like an archive we can unpack (.tar.gz, .tgz, .zip, .tar).
bool is_archive_name(const std::string& filename);

// Extract a tar/tar.gz/zip archive into dest_dir (created if missing).
// Absolute paths, ".." components and links escaping dest_dir are refused.
// Fails with ErrorKind::Extract.
Result<void> extract_archive(const std::filesystem::path& archive_path,
                             const std::filesystem::path& dest_dir);

} // namespace platform
