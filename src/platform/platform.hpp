#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Returns a name of the form "<prefix>-<pid>-<random>" that is unlikely to
// collide with a concurrent process doing the same.
std::string unique_name(const std::string& prefix);

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Running OS/CPU in the release vocabulary: "linux", "darwin", "win32";
// "x64", "arm64" (anything else is reported verbatim by the compiler macros).
std::string current_os();
std::string current_arch();

// Write contents to a sibling temp file, fsync it, then rename it over path.
// Readers observe either the old file or the new one, never a partial write.
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& contents);

// True if path is a regular file with an execute bit (any file on Windows).
bool is_executable(const std::filesystem::path& path);

// Add 0755 permissions. No-op on Windows.
Result<void> make_executable(const std::filesystem::path& path);

} // namespace platform
