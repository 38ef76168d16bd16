#include "platform.hpp"
#include <cstdlib>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <random>
#include <mutex>
#include <fstream>
#include <fmt/format.h>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#  include <process.h>
#else
#  include <unistd.h>
#  include <fcntl.h>
#  include <sys/stat.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

std::string unique_name(const std::string& prefix) {
    static std::mutex mtx;
    static std::mt19937 rng(std::random_device{}() ^ static_cast<unsigned>(std::time(nullptr)));
    std::uniform_int_distribution<unsigned> dist(0, 0xFFFFFF);
    unsigned suffix;
    {
        std::lock_guard<std::mutex> lock(mtx);
        suffix = dist(rng);
    }
#ifdef _WIN32
    int pid = _getpid();
#else
    int pid = static_cast<int>(getpid());
#endif
    return fmt::format("{}-{}-{:06x}", prefix, pid, suffix);
}

void sleep_ms(int ms) {
#ifdef _WIN32
    Sleep(ms);
#else
    usleep(static_cast<useconds_t>(ms) * 1000);
#endif
}

std::string current_os() {
#if defined(_WIN32)
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#else
    return "unknown";
#endif
}

std::string current_arch() {
#if defined(__x86_64__) || defined(_M_X64)
    return "x64";
#elif defined(__aarch64__) || defined(_M_ARM64)
    return "arm64";
#elif defined(__i386__) || defined(_M_IX86)
    return "ia32";
#elif defined(__arm__)
    return "arm";
#else
    return "unknown";
#endif
}

#ifdef _WIN32

Result<void> write_file_atomic(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    fs::path tmp = path.parent_path() / ("." + unique_name(path.filename().string()) + ".tmp");

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<void>::Err(ErrorKind::IO, "Failed to create " + tmp.string());
        }
        out << contents;
        out.flush();
        if (!out) {
            fs::remove(tmp, ec);
            return Result<void>::Err(ErrorKind::IO, "Failed to write " + tmp.string());
        }
    }

    if (!MoveFileExA(tmp.string().c_str(), path.string().c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        fs::remove(tmp, ec);
        return Result<void>::Err(ErrorKind::IO, "Failed to replace " + path.string());
    }
    return Result<void>::Ok();
}

bool is_executable(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

Result<void> make_executable(const fs::path&) {
    return Result<void>::Ok();
}

#else // Unix

Result<void> write_file_atomic(const fs::path& path, const std::string& contents) {
    std::error_code ec;
    fs::path dir = path.parent_path().empty() ? fs::path(".") : path.parent_path();
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Failed to create {}: {}", dir.string(), ec.message()));
    }

    fs::path tmp = dir / ("." + unique_name(path.filename().string()) + ".tmp");
    int fd = open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Failed to create {}: {}", tmp.string(), std::strerror(errno)));
    }

    auto fail = [&](const std::string& what) {
        std::string msg = fmt::format("{} {}: {}", what, tmp.string(), std::strerror(errno));
        close(fd);
        unlink(tmp.c_str());
        return Result<void>::Err(ErrorKind::IO, msg);
    };

    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t n = write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return fail("Failed to write");
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    if (fsync(fd) != 0) return fail("Failed to fsync");
    if (close(fd) != 0) {
        unlink(tmp.c_str());
        return Result<void>::Err(ErrorKind::IO, "Failed to close " + tmp.string());
    }

    if (rename(tmp.c_str(), path.c_str()) != 0) {
        std::string msg = fmt::format("Failed to rename {} over {}: {}",
                                      tmp.string(), path.string(), std::strerror(errno));
        unlink(tmp.c_str());
        return Result<void>::Err(ErrorKind::IO, msg);
    }

    // Persist the directory entry too
    int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) {
        fsync(dfd);
        close(dfd);
    }
    return Result<void>::Ok();
}

bool is_executable(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return false;
    return access(path.c_str(), X_OK) == 0;
}

Result<void> make_executable(const fs::path& path) {
    std::error_code ec;
    fs::permissions(path,
                    fs::perms::owner_all |
                    fs::perms::group_read | fs::perms::group_exec |
                    fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Permission,
            fmt::format("Failed to set permissions on {}: {}", path.string(), ec.message()));
    }
    return Result<void>::Ok();
}

#endif

} // namespace platform
