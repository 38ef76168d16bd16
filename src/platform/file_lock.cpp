#include "file_lock.hpp"
#include <filesystem>
#include <cerrno>

#ifdef _WIN32
#  include <windows.h>
#  include <io.h>
#  include <fcntl.h>
#else
#  include <sys/file.h>
#  include <unistd.h>
#  include <fcntl.h>
#endif

FileLock::FileLock(const std::string& lock_path, bool wait) {
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(lock_path).parent_path(), ec);

#ifdef _WIN32
    fd_ = _open(lock_path.c_str(), _O_CREAT | _O_RDWR, 0644);
    if (fd_ < 0) return;
    HANDLE h = (HANDLE)_get_osfhandle(fd_);
    OVERLAPPED ov = {};
    DWORD flags = LOCKFILE_EXCLUSIVE_LOCK;
    if (!wait) flags |= LOCKFILE_FAIL_IMMEDIATELY;
    if (!LockFileEx(h, flags, 0, 1, 0, &ov)) {
        _close(fd_);
        fd_ = -1;
    }
#else
    fd_ = open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) return;
    int op = wait ? LOCK_EX : (LOCK_EX | LOCK_NB);
    int rc;
    do {
        rc = flock(fd_, op);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) {
        close(fd_);
        fd_ = -1;
    }
#endif
}

FileLock::~FileLock() {
    if (fd_ < 0) return;
#ifdef _WIN32
    _close(fd_);
#else
    close(fd_);
#endif
    // flock is released automatically when fd is closed
}
