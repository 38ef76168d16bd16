#pragma once
#include <string>

// RAII advisory lock on a lock file. Serializes read-modify-write sequences
// between concurrent pm processes; the protected files never depend on it.
// Uses flock() on Unix, LockFileEx() on Windows.
// Lock is automatically released when the process exits (even on crash).
class FileLock {
public:
    // Acquires the lock. With wait=false, gives up immediately if another
    // process holds it. Check held() after construction.
    explicit FileLock(const std::string& lock_path, bool wait = true);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

private:
    int fd_ = -1;
};
