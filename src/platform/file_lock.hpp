#pragma once
#include <string>

// RAII advisory lock on a lock file. Non-blocking: if another process holds
// it, held() is false after construction.
// Uses flock() on Unix, LockFileEx() on Windows.
// Lock is automatically released when the process exits (even on crash).
class FileLock {
public:
    // Attempts to acquire the lock. Check held() after construction.
    explicit FileLock(const std::string& lock_path);
    ~FileLock();

    FileLock(FileLock&& other) noexcept;
    FileLock& operator=(FileLock&& other) noexcept;

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    // Returns true if this instance holds the lock.
    bool held() const { return fd_ >= 0; }

    // errno-style reason when the lock file itself could not be opened.
    // Zero when the file opened but another process holds the lock.
    int open_error() const { return open_error_; }

private:
    void release();

    int fd_ = -1;
    int open_error_ = 0;
};
