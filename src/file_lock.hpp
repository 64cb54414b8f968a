#pragma once
#include <string>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace skillgate {

// Exclusive, non-blocking lock on "<path>.lock" held for the object's
// lifetime. Throws std::runtime_error when another owner holds it.
// The lock file is left in place so every owner locks the same inode.
class FileLock {
public:
    explicit FileLock(const std::string& path) : path_(path + ".lock") {
#ifdef _WIN32
        handle_ = CreateFileA(path_.c_str(), GENERIC_WRITE, 0, nullptr,
                              OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle_ == INVALID_HANDLE_VALUE) {
            throw std::runtime_error("Audit DB is in use by another process (" + path_ + ")");
        }
#else
        fd_ = open(path_.c_str(), O_CREAT | O_RDWR, 0644);
        if (fd_ < 0) {
            throw std::runtime_error("Cannot open lock file " + path_);
        }
        if (flock(fd_, LOCK_EX | LOCK_NB) != 0) {
            close(fd_);
            fd_ = -1;
            throw std::runtime_error("Audit DB is in use by another process (" + path_ + ")");
        }
#endif
    }
    ~FileLock() {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
#else
        if (fd_ >= 0) { flock(fd_, LOCK_UN); close(fd_); }
#endif
    }
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    std::string path_;
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
#else
    int fd_ = -1;
#endif
};

} // namespace skillgate
