#pragma once

#include <chrono>
#include <filesystem>

namespace advisor {

// Advisory file lock (best-effort).
// Unix: flock on "<target>.lock", fallback: lock directory creation.
// Acquisition retries until the timeout expires; on failure locked() returns false
// and callers proceed without the lock.
class FileLock {
public:
    enum class Mode {
        Shared,
        Exclusive,
    };

    explicit FileLock(const std::filesystem::path& target,
                      Mode mode = Mode::Exclusive,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(500));
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }
    Mode mode() const { return mode_; }

private:
    bool tryAcquireOnce();
    void release();

    std::filesystem::path lock_path_;
    Mode mode_;
    bool locked_{false};
    int fd_{-1};
    bool used_dir_lock_{false};
    std::filesystem::path dir_lock_path_;
};

}  // namespace advisor
