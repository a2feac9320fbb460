#include "utils/file_lock.h"

#include <thread>
#ifdef __unix__
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace advisor {

FileLock::FileLock(const std::filesystem::path& target,
                   Mode mode,
                   std::chrono::milliseconds timeout)
    : lock_path_(target.string() + ".lock")
    , mode_(mode) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!tryAcquireOnce()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

FileLock::~FileLock() { release(); }

bool FileLock::tryAcquireOnce() {
#ifdef __unix__
    if (fd_ < 0) {
        std::error_code ec;
        std::filesystem::create_directories(lock_path_.parent_path(), ec);
        fd_ = ::open(lock_path_.c_str(), O_CREAT | O_RDWR, 0644);
    }
    if (fd_ >= 0) {
        const int op = (mode_ == Mode::Shared ? LOCK_SH : LOCK_EX) | LOCK_NB;
        if (::flock(fd_, op) == 0) {
            locked_ = true;
            return true;
        }
        return false;
    }
#endif
    // flockが使えない環境ではロックディレクトリで排他（共有モードも排他扱い）
    dir_lock_path_ = lock_path_.string() + ".d";
    std::error_code ec;
    if (std::filesystem::create_directory(dir_lock_path_, ec)) {
        locked_ = true;
        used_dir_lock_ = true;
        return true;
    }
    return false;
}

void FileLock::release() {
#ifdef __unix__
    if (fd_ >= 0) {
        if (locked_ && !used_dir_lock_) {
            ::flock(fd_, LOCK_UN);
        }
        ::close(fd_);
        fd_ = -1;
    }
#endif
    if (used_dir_lock_) {
        std::error_code ec;
        std::filesystem::remove(dir_lock_path_, ec);
        used_dir_lock_ = false;
    }
    locked_ = false;
}

}  // namespace advisor
