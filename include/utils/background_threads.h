#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace advisor {

/// 起動したスレッドを保持し、破棄時に全て join する。
/// start() は終了済みのスレッドを先に回収するので、保持数は実行中の数を超えて増えない。
/// 呼び出しは1つのスレッドから行うこと。
class BackgroundThreads {
public:
    BackgroundThreads() = default;
    ~BackgroundThreads();

    BackgroundThreads(const BackgroundThreads&) = delete;
    BackgroundThreads& operator=(const BackgroundThreads&) = delete;

    void start(std::function<void()> task);

    /// 終了済みのスレッドを join して取り除き、残りの数を返す
    size_t reap();

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::vector<Entry> entries_;
};

}  // namespace advisor
