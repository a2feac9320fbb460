#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace advisor {

/// 生産者スレッドから消費者へ増分を受け渡す有界キュー
/// - push: 満杯なら待機。close() 後は false
/// - finish: 正常終了。残りを取り出し終えると Closed
/// - close: 放棄。待機中の双方を起こし、以降の push を拒否する
template <typename T>
class BoundedChannel {
public:
    enum class PopStatus {
        Item,
        Closed,
        Timeout,
    };

    explicit BoundedChannel(size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    bool push(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() { return closed_ || finished_ || items_.size() < capacity_; });
        if (closed_ || finished_) {
            return false;
        }
        items_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    PopStatus popFor(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool ready = not_empty_.wait_for(lock, timeout, [this]() {
            return closed_ || finished_ || !items_.empty();
        });
        if (!ready) {
            return PopStatus::Timeout;
        }
        if (closed_) {
            return PopStatus::Closed;
        }
        if (items_.empty()) {
            return PopStatus::Closed;  // finished_ かつ取り出し済み
        }
        out = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return PopStatus::Item;
    }

    void finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        finished_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        items_.clear();
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool finished_{false};
    bool closed_{false};
};

}  // namespace advisor
