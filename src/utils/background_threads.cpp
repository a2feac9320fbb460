#include "utils/background_threads.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace advisor {

BackgroundThreads::~BackgroundThreads() {
    for (auto& entry : entries_) {
        if (entry.thread.joinable()) entry.thread.join();
    }
}

void BackgroundThreads::start(std::function<void()> task) {
    reap();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([task = std::move(task), done]() {
        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Background task failed: {}", e.what());
        }
        done->store(true);
    });
    entries_.push_back(Entry{std::move(thread), std::move(done)});
}

size_t BackgroundThreads::reap() {
    auto finished = std::remove_if(entries_.begin(), entries_.end(), [](Entry& entry) {
        if (!entry.done->load()) {
            return false;
        }
        if (entry.thread.joinable()) entry.thread.join();
        return true;
    });
    entries_.erase(finished, entries_.end());
    return entries_.size();
}

}  // namespace advisor
