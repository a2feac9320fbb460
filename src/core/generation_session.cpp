#include "core/generation_session.h"

#include <spdlog/spdlog.h>
#include <utility>

namespace advisor {

GenerationSession::GenerationSession(std::shared_ptr<ModelHandle> handle,
                                     GenerationRequest request,
                                     size_t channel_capacity,
                                     std::chrono::milliseconds abandon_timeout,
                                     std::chrono::milliseconds busy_timeout)
    : shared_(std::make_shared<SharedState>(channel_capacity))
    , handle_(std::move(handle))
    , request_(std::move(request))
    , abandon_timeout_(abandon_timeout)
    , busy_timeout_(busy_timeout) {}

GenerationSession::~GenerationSession() {
    if (!producer_.joinable()) {
        return;
    }
    if (completed_ && !abandoned_) {
        // finish() 済みなので join は即座に戻る
        producer_.join();
        return;
    }
    abandon();
}

void GenerationSession::start() {
    if (producer_.joinable()) {
        return;
    }
    // スレッドには共有状態・ハンドル・リクエストのコピーだけを渡す（デタッチ後の安全性）
    auto shared = shared_;
    auto handle = handle_;
    GenerationRequest request = request_;
    const auto busy_timeout = busy_timeout_;
    producer_ = std::thread([shared, handle, request, busy_timeout]() {
        {
            // 占有ロックは生産者スレッドが generate() から戻るまで持つ（デタッチ後も）
            std::unique_lock<std::timed_mutex> usage(handle->usageMutex(), std::defer_lock);
            if (!usage.try_lock_for(busy_timeout)) {
                std::lock_guard<std::mutex> lock(shared->error_mutex);
                shared->failed = true;
                shared->error = "model is busy: " + handle->modelId();
            } else if (!shared->cancelled.load()) {
                try {
                    handle->generate(request.messages, request.params,
                                     [&shared](const std::string& piece) {
                                         if (shared->cancelled.load()) {
                                             return false;
                                         }
                                         return shared->channel.push(piece);
                                     });
                } catch (const std::exception& e) {
                    std::lock_guard<std::mutex> lock(shared->error_mutex);
                    shared->failed = true;
                    shared->error = e.what();
                }
            }
        }
        shared->producer_done.store(true);
        shared->channel.finish();
        if (shared->cancelled.load()) {
            spdlog::debug("Abandoned stream producer exited for model {}", handle->modelId());
        }
    });
}

GenerationSession::Next GenerationSession::next(std::string& piece) {
    if (abandoned_) {
        return Next::Abandoned;
    }
    if (completed_) {
        std::lock_guard<std::mutex> lock(shared_->error_mutex);
        return shared_->failed ? Next::Failed : Next::Done;
    }

    switch (shared_->channel.popFor(piece, abandon_timeout_)) {
        case BoundedChannel<std::string>::PopStatus::Item:
            return Next::Piece;
        case BoundedChannel<std::string>::PopStatus::Closed: {
            completed_ = true;
            std::lock_guard<std::mutex> lock(shared_->error_mutex);
            return shared_->failed ? Next::Failed : Next::Done;
        }
        case BoundedChannel<std::string>::PopStatus::Timeout:
            spdlog::warn("Stream generation abandoned: no output for {}ms (model {})",
                         abandon_timeout_.count(), handle_ ? handle_->modelId() : std::string());
            abandon();
            return Next::Abandoned;
    }
    return Next::Abandoned;
}

void GenerationSession::abandon() {
    if (abandoned_) {
        return;
    }
    abandoned_ = true;
    shared_->cancelled.store(true);
    shared_->channel.close();
    if (producer_.joinable()) {
        if (shared_->producer_done.load()) {
            producer_.join();
        } else {
            // 強制停止はしない。生産者は次の増分で cancelled を検知して終了する
            producer_.detach();
        }
    }
}

std::string GenerationSession::error() const {
    std::lock_guard<std::mutex> lock(shared_->error_mutex);
    return shared_->error;
}

}  // namespace advisor
