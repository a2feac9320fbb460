#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "core/bounded_channel.h"
#include "core/engine_types.h"
#include "core/model_handle.h"

namespace advisor {

/// 進行中のストリーミング生成1件
/// 生産者スレッド（ModelHandle::generate）と有界チャネル、放棄タイムアウトを所有する。
/// 生産者はハンドルの shared_ptr と占有ロックを保持するため、デタッチ後もハンドルは破棄されず、
/// 次の生成は生産者が停止するまで始まらない。
class GenerationSession {
public:
    enum class Next {
        Piece,      // piece に増分が入った
        Done,       // 生産者が正常終了した
        Failed,     // 生産者が例外で終了した（error() 参照）
        Abandoned,  // タイムアウトまたは消費側の放棄
    };

    GenerationSession(std::shared_ptr<ModelHandle> handle,
                      GenerationRequest request,
                      size_t channel_capacity,
                      std::chrono::milliseconds abandon_timeout,
                      std::chrono::milliseconds busy_timeout);
    ~GenerationSession();

    GenerationSession(const GenerationSession&) = delete;
    GenerationSession& operator=(const GenerationSession&) = delete;

    void start();

    /// 次の増分を最大 abandon_timeout 待つ。タイムアウト時はセッションを放棄する
    Next next(std::string& piece);

    /// 消費を打ち切る。生産者は次の増分で停止し、スレッドはデタッチされる
    void abandon();

    bool abandoned() const { return abandoned_; }
    std::string error() const;

private:
    struct SharedState {
        explicit SharedState(size_t capacity) : channel(capacity) {}

        BoundedChannel<std::string> channel;
        std::atomic<bool> cancelled{false};
        std::atomic<bool> producer_done{false};
        mutable std::mutex error_mutex;
        std::string error;
        bool failed{false};
    };

    std::shared_ptr<SharedState> shared_;
    std::shared_ptr<ModelHandle> handle_;
    GenerationRequest request_;
    std::chrono::milliseconds abandon_timeout_;
    std::chrono::milliseconds busy_timeout_;
    std::thread producer_;
    bool abandoned_{false};
    bool completed_{false};
};

}  // namespace advisor
