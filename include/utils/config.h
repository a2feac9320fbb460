#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace advisor {

struct DownloadConfig {
    bool enabled{true};
    std::string hf_base_url{"https://huggingface.co"};
    int max_retries{2};
    std::chrono::milliseconds backoff{200};
    std::chrono::milliseconds timeout{30000};
    size_t max_bytes_per_sec{0};
};

struct AdvisorConfig {
    std::string data_dir;         // ~/.stock-advisor
    std::string cache_dir;        // Weight Store（models--<org>--<name>/）
    std::string persist_file;     // 最後にロード成功したモデルIDの記録
    std::string catalog_file;     // 空ならビルトインカタログのみ
    std::string default_model{"Qwen3-8B"};
    bool auto_resume{true};

    int n_gpu_layers{999};        // 999 = 可能な限りGPUへオフロード
    int ctx_size{8192};
    int batch_size{512};
    int n_threads{0};             // 0 = llama.cpp のデフォルト

    size_t max_tokens{1024};
    float temperature{0.3f};
    size_t stream_channel_capacity{64};
    std::chrono::milliseconds stream_timeout{std::chrono::seconds(120)};

    DownloadConfig download;
};

AdvisorConfig loadAdvisorConfig();
std::pair<AdvisorConfig, std::string> loadAdvisorConfigWithLog();

}  // namespace advisor
