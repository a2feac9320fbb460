#include "models/model_downloader.h"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <regex>
#include <thread>
#include <utility>

#include "utils/file_lock.h"

namespace fs = std::filesystem;

namespace advisor {

namespace {

struct HttpUrl {
    std::string scheme;
    std::string host;
    int port{0};
    std::string path;
};

HttpUrl parseUrl(const std::string& url) {
    static const std::regex re(R"(^([a-zA-Z][a-zA-Z0-9+.-]*)://([^/:]+)(?::(\d+))?(.*)$)");
    std::smatch match;
    HttpUrl parsed;
    if (std::regex_match(url, match, re)) {
        parsed.scheme = match[1].str();
        parsed.host = match[2].str();
        parsed.port = match[3].matched ? std::stoi(match[3].str()) : (parsed.scheme == "https" ? 443 : 80);
        parsed.path = match[4].str().empty() ? "/" : match[4].str();
    }
    return parsed;
}

std::unique_ptr<httplib::Client> makeClient(const HttpUrl& url, std::chrono::milliseconds timeout) {
    if (url.scheme.empty() || url.host.empty()) {
        return nullptr;
    }

#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
    if (url.scheme == "https") {
        return nullptr;  // HTTPS is not supported in this build
    }
#endif

    std::string scheme_host_port = url.scheme + "://" + url.host;
    if (url.port != 0) {
        scheme_host_port += ":" + std::to_string(url.port);
    }

    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    if (client && client->is_valid()) {
        const int sec = static_cast<int>(timeout.count() / 1000);
        const int usec = static_cast<int>((timeout.count() % 1000) * 1000);
        client->set_connection_timeout(sec, usec);
        client->set_read_timeout(sec, usec);
        client->set_write_timeout(sec, usec);
        // resolve/main は CDN へリダイレクトされる
        client->set_follow_location(true);
        return client;
    }
    return nullptr;
}

uint64_t fileSizeOrZero(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return 0;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

}  // namespace

ModelDownloader::ModelDownloader(WeightStore store, DownloadConfig config)
    : store_(std::move(store)), config_(std::move(config)) {}

void ModelDownloader::setError(std::string message) {
    spdlog::warn("ModelDownloader: {}", message);
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = std::move(message);
}

std::string ModelDownloader::buildResolveUrl(const std::string& base_url,
                                             const std::string& repo,
                                             const std::string& file) {
    std::string base = base_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/" + repo + "/resolve/main/" + file;
}

std::string ModelDownloader::download(const CatalogEntry& entry, DownloadProgressCallback cb) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_.clear();
    }
    if (entry.repo.empty() || entry.file.empty()) {
        setError("no GGUF file name for " + (entry.name.empty() ? entry.repo : entry.name));
        return "";
    }

    const HttpUrl url = parseUrl(buildResolveUrl(config_.hf_base_url, entry.repo, entry.file));
    auto client = makeClient(url, config_.timeout);
    if (!client) {
        setError("failed to create HTTP client for " + config_.hf_base_url);
        return "";
    }

    httplib::Headers auth;
    if (const char* token = std::getenv("HF_TOKEN")) {
        if (*token) auth.emplace("Authorization", std::string("Bearer ") + token);
    }

    const fs::path out_path = store_.snapshotDir(entry.repo) / entry.file;
    const fs::path part_path = out_path.string() + ".part";
    std::error_code ec;
    fs::create_directories(out_path.parent_path(), ec);
    if (ec) {
        setError("failed to create " + out_path.parent_path().string() + ": " + ec.message());
        return "";
    }

    // 同じ重みを書き込むのは1プロセスのみ
    FileLock lock(out_path, FileLock::Mode::Exclusive, std::chrono::seconds(5));
    if (!lock.locked()) {
        setError("another download of " + entry.file + " is in progress");
        return "";
    }
    if (fileSizeOrZero(out_path) > 0) {
        return out_path.string();
    }

    spdlog::info("Downloading {} from {}{}", entry.file, url.scheme + "://" + url.host, url.path);

    auto download_once = [&](uint64_t offset) -> bool {
        for (int attempt = 0; attempt <= config_.max_retries; ++attempt) {
            uint64_t start_offset = offset;
            std::ofstream ofs(part_path, std::ios::binary | (start_offset > 0 ? std::ios::app : std::ios::trunc));
            if (!ofs.is_open()) {
                setError("failed to open " + part_path.string());
                return false;
            }

            uint64_t downloaded = start_offset;
            uint64_t total = 0;
            int status = 0;
            const auto start_time = std::chrono::steady_clock::now();

            httplib::Headers headers = auth;
            if (start_offset > 0) {
                headers.emplace("Range", "bytes=" + std::to_string(start_offset) + "-");
            }
            auto result = client->Get(
                url.path,
                headers,
                [&](const httplib::Response& res) {
                    status = res.status;
                    if (res.status == 200 && start_offset > 0) {
                        // Range を無視された場合は最初から書き直す
                        ofs.close();
                        ofs.open(part_path, std::ios::binary | std::ios::trunc);
                        start_offset = 0;
                        downloaded = 0;
                    }
                    if (res.has_header("Content-Length")) {
                        try {
                            total = start_offset + std::stoull(res.get_header_value("Content-Length"));
                        } catch (const std::exception&) {
                            total = 0;
                        }
                    }
                    return ofs.is_open() && res.status >= 200 && res.status < 300;
                },
                [&](const char* data, size_t data_length) {
                    ofs.write(data, static_cast<std::streamsize>(data_length));
                    if (!ofs) return false;
                    downloaded += data_length;
                    if (cb) cb(downloaded, total);

                    if (config_.max_bytes_per_sec > 0) {
                        auto elapsed = std::chrono::steady_clock::now() - start_time;
                        double elapsed_sec = std::chrono::duration<double>(elapsed).count();
                        double allowed = static_cast<double>(config_.max_bytes_per_sec) * elapsed_sec;
                        double fetched = static_cast<double>(downloaded - start_offset);
                        if (fetched > allowed && elapsed_sec > 0.0) {
                            double sleep_sec = (fetched - allowed) / static_cast<double>(config_.max_bytes_per_sec);
                            std::this_thread::sleep_for(std::chrono::duration<double>(sleep_sec));
                        }
                    }
                    return true;
                });
            ofs.flush();
            ofs.close();

            if (result && result->status >= 200 && result->status < 300) {
                if (total > 0 && downloaded != total) {
                    spdlog::warn("Short read for {}: {} of {} bytes", entry.file, downloaded, total);
                    offset = downloaded;
                } else {
                    if (cb) cb(downloaded, downloaded);
                    return true;
                }
            } else if (status == 401 || status == 403 || status == 404) {
                setError("HTTP " + std::to_string(status) + " for " + entry.repo + "/" + entry.file);
                return false;
            } else {
                // 次の試行は書き込めた分から再開
                offset = fileSizeOrZero(part_path);
            }

            if (attempt < config_.max_retries) std::this_thread::sleep_for(config_.backoff);
        }
        setError("download failed after " + std::to_string(config_.max_retries + 1) + " attempts: " + entry.file);
        return false;
    };

    bool ok = download_once(fileSizeOrZero(part_path));
    if (!ok && fileSizeOrZero(part_path) > 0) {
        // 再開に失敗したら全体を取り直す
        ok = download_once(0);
    }
    if (!ok) {
        return "";
    }

    fs::rename(part_path, out_path, ec);
    if (ec) {
        setError("failed to move " + part_path.string() + " into place: " + ec.message());
        return "";
    }
    spdlog::info("Downloaded {} ({} bytes)", out_path.string(), fileSizeOrZero(out_path));
    return out_path.string();
}

}  // namespace advisor
