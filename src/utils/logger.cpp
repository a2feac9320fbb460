#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <memory>
#include <sstream>
#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace advisor::logger {

namespace {

constexpr const char* kLogFileBase = "advisor.jsonl";
constexpr int kDefaultRetentionDays = 7;
constexpr const char* kConsolePattern = "[%Y-%m-%d %T.%e] [%l] %v";
constexpr const char* kJsonPattern = R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"msg":%*})";

std::string format_date(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm_value{};
    localtime_r(&t, &tm_value);
    std::ostringstream oss;
    oss << std::put_time(&tm_value, "%Y-%m-%d");
    return oss.str();
}

// YYYY-MM-DD のみ。バックアップ等の別名ファイルは対象外
bool is_date_suffix(const std::string& s) {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// %* : メッセージを JSON 文字列としてエスケープして出力（UTF-8 はそのまま）
class JsonMessageFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg& msg, const std::tm&, spdlog::memory_buf_t& dest) override {
        const std::string quoted = nlohmann::json(std::string(msg.payload.data(), msg.payload.size()))
                                       .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        dest.append(quoted.data(), quoted.data() + quoted.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return std::make_unique<JsonMessageFlag>();
    }
};

spdlog::sink_ptr make_json_file_sink(const std::string& path) {
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    auto formatter = std::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<JsonMessageFlag>('*').set_pattern(kJsonPattern);
    sink->set_formatter(std::move(formatter));
    return sink;
}

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string lower = level_text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warning") return spdlog::level::warn;
    if (lower == "fatal") return spdlog::level::critical;
    auto level = spdlog::level::from_str(lower);
    // from_str は未知の文字列で off を返す
    if (level == spdlog::level::off && lower != "off") return spdlog::level::info;
    return level;
}

std::string get_log_dir() {
    const std::string dir = env_or_empty("ADVISOR_LOG_DIR");
    if (!dir.empty()) return dir;
    std::string home = env_or_empty("HOME");
    if (home.empty()) home = "/tmp";
    return (fs::path(home) / ".stock-advisor" / "logs").string();
}

std::string get_log_file_path() {
    return (fs::path(get_log_dir()) /
            (std::string(kLogFileBase) + "." + format_date(std::chrono::system_clock::now())))
        .string();
}

int get_retention_days() {
    const std::string value = env_or_empty("ADVISOR_LOG_RETENTION_DAYS");
    if (value.empty()) return kDefaultRetentionDays;
    try {
        int days = std::stoi(value);
        if (days > 0 && days < 365) return days;
    } catch (const std::exception&) {
    }
    return kDefaultRetentionDays;
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    if (!fs::is_directory(log_dir, ec)) return;

    // 日付文字列は辞書順 = 時系列順
    const std::string cutoff = format_date(
        std::chrono::system_clock::now() - std::chrono::hours(24 * retention_days));
    const std::string prefix = std::string(kLogFileBase) + ".";

    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code file_ec;
        if (!it->is_regular_file(file_ec)) continue;
        const std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) != 0) continue;

        const std::string date = name.substr(prefix.size());
        if (is_date_suffix(date) && date < cutoff) {
            fs::remove(it->path(), file_ec);
        }
    }
}

void init(const std::string& level,
          const std::string& pattern,
          const std::string& file_path,
          std::vector<spdlog::sink_ptr> additional_sinks) {
    std::vector<spdlog::sink_ptr> sinks = std::move(additional_sinks);
    if (sinks.empty()) {
        const std::string path = file_path.empty() ? get_log_file_path() : file_path;
        std::error_code ec;
        fs::create_directories(fs::path(path).parent_path(), ec);
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false));
    }

    auto logger = std::make_shared<spdlog::logger>("advisor", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    if (!pattern.empty()) {
        spdlog::set_pattern(pattern);
    }
    spdlog::set_level(parse_level(level));
    spdlog::flush_on(spdlog::level::info);
}

void init_from_env(bool quiet_stdout) {
    const std::string level = env_or_empty("ADVISOR_LOG_LEVEL");
    const std::string log_dir = get_log_dir();
    std::error_code ec;
    fs::create_directories(log_dir, ec);
    cleanup_old_logs(log_dir, get_retention_days());

    // 対話CLIでは回答の表示を邪魔しないよう warn 以上のみ標準エラーへ
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    if (quiet_stdout) {
        console_sink->set_level(spdlog::level::warn);
    }

    const std::string log_path = get_log_file_path();
    init(level.empty() ? "info" : level, "", "", {console_sink, make_json_file_sink(log_path)});
    spdlog::info("Advisor logs initialized: {}", log_path);
}

}  // namespace advisor::logger
