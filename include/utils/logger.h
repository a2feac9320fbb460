// logger.h - spdlog wrapper shared by the advisor binaries and tests
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace advisor::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Get the log directory path (~/.stock-advisor/logs by default).
std::string get_log_dir();

// Get today's log file path (advisor.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// Get retention days from environment (default: 7).
int get_retention_days();

// Remove advisor.jsonl.* files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Initialize default logger with optional pattern and file sink.
// additional_sinks is mainly for testing (e.g., ostream sink injection).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// Initialize using environment variables:
// ADVISOR_LOG_DIR (log directory, default: ~/.stock-advisor/logs)
// ADVISOR_LOG_LEVEL (trace|debug|info|warn|error|critical|off)
// ADVISOR_LOG_RETENTION_DAYS (retention days, default: 7)
// quiet_stdout=true keeps the console clean for the interactive CLI.
void init_from_env(bool quiet_stdout = false);

}  // namespace advisor::logger
