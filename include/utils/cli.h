#pragma once

#include <optional>
#include <string>

namespace advisor {

/// Subcommand types for advisor CLI
enum class Subcommand {
    None,    // 引数なし: 対話モード（前回のモデルを自動ロード）
    Status,  // status
    Models,  // models
    Run,     // run [model]
    Ask,     // ask <prompt>
};

/// 全サブコマンド共通のオプション
struct CommandOptions {
    std::string model;                 // run/ask: ロードするモデル（空なら前回/既定）
    std::string prompt;                // ask
    std::string system;                // --system
    std::optional<float> temperature;  // --temperature
    bool stream{false};                // --stream
    bool no_resume{false};             // --no-resume
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};
    CommandOptions options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

std::string getHelpMessage();
std::string getVersionMessage();

/// Convert subcommand enum to string
std::string subcommandToString(Subcommand cmd);

}  // namespace advisor
