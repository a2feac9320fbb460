#include "utils/cli.h"
#include "utils/version.h"

#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace advisor {

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "advisor " << ADVISOR_VERSION << " - local LLM narration for stock-advisor\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    advisor [COMMAND] [OPTIONS]\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    (none)           Interactive session (resumes the last loaded model)\n";
    oss << "    status           Print lifecycle status as JSON\n";
    oss << "    models           List selectable models and their cached size\n";
    oss << "    run [MODEL]      Load a model and start an interactive session\n";
    oss << "    ask <PROMPT>     Load a model, answer one prompt and exit\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    --model <MODEL>        Model for ask (default: last loaded, then config)\n";
    oss << "    --stream               Print the answer while it is generated\n";
    oss << "    --temperature <T>      Sampling temperature (0 = deterministic)\n";
    oss << "    --system <TEXT>        System prompt\n";
    oss << "    --no-resume            Do not load the last used model on start\n";
    oss << "    -h, --help             Print help information\n";
    oss << "    -V, --version          Print version information\n";
    oss << "\n";
    oss << "SESSION COMMANDS:\n";
    oss << "    /load <MODEL>    Load or switch model in the background\n";
    oss << "    /unload          Release the current model\n";
    oss << "    /status          Show lifecycle status\n";
    oss << "    /models          List selectable models\n";
    oss << "    /quit            Exit\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    ADVISOR_CONFIG              Config file (default: ~/.stock-advisor/config.json)\n";
    oss << "    ADVISOR_CACHE_DIR           Weight store directory\n";
    oss << "    ADVISOR_PERSIST_FILE        Last-model record file\n";
    oss << "    ADVISOR_LOG_LEVEL           Log level (trace|debug|info|warn|error)\n";
    oss << "    ADVISOR_LOG_DIR             Log directory (default: ~/.stock-advisor/logs)\n";
    oss << "    ADVISOR_LOG_RETENTION_DAYS  Log retention days (default: 7)\n";
    oss << "    HF_TOKEN                    HuggingFace token (gated models)\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "advisor " << ADVISOR_VERSION << "\n";
    return oss.str();
}

std::string subcommandToString(Subcommand cmd) {
    switch (cmd) {
        case Subcommand::None:
            return "none";
        case Subcommand::Status:
            return "status";
        case Subcommand::Models:
            return "models";
        case Subcommand::Run:
            return "run";
        case Subcommand::Ask:
            return "ask";
    }
    return "unknown";
}

namespace {

CliResult exitWith(CliResult result, int code, std::string output) {
    result.should_exit = true;
    result.exit_code = code;
    result.output = std::move(output);
    return result;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;
    int first = 1;

    if (argc >= 2 && argv[1][0] != '-') {
        const char* command = argv[1];
        if (std::strcmp(command, "status") == 0) {
            result.subcommand = Subcommand::Status;
        } else if (std::strcmp(command, "models") == 0) {
            result.subcommand = Subcommand::Models;
        } else if (std::strcmp(command, "run") == 0) {
            result.subcommand = Subcommand::Run;
        } else if (std::strcmp(command, "ask") == 0) {
            result.subcommand = Subcommand::Ask;
        } else {
            return exitWith(result, 1, std::string("Error: unknown command '") + command +
                                           "'\n\nRun 'advisor --help' for usage.\n");
        }
        first = 2;
    }

    std::string positional;
    for (int i = first; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            return exitWith(result, 0, getHelpMessage());
        }
        if (std::strcmp(arg, "-V") == 0 || std::strcmp(arg, "--version") == 0) {
            return exitWith(result, 0, getVersionMessage());
        }
        if (std::strcmp(arg, "--stream") == 0) {
            result.options.stream = true;
        } else if (std::strcmp(arg, "--no-resume") == 0) {
            result.options.no_resume = true;
        } else if (std::strcmp(arg, "--system") == 0 && i + 1 < argc) {
            result.options.system = argv[++i];
        } else if (std::strcmp(arg, "--model") == 0 && i + 1 < argc) {
            result.options.model = argv[++i];
        } else if (std::strcmp(arg, "--temperature") == 0 && i + 1 < argc) {
            const char* value = argv[++i];
            try {
                float t = std::stof(value);
                if (t < 0.0f) throw std::out_of_range("negative");
                result.options.temperature = t;
            } catch (const std::exception&) {
                return exitWith(result, 1, std::string("Error: invalid temperature '") + value + "'\n");
            }
        } else if (arg[0] == '-') {
            return exitWith(result, 1, std::string("Error: unknown option '") + arg + "'\n");
        } else {
            if (!positional.empty()) positional += " ";
            positional += arg;
        }
    }

    switch (result.subcommand) {
        case Subcommand::Run:
            if (result.options.model.empty()) result.options.model = positional;
            break;
        case Subcommand::Ask:
            result.options.prompt = positional;
            if (result.options.prompt.empty()) {
                return exitWith(result, 1, "Error: prompt required\n\nUsage: advisor ask <PROMPT>\n");
            }
            break;
        default:
            if (!positional.empty()) {
                return exitWith(result, 1, "Error: unexpected argument '" + positional + "'\n");
            }
            break;
    }
    return result;
}

}  // namespace advisor
