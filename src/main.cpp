#include "mnemo/context/conversation_memory.hpp"
#include "mnemo/core/config.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace mnemo;

static void print_usage() {
    std::cout << "Usage: mnemo [options]\n"
              << "\n"
              << "Reads conversation turns from stdin. Each plain line is recorded as a\n"
              << "user turn and the resulting context payload is printed as JSON.\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config PATH    Config file (default: ~/.mnemo/config.yaml)\n"
              << "  -s, --session NAME   Load a saved session on start\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Commands:\n"
              << "  /assistant TEXT      Record an assistant turn\n"
              << "  /system TEXT         Record a system turn\n"
              << "  /recall QUERY        Show recalled earlier messages\n"
              << "  /save [NAME]         Save the session\n"
              << "  /load NAME           Load a saved session\n"
              << "  /sessions            List saved sessions\n"
              << "  /stats               Show memory statistics\n"
              << "  /clear               Start a new session\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit\n"
              << "\n"
              << "Environment variables:\n"
              << "  ANTHROPIC_API_KEY    API key for delegated summaries\n";
}

static void setup_logging(const core::ObservabilityConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!config.log_path.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                config.log_path.string(), false));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Warning: cannot open log file: " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("mnemo", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

static std::string command_arg(const std::string& line, size_t command_len) {
    if (line.size() <= command_len) return "";
    size_t start = line.find_first_not_of(' ', command_len);
    return start == std::string::npos ? "" : line.substr(start);
}

// Input lines are not guaranteed to be UTF-8
static std::string render(const core::Json& j) {
    return j.dump(2, ' ', false, core::Json::error_handler_t::replace);
}

static void print_payload(context::ConversationMemory& memory, const std::string& query) {
    auto payload = memory.build_context(query);
    if (payload.is_err()) {
        std::cerr << "Error: " << payload.error().full_message() << "\n";
        return;
    }
    std::cout << render(payload.value().to_json()) << "\n";
}

static bool handle_command(context::ConversationMemory& memory, const std::string& line) {
    if (line == "/quit" || line == "/exit") {
        return false;
    }

    if (line == "/help") {
        print_usage();
    } else if (line.rfind("/assistant", 0) == 0) {
        auto text = command_arg(line, 10);
        if (text.empty()) {
            std::cout << "Usage: /assistant TEXT\n";
        } else {
            auto msg = memory.add(core::Role::Assistant, text);
            std::cout << "Recorded assistant message " << msg.id << "\n";
        }
    } else if (line.rfind("/system", 0) == 0) {
        auto text = command_arg(line, 7);
        if (text.empty()) {
            std::cout << "Usage: /system TEXT\n";
        } else {
            auto msg = memory.add(core::Role::System, text);
            std::cout << "Recorded system message " << msg.id << "\n";
        }
    } else if (line.rfind("/recall", 0) == 0) {
        auto query = command_arg(line, 7);
        core::Json chunks = core::Json::array();
        for (const auto& chunk : memory.recall(query)) {
            chunks.push_back(chunk.to_json());
        }
        std::cout << render(chunks) << "\n";
    } else if (line.rfind("/save", 0) == 0) {
        auto name = command_arg(line, 5);
        auto result = memory.save_session(name.empty() ? std::nullopt
                                                       : std::optional<std::string>(name));
        if (result.is_err()) {
            std::cerr << "Error: " << result.error().full_message() << "\n";
        } else {
            std::cout << "Saved to " << result.value().string() << "\n";
        }
    } else if (line.rfind("/load", 0) == 0) {
        auto name = command_arg(line, 5);
        if (name.empty()) {
            std::cout << "Usage: /load NAME\n";
        } else {
            auto result = memory.load_session(name);
            if (result.is_err()) {
                std::cerr << "Error: " << result.error().full_message() << "\n";
            } else {
                std::cout << "Loaded session " << name << "\n";
            }
        }
    } else if (line == "/sessions") {
        auto sessions = memory.list_sessions();
        if (sessions.empty()) {
            std::cout << "No saved sessions.\n";
        }
        for (const auto& name : sessions) {
            std::cout << "  " << name << "\n";
        }
    } else if (line == "/stats") {
        std::cout << render(memory.stats().to_json()) << "\n";
    } else if (line == "/clear") {
        memory.clear();
        std::cout << "Started a new session.\n";
    } else {
        std::cout << "Unknown command. Type /help for available commands.\n";
    }

    return true;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string session_name;

    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            config_path = argv[++i];
        } else if ((std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--session") == 0) && i + 1 < argc) {
            session_name = argv[++i];
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    core::Config config;
    if (config_path.empty()) {
        config = core::Config::load_or_default(core::Config::default_path());
    } else {
        auto loaded = core::Config::load(config_path);
        if (loaded.is_err()) {
            std::cerr << "Error: " << loaded.error().full_message() << "\n";
            return 1;
        }
        config = std::move(loaded).value();
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        std::cerr << "Error: " << valid.error().full_message() << "\n";
        return 1;
    }

    setup_logging(config.observability);

    context::ConversationMemory memory(config);

    if (!session_name.empty()) {
        auto result = memory.load_session(session_name);
        if (result.is_err()) {
            std::cerr << "Error: " << result.error().full_message() << "\n";
            return 1;
        }
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (!handle_command(memory, line)) break;
            continue;
        }

        memory.add(core::Role::User, line);
        print_payload(memory, line);
    }

    return 0;
}
