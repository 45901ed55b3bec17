#include "p2p_node.h"
#include "terminal_cli.h"
#include "logger.h"
#include "config_manager.h"
#include <charconv>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <signal.h>
#include <filesystem>

namespace {

TerminalCLI* g_cli = nullptr;

void handle_termination(int) {
    if (g_cli) {
        g_cli->stop();
    }
}

std::optional<uint16_t> parse_port(const std::string& text) {
    unsigned value = 0;
    const char* end = text.data() + text.size();
    const auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end || value < 1 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config FILE   Path to configuration file (default: config.json)\n"
              << "  --name NAME     Display name announced to peers (default: device.display_name)\n"
              << "  --port PORT     TCP listen port (default: communication.tcp.port)\n"
              << "  --log-level LVL Log level: debug|info|warning|error|none (default: logging.level)\n"
              << "  --no-discovery  Do not run LAN discovery; connect by address only\n"
              << "  --daemon        Run as daemon (no stdin, suitable for background/testing)\n"
              << "  --help          Show this help message\n"
              << "\nInteractive CLI (after startup):\n"
              << "  Type 'help' to see commands. Useful ones:\n"
              << "    connect <peer_id> [ip]\n"
              << "    send <peer_id> <text>\n"
              << "    file <peer_id> <path>\n"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);

    // Quiet until the configured level is known; the config search probes several paths
    set_log_level(LogLevel::NONE);

    P2PNode::Options options;
    std::string config_path = "config.json";
    std::string requested_log_level;
    bool daemon_mode = false;

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];

        // Consumes the value that follows `arg`, or reports it missing.
        auto take_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires an argument" << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (!take_value(config_path)) return 1;
        } else if (arg == "--name") {
            if (!take_value(options.display_name)) return 1;
        } else if (arg == "--log-level") {
            if (!take_value(requested_log_level)) return 1;
        } else if (arg == "--port") {
            if (!take_value(value)) return 1;
            const auto port = parse_port(value);
            if (!port) {
                std::cerr << "Error: Port must be a number between 1 and 65535: " << value << std::endl;
                return 1;
            }
            options.port = *port;
        } else if (arg == "--no-discovery") {
            options.discovery_enabled = false;
        } else if (arg == "--daemon") {
            daemon_mode = true;
        } else {
            std::cerr << "Error: Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    // Load configuration with fallbacks (useful when running from build/)
    std::vector<std::string> candidates;
    candidates.push_back(config_path); // user-specified or default
    candidates.push_back("../config.json");
    candidates.push_back("../../config.json");

    // Also attempt paths relative to the executable location
    std::error_code ec;
    const std::filesystem::path exe_path = std::filesystem::absolute(argv[0], ec);
    if (!ec) {
        const std::filesystem::path exe_dir = exe_path.parent_path();
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    }

    std::string chosen_config;
    for (const auto& c : candidates) {
        if (ConfigManager::getInstance().loadConfig(c)) {
            chosen_config = c;
            break;
        }
    }

    ConfigManager& config = ConfigManager::getInstance();
    set_log_level(parse_log_level(requested_log_level.empty() ? config.getLogLevel() : requested_log_level));
    if (config.isAsyncLogging()) {
        enable_async_logging();
    }

    if (chosen_config.empty()) {
        // Every setting has a default; a missing file is not fatal.
        nativeLog("WARNING: No configuration file found, using defaults. Tried:");
        for (const auto& c : candidates) {
            nativeLog("  - " + c);
        }
    } else {
        LOG_INFO("MAIN: Loaded configuration from " + chosen_config);
    }

    // Create P2P node (not started yet)
    P2PNode node;
    if (!node.start(options)) {
        std::cerr << "Error: Failed to start nearlink node" << std::endl;
        return 1;
    }

    // Create CLI after start so its callbacks attach to the live notifier
    TerminalCLI cli(node, daemon_mode);
    g_cli = &cli;
    if (daemon_mode) {
        signal(SIGINT, handle_termination);
        signal(SIGTERM, handle_termination);
    }

    cli.run();

    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    g_cli = nullptr;

    node.stop();
    disable_async_logging();
    return 0;
}
