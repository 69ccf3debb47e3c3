#include "config.hpp"
#include "commands.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "host.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void install_signal_handlers() {
    // No SA_RESTART: a blocked getline must return so the REPL can exit.
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

static void print_usage() {
    std::cout << "Usage: toolhost [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH                 Read servers from PATH (default: ~/.toolhost/config.json)\n"
              << "  --list                        Start all servers, print their tools and exit\n"
              << "  --call SERVER TOOL [JSON]     Start SERVER, run TOOL once and exit\n"
              << "  -h, --help                    Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /servers, /tools [SERVER], /start ID, /stop ID, /refresh ID,\n"
              << "  /call SERVER TOOL [JSON], /help, /quit\n"
              << "\n"
              << "Environment variables:\n"
              << "  TOOLHOST_HANDSHAKE_TIMEOUT_MS   Handshake step timeout\n"
              << "  TOOLHOST_TOOL_TIMEOUT_MS        Tool call timeout\n"
              << "  TOOLHOST_LOG_LEVEL              debug, info, warn or error\n";
}

static void subscribe_console(toolhost::EventBus& bus) {
    toolhost::subscribe<toolhost::ServerErrorEvent>(bus,
        [](const toolhost::ServerErrorEvent& ev) {
            std::cerr << "[" << ev.server_id << "] error: " << ev.message << "\n";
        });
    toolhost::subscribe<toolhost::ToolsDiscoveredEvent>(bus,
        [](const toolhost::ToolsDiscoveredEvent& ev) {
            toolhost::log_debug(ev.server_id, std::to_string(ev.tool_count) + " tool(s) available");
        });
}

static void start_all(toolhost::Host& host) {
    for (const auto& s : host.list_servers()) {
        if (s.status == toolhost::ServerStatus::Running) continue;
        auto started = host.start_server(s.id);
        if (!started.success) {
            std::cerr << "Failed to start " << s.id << ": " << started.error.describe() << "\n";
        }
    }
}

int main(int argc, char* argv[]) try {
    std::string config_path;
    bool list_mode = false;
    std::string call_args;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--list") == 0) {
            list_mode = true;
        } else if (std::strcmp(argv[i], "--call") == 0 && i + 2 < argc) {
            call_args = std::string(argv[i + 1]) + " " + argv[i + 2];
            i += 2;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                call_args += " ";
                call_args += argv[++i];
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    auto config = config_path.empty()
        ? toolhost::HostConfig::load()
        : toolhost::HostConfig::load_file(toolhost::expand_home(config_path));

    toolhost::LogLevel level;
    if (toolhost::parse_log_level(config.log_level, level)) {
        toolhost::set_log_level(level);
    } else {
        toolhost::log_warn("config", "Unknown log level: " + config.log_level);
    }

    install_signal_handlers();

    toolhost::EventBus bus;
    subscribe_console(bus);
    toolhost::Host host(config, &bus);
    host.add_configured_servers();

    // One-shot call
    if (!call_args.empty()) {
        auto server_id = toolhost::split_first_word(call_args).first;
        auto started = host.start_server(server_id);
        if (!started.success) {
            std::cerr << "Failed to start " << server_id << ": "
                      << started.error.describe() << "\n";
            return 1;
        }
        std::cout << toolhost::cmd_call(host, call_args) << '\n';
        host.shutdown();
        return 0;
    }

    if (list_mode) {
        start_all(host);
        std::cout << toolhost::cmd_servers(host) << "\n"
                  << toolhost::cmd_tools(host, "");
        host.shutdown();
        return 0;
    }

    // Interactive REPL
    std::cout << "toolhost " << toolhost::protocol::kClientVersion << "\n"
              << host.list_servers().size() << " server(s) configured.\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "toolhost> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D) or interrupted by a signal
            std::cout << "\n";
            break;
        }

        line = toolhost::trim(line);
        if (line.empty()) continue;

        if (line == "/quit" || line == "/exit") break;
        if (line[0] != '/') {
            std::cout << "Commands start with /. Type /help.\n";
            continue;
        }
        std::cout << toolhost::run_command(host, line) << "\n";
    }

    std::cerr << "Stopping servers...\n";
    host.shutdown();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
