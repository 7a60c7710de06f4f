#include "swarmshare/Config.hpp"
#include "swarmshare/coordinator/EventLoop.hpp"
#include "swarmshare/coordinator/FileRegistry.hpp"
#include "swarmshare/coordinator/SignalingServer.hpp"
#include "swarmshare/logging/StructuredLogger.hpp"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace {

using swarmshare::coordinator::EventLoop;
using swarmshare::coordinator::FileRegistry;
using swarmshare::coordinator::SignalingServer;
using swarmshare::coordinator::SignalingServerConfig;

EventLoop* g_loop = nullptr;

void handle_signal(int) {
    if (g_loop) {
        g_loop->stop();
    }
}

void install_signal_handlers() {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

struct CliConfig {
    std::optional<std::pair<std::string, std::uint16_t>> listen;
    std::optional<std::string> config_path;
    bool show_help{false};
    bool valid{true};
    std::string error;
};

std::optional<std::pair<std::string, std::uint16_t>> parse_listen_endpoint(const std::string& text) {
    const auto pos = text.rfind(':');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string host = text.substr(0, pos);
    std::string port_text = text.substr(pos + 1);
    if (host.empty() || port_text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const auto port_value = std::strtoul(port_text.c_str(), &end, 10);
    if (!end || *end != '\0' || port_value > 65535) {
        return std::nullopt;
    }
    return std::make_pair(host, static_cast<std::uint16_t>(port_value));
}

CliConfig parse_arguments(int argc, char** argv) {
    CliConfig parsed;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
            continue;
        }
        if (arg == "--listen" || arg == "--config") {
            if (i + 1 >= argc) {
                parsed.valid = false;
                parsed.error = arg + " requires a value";
                break;
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                parsed.config_path = value;
                continue;
            }
            parsed.listen = parse_listen_endpoint(value);
            if (!parsed.listen) {
                parsed.valid = false;
                parsed.error = "Invalid --listen value";
                break;
            }
            continue;
        }
        parsed.valid = false;
        parsed.error = "Unknown argument: " + arg;
        break;
    }
    return parsed;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--listen host:port] [--config path]\n";
    std::cout << "Options:\n";
    std::cout << "  --listen host:port   Address to bind (default 0.0.0.0:9750)\n";
    std::cout << "  --config path        key = value configuration file\n";
    std::cout << "  -h, --help           Show this message\n";
}

}  // namespace

int main(int argc, char** argv) {
    const auto cli = parse_arguments(argc, argv);
    if (!cli.valid) {
        std::cerr << cli.error << "\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cli.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }

    swarmshare::Config config;
    if (cli.config_path) {
        try {
            config = swarmshare::load_config(*cli.config_path);
        } catch (const swarmshare::ConfigError& error) {
            std::cerr << error.code() << ": " << error.what() << "\n";
            return EXIT_FAILURE;
        }
    }
    swarmshare::logging::StructuredLogger::instance().set_enabled(config.logging_enabled);

    SignalingServerConfig server_config;
    server_config.listen_port = config.coordinator_port;
    server_config.sweep_interval = std::chrono::duration_cast<std::chrono::milliseconds>(config.cleanup_interval);
    server_config.max_write_buffer_bytes = config.signaling_write_buffer_bytes;
    if (cli.listen) {
        server_config.listen_host = cli.listen->first;
        server_config.listen_port = cli.listen->second;
    }

    install_signal_handlers();

    try {
        EventLoop loop;
        g_loop = &loop;
        FileRegistry registry(config);
        SignalingServer server(loop, registry, server_config);
        if (!server.start()) {
            g_loop = nullptr;
            return EXIT_FAILURE;
        }

        loop.run();

        server.stop();
        g_loop = nullptr;
    } catch (const std::exception& error) {
        g_loop = nullptr;
        std::cerr << "coordinator failed: " << error.what() << "\n";
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
