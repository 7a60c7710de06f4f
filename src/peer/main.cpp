#include "swarmshare/Config.hpp"
#include "swarmshare/Error.hpp"
#include "swarmshare/core/FileNotification.hpp"
#include "swarmshare/core/TransferService.hpp"
#include "swarmshare/logging/StructuredLogger.hpp"
#include "swarmshare/network/SignalingClient.hpp"
#include "swarmshare/network/Socket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace {

using swarmshare::Config;
using swarmshare::TransferEvent;
using swarmshare::TransferEventKind;
using swarmshare::TransferService;

std::atomic<bool> g_stop{false};

void handle_signal(int) {
    g_stop.store(true);
}

void install_signal_handlers() {
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = "[" + code_ + "] " + message_;
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(const CliException& ex) {
    std::cerr << ex.what() << std::endl;
    if (!ex.hint().empty()) {
        std::cerr << "Hint: " << ex.hint() << std::endl;
    }
}

void print_status_error(const swarmshare::Status& status) {
    std::cerr << "Error [" << swarmshare::error_code_name(status.code) << "]: " << swarmshare::user_message(status.code);
    if (!status.message.empty()) {
        std::cerr << " (" << status.message << ")";
    }
    std::cerr << std::endl;
}

struct GlobalOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> coordinator;
    std::optional<std::string> storage_dir;
    std::optional<bool> persistent;
    std::optional<std::uint16_t> transport_port;
    std::string principal;
    std::string device{"default"};
    std::string token;
};

struct CommandArgs {
    std::string command;
    std::vector<std::string> positional;
    std::vector<std::string> recipients;
    std::optional<std::string> out;
    std::optional<std::string> name;
    std::optional<std::string> mime;
};

void print_usage() {
    std::cout << "swarmshare peer\n";
    std::cout << "Usage: swarmshare-peer [options] <command> [args]\n\n";
    std::cout << "Options:\n"
              << "  --principal <id>          Principal this device acts for (required)\n"
              << "  --device <id>             Device identifier (default: default)\n"
              << "  --token <secret>          Session token presented to the coordinator\n"
              << "  --coordinator <host:port> Coordinator endpoint (default from config, 127.0.0.1:9750)\n"
              << "  --storage-dir <path>      Directory for chunks and local metadata\n"
              << "  --persistent              Keep chunks and metadata on disk\n"
              << "  --no-persistent           Keep chunks in memory only\n"
              << "  --transport-port <port>   Peer transport listening port (default: ephemeral)\n"
              << "  --config <file>           key = value configuration file\n"
              << "  --help                    Print this help message\n\n";
    std::cout << "Commands:\n"
              << "  share <file> --to <p1,p2> [--name <n>] [--mime <type>] [--out <notification>]\n"
              << "                           Share a file and keep seeding it until interrupted\n"
              << "  fetch <notification> [--out <path>]\n"
              << "                           Download the file a notification describes\n"
              << "  seed                      Re-announce every local file and serve until interrupted\n"
              << "  resume <fileId>           Continue a download paused by an earlier interrupted fetch\n"
              << "  revoke <fileId> <principal>...\n"
              << "                           Remove principals from a file's share list\n";
}

std::vector<std::string> split_list(std::string_view text) {
    std::vector<std::string> parts;
    while (!text.empty()) {
        const auto comma = text.find(',');
        const auto part = text.substr(0, comma);
        if (!part.empty()) {
            parts.emplace_back(part);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return parts;
}

std::uint16_t parse_port(std::string_view option, const std::string& value) {
    char* end = nullptr;
    const auto parsed = std::strtoul(value.c_str(), &end, 10);
    if (!end || *end != '\0' || parsed > 65535) {
        throw_cli_error("E_INVALID_PORT", std::string(option) + " expects a port number", "Use a value in 0-65535");
    }
    return static_cast<std::uint16_t>(parsed);
}

Config build_config(const GlobalOptions& options) {
    Config config;
    if (options.config_path) {
        try {
            config = swarmshare::load_config(*options.config_path);
        } catch (const swarmshare::ConfigError& error) {
            throw_cli_error(error.code(), error.what(), "Check " + *options.config_path);
        }
    }
    if (options.coordinator) {
        const auto endpoint = swarmshare::network::parse_endpoint(*options.coordinator);
        if (!endpoint) {
            throw_cli_error("E_INVALID_ENDPOINT", "Invalid --coordinator value", "Use host:port");
        }
        config.coordinator_host = endpoint->first;
        config.coordinator_port = endpoint->second;
    }
    if (options.storage_dir) {
        config.storage_directory = *options.storage_dir;
    }
    if (options.persistent) {
        config.storage_persistent_enabled = *options.persistent;
    }
    if (options.transport_port) {
        config.transport_port = *options.transport_port;
    }
    return config;
}

std::string read_text_file(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw_cli_error("E_FILE_UNREADABLE", "Cannot read " + path);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

void wait_for_stop(TransferService& service, swarmshare::network::CoordinatorLink& link) {
    auto next_check = std::chrono::steady_clock::now();
    while (!g_stop.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        const auto now = std::chrono::steady_clock::now();
        if (now < next_check || link.connected()) {
            continue;
        }
        next_check = now + std::chrono::seconds(2);
        if (link.connect().ok()) {
            const auto status = service.reconnect();
            if (!status.ok()) {
                print_status_error(status);
            }
        }
    }
}

int run_share(TransferService& service, swarmshare::network::CoordinatorLink& link, const CommandArgs& args) {
    if (args.positional.size() != 1) {
        throw_cli_error("E_MISSING_ARGUMENT", "share expects exactly one file", "swarmshare-peer share <file> --to <p1,p2>");
    }
    const auto shared = service.share_file(args.positional.front(),
                                           args.recipients,
                                           args.name.value_or(std::string{}),
                                           args.mime.value_or(std::string{}));
    if (!shared.ok()) {
        print_status_error(shared.status);
        return EXIT_FAILURE;
    }

    const auto text = swarmshare::serialize_notification(*shared.value);
    if (args.out) {
        std::ofstream output(*args.out, std::ios::trunc);
        if (!output || !(output << text)) {
            throw_cli_error("E_FILE_UNWRITABLE", "Cannot write " + *args.out);
        }
        std::cout << "Notification written to " << *args.out << std::endl;
    } else {
        std::cout << text;
    }
    std::cout << "Seeding " << shared.value->file_id << " (Ctrl+C to stop)" << std::endl;
    wait_for_stop(service, link);
    return EXIT_SUCCESS;
}

// Runs `start`, then blocks until the download ends or the user interrupts it.
// An interrupted download is paused so `resume` can pick it up later.
template <typename StartFn>
int wait_for_download(TransferService& service, const swarmshare::FileId& file_id, StartFn start) {
    std::mutex mutex;
    std::condition_variable cv;
    std::optional<TransferEvent> outcome;
    service.set_event_handler([&](const TransferEvent& event) {
        if (event.file_id != file_id || event.kind == TransferEventKind::FileAvailable) {
            return;
        }
        {
            std::scoped_lock lock(mutex);
            outcome = event;
        }
        cv.notify_all();
    });

    const swarmshare::Status started = start();
    if (!started.ok()) {
        print_status_error(started);
        return EXIT_FAILURE;
    }

    std::unique_lock lock(mutex);
    while (!outcome && !g_stop.load()) {
        cv.wait_for(lock, std::chrono::milliseconds(200));
    }
    if (!outcome) {
        lock.unlock();
        const auto paused = service.pause_download(file_id);
        if (!paused.ok()) {
            print_status_error(paused);
        }
        std::cerr << "Interrupted; run `resume " << file_id << "` to continue" << std::endl;
        return EXIT_FAILURE;
    }
    if (outcome->kind != TransferEventKind::DownloadComplete) {
        print_status_error(outcome->status);
        return EXIT_FAILURE;
    }
    std::cout << "Saved " << outcome->output_path.string() << std::endl;
    return EXIT_SUCCESS;
}

int run_fetch(TransferService& service, const CommandArgs& args) {
    if (args.positional.size() != 1) {
        throw_cli_error("E_MISSING_ARGUMENT", "fetch expects a notification file", "swarmshare-peer fetch <notification>");
    }
    const auto parsed = swarmshare::parse_notification(read_text_file(args.positional.front()));
    if (!parsed.ok()) {
        print_status_error(parsed.status);
        return EXIT_FAILURE;
    }
    const auto& notification = *parsed.value;
    const auto output = args.out.value_or(notification.file_name.empty() ? notification.file_id : notification.file_name);

    return wait_for_download(service, notification.file_id, [&]() { return service.start_download(notification, output); });
}

int run_resume(TransferService& service, const CommandArgs& args) {
    if (args.positional.size() != 1) {
        throw_cli_error("E_MISSING_ARGUMENT", "resume expects a fileId", "swarmshare-peer resume <fileId>");
    }
    const auto& file_id = args.positional.front();
    return wait_for_download(service, file_id, [&]() { return service.resume_download(file_id); });
}

int run_revoke(TransferService& service, const CommandArgs& args) {
    if (args.positional.size() < 2) {
        throw_cli_error("E_MISSING_ARGUMENT", "revoke expects a fileId and principals", "swarmshare-peer revoke <fileId> <principal>...");
    }
    const std::vector<std::string> targets(args.positional.begin() + 1, args.positional.end());
    const auto result = service.revoke(args.positional.front(), targets);
    if (!result.ok()) {
        print_status_error(result.status);
        return EXIT_FAILURE;
    }
    std::cout << "Shared with " << result.value->size() << " principal(s)" << std::endl;
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        GlobalOptions options;
        CommandArgs command;

        std::size_t index = 0;
        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return args[index++];
        };

        while (index < args.size()) {
            const auto arg = args[index++];
            if (arg == "--help" || arg == "-h" || arg == "help") {
                print_usage();
                return EXIT_SUCCESS;
            }
            if (arg == "--config") {
                options.config_path = require_value(arg);
            } else if (arg == "--coordinator") {
                options.coordinator = require_value(arg);
            } else if (arg == "--principal") {
                options.principal = require_value(arg);
            } else if (arg == "--device") {
                options.device = require_value(arg);
            } else if (arg == "--token") {
                options.token = require_value(arg);
            } else if (arg == "--storage-dir") {
                options.storage_dir = require_value(arg);
            } else if (arg == "--persistent") {
                options.persistent = true;
            } else if (arg == "--no-persistent") {
                options.persistent = false;
            } else if (arg == "--transport-port") {
                options.transport_port = parse_port(arg, require_value(arg));
            } else if (arg == "--to") {
                for (auto& recipient : split_list(require_value(arg))) {
                    command.recipients.push_back(std::move(recipient));
                }
            } else if (arg == "--out") {
                command.out = require_value(arg);
            } else if (arg == "--name") {
                command.name = require_value(arg);
            } else if (arg == "--mime") {
                command.mime = require_value(arg);
            } else if (arg.starts_with("-")) {
                throw_cli_error("E_UNKNOWN_OPTION", "Unknown option " + arg, "Run swarmshare-peer --help");
            } else if (command.command.empty()) {
                command.command = arg;
            } else {
                command.positional.push_back(arg);
            }
        }

        if (command.command.empty()) {
            print_usage();
            return EXIT_FAILURE;
        }
        if (command.command != "share" && command.command != "fetch" && command.command != "seed" &&
            command.command != "revoke" && command.command != "resume") {
            throw_cli_error("E_UNKNOWN_COMMAND", "Unknown command " + command.command, "Run swarmshare-peer --help");
        }
        if (options.principal.empty()) {
            throw_cli_error("E_MISSING_PRINCIPAL", "--principal is required");
        }

        const auto config = build_config(options);
        swarmshare::logging::StructuredLogger::instance().set_enabled(config.logging_enabled);
        install_signal_handlers();

        swarmshare::network::SignalingClientConfig link_config;
        link_config.host = config.coordinator_host;
        link_config.port = config.coordinator_port;
        link_config.token = options.token;
        link_config.request_timeout = config.coordinator_request_timeout;
        swarmshare::network::SignalingClient link(swarmshare::DeviceKey{options.principal, options.device}, link_config);

        const auto connected = link.connect();
        if (!connected.ok()) {
            print_status_error(connected);
            return EXIT_FAILURE;
        }

        TransferService service(link, config);
        if (!service.start()) {
            std::cerr << "Failed to start the peer transport" << std::endl;
            return EXIT_FAILURE;
        }

        int exit_code = EXIT_SUCCESS;
        if (command.command == "share") {
            exit_code = run_share(service, link, command);
        } else if (command.command == "fetch") {
            exit_code = run_fetch(service, command);
        } else if (command.command == "resume") {
            exit_code = run_resume(service, command);
        } else if (command.command == "revoke") {
            exit_code = run_revoke(service, command);
        } else {
            const auto status = service.reconnect();
            if (!status.ok()) {
                print_status_error(status);
            }
            std::cout << "Seeding local files (Ctrl+C to stop)" << std::endl;
            wait_for_stop(service, link);
        }

        service.stop();
        link.disconnect();
        return exit_code;
    } catch (const CliException& ex) {
        print_cli_error(ex);
        return EXIT_FAILURE;
    } catch (const std::exception& ex) {
        std::cerr << "swarmshare-peer failed: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }
}
