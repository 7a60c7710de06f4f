#include "swarmshare/Config.hpp"

#include <cctype>
#include <charconv>
#include <fstream>
#include <limits>
#include <string>

namespace swarmshare {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

std::uint64_t parse_unsigned(std::string_view key, std::string_view value, std::uint64_t min, std::uint64_t max) {
    std::uint64_t parsed = 0;
    const auto* begin = value.data();
    const auto* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end) {
        throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be an unsigned integer");
    }
    if (parsed < min || parsed > max) {
        throw ConfigError("E_CONFIG_VALUE",
                          std::string(key) + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return parsed;
}

bool parse_bool(std::string_view key, std::string_view value) {
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return false;
    }
    throw ConfigError("E_CONFIG_VALUE", std::string(key) + " must be a boolean");
}

template <typename Duration>
Duration parse_duration(std::string_view key, std::string_view value) {
    const auto count = parse_unsigned(key, value, 1, std::numeric_limits<std::uint32_t>::max());
    return Duration(static_cast<typename Duration::rep>(count));
}

}  // namespace

void apply_config_value(Config& config, std::string_view key, std::string_view value) {
    constexpr auto kU16 = static_cast<std::uint64_t>(std::numeric_limits<std::uint16_t>::max());

    if (key == "chunk_size_bytes") {
        config.chunk_size_bytes = static_cast<std::uint32_t>(parse_unsigned(key, value, 1024, 16ull * 1024ull * 1024ull));
    } else if (key == "max_file_size_bytes") {
        config.max_file_size_bytes = parse_unsigned(key, value, 1, std::numeric_limits<std::uint64_t>::max());
    } else if (key == "record_ttl_seconds") {
        config.record_ttl = parse_duration<std::chrono::seconds>(key, value);
    } else if (key == "orphan_record_ttl_seconds") {
        config.orphan_record_ttl = parse_duration<std::chrono::seconds>(key, value);
    } else if (key == "cleanup_interval_seconds") {
        config.cleanup_interval = parse_duration<std::chrono::seconds>(key, value);
    } else if (key == "signaling_write_buffer_bytes") {
        config.signaling_write_buffer_bytes = static_cast<std::size_t>(parse_unsigned(key, value, 1024, 1ull << 32));
    } else if (key == "share_max_principals") {
        config.share_max_principals = static_cast<std::size_t>(parse_unsigned(key, value, 1, 1000000));
    } else if (key == "share_rate_limit") {
        config.share_rate_limit = static_cast<std::size_t>(parse_unsigned(key, value, 1, 100000));
    } else if (key == "share_rate_window_seconds") {
        config.share_rate_window = parse_duration<std::chrono::seconds>(key, value);
    } else if (key == "seeder_upload_slots") {
        config.seeder_upload_slots = static_cast<std::uint16_t>(parse_unsigned(key, value, 1, kU16));
    } else if (key == "pipeline_depth") {
        config.pipeline_depth = static_cast<std::uint16_t>(parse_unsigned(key, value, 1, kU16));
    } else if (key == "max_requests_per_peer") {
        config.max_requests_per_peer = static_cast<std::uint16_t>(parse_unsigned(key, value, 1, kU16));
    } else if (key == "drain_timeout_ms") {
        config.drain_timeout = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "drain_poll_interval_ms") {
        config.drain_poll_interval = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "request_timeout_ms") {
        config.request_timeout = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "scheduling_round_interval_ms") {
        config.scheduling_round_interval = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "stall_round_limit") {
        config.stall_round_limit = static_cast<std::uint16_t>(parse_unsigned(key, value, 1, kU16));
    } else if (key == "chunk_retry_limit") {
        config.chunk_retry_limit = static_cast<std::uint8_t>(parse_unsigned(key, value, 1, 255));
    } else if (key == "chunk_retry_initial_backoff_ms") {
        config.chunk_retry_initial_backoff = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "chunk_retry_max_backoff_ms") {
        config.chunk_retry_max_backoff = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "max_pipeline_depth") {
        config.max_pipeline_depth = static_cast<std::uint16_t>(parse_unsigned(key, value, 1, kU16));
    } else if (key == "adaptive_max_requests_per_peer") {
        config.adaptive_max_requests_per_peer = static_cast<std::uint16_t>(parse_unsigned(key, value, 1, kU16));
    } else if (key == "adaptive_success_threshold") {
        config.adaptive_success_threshold = static_cast<std::uint16_t>(parse_unsigned(key, value, 1, kU16));
    } else if (key == "adaptive_cooldown_ms") {
        config.adaptive_cooldown = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "integrity_recovery_attempts") {
        config.integrity_recovery_attempts = static_cast<std::uint8_t>(parse_unsigned(key, value, 0, 255));
    } else if (key == "max_concurrent_downloads") {
        config.max_concurrent_downloads = static_cast<std::size_t>(parse_unsigned(key, value, 1, 1024));
    } else if (key == "worker_threads") {
        config.worker_threads = static_cast<std::size_t>(parse_unsigned(key, value, 0, 256));
    } else if (key == "coordinator_host") {
        if (value.empty()) {
            throw ConfigError("E_CONFIG_VALUE", "coordinator_host must not be empty");
        }
        config.coordinator_host = std::string(value);
    } else if (key == "coordinator_port") {
        config.coordinator_port = static_cast<std::uint16_t>(parse_unsigned(key, value, 1, kU16));
    } else if (key == "coordinator_request_timeout_ms") {
        config.coordinator_request_timeout = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "transport_host") {
        if (value.empty()) {
            throw ConfigError("E_CONFIG_VALUE", "transport_host must not be empty");
        }
        config.transport_host = std::string(value);
    } else if (key == "transport_port") {
        config.transport_port = static_cast<std::uint16_t>(parse_unsigned(key, value, 0, kU16));
    } else if (key == "transport_connect_timeout_ms") {
        config.transport_connect_timeout = parse_duration<std::chrono::milliseconds>(key, value);
    } else if (key == "storage_persistent") {
        config.storage_persistent_enabled = parse_bool(key, value);
    } else if (key == "storage_wipe_on_delete") {
        config.storage_wipe_on_delete = parse_bool(key, value);
    } else if (key == "storage_wipe_passes") {
        config.storage_wipe_passes = static_cast<std::uint8_t>(parse_unsigned(key, value, 1, 255));
    } else if (key == "storage_directory") {
        if (value.empty()) {
            throw ConfigError("E_CONFIG_VALUE", "storage_directory must not be empty");
        }
        config.storage_directory = std::string(value);
    } else if (key == "logging_enabled") {
        config.logging_enabled = parse_bool(key, value);
    } else {
        throw ConfigError("E_CONFIG_KEY", "Unknown configuration key: " + std::string(key));
    }
}

Config load_config(const std::filesystem::path& path, Config base) {
    std::ifstream stream(path);
    if (!stream) {
        throw ConfigError("E_CONFIG_IO", "Unable to open config file " + path.string());
    }

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        auto text = trim(line);
        if (const auto comment = text.find('#'); comment != std::string_view::npos) {
            text = trim(text.substr(0, comment));
        }
        if (text.empty()) {
            continue;
        }

        const auto separator = text.find('=');
        if (separator == std::string_view::npos) {
            throw ConfigError("E_CONFIG_PARSE",
                              "Expected key = value at line " + std::to_string(line_number) + " of " + path.string());
        }
        const auto key = trim(text.substr(0, separator));
        const auto value = trim(text.substr(separator + 1));
        if (key.empty()) {
            throw ConfigError("E_CONFIG_PARSE", "Missing key at line " + std::to_string(line_number));
        }
        apply_config_value(base, key, value);
    }
    return base;
}

}  // namespace swarmshare
