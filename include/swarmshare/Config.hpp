#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace swarmshare {

struct Config {
    std::uint32_t chunk_size_bytes{64u * 1024u};
    std::uint64_t max_file_size_bytes{200ull * 1024ull * 1024ull};

    // Coordinator record lifetime.
    std::chrono::seconds record_ttl{std::chrono::hours(24 * 30)};
    std::chrono::seconds orphan_record_ttl{std::chrono::hours(24 * 7)};
    std::chrono::seconds cleanup_interval{std::chrono::hours(1)};
    std::size_t signaling_write_buffer_bytes{4u * 1024u * 1024u};

    std::size_t share_max_principals{1000};
    std::size_t share_rate_limit{10};
    std::chrono::seconds share_rate_window{std::chrono::seconds(60)};

    std::uint16_t seeder_upload_slots{4};

    // Download scheduling.
    std::uint16_t pipeline_depth{4};
    std::uint16_t max_requests_per_peer{2};
    std::chrono::milliseconds drain_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds drain_poll_interval{std::chrono::milliseconds(100)};
    std::chrono::milliseconds request_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds scheduling_round_interval{std::chrono::seconds(2)};
    std::uint16_t stall_round_limit{3};
    std::uint8_t chunk_retry_limit{3};
    std::chrono::milliseconds chunk_retry_initial_backoff{std::chrono::seconds(1)};
    std::chrono::milliseconds chunk_retry_max_backoff{std::chrono::seconds(4)};
    // Adaptive in-flight limits: grow by one after a run of successes, shrink by one on timeouts.
    std::uint16_t max_pipeline_depth{16};
    std::uint16_t adaptive_max_requests_per_peer{8};
    std::uint16_t adaptive_success_threshold{10};
    std::chrono::milliseconds adaptive_cooldown{std::chrono::seconds(5)};
    std::uint8_t integrity_recovery_attempts{2};
    std::size_t max_concurrent_downloads{3};

    std::size_t worker_threads{2};

    std::string coordinator_host{"127.0.0.1"};
    std::uint16_t coordinator_port{9750};
    std::chrono::milliseconds coordinator_request_timeout{std::chrono::seconds(5)};

    std::string transport_host{"127.0.0.1"};
    std::uint16_t transport_port{0};
    std::chrono::milliseconds transport_connect_timeout{std::chrono::seconds(5)};

    bool storage_persistent_enabled{false};
    bool storage_wipe_on_delete{true};
    std::uint8_t storage_wipe_passes{1};
    std::string storage_directory{"storage"};

    bool logging_enabled{true};
};

class ConfigError : public std::runtime_error {
public:
    ConfigError(std::string code, const std::string& message)
        : std::runtime_error(message), code_(std::move(code)) {}

    const std::string& code() const noexcept { return code_; }

private:
    std::string code_;
};

// Reads `key = value` lines; unknown keys and malformed values throw ConfigError.
Config load_config(const std::filesystem::path& path, Config base = {});
void apply_config_value(Config& config, std::string_view key, std::string_view value);

}  // namespace swarmshare
