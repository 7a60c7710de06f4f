#pragma once

#include "swarmshare/Config.hpp"
#include "swarmshare/Error.hpp"
#include "swarmshare/SwarmTypes.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/core/ChunkBitmap.hpp"
#include "swarmshare/core/ChunkScheduler.hpp"
#include "swarmshare/crypto/EncryptionService.hpp"
#include "swarmshare/storage/ChunkStore.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace swarmshare {

enum class SessionPhase : std::uint8_t {
    Downloading,
    Paused,
    Draining,
    Assembling,
    Verifying,
    Complete,
    Failed
};

std::string_view session_phase_name(SessionPhase phase) noexcept;
bool is_terminal(SessionPhase phase) noexcept;

struct SessionParams {
    FileId file_id;
    crypto::FileKey key{};
    std::uint64_t file_size{0};
    std::uint32_t chunk_count{0};
    std::uint32_t chunk_size{0};
    std::string sender_checksum;
    std::string coordinator_checksum;
    std::filesystem::path output_path;
};

// What a session needs from the world around it.
class SessionPort {
public:
    // Runs off the session's sequence; the returned continuation is handed back to it.
    using BackgroundJob = std::function<std::function<void()>()>;

    virtual ~SessionPort() = default;

    virtual Status request_chunk(const DeviceKey& peer, const FileId& file_id, ChunkIndex index) = 0;
    virtual void connect_peer(const DeviceKey& peer, const FileId& file_id) = 0;
    virtual void close_connections(const FileId& file_id) = 0;
    virtual void on_chunk_stored(const FileId& file_id, ChunkIndex index) = 0;
    // The chunks failed verification and were erased from the store.
    virtual void on_chunks_discarded(const FileId& file_id, const std::vector<ChunkIndex>& indices) = 0;
    virtual void offload(BackgroundJob job) = 0;
};

// One download: downloading -> draining -> assembling -> verifying -> complete | failed.
// Downloading and draining may be paused. An integrity failure erases the suspect chunks and,
// while recovery attempts remain, returns to downloading to fetch them again.
//
// Not thread-safe. Every call, including offloaded continuations, must come from a single
// logical owner; TransferService routes them through one strand per session.
class SwarmSession : public std::enable_shared_from_this<SwarmSession> {
public:
    using Clock = std::chrono::steady_clock;
    using Listener = std::function<void(SessionPhase phase, const Status& status)>;

    SwarmSession(SessionParams params, storage::ChunkStore& store, SessionPort& port, const Config& config);

    SwarmSession(const SwarmSession&) = delete;
    SwarmSession& operator=(const SwarmSession&) = delete;

    void set_listener(Listener listener);

    // Picks up chunks already in the store from an earlier attempt.
    void start(Clock::time_point now);
    // Seeders other than this device; peers missing from the list are dropped.
    void update_seeders(const std::vector<SeederInfo>& seeders, Clock::time_point now);
    void on_peer_connected(const DeviceKey& peer, Clock::time_point now);
    void on_peer_lost(const DeviceKey& peer, Clock::time_point now);
    // The chunk has already been authenticated and hash-checked.
    void on_chunk(const DeviceKey& from, crypto::EncryptedChunk chunk, Clock::time_point now);
    void on_chunk_failed(const DeviceKey& from, ChunkIndex index, ErrorCode reason, Clock::time_point now);
    void tick(Clock::time_point now);
    void cancel(Clock::time_point now);
    // Only a downloading or draining session pauses. Peers, reputation and held chunks are kept;
    // connections and outstanding requests are dropped.
    bool pause(Clock::time_point now);
    bool resume(Clock::time_point now);

    [[nodiscard]] SessionPhase phase() const noexcept { return phase_; }
    [[nodiscard]] const Status& outcome() const noexcept { return outcome_; }
    [[nodiscard]] const ChunkBitmap& held() const noexcept { return held_; }
    [[nodiscard]] std::size_t in_flight_count() const noexcept { return scheduler_.in_flight_count(); }
    [[nodiscard]] const SessionParams& params() const noexcept { return params_; }

private:
    void advance(Clock::time_point now);
    void dispatch(Clock::time_point now);
    void connect_holders(Clock::time_point now);
    [[nodiscard]] bool ready_to_drain() const;
    void check_availability(Clock::time_point now);

    void set_phase(SessionPhase next);
    void finish(SessionPhase terminal, Status status);

    void begin_assembly();
    void on_assembled(Status status, const std::filesystem::path& part, const std::vector<ChunkIndex>& corrupt);
    void on_verified(Status status, const std::filesystem::path& part);
    // `identified` is false when the failure could not be pinned on particular chunks.
    void recover(const std::vector<ChunkIndex>& suspect, bool identified, Status status);

    SessionParams params_;
    storage::ChunkStore& store_;
    SessionPort& port_;
    const Config& config_;
    ChunkScheduler scheduler_;
    ChunkBitmap held_;

    SessionPhase phase_{SessionPhase::Downloading};
    Status outcome_;
    Listener listener_;

    std::set<DeviceKey> connected_;
    std::map<DeviceKey, Clock::time_point> connect_attempts_;
    std::map<ChunkIndex, DeviceKey> suppliers_;
    std::uint8_t integrity_attempts_{0};
    Clock::time_point drain_started_{};
    Clock::time_point last_round_{};
    std::optional<Clock::time_point> unavailable_since_;
};

}  // namespace swarmshare
