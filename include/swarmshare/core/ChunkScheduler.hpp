#pragma once

#include "swarmshare/Config.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/core/ChunkBitmap.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace swarmshare {

struct ChunkDispatch {
    DeviceKey peer;
    ChunkIndex index{0};
};

// Rarest-first request planner for one download. Holds no clock and does no I/O; the owning
// session feeds it peer availability and request outcomes and asks it what to send next.
//
// The in-flight window and each peer's request limit adapt: a run of successes widens them by one,
// a failed or timed-out request narrows them by one. Changes are spaced by a cooldown.
class ChunkScheduler {
public:
    using Clock = std::chrono::steady_clock;

    ChunkScheduler(std::uint32_t chunk_count, const Config& config);

    // upload_slots == 0 means the peer did not report a limit; the configured default applies.
    void update_peer(const DeviceKey& peer,
                     ChunkBitmap chunks,
                     std::uint16_t upload_slots,
                     std::uint16_t reported_uploads);
    // Both return the indices whose requests were released.
    std::vector<ChunkIndex> remove_peer(const DeviceKey& peer);
    std::vector<ChunkIndex> set_connected(const DeviceKey& peer, bool connected);

    // Picks up to (window - in flight) requests and records them as dispatched.
    std::vector<ChunkDispatch> next_requests(const ChunkBitmap& held, Clock::time_point now);

    // Both return true when the index was in flight.
    bool on_success(const DeviceKey& peer, ChunkIndex index, Clock::time_point now);
    bool on_failure(const DeviceKey& peer, ChunkIndex index, Clock::time_point now);
    // The peer supplied a chunk that failed verification; the re-fetch prefers other holders.
    void on_corrupt(const DeviceKey& peer, ChunkIndex index);

    // Requests older than the request timeout are failed and their peers marked unresponsive.
    std::vector<ChunkDispatch> expire(Clock::time_point now);

    // Closes a scheduling round: a peer that had requests but delivered nothing accrues a zero round.
    void end_round();

    [[nodiscard]] bool in_flight(ChunkIndex index) const;
    [[nodiscard]] std::size_t in_flight_count() const noexcept { return in_flight_.size(); }
    [[nodiscard]] std::vector<ChunkIndex> in_flight_indices() const;
    [[nodiscard]] std::uint16_t window() const noexcept { return window_.value; }
    [[nodiscard]] std::uint16_t request_limit(const DeviceKey& peer) const;

    // Any known peer advertises the index, connected or not.
    [[nodiscard]] bool has_holder(ChunkIndex index) const;
    // Known peers that hold something missing from `held` but have no channel yet.
    [[nodiscard]] std::vector<DeviceKey> unconnected_holders(const ChunkBitmap& held) const;

    [[nodiscard]] bool knows_peer(const DeviceKey& peer) const;
    [[nodiscard]] std::vector<DeviceKey> peers() const;
    [[nodiscard]] bool is_stalled(const DeviceKey& peer) const;
    [[nodiscard]] bool is_unresponsive(const DeviceKey& peer) const;
    [[nodiscard]] int reputation(const DeviceKey& peer) const;
    [[nodiscard]] std::optional<Clock::time_point> retry_after(ChunkIndex index) const;

    void clear();

private:
    struct AdaptiveLimit {
        std::uint16_t value{1};
        std::uint16_t successes{0};
        std::optional<Clock::time_point> changed_at;
    };

    struct PeerState {
        ChunkBitmap chunks;
        AdaptiveLimit limit;
        std::uint16_t upload_slots{0};
        std::uint16_t reported_uploads{0};
        bool connected{false};
        bool unresponsive{false};
        int reputation{0};
        std::uint32_t in_flight{0};
        std::uint32_t round_requests{0};
        std::uint32_t round_successes{0};
        std::uint16_t zero_rounds{0};
    };

    struct InFlight {
        DeviceKey peer;
        Clock::time_point dispatched_at{};
    };

    struct RetryState {
        std::set<DeviceKey> failed_peers;
        std::uint8_t attempts{0};
        Clock::time_point not_before{};
    };

    static constexpr int kMaxReputation = 100;
    static constexpr int kMinReputation = -100;
    static constexpr int kSuccessReward = 1;
    static constexpr int kFailurePenalty = 2;
    static constexpr int kCorruptionPenalty = 10;

    [[nodiscard]] bool stalled(const PeerState& state) const noexcept;
    [[nodiscard]] bool has_capacity(const PeerState& state) const noexcept;
    [[nodiscard]] std::uint16_t slots_for(const PeerState& state) const noexcept;
    std::optional<DeviceKey> pick_holder(ChunkIndex index) const;
    void release(ChunkIndex index);
    std::vector<ChunkIndex> release_peer(const DeviceKey& peer);
    Clock::duration backoff_for(std::uint8_t attempts) const;
    void widen(AdaptiveLimit& limit, std::uint16_t ceiling, Clock::time_point now) const;
    void narrow(AdaptiveLimit& limit, Clock::time_point now) const;

    std::uint32_t chunk_count_;
    const Config& config_;
    AdaptiveLimit window_;
    std::map<DeviceKey, PeerState> peers_;
    std::map<ChunkIndex, InFlight> in_flight_;
    std::map<ChunkIndex, RetryState> retries_;
};

}  // namespace swarmshare
