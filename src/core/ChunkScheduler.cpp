#include "swarmshare/core/ChunkScheduler.hpp"

#include <algorithm>
#include <tuple>
#include <utility>

namespace swarmshare {

ChunkScheduler::ChunkScheduler(std::uint32_t chunk_count, const Config& config)
    : chunk_count_(chunk_count),
      config_(config) {
    window_.value = config_.pipeline_depth;
}

void ChunkScheduler::update_peer(const DeviceKey& peer,
                                 ChunkBitmap chunks,
                                 std::uint16_t upload_slots,
                                 std::uint16_t reported_uploads) {
    if (chunks.size() != chunk_count_) {
        chunks = ChunkBitmap::from_indices(chunk_count_, chunks.indices());
    }
    auto [it, inserted] = peers_.try_emplace(peer);
    auto& state = it->second;
    if (inserted) {
        state.limit.value = config_.max_requests_per_peer;
    }
    state.chunks = std::move(chunks);
    state.upload_slots = upload_slots;
    state.reported_uploads = reported_uploads;
}

std::vector<ChunkIndex> ChunkScheduler::remove_peer(const DeviceKey& peer) {
    auto released = release_peer(peer);
    peers_.erase(peer);
    for (auto& [index, retry] : retries_) {
        retry.failed_peers.erase(peer);
    }
    return released;
}

std::vector<ChunkIndex> ChunkScheduler::set_connected(const DeviceKey& peer, bool connected) {
    const auto it = peers_.find(peer);
    if (it == peers_.end()) {
        return {};
    }
    it->second.connected = connected;
    if (connected) {
        return {};
    }
    return release_peer(peer);
}

std::vector<ChunkDispatch> ChunkScheduler::next_requests(const ChunkBitmap& held, Clock::time_point now) {
    std::vector<ChunkDispatch> dispatched;
    const auto depth = static_cast<std::size_t>(window_.value);
    if (in_flight_.size() >= depth) {
        return dispatched;
    }

    struct Candidate {
        ChunkIndex index{0};
        bool stalled_only{false};
        std::size_t rarity{0};
    };

    std::vector<Candidate> candidates;
    for (ChunkIndex index = 0; index < chunk_count_; ++index) {
        if (held.test(index) || in_flight_.contains(index)) {
            continue;
        }
        if (const auto retry = retries_.find(index); retry != retries_.end() && now < retry->second.not_before) {
            continue;
        }
        std::size_t healthy = 0;
        bool eligible = false;
        for (const auto& [peer, state] : peers_) {
            if (!state.chunks.test(index)) {
                continue;
            }
            if (!stalled(state)) {
                ++healthy;
            }
            if (state.connected && has_capacity(state)) {
                eligible = true;
            }
        }
        if (!eligible) {
            continue;
        }
        candidates.push_back(Candidate{index, healthy == 0, healthy});
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& lhs, const Candidate& rhs) {
        return std::tie(lhs.stalled_only, lhs.rarity, lhs.index) < std::tie(rhs.stalled_only, rhs.rarity, rhs.index);
    });

    for (const auto& candidate : candidates) {
        if (in_flight_.size() >= depth) {
            break;
        }
        const auto holder = pick_holder(candidate.index);
        if (!holder) {
            continue;
        }
        auto& state = peers_[*holder];
        state.in_flight += 1;
        state.round_requests += 1;
        in_flight_[candidate.index] = InFlight{*holder, now};
        dispatched.push_back(ChunkDispatch{*holder, candidate.index});
    }
    return dispatched;
}

bool ChunkScheduler::on_success(const DeviceKey& peer, ChunkIndex index, Clock::time_point now) {
    const bool was_in_flight = in_flight_.contains(index);
    release(index);
    retries_.erase(index);
    if (was_in_flight) {
        widen(window_, std::max(config_.pipeline_depth, config_.max_pipeline_depth), now);
    }
    if (const auto it = peers_.find(peer); it != peers_.end()) {
        auto& state = it->second;
        state.reputation = std::min(state.reputation + kSuccessReward, kMaxReputation);
        state.unresponsive = false;
        state.round_successes += 1;
        state.chunks.set(index);
        if (was_in_flight) {
            widen(state.limit, std::max(config_.max_requests_per_peer, config_.adaptive_max_requests_per_peer), now);
        }
    }
    return was_in_flight;
}

bool ChunkScheduler::on_failure(const DeviceKey& peer, ChunkIndex index, Clock::time_point now) {
    const auto it = in_flight_.find(index);
    if (it == in_flight_.end() || it->second.peer != peer) {
        return false;
    }
    release(index);
    narrow(window_, now);
    if (const auto peer_it = peers_.find(peer); peer_it != peers_.end()) {
        auto& state = peer_it->second;
        state.reputation = std::max(state.reputation - kFailurePenalty, kMinReputation);
        narrow(state.limit, now);
    }

    auto& retry = retries_[index];
    retry.failed_peers.insert(peer);
    retry.attempts += 1;
    retry.not_before = now + backoff_for(retry.attempts);
    if (retry.attempts >= config_.chunk_retry_limit) {
        // Every holder gets another chance after a full round of retries.
        retry.failed_peers.clear();
        retry.attempts = 0;
    }
    return true;
}

void ChunkScheduler::on_corrupt(const DeviceKey& peer, ChunkIndex index) {
    if (const auto it = peers_.find(peer); it != peers_.end()) {
        it->second.reputation = std::max(it->second.reputation - kCorruptionPenalty, kMinReputation);
    }
    retries_[index].failed_peers.insert(peer);
}

std::vector<ChunkDispatch> ChunkScheduler::expire(Clock::time_point now) {
    std::vector<ChunkDispatch> expired;
    for (const auto& [index, entry] : in_flight_) {
        if (now - entry.dispatched_at >= config_.request_timeout) {
            expired.push_back(ChunkDispatch{entry.peer, index});
        }
    }
    for (const auto& dispatch : expired) {
        on_failure(dispatch.peer, dispatch.index, now);
        if (const auto it = peers_.find(dispatch.peer); it != peers_.end()) {
            it->second.unresponsive = true;
        }
    }
    return expired;
}

void ChunkScheduler::end_round() {
    for (auto& [peer, state] : peers_) {
        const bool active = state.round_requests > 0 || state.in_flight > 0;
        if (state.round_successes > 0) {
            state.zero_rounds = 0;
        } else if (active) {
            state.zero_rounds += 1;
        }
        state.round_requests = 0;
        state.round_successes = 0;
    }
}

bool ChunkScheduler::in_flight(ChunkIndex index) const {
    return in_flight_.contains(index);
}

std::vector<ChunkIndex> ChunkScheduler::in_flight_indices() const {
    std::vector<ChunkIndex> indices;
    indices.reserve(in_flight_.size());
    for (const auto& [index, entry] : in_flight_) {
        indices.push_back(index);
    }
    return indices;
}

std::uint16_t ChunkScheduler::request_limit(const DeviceKey& peer) const {
    const auto it = peers_.find(peer);
    return it == peers_.end() ? config_.max_requests_per_peer : it->second.limit.value;
}

bool ChunkScheduler::has_holder(ChunkIndex index) const {
    return std::any_of(peers_.begin(), peers_.end(), [index](const auto& entry) {
        return entry.second.chunks.test(index);
    });
}

std::vector<DeviceKey> ChunkScheduler::unconnected_holders(const ChunkBitmap& held) const {
    std::vector<DeviceKey> result;
    for (const auto& [peer, state] : peers_) {
        if (!state.connected && held.has_chunks_missing_from(state.chunks)) {
            result.push_back(peer);
        }
    }
    return result;
}

bool ChunkScheduler::knows_peer(const DeviceKey& peer) const {
    return peers_.contains(peer);
}

std::vector<DeviceKey> ChunkScheduler::peers() const {
    std::vector<DeviceKey> result;
    result.reserve(peers_.size());
    for (const auto& [peer, state] : peers_) {
        result.push_back(peer);
    }
    return result;
}

bool ChunkScheduler::is_stalled(const DeviceKey& peer) const {
    const auto it = peers_.find(peer);
    return it != peers_.end() && stalled(it->second);
}

bool ChunkScheduler::is_unresponsive(const DeviceKey& peer) const {
    const auto it = peers_.find(peer);
    return it != peers_.end() && it->second.unresponsive;
}

int ChunkScheduler::reputation(const DeviceKey& peer) const {
    const auto it = peers_.find(peer);
    return it == peers_.end() ? 0 : it->second.reputation;
}

std::optional<ChunkScheduler::Clock::time_point> ChunkScheduler::retry_after(ChunkIndex index) const {
    const auto it = retries_.find(index);
    if (it == retries_.end()) {
        return std::nullopt;
    }
    return it->second.not_before;
}

void ChunkScheduler::clear() {
    window_ = AdaptiveLimit{};
    window_.value = config_.pipeline_depth;
    peers_.clear();
    in_flight_.clear();
    retries_.clear();
}

bool ChunkScheduler::stalled(const PeerState& state) const noexcept {
    return config_.stall_round_limit > 0 && state.zero_rounds >= config_.stall_round_limit;
}

bool ChunkScheduler::has_capacity(const PeerState& state) const noexcept {
    if (state.in_flight >= state.limit.value) {
        return false;
    }
    const auto load = static_cast<std::uint32_t>(state.in_flight) + state.reported_uploads;
    return load < slots_for(state);
}

std::uint16_t ChunkScheduler::slots_for(const PeerState& state) const noexcept {
    return state.upload_slots > 0 ? state.upload_slots : config_.seeder_upload_slots;
}

std::optional<DeviceKey> ChunkScheduler::pick_holder(ChunkIndex index) const {
    const RetryState* retry = nullptr;
    if (const auto it = retries_.find(index); it != retries_.end()) {
        retry = &it->second;
    }

    const DeviceKey* best = nullptr;
    std::tuple<bool, bool, bool, std::uint32_t, int> best_rank{};
    for (const auto& [peer, state] : peers_) {
        if (!state.connected || !state.chunks.test(index) || !has_capacity(state)) {
            continue;
        }
        const bool failed_before = retry != nullptr && retry->failed_peers.contains(peer);
        // Lower ranks win; reputation is negated so that higher scores sort first.
        const auto rank = std::make_tuple(failed_before,
                                          state.unresponsive,
                                          stalled(state),
                                          static_cast<std::uint32_t>(state.in_flight) + state.reported_uploads,
                                          -state.reputation);
        if (best == nullptr || rank < best_rank) {
            best = &peer;
            best_rank = rank;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

void ChunkScheduler::release(ChunkIndex index) {
    const auto it = in_flight_.find(index);
    if (it == in_flight_.end()) {
        return;
    }
    if (const auto peer_it = peers_.find(it->second.peer); peer_it != peers_.end() && peer_it->second.in_flight > 0) {
        peer_it->second.in_flight -= 1;
    }
    in_flight_.erase(it);
}

std::vector<ChunkIndex> ChunkScheduler::release_peer(const DeviceKey& peer) {
    std::vector<ChunkIndex> released;
    for (const auto& [index, entry] : in_flight_) {
        if (entry.peer == peer) {
            released.push_back(index);
        }
    }
    for (const auto index : released) {
        release(index);
    }
    return released;
}

ChunkScheduler::Clock::duration ChunkScheduler::backoff_for(std::uint8_t attempts) const {
    auto backoff = config_.chunk_retry_initial_backoff;
    for (std::uint8_t i = 1; i < attempts; ++i) {
        backoff *= 2;
        if (backoff >= config_.chunk_retry_max_backoff) {
            break;
        }
    }
    if (config_.chunk_retry_max_backoff > std::chrono::milliseconds::zero() && backoff > config_.chunk_retry_max_backoff) {
        backoff = config_.chunk_retry_max_backoff;
    }
    return backoff;
}

void ChunkScheduler::widen(AdaptiveLimit& limit, std::uint16_t ceiling, Clock::time_point now) const {
    limit.successes += 1;
    if (limit.successes < config_.adaptive_success_threshold || limit.value >= ceiling) {
        return;
    }
    if (limit.changed_at && now - *limit.changed_at < config_.adaptive_cooldown) {
        return;
    }
    limit.value += 1;
    limit.successes = 0;
    limit.changed_at = now;
}

void ChunkScheduler::narrow(AdaptiveLimit& limit, Clock::time_point now) const {
    limit.successes = 0;
    if (limit.value <= 1) {
        return;
    }
    if (limit.changed_at && now - *limit.changed_at < config_.adaptive_cooldown) {
        return;
    }
    limit.value -= 1;
    limit.changed_at = now;
}

}  // namespace swarmshare
