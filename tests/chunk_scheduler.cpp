#include "swarmshare/core/ChunkScheduler.hpp"

#include <cassert>
#include <chrono>
#include <vector>

using namespace std::chrono_literals;

namespace {

using swarmshare::ChunkBitmap;
using swarmshare::ChunkIndex;
using swarmshare::ChunkScheduler;
using swarmshare::DeviceKey;

const DeviceKey kAlpha{"alpha", "a"};
const DeviceKey kBravo{"bravo", "b"};
const DeviceKey kCharlie{"charlie", "c"};

ChunkBitmap holding(std::uint32_t size, std::vector<ChunkIndex> indices) {
    return ChunkBitmap::from_indices(size, indices);
}

bool dispatched(const std::vector<swarmshare::ChunkDispatch>& requests, const DeviceKey& peer, ChunkIndex index) {
    for (const auto& request : requests) {
        if (request.peer == peer && request.index == index) {
            return true;
        }
    }
    return false;
}

void rarest_first(const swarmshare::Config& config) {
    ChunkScheduler scheduler(6, config);
    scheduler.update_peer(kAlpha, ChunkBitmap::full(6), 0, 0);
    scheduler.update_peer(kBravo, holding(6, {0, 1, 2, 3, 4}), 0, 0);
    scheduler.update_peer(kCharlie, holding(6, {0, 1, 2, 3}), 0, 0);
    for (const auto& peer : {kAlpha, kBravo, kCharlie}) {
        scheduler.set_connected(peer, true);
    }

    ChunkBitmap held(6);
    const auto now = ChunkScheduler::Clock::now();
    const auto first = scheduler.next_requests(held, now);
    // Pipeline depth bounds the batch; the rarest chunks go first, spread by load.
    assert(first.size() == 4);
    assert(first[0].index == 5 && first[0].peer == kAlpha);
    assert(first[1].index == 4 && first[1].peer == kBravo);
    assert(first[2].index == 0 && first[2].peer == kCharlie);
    assert(first[3].index == 1 && first[3].peer == kAlpha);
    assert(scheduler.in_flight_count() == 4);
    assert(scheduler.next_requests(held, now).empty());

    // Alpha is at its per-peer cap; a success frees a slot and lifts its reputation.
    assert(scheduler.on_success(kAlpha, 5, now));
    held.set(5);
    assert(scheduler.reputation(kAlpha) == 1);
    const auto second = scheduler.next_requests(held, now);
    assert(second.size() == 1);
    assert(dispatched(second, kAlpha, 2));

    // Losing a peer releases its requests.
    const auto released = scheduler.remove_peer(kAlpha);
    assert(released.size() == 2);
    assert(!scheduler.in_flight(1));
    assert(!scheduler.knows_peer(kAlpha));
    assert(!scheduler.has_holder(5));
    assert(scheduler.in_flight_count() == 2);
}

void slot_limits(const swarmshare::Config& config) {
    ChunkScheduler scheduler(2, config);
    // Two slots, both already busy with other downloaders.
    scheduler.update_peer(kAlpha, ChunkBitmap::full(2), 2, 2);
    scheduler.set_connected(kAlpha, true);
    ChunkBitmap held(2);
    assert(scheduler.next_requests(held, ChunkScheduler::Clock::now()).empty());

    scheduler.update_peer(kAlpha, ChunkBitmap::full(2), 2, 1);
    assert(scheduler.next_requests(held, ChunkScheduler::Clock::now()).size() == 1);
}

void retry_backoff(const swarmshare::Config& config) {
    ChunkScheduler scheduler(1, config);
    scheduler.update_peer(kAlpha, ChunkBitmap::full(1), 0, 0);
    scheduler.update_peer(kBravo, ChunkBitmap::full(1), 0, 0);
    scheduler.set_connected(kAlpha, true);
    scheduler.set_connected(kBravo, true);

    ChunkBitmap held(1);
    const auto t0 = ChunkScheduler::Clock::now();
    auto requests = scheduler.next_requests(held, t0);
    assert(requests.size() == 1 && requests[0].peer == kAlpha);

    // Failures only count against the peer that holds the request.
    assert(!scheduler.on_failure(kBravo, 0, t0));
    assert(scheduler.on_failure(kAlpha, 0, t0));
    assert(scheduler.reputation(kAlpha) == -2);
    assert(scheduler.retry_after(0) == t0 + 1s);
    assert(scheduler.next_requests(held, t0 + 500ms).empty());

    // The retry avoids the peer that already failed it.
    requests = scheduler.next_requests(held, t0 + 1s);
    assert(requests.size() == 1 && requests[0].peer == kBravo);
    assert(scheduler.on_failure(kBravo, 0, t0 + 1s));
    assert(scheduler.retry_after(0) == t0 + 3s);

    requests = scheduler.next_requests(held, t0 + 3s);
    assert(requests.size() == 1 && requests[0].peer == kAlpha);
    assert(scheduler.on_failure(kAlpha, 0, t0 + 3s));
    // Doubled again and capped at the maximum.
    assert(scheduler.retry_after(0) == t0 + 7s);

    // After the retry limit every holder is eligible again; reputation breaks the tie.
    requests = scheduler.next_requests(held, t0 + 7s);
    assert(requests.size() == 1 && requests[0].peer == kBravo);

    const auto expired = scheduler.expire(t0 + 7s + config.request_timeout);
    assert(expired.size() == 1);
    assert(expired[0].peer == kBravo);
    assert(scheduler.is_unresponsive(kBravo));
    assert(scheduler.in_flight_count() == 0);
}

void stalled_peers(const swarmshare::Config& config) {
    ChunkScheduler scheduler(2, config);
    scheduler.update_peer(kAlpha, ChunkBitmap::full(2), 0, 0);
    scheduler.update_peer(kBravo, holding(2, {1}), 0, 0);
    scheduler.set_connected(kAlpha, true);

    ChunkBitmap held(2);
    const auto t0 = ChunkScheduler::Clock::now();
    assert(scheduler.next_requests(held, t0).size() == 2);
    const auto unconnected = scheduler.unconnected_holders(held);
    assert(unconnected.size() == 1 && unconnected[0] == kBravo);

    // Three rounds with requests outstanding and nothing delivered.
    for (std::uint16_t round = 0; round < config.stall_round_limit; ++round) {
        assert(!scheduler.is_stalled(kAlpha));
        scheduler.end_round();
    }
    assert(scheduler.is_stalled(kAlpha));
    assert(!scheduler.is_stalled(kBravo));

    assert(scheduler.set_connected(kAlpha, false).size() == 2);
    scheduler.set_connected(kAlpha, true);
    scheduler.set_connected(kBravo, true);

    // Chunks with a healthy holder come first and go to the healthy peer.
    const auto requests = scheduler.next_requests(held, t0 + 1s);
    assert(requests.size() == 2);
    assert(requests[0].index == 1 && requests[0].peer == kBravo);
    assert(requests[1].index == 0 && requests[1].peer == kAlpha);

    // A delivery clears the stall.
    scheduler.on_success(kAlpha, 0, t0 + 2s);
    scheduler.end_round();
    assert(!scheduler.is_stalled(kAlpha));
}

void adaptive_limits(swarmshare::Config config) {
    config.adaptive_success_threshold = 3;
    config.adaptive_cooldown = 1s;
    config.max_pipeline_depth = 6;
    config.adaptive_max_requests_per_peer = 3;

    ChunkScheduler scheduler(40, config);
    scheduler.update_peer(kAlpha, ChunkBitmap::full(40), 16, 0);
    scheduler.set_connected(kAlpha, true);
    assert(scheduler.window() == 4);
    assert(scheduler.request_limit(kAlpha) == 2);

    ChunkBitmap held(40);
    const auto deliver = [&](ChunkScheduler::Clock::time_point at) {
        const auto batch = scheduler.next_requests(held, at);
        for (const auto& request : batch) {
            assert(scheduler.on_success(request.peer, request.index, at));
            held.set(request.index);
        }
        return batch.size();
    };

    // The third success widens both limits by one.
    const auto t0 = ChunkScheduler::Clock::now();
    assert(deliver(t0) == 2);
    assert(deliver(t0) == 2);
    assert(scheduler.window() == 5);
    assert(scheduler.request_limit(kAlpha) == 3);

    // Inside the cooldown nothing moves; the peer limit is already at its ceiling.
    assert(deliver(t0 + 500ms) == 3);
    assert(scheduler.window() == 5);
    assert(deliver(t0 + 2s) == 3);
    assert(scheduler.window() == 6);
    assert(deliver(t0 + 4s) == 3);
    assert(scheduler.window() == 6);
    assert(scheduler.request_limit(kAlpha) == 3);

    // Timeouts narrow each limit once per cooldown.
    assert(scheduler.next_requests(held, t0 + 5s).size() == 3);
    assert(scheduler.expire(t0 + 5s + config.request_timeout).size() == 3);
    assert(scheduler.window() == 5);
    assert(scheduler.request_limit(kAlpha) == 2);

    // A corrupt delivery costs more reputation than a plain failure.
    const auto before = scheduler.reputation(kAlpha);
    scheduler.on_corrupt(kAlpha, 0);
    assert(scheduler.reputation(kAlpha) == before - 10);

    scheduler.clear();
    assert(scheduler.window() == 4);
}

}  // namespace

int main() {
    swarmshare::Config config{};
    config.pipeline_depth = 4;
    config.max_requests_per_peer = 2;
    config.seeder_upload_slots = 4;
    config.request_timeout = std::chrono::seconds(10);
    config.chunk_retry_limit = 3;
    config.chunk_retry_initial_backoff = std::chrono::seconds(1);
    config.chunk_retry_max_backoff = std::chrono::seconds(4);
    config.stall_round_limit = 3;

    rarest_first(config);
    slot_limits(config);
    retry_backoff(config);
    stalled_peers(config);
    adaptive_limits(config);
    return 0;
}
