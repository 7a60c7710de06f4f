#include "swarmshare/core/SwarmSession.hpp"
#include "swarmshare/integrity/IntegrityVerifier.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <numeric>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

namespace {

using swarmshare::ChunkIndex;
using swarmshare::DeviceKey;
using swarmshare::ErrorCode;
using swarmshare::SessionPhase;
using swarmshare::SwarmSession;

const DeviceKey kPeerOne{"bob", "phone"};
const DeviceKey kPeerTwo{"carol", "desktop"};
const DeviceKey kPeerThree{"dave", "tablet"};

struct Request {
    DeviceKey peer;
    ChunkIndex index{0};
};

// Records what the session asks for; background work runs inline.
class RecordingPort final : public swarmshare::SessionPort {
public:
    swarmshare::Status request_chunk(const DeviceKey& peer, const swarmshare::FileId&, ChunkIndex index) override {
        requests.push_back(Request{peer, index});
        return swarmshare::make_ok();
    }

    void connect_peer(const DeviceKey& peer, const swarmshare::FileId&) override { connects.push_back(peer); }

    void close_connections(const swarmshare::FileId&) override { ++closes; }

    void on_chunk_stored(const swarmshare::FileId&, ChunkIndex index) override { stored.push_back(index); }

    void on_chunks_discarded(const swarmshare::FileId&, const std::vector<ChunkIndex>& indices) override {
        discarded.insert(discarded.end(), indices.begin(), indices.end());
    }

    void offload(BackgroundJob job) override {
        auto continuation = job();
        continuation();
    }

    std::vector<Request> requests;
    std::vector<DeviceKey> connects;
    std::vector<ChunkIndex> stored;
    std::vector<ChunkIndex> discarded;
    int closes{0};
};

struct Fixture {
    explicit Fixture(std::uint64_t file_size, std::uint32_t chunk_size, const char* name)
        : content(file_size) {
        config.chunk_size_bytes = chunk_size;
        for (std::size_t i = 0; i < content.size(); ++i) {
            content[i] = static_cast<std::uint8_t>((i * 131u + 17u) & 0xFFu);
        }
        key = swarmshare::crypto::EncryptionService::generate_key();
        params.file_id = "5e55107e5e55107e5e55107e5e55107e";
        params.key = key;
        params.file_size = file_size;
        params.chunk_size = chunk_size;
        params.chunk_count = swarmshare::chunk_count_for(file_size, chunk_size);
        params.sender_checksum = swarmshare::integrity::IntegrityVerifier::file_checksum(content);
        params.coordinator_checksum = params.sender_checksum;
        params.output_path = std::filesystem::temp_directory_path() / name;
        std::filesystem::remove(params.output_path);
    }

    swarmshare::crypto::EncryptedChunk chunk(ChunkIndex index) const {
        const auto offset = static_cast<std::size_t>(index) * params.chunk_size;
        const auto length = std::min<std::size_t>(params.chunk_size, content.size() - offset);
        return swarmshare::crypto::EncryptionService::encrypt_chunk(
            key, params.file_id, index, std::span<const std::uint8_t>(content.data() + offset, length));
    }

    std::shared_ptr<SwarmSession> make_session() {
        auto session = std::make_shared<SwarmSession>(params, store, port, config);
        session->set_listener([this](SessionPhase phase, const swarmshare::Status&) { phases.push_back(phase); });
        return session;
    }

    std::vector<swarmshare::SeederInfo> seeders(std::initializer_list<DeviceKey> peers) const {
        std::vector<ChunkIndex> all(params.chunk_count);
        std::iota(all.begin(), all.end(), 0u);
        std::vector<swarmshare::SeederInfo> result;
        for (const auto& peer : peers) {
            result.push_back(swarmshare::SeederInfo{peer, all, 4, 0});
        }
        return result;
    }

    // Answers every outstanding request, including the ones issued while answering.
    void serve_all(SwarmSession& session, SwarmSession::Clock::time_point now) {
        std::size_t served = 0;
        while (served < port.requests.size()) {
            const auto request = port.requests[served++];
            session.on_chunk(request.peer, chunk(request.index), now);
        }
    }

    std::vector<std::uint8_t> read_output() const {
        std::ifstream input(params.output_path, std::ios::binary);
        return {std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    }

    swarmshare::Config config{};
    swarmshare::SessionParams params{};
    swarmshare::crypto::FileKey key{};
    std::vector<std::uint8_t> content;
    swarmshare::storage::ChunkStore store{};
    RecordingPort port;
    std::vector<SessionPhase> phases;
};

std::filesystem::path part_of(const std::filesystem::path& output) {
    auto part = output;
    part += ".part";
    return part;
}

void drain_timeout_with_missing_chunk() {
    Fixture fixture(1048576, 65536, "swarmshare_session_drain.bin");
    assert(fixture.params.chunk_count == 16);
    for (ChunkIndex index = 0; index < 13; ++index) {
        fixture.store.put(fixture.chunk(index));
    }

    auto session = fixture.make_session();
    const auto t0 = SwarmSession::Clock::now();
    session->start(t0);
    assert(session->held().count() == 13);

    session->update_seeders(fixture.seeders({kPeerOne, kPeerTwo, kPeerThree}), t0);
    assert(fixture.port.connects.size() == 3);
    for (const auto& peer : {kPeerOne, kPeerTwo, kPeerThree}) {
        session->on_peer_connected(peer, t0);
    }

    // The last three indices are all tracked: nothing left to dispatch.
    assert(fixture.port.requests.size() == 3);
    assert(session->in_flight_count() == 3);
    assert(session->phase() == SessionPhase::Draining);

    const auto find = [&](ChunkIndex index) {
        for (const auto& request : fixture.port.requests) {
            if (request.index == index) {
                return request;
            }
        }
        assert(false);
        return Request{};
    };

    const auto fourteen = find(14);
    session->on_chunk(fourteen.peer, fixture.chunk(14), t0 + 100ms);
    const auto fifteen = find(15);
    session->on_chunk(fifteen.peer, fixture.chunk(15), t0 + 200ms);
    assert(session->phase() == SessionPhase::Draining);
    assert(session->held().count() == 15);

    session->tick(t0 + 4900ms);
    assert(session->phase() == SessionPhase::Draining);

    session->tick(t0 + 5s);
    assert(session->phase() == SessionPhase::Failed);
    assert(session->outcome().code == ErrorCode::DrainTimeout);
    assert(fixture.port.closes == 1);
    assert(!std::filesystem::exists(fixture.params.output_path));
    assert(std::find(fixture.phases.begin(), fixture.phases.end(), SessionPhase::Assembling) != fixture.phases.end());
    assert(fixture.phases.back() == SessionPhase::Failed);

    // A chunk that shows up after the drain closed is not written.
    const auto thirteen = find(13);
    session->on_chunk(thirteen.peer, fixture.chunk(13), t0 + 6s);
    assert(!fixture.store.contains(fixture.params.file_id, 13));
    assert(session->phase() == SessionPhase::Failed);

    // Partial chunks stay for a later attempt.
    assert(fixture.store.chunk_count(fixture.params.file_id) == 15);
}

void complete_download() {
    Fixture fixture(3000, 1024, "swarmshare_session_complete.bin");
    assert(fixture.params.chunk_count == 3);

    auto session = fixture.make_session();
    const auto t0 = SwarmSession::Clock::now();
    session->start(t0);
    session->update_seeders(fixture.seeders({kPeerOne}), t0);
    session->on_peer_connected(kPeerOne, t0);
    assert(session->phase() == SessionPhase::Downloading);

    fixture.serve_all(*session, t0 + 50ms);
    assert(session->phase() == SessionPhase::Complete);
    assert(session->outcome().ok());
    assert(fixture.read_output() == fixture.content);
    assert(!std::filesystem::exists(part_of(fixture.params.output_path)));

    // Progress is reported once per index.
    auto stored = fixture.port.stored;
    std::sort(stored.begin(), stored.end());
    assert((stored == std::vector<ChunkIndex>{0, 1, 2}));

    const std::vector<SessionPhase> expected{SessionPhase::Draining, SessionPhase::Assembling, SessionPhase::Verifying,
                                             SessionPhase::Complete};
    assert(fixture.phases == expected);
    std::filesystem::remove(fixture.params.output_path);
}

void corrupted_chunk_is_refetched() {
    Fixture fixture(3000, 1024, "swarmshare_session_corrupt.bin");
    auto corrupted = fixture.chunk(1);
    corrupted.ciphertext[5] ^= 0x01u;
    fixture.store.put(fixture.chunk(0));
    fixture.store.put(std::move(corrupted));
    fixture.store.put(fixture.chunk(2));

    auto session = fixture.make_session();
    const auto t0 = SwarmSession::Clock::now();
    session->start(t0);
    // Only the chunk that fails to authenticate is dropped, and the session goes back for it.
    assert(session->phase() == SessionPhase::Downloading);
    assert((fixture.port.discarded == std::vector<ChunkIndex>{1}));
    assert(!fixture.store.contains(fixture.params.file_id, 1));
    assert(fixture.store.chunk_count(fixture.params.file_id) == 2);
    assert(session->held().count() == 2);
    assert(!std::filesystem::exists(part_of(fixture.params.output_path)));

    session->update_seeders(fixture.seeders({kPeerOne}), t0);
    session->on_peer_connected(kPeerOne, t0);
    assert(fixture.port.requests.size() == 1 && fixture.port.requests[0].index == 1);
    fixture.serve_all(*session, t0 + 50ms);
    assert(session->phase() == SessionPhase::Complete);
    assert(fixture.read_output() == fixture.content);
    std::filesystem::remove(fixture.params.output_path);
}

// Chunk 1 is validly encrypted but carries the wrong bytes, so only the whole-file checksum catches it.
void swapped_plaintext_refetches_every_chunk() {
    Fixture fixture(3000, 1024, "swarmshare_session_swapped.bin");
    const std::vector<std::uint8_t> other(1024, 0x5A);
    fixture.store.put(fixture.chunk(0));
    fixture.store.put(swarmshare::crypto::EncryptionService::encrypt_chunk(fixture.key, fixture.params.file_id, 1, other));
    fixture.store.put(fixture.chunk(2));

    auto session = fixture.make_session();
    const auto t0 = SwarmSession::Clock::now();
    session->start(t0);
    assert(session->phase() == SessionPhase::Downloading);
    assert(fixture.port.discarded.size() == 3);
    assert(fixture.store.chunk_count(fixture.params.file_id) == 0);
    assert(session->held().count() == 0);

    session->update_seeders(fixture.seeders({kPeerOne, kPeerTwo}), t0);
    session->on_peer_connected(kPeerOne, t0);
    session->on_peer_connected(kPeerTwo, t0);
    fixture.serve_all(*session, t0 + 50ms);
    assert(session->phase() == SessionPhase::Complete);
    assert(fixture.read_output() == fixture.content);
    std::filesystem::remove(fixture.params.output_path);
}

void integrity_recovery_exhausted() {
    Fixture fixture(3000, 1024, "swarmshare_session_exhausted.bin");
    fixture.config.integrity_recovery_attempts = 0;
    const std::vector<std::uint8_t> other(1024, 0x5A);
    fixture.store.put(fixture.chunk(0));
    fixture.store.put(swarmshare::crypto::EncryptionService::encrypt_chunk(fixture.key, fixture.params.file_id, 1, other));
    fixture.store.put(fixture.chunk(2));

    auto session = fixture.make_session();
    session->start(SwarmSession::Clock::now());
    assert(session->phase() == SessionPhase::Failed);
    assert(session->outcome().code == ErrorCode::IntegrityFailure);
    // The suspect chunks are gone even though no further attempt is made.
    assert(fixture.store.chunk_count(fixture.params.file_id) == 0);
    assert(!std::filesystem::exists(fixture.params.output_path));
    assert(!std::filesystem::exists(part_of(fixture.params.output_path)));
}

void checksum_disagreement_fails_verification() {
    Fixture fixture(3000, 1024, "swarmshare_session_checksum.bin");
    fixture.params.coordinator_checksum = std::string(64, '0');
    for (ChunkIndex index = 0; index < 3; ++index) {
        fixture.store.put(fixture.chunk(index));
    }

    auto session = fixture.make_session();
    session->start(SwarmSession::Clock::now());
    // No fetch can satisfy two different checksums; the session fails at once.
    assert(session->phase() == SessionPhase::Failed);
    assert(session->outcome().code == ErrorCode::IntegrityFailure);
    assert(fixture.store.chunk_count(fixture.params.file_id) == 0);
    assert(!std::filesystem::exists(fixture.params.output_path));
    assert(!std::filesystem::exists(part_of(fixture.params.output_path)));
}

void pause_and_resume() {
    Fixture fixture(4096, 1024, "swarmshare_session_pause.bin");
    auto session = fixture.make_session();
    const auto t0 = SwarmSession::Clock::now();
    session->start(t0);
    session->update_seeders(fixture.seeders({kPeerOne}), t0);
    session->on_peer_connected(kPeerOne, t0);
    assert(fixture.port.requests.size() == 2);
    session->on_chunk(kPeerOne, fixture.chunk(fixture.port.requests[0].index), t0 + 5ms);
    assert(session->held().count() == 1);
    assert(fixture.port.requests.size() == 3);

    assert(session->pause(t0 + 10ms));
    assert(session->phase() == SessionPhase::Paused);
    assert(fixture.port.closes == 1);
    assert(session->in_flight_count() == 0);
    assert(!session->pause(t0 + 10ms));

    // Nothing lands while paused, and a paused session never times out.
    const auto late = fixture.port.requests[1].index;
    session->on_chunk(kPeerOne, fixture.chunk(late), t0 + 20ms);
    assert(!fixture.store.contains(fixture.params.file_id, late));
    session->on_peer_connected(kPeerOne, t0 + 30ms);
    assert(fixture.port.requests.size() == 3);
    session->tick(t0 + fixture.config.request_timeout * 3);
    assert(session->phase() == SessionPhase::Paused);

    // Held chunks survive; the session reconnects and picks up where it stopped.
    const auto t1 = t0 + fixture.config.request_timeout * 3;
    assert(session->resume(t1));
    assert(session->phase() == SessionPhase::Downloading);
    assert(session->held().count() == 1);
    assert(fixture.port.connects.size() == 2);
    session->on_peer_connected(kPeerOne, t1);
    assert(fixture.port.requests.size() == 5);
    fixture.serve_all(*session, t1 + 50ms);
    assert(session->phase() == SessionPhase::Complete);
    assert(fixture.read_output() == fixture.content);
    assert(!session->pause(t1 + 1s));
    assert(!session->resume(t1 + 1s));
    std::filesystem::remove(fixture.params.output_path);
}

void rejected_request_returns_to_downloading() {
    Fixture fixture(2048, 1024, "swarmshare_session_reject.bin");
    auto session = fixture.make_session();
    const auto t0 = SwarmSession::Clock::now();
    session->start(t0);
    session->update_seeders(fixture.seeders({kPeerOne}), t0);
    session->on_peer_connected(kPeerOne, t0);
    assert(session->phase() == SessionPhase::Draining);
    assert(fixture.port.requests.size() == 2);

    session->on_chunk(kPeerOne, fixture.chunk(0), t0 + 10ms);
    session->on_chunk_failed(kPeerOne, 1, ErrorCode::RateLimited, t0 + 20ms);
    // The gap is still fetchable, so the drain is abandoned rather than timed out.
    assert(session->phase() == SessionPhase::Downloading);
    assert(session->in_flight_count() == 0);

    // Retried once the backoff has passed.
    session->tick(t0 + 20ms + fixture.config.chunk_retry_initial_backoff);
    assert(fixture.port.requests.size() == 3);
    assert(session->phase() == SessionPhase::Draining);
    session->on_chunk(kPeerOne, fixture.chunk(1), t0 + 2s);
    assert(session->phase() == SessionPhase::Complete);
    std::filesystem::remove(fixture.params.output_path);
}

void no_holders_becomes_unavailable() {
    Fixture fixture(2048, 1024, "swarmshare_session_unavailable.bin");
    auto session = fixture.make_session();
    const auto t0 = SwarmSession::Clock::now();
    session->start(t0);
    session->tick(t0 + 1s);
    assert(session->phase() == SessionPhase::Downloading);
    session->tick(t0 + fixture.config.request_timeout);
    assert(session->phase() == SessionPhase::Failed);
    assert(session->outcome().code == ErrorCode::Unavailable);
}

void cancel_closes_connections() {
    Fixture fixture(2048, 1024, "swarmshare_session_cancel.bin");
    auto session = fixture.make_session();
    const auto t0 = SwarmSession::Clock::now();
    session->start(t0);
    session->update_seeders(fixture.seeders({kPeerOne}), t0);
    session->cancel(t0);
    assert(session->phase() == SessionPhase::Failed);
    assert(session->outcome().code == ErrorCode::Cancelled);
    assert(fixture.port.closes == 1);
    session->cancel(t0);
    assert(fixture.port.closes == 1);
}

}  // namespace

int main() {
    drain_timeout_with_missing_chunk();
    complete_download();
    corrupted_chunk_is_refetched();
    swapped_plaintext_refetches_every_chunk();
    integrity_recovery_exhausted();
    checksum_disagreement_fails_verification();
    pause_and_resume();
    rejected_request_returns_to_downloading();
    no_holders_becomes_unavailable();
    cancel_closes_connections();
    return 0;
}
