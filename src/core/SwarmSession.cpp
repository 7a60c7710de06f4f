#include "swarmshare/core/SwarmSession.hpp"

#include "swarmshare/integrity/IntegrityVerifier.hpp"
#include "swarmshare/logging/StructuredLogger.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>

namespace swarmshare {

using logging::StructuredLogger;
using logging::log_event;

namespace {

std::filesystem::path part_path_for(const std::filesystem::path& output) {
    auto part = output;
    part += ".part";
    return part;
}

void discard(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

// Every chunk is checked; the ones that do not authenticate are collected in `corrupt`.
Status assemble(const SessionParams& params,
                const storage::ChunkStore& store,
                const std::filesystem::path& part,
                std::vector<ChunkIndex>& corrupt) {
    std::error_code ec;
    if (part.has_parent_path()) {
        std::filesystem::create_directories(part.parent_path(), ec);
    }

    std::ofstream output(part, std::ios::binary | std::ios::trunc);
    if (!output) {
        return make_error(ErrorCode::Unavailable, "cannot open " + part.string());
    }

    std::uint64_t written = 0;
    for (ChunkIndex index = 0; index < params.chunk_count; ++index) {
        const auto chunk = store.get(params.file_id, index);
        if (!chunk) {
            return make_error(ErrorCode::DrainTimeout, "chunk " + std::to_string(index) + " missing at assembly");
        }
        const auto plaintext = crypto::EncryptionService::decrypt_chunk(params.key, *chunk);
        if (!plaintext || !integrity::IntegrityVerifier::verify_chunk(*plaintext, chunk->plaintext_hash)) {
            corrupt.push_back(index);
            continue;
        }
        if (!corrupt.empty()) {
            continue;
        }
        output.write(reinterpret_cast<const char*>(plaintext->data()), static_cast<std::streamsize>(plaintext->size()));
        written += plaintext->size();
    }
    if (!corrupt.empty()) {
        return make_error(ErrorCode::IntegrityFailure,
                          std::to_string(corrupt.size()) + " chunks do not authenticate, first " +
                              std::to_string(corrupt.front()));
    }
    output.flush();
    if (!output) {
        return make_error(ErrorCode::Unavailable, "write failed for " + part.string());
    }
    if (written != params.file_size) {
        return make_error(ErrorCode::IntegrityFailure,
                          "assembled " + std::to_string(written) + " bytes, expected " + std::to_string(params.file_size));
    }
    return make_ok();
}

}  // namespace

std::string_view session_phase_name(SessionPhase phase) noexcept {
    switch (phase) {
        case SessionPhase::Downloading:
            return "downloading";
        case SessionPhase::Paused:
            return "paused";
        case SessionPhase::Draining:
            return "draining";
        case SessionPhase::Assembling:
            return "assembling";
        case SessionPhase::Verifying:
            return "verifying";
        case SessionPhase::Complete:
            return "complete";
        case SessionPhase::Failed:
            return "failed";
    }
    return "unknown";
}

bool is_terminal(SessionPhase phase) noexcept {
    return phase == SessionPhase::Complete || phase == SessionPhase::Failed;
}

SwarmSession::SwarmSession(SessionParams params, storage::ChunkStore& store, SessionPort& port, const Config& config)
    : params_(std::move(params)),
      store_(store),
      port_(port),
      config_(config),
      scheduler_(params_.chunk_count, config),
      held_(params_.chunk_count) {}

void SwarmSession::set_listener(Listener listener) {
    listener_ = std::move(listener);
}

void SwarmSession::start(Clock::time_point now) {
    for (const auto index : store_.indices(params_.file_id)) {
        held_.set(index);
    }
    last_round_ = now;
    log_event(StructuredLogger::Level::Info,
              "session.start",
              {{"file_id", params_.file_id},
               {"held", std::to_string(held_.count())},
               {"chunk_count", std::to_string(params_.chunk_count)}});
    advance(now);
}

void SwarmSession::update_seeders(const std::vector<SeederInfo>& seeders, Clock::time_point now) {
    if (is_terminal(phase_)) {
        return;
    }
    std::set<DeviceKey> listed;
    for (const auto& seeder : seeders) {
        listed.insert(seeder.device);
        scheduler_.update_peer(seeder.device,
                               ChunkBitmap::from_indices(params_.chunk_count, seeder.chunks),
                               seeder.upload_slots,
                               seeder.active_uploads);
        if (connected_.contains(seeder.device)) {
            scheduler_.set_connected(seeder.device, true);
        }
    }

    for (const auto& peer : scheduler_.peers()) {
        if (!listed.contains(peer)) {
            scheduler_.remove_peer(peer);
            connect_attempts_.erase(peer);
        }
    }
    advance(now);
}

void SwarmSession::on_peer_connected(const DeviceKey& peer, Clock::time_point now) {
    if (is_terminal(phase_) || phase_ == SessionPhase::Paused) {
        return;
    }
    connected_.insert(peer);
    connect_attempts_.erase(peer);
    scheduler_.set_connected(peer, true);
    advance(now);
}

void SwarmSession::on_peer_lost(const DeviceKey& peer, Clock::time_point now) {
    if (is_terminal(phase_)) {
        return;
    }
    // The attempt time is kept so that a failed negotiation is not retried before the connect timeout.
    connected_.erase(peer);
    const auto released = scheduler_.set_connected(peer, false);
    if (!released.empty()) {
        log_event(StructuredLogger::Level::Info,
                  "session.peer_lost",
                  {{"file_id", params_.file_id},
                   {"peer", device_key_to_string(peer)},
                   {"released", std::to_string(released.size())}});
    }
    advance(now);
}

void SwarmSession::on_chunk(const DeviceKey& from, crypto::EncryptedChunk chunk, Clock::time_point now) {
    if (phase_ != SessionPhase::Downloading && phase_ != SessionPhase::Draining) {
        log_event(StructuredLogger::Level::Warning,
                  "session.late_chunk",
                  {{"file_id", params_.file_id},
                   {"index", std::to_string(chunk.chunk_index)},
                   {"phase", std::string(session_phase_name(phase_))}});
        return;
    }
    if (chunk.file_id != params_.file_id || chunk.chunk_index >= params_.chunk_count) {
        return;
    }

    const auto index = chunk.chunk_index;
    // A duplicate write is a no-op in the store and the bitmap alike; progress moves once per index.
    store_.put(std::move(chunk));
    suppliers_.insert_or_assign(index, from);
    scheduler_.on_success(from, index, now);
    if (held_.set(index)) {
        port_.on_chunk_stored(params_.file_id, index);
    }
    advance(now);
}

void SwarmSession::on_chunk_failed(const DeviceKey& from, ChunkIndex index, ErrorCode reason, Clock::time_point now) {
    if (is_terminal(phase_)) {
        return;
    }
    if (scheduler_.on_failure(from, index, now)) {
        log_event(StructuredLogger::Level::Info,
                  "session.chunk_rejected",
                  {{"file_id", params_.file_id},
                   {"index", std::to_string(index)},
                   {"peer", device_key_to_string(from)},
                   {"reason", std::string(error_code_name(reason))}});
    }
    advance(now);
}

void SwarmSession::tick(Clock::time_point now) {
    if (phase_ == SessionPhase::Downloading) {
        for (const auto& expired : scheduler_.expire(now)) {
            log_event(StructuredLogger::Level::Info,
                      "session.request_timeout",
                      {{"file_id", params_.file_id},
                       {"index", std::to_string(expired.index)},
                       {"peer", device_key_to_string(expired.peer)}});
        }
        if (now - last_round_ >= config_.scheduling_round_interval) {
            scheduler_.end_round();
            last_round_ = now;
        }
    }
    advance(now);
}

void SwarmSession::cancel(Clock::time_point) {
    if (is_terminal(phase_)) {
        return;
    }
    finish(SessionPhase::Failed, make_error(ErrorCode::Cancelled, "cancelled"));
}

bool SwarmSession::pause(Clock::time_point) {
    if (phase_ != SessionPhase::Downloading && phase_ != SessionPhase::Draining) {
        return false;
    }
    port_.close_connections(params_.file_id);
    std::size_t released = 0;
    for (const auto& peer : connected_) {
        released += scheduler_.set_connected(peer, false).size();
    }
    connected_.clear();
    connect_attempts_.clear();
    unavailable_since_.reset();
    log_event(StructuredLogger::Level::Info,
              "session.paused",
              {{"file_id", params_.file_id}, {"released", std::to_string(released)}});
    set_phase(SessionPhase::Paused);
    return true;
}

bool SwarmSession::resume(Clock::time_point now) {
    if (phase_ != SessionPhase::Paused) {
        return false;
    }
    last_round_ = now;
    set_phase(SessionPhase::Downloading);
    advance(now);
    return true;
}

void SwarmSession::advance(Clock::time_point now) {
    if (phase_ == SessionPhase::Downloading) {
        if (!ready_to_drain()) {
            connect_holders(now);
            dispatch(now);
        }
        if (ready_to_drain()) {
            drain_started_ = now;
            set_phase(SessionPhase::Draining);
        } else {
            check_availability(now);
            return;
        }
    }

    if (phase_ != SessionPhase::Draining) {
        return;
    }

    if (scheduler_.in_flight_count() == 0) {
        if (!held_.complete()) {
            // Requests were rejected or released while draining; the gap is still fetchable.
            set_phase(SessionPhase::Downloading);
            advance(now);
            return;
        }
        set_phase(SessionPhase::Assembling);
        begin_assembly();
        return;
    }

    if (now - drain_started_ >= config_.drain_timeout) {
        log_event(StructuredLogger::Level::Warning,
                  "session.drain_timeout",
                  {{"file_id", params_.file_id},
                   {"in_flight", std::to_string(scheduler_.in_flight_count())},
                   {"missing", std::to_string(params_.chunk_count - held_.count())}});
        set_phase(SessionPhase::Assembling);
        if (!held_.complete()) {
            finish(SessionPhase::Failed,
                   make_error(ErrorCode::DrainTimeout,
                              std::to_string(params_.chunk_count - held_.count()) + " chunks missing after drain"));
            return;
        }
        begin_assembly();
    }
}

void SwarmSession::dispatch(Clock::time_point now) {
    for (const auto& request : scheduler_.next_requests(held_, now)) {
        const auto status = port_.request_chunk(request.peer, params_.file_id, request.index);
        if (!status.ok()) {
            log_event(StructuredLogger::Level::Info,
                      "session.request_failed",
                      {{"file_id", params_.file_id},
                       {"index", std::to_string(request.index)},
                       {"peer", device_key_to_string(request.peer)},
                       {"error", status.message}});
            scheduler_.on_failure(request.peer, request.index, now);
        }
    }
}

void SwarmSession::connect_holders(Clock::time_point now) {
    for (const auto& peer : scheduler_.unconnected_holders(held_)) {
        const auto it = connect_attempts_.find(peer);
        if (it != connect_attempts_.end() && now - it->second < config_.transport_connect_timeout) {
            continue;
        }
        connect_attempts_[peer] = now;
        port_.connect_peer(peer, params_.file_id);
    }
}

bool SwarmSession::ready_to_drain() const {
    if (held_.complete()) {
        return true;
    }
    const auto missing = held_.missing();
    if (scheduler_.in_flight_count() == 0) {
        return false;
    }
    return std::all_of(missing.begin(), missing.end(), [this](ChunkIndex index) {
        return scheduler_.in_flight(index);
    });
}

void SwarmSession::check_availability(Clock::time_point now) {
    if (scheduler_.in_flight_count() > 0) {
        unavailable_since_.reset();
        return;
    }
    const auto missing = held_.missing();
    const bool obtainable = std::any_of(missing.begin(), missing.end(), [this](ChunkIndex index) {
        return scheduler_.has_holder(index);
    });
    if (obtainable) {
        unavailable_since_.reset();
        return;
    }
    if (!unavailable_since_) {
        unavailable_since_ = now;
        return;
    }
    if (now - *unavailable_since_ >= config_.request_timeout) {
        finish(SessionPhase::Failed,
               make_error(ErrorCode::Unavailable,
                          std::to_string(missing.size()) + " chunks have no holder"));
    }
}

void SwarmSession::set_phase(SessionPhase next) {
    if (next == phase_) {
        return;
    }
    log_event(StructuredLogger::Level::Info,
              "session.phase",
              {{"file_id", params_.file_id},
               {"from", std::string(session_phase_name(phase_))},
               {"to", std::string(session_phase_name(next))},
               {"held", std::to_string(held_.count())}});
    phase_ = next;
    if (listener_ && !is_terminal(next)) {
        listener_(phase_, outcome_);
    }
}

void SwarmSession::finish(SessionPhase terminal, Status status) {
    outcome_ = std::move(status);
    set_phase(terminal);
    // Partial chunks stay in the store so a later attempt can resume from them.
    port_.close_connections(params_.file_id);
    scheduler_.clear();
    connected_.clear();
    connect_attempts_.clear();
    suppliers_.clear();
    unavailable_since_.reset();
    if (listener_) {
        listener_(phase_, outcome_);
    }
}

void SwarmSession::begin_assembly() {
    auto self = shared_from_this();
    const auto part = part_path_for(params_.output_path);
    port_.offload([self, part, params = params_, &store = store_]() -> std::function<void()> {
        std::vector<ChunkIndex> corrupt;
        auto status = assemble(params, store, part, corrupt);
        return [self, status = std::move(status), part, corrupt = std::move(corrupt)]() {
            self->on_assembled(status, part, corrupt);
        };
    });
}

void SwarmSession::on_assembled(Status status,
                                const std::filesystem::path& part,
                                const std::vector<ChunkIndex>& corrupt) {
    if (phase_ != SessionPhase::Assembling) {
        discard(part);
        return;
    }
    if (!status.ok()) {
        discard(part);
        if (status.code != ErrorCode::IntegrityFailure) {
            finish(SessionPhase::Failed, std::move(status));
            return;
        }
        log_event(StructuredLogger::Level::Error,
                  "session.integrity_failure",
                  {{"file_id", params_.file_id}, {"stage", "assembly"}, {"detail", status.message}});
        // A size mismatch with every chunk authenticating leaves no single chunk to blame.
        recover(corrupt.empty() ? held_.indices() : corrupt, !corrupt.empty(), std::move(status));
        return;
    }

    set_phase(SessionPhase::Verifying);
    auto self = shared_from_this();
    port_.offload([self, part, sender = params_.sender_checksum, coordinator = params_.coordinator_checksum]()
                      -> std::function<void()> {
        const auto computed = integrity::IntegrityVerifier::file_checksum(part);
        auto status = computed ? integrity::IntegrityVerifier::verify_assembled(*computed, sender, coordinator)
                               : make_error(ErrorCode::IntegrityFailure, "assembled file unreadable");
        return [self, status = std::move(status), part]() { self->on_verified(status, part); };
    });
}

void SwarmSession::on_verified(Status status, const std::filesystem::path& part) {
    if (phase_ != SessionPhase::Verifying) {
        discard(part);
        return;
    }
    if (!status.ok()) {
        discard(part);
        log_event(StructuredLogger::Level::Error,
                  "session.integrity_failure",
                  {{"file_id", params_.file_id}, {"stage", "verify"}, {"detail", status.message}});
        // Each chunk matched its own hash, so any of them may carry the wrong bytes.
        recover(held_.indices(), false, std::move(status));
        return;
    }

    std::error_code ec;
    std::filesystem::rename(part, params_.output_path, ec);
    if (ec) {
        discard(part);
        finish(SessionPhase::Failed, make_error(ErrorCode::Unavailable, "cannot move output: " + ec.message()));
        return;
    }
    finish(SessionPhase::Complete, make_ok());
}

void SwarmSession::recover(const std::vector<ChunkIndex>& suspect, bool identified, Status status) {
    for (const auto index : suspect) {
        store_.erase(params_.file_id, index);
        held_.reset(index);
        if (const auto supplier = suppliers_.find(index); supplier != suppliers_.end()) {
            if (identified) {
                scheduler_.on_corrupt(supplier->second, index);
            }
            suppliers_.erase(supplier);
        }
    }
    port_.on_chunks_discarded(params_.file_id, suspect);

    // Re-fetching cannot help when the two expected checksums already disagree.
    const bool refetch = integrity_attempts_ < config_.integrity_recovery_attempts &&
                         integrity::IntegrityVerifier::checksums_equal(params_.sender_checksum,
                                                                       params_.coordinator_checksum);
    log_event(StructuredLogger::Level::Warning,
              "session.chunks_discarded",
              {{"file_id", params_.file_id},
               {"count", std::to_string(suspect.size())},
               {"attempt", std::to_string(integrity_attempts_)},
               {"refetch", refetch ? "true" : "false"}});
    if (!refetch) {
        finish(SessionPhase::Failed, std::move(status));
        return;
    }
    integrity_attempts_ += 1;
    set_phase(SessionPhase::Downloading);
    advance(Clock::now());
}

}  // namespace swarmshare
