#include "swarmshare/core/TransferService.hpp"

#include "swarmshare/core/ChunkBitmap.hpp"
#include "swarmshare/crypto/Sha256.hpp"
#include "swarmshare/integrity/IntegrityVerifier.hpp"
#include "swarmshare/logging/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <deque>
#include <exception>
#include <fstream>
#include <system_error>
#include <utility>
#include <variant>

namespace swarmshare {

using logging::StructuredLogger;
using logging::log_event;

namespace {

constexpr auto kChunkReportInterval = std::chrono::seconds(1);

std::filesystem::path metadata_path_for(const Config& config) {
    if (!config.storage_persistent_enabled) {
        return {};
    }
    return std::filesystem::path(config.storage_directory) / "metadata.tsv";
}

transport::TransportConfig transport_config_for(const Config& config) {
    transport::TransportConfig transport{};
    transport.listen_host = config.transport_host;
    transport.listen_port = config.transport_port;
    transport.connect_timeout = config.transport_connect_timeout;
    return transport;
}

FileId generate_file_id() {
    std::array<std::uint8_t, 16> bytes{};
    crypto::EncryptionService::random_bytes(bytes);
    return to_hex(bytes);
}

std::vector<ChunkIndex> advertised_chunks(const std::vector<SeederInfo>& seeders, std::uint32_t chunk_count) {
    ChunkBitmap available(chunk_count);
    for (const auto& seeder : seeders) {
        available.merge(ChunkBitmap::from_indices(chunk_count, seeder.chunks));
    }
    return available.indices();
}

std::vector<ChunkIndex> all_indices(std::uint32_t chunk_count) {
    return ChunkBitmap::full(chunk_count).indices();
}

}  // namespace

// Binds one SwarmSession to the service. Everything the session does runs on this object's strand.
class TransferService::Download final : public SessionPort, public std::enable_shared_from_this<TransferService::Download> {
public:
    Download(TransferService& service, storage::LocalFileEntry entry, SessionParams params)
        : service_(service),
          entry_(std::move(entry)),
          key_(params.key),
          chunk_count_(params.chunk_count),
          strand_(std::make_shared<Strand>(service.pool_)),
          session_(std::make_shared<SwarmSession>(std::move(params), service.store_, *this, service.config_)) {}

    void post(std::function<void(SwarmSession&)> action) {
        auto self = shared_from_this();
        strand_->post([self, action = std::move(action)]() { action(*self->session_); });
    }

    SwarmSession& session() noexcept { return *session_; }
    const storage::LocalFileEntry& entry() const noexcept { return entry_; }
    const crypto::FileKey& key() const noexcept { return key_; }

    void record(SessionPhase phase, const Status& status) {
        std::scoped_lock lock(snapshot_mutex_);
        phase_ = phase;
        outcome_ = status;
    }

    DownloadProgress snapshot() const {
        std::scoped_lock lock(snapshot_mutex_);
        return DownloadProgress{phase_, held_, chunk_count_, outcome_};
    }

    bool finished() const {
        std::scoped_lock lock(snapshot_mutex_);
        return is_terminal(phase_);
    }

    void set_held(std::uint32_t held) {
        std::scoped_lock lock(snapshot_mutex_);
        held_ = held;
    }

    Status request_chunk(const DeviceKey& peer, const FileId& file_id, ChunkIndex index) override {
        return service_.transport_.send(transport::ChannelKey{peer, file_id}, protocol::ChunkRequest{file_id, index});
    }

    void connect_peer(const DeviceKey& peer, const FileId& file_id) override {
        const transport::ChannelKey key{peer, file_id};
        if (service_.transport_.is_connected(key)) {
            post([peer](SwarmSession& session) { session.on_peer_connected(peer, SwarmSession::Clock::now()); });
            return;
        }
        const auto status = service_.transport_.connect(key);
        if (!status.ok()) {
            log_event(StructuredLogger::Level::Warning,
                      "transfer.connect_failed",
                      {{"peer", device_key_to_string(peer)}, {"file_id", file_id}, {"error", status.message}});
        }
    }

    void close_connections(const FileId& file_id) override {
        service_.transport_.close_file(file_id);
    }

    void on_chunk_stored(const FileId& file_id, ChunkIndex) override {
        set_held(session_->held().count());
        std::scoped_lock lock(service_.state_mutex_);
        service_.dirty_reports_.insert(file_id);
    }

    void on_chunks_discarded(const FileId& file_id, const std::vector<ChunkIndex>& indices) override {
        set_held(session_->held().count());
        log_event(StructuredLogger::Level::Warning,
                  "transfer.chunks_withdrawn",
                  {{"file_id", file_id}, {"count", std::to_string(indices.size())}});
        std::scoped_lock lock(service_.state_mutex_);
        service_.dirty_reports_.insert(file_id);
    }

    void offload(BackgroundJob job) override {
        auto self = shared_from_this();
        const bool accepted = service_.pool_.post([self, job = std::move(job)]() {
            auto continuation = job();
            self->strand_->post([self, continuation = std::move(continuation)]() {
                if (continuation) {
                    continuation();
                }
            });
        });
        if (!accepted) {
            log_event(StructuredLogger::Level::Warning, "transfer.offload_rejected", {{"file_id", entry_.file_id}});
        }
    }

private:
    TransferService& service_;
    storage::LocalFileEntry entry_;
    crypto::FileKey key_;
    std::uint32_t chunk_count_;
    std::shared_ptr<Strand> strand_;
    std::shared_ptr<SwarmSession> session_;

    mutable std::mutex snapshot_mutex_;
    SessionPhase phase_{SessionPhase::Downloading};
    std::uint32_t held_{0};
    Status outcome_;
};

TransferService::TransferService(network::CoordinatorLink& link, Config config)
    : config_(std::move(config)),
      link_(link),
      store_(config_),
      metadata_(metadata_path_for(config_)),
      pool_(config_.worker_threads),
      transport_(link, transport_config_for(config_)) {}

TransferService::~TransferService() {
    stop();
}

bool TransferService::start() {
    if (running_.load()) {
        return true;
    }
    if (!metadata_.load()) {
        log_event(StructuredLogger::Level::Warning, "transfer.metadata_unreadable");
    }

    transport_.set_message_handler([this](const transport::ChannelKey& channel, protocol::PeerMessage message) {
        handle_message(channel, std::move(message));
    });
    transport_.set_connection_handler([this](const transport::ChannelKey& channel, bool connected) {
        handle_connection(channel, connected);
    });
    transport_.set_admission_hook([this](const DeviceKey& peer, const FileId& file_id) { return admit(peer, file_id); });
    if (!transport_.start()) {
        return false;
    }

    for (const auto& entry : metadata_.list()) {
        if (store_.persistent()) {
            store_.load_persisted(entry.file_id);
        }
        refresh_access(entry.file_id, entry.shared_with);
    }

    link_.set_push_handler([this](const PushNotification& push) {
        pool_.post([this, push]() { handle_push(push); });
    });
    link_.set_relay_handler([this](const RelayEnvelope& envelope) { transport_.handle_signal(envelope); });

    running_.store(true);
    tick_thread_ = std::thread(&TransferService::tick_loop, this);
    log_event(StructuredLogger::Level::Info,
              "transfer.started",
              {{"device", device_key_to_string(link_.self())},
               {"transport_port", std::to_string(transport_.listening_port())}});
    return true;
}

void TransferService::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    link_.set_push_handler(nullptr);
    link_.set_relay_handler(nullptr);
    tick_cv_.notify_all();
    if (tick_thread_.joinable()) {
        tick_thread_.join();
    }
    transport_.stop();
    pool_.shutdown();
    log_event(StructuredLogger::Level::Info, "transfer.stopped", {{"device", device_key_to_string(link_.self())}});
}

void TransferService::set_event_handler(EventHandler handler) {
    std::scoped_lock lock(handler_mutex_);
    event_handler_ = std::move(handler);
}

Result<FileNotification> TransferService::share_file(const std::filesystem::path& path,
                                                     const std::vector<PrincipalId>& recipients,
                                                     std::string file_name,
                                                     std::string mime_type) {
    if (!running_.load()) {
        return make_failure<FileNotification>(ErrorCode::Unavailable, "service not running");
    }

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_failure<FileNotification>(ErrorCode::FileNotFound, "cannot stat " + path.string());
    }
    if (file_size == 0 || file_size > config_.max_file_size_bytes) {
        return make_failure<FileNotification>(ErrorCode::InvalidArgument, "file size out of range");
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return make_failure<FileNotification>(ErrorCode::FileNotFound, "cannot open " + path.string());
    }

    const auto file_id = generate_file_id();
    const auto key = crypto::EncryptionService::generate_key();
    const auto chunk_count = chunk_count_for(file_size, config_.chunk_size_bytes);
    if (file_name.empty()) {
        file_name = path.filename().string();
    }

    std::vector<PrincipalId> shared_with{link_.self().principal};
    for (const auto& recipient : recipients) {
        if (std::find(shared_with.begin(), shared_with.end(), recipient) == shared_with.end()) {
            shared_with.push_back(recipient);
        }
    }

    storage::LocalFileEntry entry;
    entry.file_id = file_id;
    entry.status = storage::LocalFileStatus::Uploading;
    entry.chunk_count = chunk_count;
    entry.file_size = file_size;
    entry.shared_with = shared_with;
    entry.file_key = crypto::file_key_to_string(key);
    entry.file_name = file_name;
    entry.mime_type = mime_type;
    entry.output_path = path.string();
    entry.sender_id = link_.self().principal;
    metadata_.upsert(entry);

    struct Progress {
        std::mutex mutex;
        std::condition_variable cv;
        std::size_t remaining{0};
        bool failed{false};
    };
    auto progress = std::make_shared<Progress>();
    progress->remaining = chunk_count;

    crypto::Sha256 hasher;
    for (ChunkIndex index = 0; index < chunk_count; ++index) {
        const auto offset = static_cast<std::uint64_t>(index) * config_.chunk_size_bytes;
        const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(config_.chunk_size_bytes, file_size - offset));
        ChunkData plaintext(length);
        input.read(reinterpret_cast<char*>(plaintext.data()), static_cast<std::streamsize>(length));
        if (!input) {
            std::scoped_lock lock(progress->mutex);
            progress->failed = true;
            progress->remaining -= chunk_count - index;
            break;
        }
        hasher.update(plaintext);

        const bool posted = pool_.post([this, progress, file_id, key, index, plaintext = std::move(plaintext)]() {
            bool ok = true;
            try {
                store_.put(crypto::EncryptionService::encrypt_chunk(key, file_id, index, plaintext));
            } catch (const std::exception& ex) {
                log_event(StructuredLogger::Level::Error,
                          "transfer.encrypt_failed",
                          {{"file_id", file_id}, {"index", std::to_string(index)}, {"error", ex.what()}});
                ok = false;
            }
            {
                std::scoped_lock lock(progress->mutex);
                progress->failed = progress->failed || !ok;
                progress->remaining -= 1;
            }
            progress->cv.notify_all();
        });
        if (!posted) {
            std::scoped_lock lock(progress->mutex);
            progress->failed = true;
            progress->remaining -= chunk_count - index;
            break;
        }
    }

    bool failed = false;
    {
        std::unique_lock lock(progress->mutex);
        progress->cv.wait(lock, [&progress]() { return progress->remaining == 0; });
        failed = progress->failed;
    }
    if (failed || store_.chunk_count(file_id) != chunk_count) {
        store_.remove_file(file_id);
        metadata_.remove(file_id);
        return make_failure<FileNotification>(ErrorCode::Unavailable, "failed to chunk " + path.string());
    }

    const auto digest = hasher.finalize();
    const auto checksum = to_hex(digest);

    AnnounceRequest request;
    request.file_id = file_id;
    request.file_size = file_size;
    request.checksum = checksum;
    request.chunk_count = chunk_count;
    request.available_chunks = all_indices(chunk_count);
    request.shared_with = shared_with;
    request.upload_slots = config_.seeder_upload_slots;

    const auto announced = link_.announce(request);
    if (!announced.ok()) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.announce_failed",
                  {{"file_id", file_id}, {"code", std::string(error_code_name(announced.status.code))}});
        store_.remove_file(file_id);
        metadata_.remove(file_id);
        return make_failure<FileNotification>(announced.status);
    }

    entry.status = storage::LocalFileStatus::Seeding;
    entry.checksum = checksum;
    entry.shared_with = announced.value->shared_with;
    metadata_.upsert(entry);
    refresh_access(file_id, entry.shared_with);

    FileNotification notification;
    notification.file_id = file_id;
    notification.file_name = file_name;
    notification.mime_type = std::move(mime_type);
    notification.file_size = file_size;
    notification.chunk_count = chunk_count;
    notification.checksum = checksum;
    notification.file_key = key;
    notification.sender_id = link_.self().principal;
    notification.timestamp = std::chrono::system_clock::now();

    log_event(StructuredLogger::Level::Info,
              "transfer.shared",
              {{"file_id", file_id},
               {"chunks", std::to_string(chunk_count)},
               {"recipients", std::to_string(recipients.size())}});
    return make_result(std::move(notification));
}

Status TransferService::start_download(const FileNotification& notification, const std::filesystem::path& output_path) {
    if (!running_.load()) {
        return make_error(ErrorCode::Unavailable, "service not running");
    }
    if (const auto existing = find_download(notification.file_id); existing && !existing->finished()) {
        return make_error(ErrorCode::AlreadyActive, "download already running");
    }

    const auto info = link_.get_info(notification.file_id);
    if (!info.ok()) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.info_failed",
                  {{"file_id", notification.file_id}, {"code", std::string(error_code_name(info.status.code))}});
        return info.status;
    }

    const auto trust = integrity::IntegrityVerifier::check_trust(notification.checksum, info.value->checksum);
    if (!trust.ok()) {
        log_event(StructuredLogger::Level::Warning, "transfer.checksum_mismatch", {{"file_id", notification.file_id}});
        return trust;
    }
    if (notification.chunk_count != info.value->chunk_count || notification.file_size != info.value->file_size) {
        return make_error(ErrorCode::ChecksumMismatch, "notification disagrees with the coordinator record");
    }

    if (store_.persistent()) {
        store_.load_persisted(notification.file_id);
    }

    storage::LocalFileEntry entry;
    entry.file_id = notification.file_id;
    entry.status = storage::LocalFileStatus::Downloading;
    entry.checksum = notification.checksum;
    entry.chunk_count = notification.chunk_count;
    entry.file_size = notification.file_size;
    entry.shared_with = info.value->shared_with;
    entry.file_key = crypto::file_key_to_string(notification.file_key);
    entry.file_name = notification.file_name;
    entry.mime_type = notification.mime_type;
    entry.output_path = output_path.string();
    entry.sender_id = notification.sender_id;
    metadata_.upsert(entry);

    const auto registered = link_.register_leecher(notification.file_id, store_.indices(notification.file_id));
    if (!registered.ok()) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.register_leecher_failed",
                  {{"file_id", notification.file_id}, {"code", std::string(error_code_name(registered.code))}});
        if (error_category(registered.code) == ErrorCategory::AccessControl) {
            return registered;
        }
    }
    return launch(entry, *info.value);
}

Status TransferService::cancel_download(const FileId& file_id) {
    const auto download = find_download(file_id);
    if (!download || download->finished()) {
        return make_error(ErrorCode::FileNotFound, "no active download");
    }
    {
        std::scoped_lock lock(state_mutex_);
        std::erase(queue_, file_id);
    }
    download->post([](SwarmSession& session) { session.cancel(SwarmSession::Clock::now()); });
    return make_ok();
}

Status TransferService::pause_download(const FileId& file_id) {
    const auto download = find_download(file_id);
    if (!download || download->finished()) {
        return make_error(ErrorCode::FileNotFound, "no active download");
    }
    DownloadSlot previous = DownloadSlot::Running;
    {
        std::scoped_lock lock(state_mutex_);
        auto& slot = slots_[file_id];
        if (slot == DownloadSlot::Paused) {
            return make_error(ErrorCode::InvalidArgument, "download already paused");
        }
        previous = slot;
        slot = DownloadSlot::Paused;
        std::erase(queue_, file_id);
    }
    metadata_.set_status(file_id, storage::LocalFileStatus::Paused);

    if (previous == DownloadSlot::Queued) {
        download->record(SessionPhase::Paused, make_ok());
    } else {
        download->post([this, file_id](SwarmSession& session) {
            if (session.pause(SwarmSession::Clock::now()) || is_terminal(session.phase())) {
                return;
            }
            // Assembly is under way; the download keeps its slot and finishes.
            {
                std::scoped_lock lock(state_mutex_);
                if (const auto slot = slots_.find(file_id); slot != slots_.end() && slot->second == DownloadSlot::Paused) {
                    slot->second = DownloadSlot::Running;
                }
            }
            metadata_.set_status(file_id, storage::LocalFileStatus::Downloading);
            log_event(StructuredLogger::Level::Info, "transfer.pause_ignored", {{"file_id", file_id}});
        });
    }
    log_event(StructuredLogger::Level::Info, "transfer.paused", {{"file_id", file_id}});
    start_next_queued();
    return make_ok();
}

Status TransferService::resume_download(const FileId& file_id) {
    const auto download = find_download(file_id);
    if (!download || download->finished()) {
        // After a restart only the metadata remembers the pause.
        const auto entry = metadata_.get(file_id);
        if (!entry || entry->status != storage::LocalFileStatus::Paused) {
            return make_error(ErrorCode::FileNotFound, "no paused download");
        }
        const auto info = link_.get_info(file_id);
        if (!info.ok()) {
            return info.status;
        }
        const auto registered = link_.register_leecher(file_id, store_.indices(file_id));
        if (!registered.ok() && error_category(registered.code) == ErrorCategory::AccessControl) {
            return registered;
        }
        return launch(*entry, *info.value);
    }

    bool queued = false;
    {
        std::scoped_lock lock(state_mutex_);
        const auto slot = slots_.find(file_id);
        if (slot == slots_.end() || slot->second != DownloadSlot::Paused) {
            return make_error(ErrorCode::InvalidArgument, "download not paused");
        }
        queued = running_count() >= config_.max_concurrent_downloads;
        slot->second = queued ? DownloadSlot::Queued : DownloadSlot::Running;
        if (queued) {
            queue_.push_back(file_id);
        }
    }
    metadata_.set_status(file_id, storage::LocalFileStatus::Downloading);
    log_event(StructuredLogger::Level::Info,
              "transfer.resumed",
              {{"file_id", file_id}, {"queued", queued ? "true" : "false"}});
    if (queued) {
        download->record(SessionPhase::Downloading, make_ok());
    } else {
        begin(download, current_seeders(file_id));
    }
    return make_ok();
}

Result<std::vector<PrincipalId>> TransferService::share_add(const FileId& file_id, const std::vector<PrincipalId>& targets) {
    auto result = link_.share_update(file_id, ShareAction::Add, targets);
    if (result.ok()) {
        refresh_access(file_id, *result.value);
        metadata_.update_shared_with(file_id, *result.value);
    }
    return result;
}

Result<std::vector<PrincipalId>> TransferService::revoke(const FileId& file_id, const std::vector<PrincipalId>& targets) {
    auto result = link_.share_update(file_id, ShareAction::Revoke, targets);
    if (!result.ok()) {
        return result;
    }
    const auto& self = link_.self().principal;
    if (std::find(targets.begin(), targets.end(), self) != targets.end()) {
        drop_file(file_id);
        return result;
    }
    refresh_access(file_id, *result.value);
    metadata_.update_shared_with(file_id, *result.value);
    return result;
}

Status TransferService::remove_file(const FileId& file_id) {
    const auto status = link_.unannounce(file_id);
    if (!status.ok()) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.unannounce_failed",
                  {{"file_id", file_id}, {"code", std::string(error_code_name(status.code))}});
    }
    drop_file(file_id);
    return status;
}

Status TransferService::reconnect() {
    if (!link_.connected()) {
        return make_error(ErrorCode::Unavailable, "coordinator link down");
    }
    Status first_failure;
    for (const auto& entry : metadata_.list()) {
        switch (entry.status) {
            case storage::LocalFileStatus::Uploading:
            case storage::LocalFileStatus::Seeding:
            case storage::LocalFileStatus::Complete: {
                const auto status = reannounce(entry);
                if (!status.ok() && first_failure.ok()) {
                    first_failure = status;
                }
                break;
            }
            case storage::LocalFileStatus::Downloading:
            case storage::LocalFileStatus::Partial:
                maybe_resume(entry.file_id, std::nullopt);
                break;
            case storage::LocalFileStatus::Paused:
                break;
        }
    }
    return first_failure;
}

std::optional<DownloadProgress> TransferService::progress(const FileId& file_id) const {
    std::shared_ptr<Download> download;
    bool queued = false;
    {
        std::scoped_lock lock(state_mutex_);
        const auto it = downloads_.find(file_id);
        if (it == downloads_.end()) {
            return std::nullopt;
        }
        download = it->second;
        const auto slot = slots_.find(file_id);
        queued = slot != slots_.end() && slot->second == DownloadSlot::Queued;
    }
    auto snapshot = download->snapshot();
    snapshot.queued = queued && !is_terminal(snapshot.phase);
    return snapshot;
}

void TransferService::handle_push(const PushNotification& push) {
    switch (push.kind) {
        case PushKind::FileAvailable:
            emit(TransferEvent{TransferEventKind::FileAvailable, push.file_id, make_ok(), {}});
            return;
        case PushKind::AccessRevoked:
            log_event(StructuredLogger::Level::Info, "transfer.access_revoked", {{"file_id", push.file_id}});
            drop_file(push.file_id);
            emit(TransferEvent{TransferEventKind::AccessRevoked,
                               push.file_id,
                               make_error(ErrorCode::AccessDenied, "access revoked"),
                               {}});
            return;
        case PushKind::UploaderOnline:
            maybe_resume(push.file_id,
                         push.available_chunks.empty() ? std::nullopt
                                                       : std::optional<std::vector<ChunkIndex>>(push.available_chunks));
            return;
        case PushKind::SeedersUpdate:
            break;
    }

    const auto download = find_download(push.file_id);
    if (!download && !metadata_.get(push.file_id)) {
        return;
    }
    const auto info = link_.get_info(push.file_id);
    if (!info.ok()) {
        return;
    }
    refresh_access(push.file_id, info.value->shared_with);
    metadata_.update_shared_with(push.file_id, info.value->shared_with);

    if (download && !download->finished()) {
        // Queued and paused sessions fetch a fresh list when they start again.
        bool running = false;
        {
            std::scoped_lock lock(state_mutex_);
            const auto slot = slots_.find(push.file_id);
            running = slot != slots_.end() && slot->second == DownloadSlot::Running;
        }
        if (running) {
            auto seeders = remote_seeders(info.value->seeders);
            download->post([seeders = std::move(seeders)](SwarmSession& session) {
                session.update_seeders(seeders, SwarmSession::Clock::now());
            });
        }
        return;
    }
    maybe_resume(push.file_id, advertised_chunks(remote_seeders(info.value->seeders), info.value->chunk_count));
}

void TransferService::handle_message(const transport::ChannelKey& channel, protocol::PeerMessage message) {
    if (const auto* request = std::get_if<protocol::ChunkRequest>(&message)) {
        pool_.post([this, channel, request = *request]() { serve_request(channel, request); });
        return;
    }
    if (auto* response = std::get_if<protocol::ChunkResponse>(&message)) {
        pool_.post([this, channel, chunk = std::move(response->chunk)]() { accept_response(channel, chunk); });
        return;
    }
    if (const auto* reject = std::get_if<protocol::ChunkReject>(&message)) {
        const auto download = find_download(channel.file_id);
        if (!download || reject->file_id != channel.file_id) {
            return;
        }
        download->post([peer = channel.peer, index = reject->chunk_index, reason = reject->reason](SwarmSession& session) {
            session.on_chunk_failed(peer, index, reason, SwarmSession::Clock::now());
        });
    }
}

void TransferService::handle_connection(const transport::ChannelKey& channel, bool connected) {
    const auto download = find_download(channel.file_id);
    if (!download) {
        return;
    }
    download->post([peer = channel.peer, connected](SwarmSession& session) {
        const auto now = SwarmSession::Clock::now();
        if (connected) {
            session.on_peer_connected(peer, now);
        } else {
            session.on_peer_lost(peer, now);
        }
    });
}

bool TransferService::admit(const DeviceKey& peer, const FileId& file_id) const {
    return authorized(peer.principal, file_id);
}

void TransferService::serve_request(const transport::ChannelKey& channel, const protocol::ChunkRequest& request) {
    const auto reject = [this, &channel, &request](ErrorCode reason) {
        const auto status = transport_.send(channel, protocol::ChunkReject{request.file_id, request.chunk_index, reason});
        if (!status.ok()) {
            log_event(StructuredLogger::Level::Debug,
                      "transfer.reject_not_sent",
                      {{"peer", device_key_to_string(channel.peer)}, {"error", status.message}});
        }
    };

    if (request.file_id != channel.file_id) {
        reject(ErrorCode::InvalidArgument);
        return;
    }
    if (!authorized(channel.peer.principal, request.file_id)) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.request_denied",
                  {{"peer", device_key_to_string(channel.peer)}, {"file_id", request.file_id}});
        reject(ErrorCode::AccessDenied);
        transport_.close(channel);
        return;
    }
    if (active_uploads_.fetch_add(1) >= config_.seeder_upload_slots) {
        active_uploads_.fetch_sub(1);
        reject(ErrorCode::RateLimited);
        return;
    }

    auto chunk = store_.get(request.file_id, request.chunk_index);
    if (!chunk) {
        reject(ErrorCode::Unavailable);
    } else {
        const auto status = transport_.send(channel, protocol::ChunkResponse{std::move(*chunk)});
        if (!status.ok()) {
            log_event(StructuredLogger::Level::Info,
                      "transfer.upload_failed",
                      {{"peer", device_key_to_string(channel.peer)},
                       {"file_id", request.file_id},
                       {"index", std::to_string(request.chunk_index)},
                       {"error", status.message}});
        }
    }
    active_uploads_.fetch_sub(1);
}

void TransferService::accept_response(const transport::ChannelKey& channel, crypto::EncryptedChunk chunk) {
    const auto download = find_download(channel.file_id);
    if (!download || chunk.file_id != channel.file_id) {
        return;
    }
    const auto plaintext = crypto::EncryptionService::decrypt_chunk(download->key(), chunk);
    if (!plaintext || !integrity::IntegrityVerifier::verify_chunk(*plaintext, chunk.plaintext_hash)) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.chunk_invalid",
                  {{"peer", device_key_to_string(channel.peer)},
                   {"file_id", chunk.file_id},
                   {"index", std::to_string(chunk.chunk_index)}});
        download->post([peer = channel.peer, index = chunk.chunk_index](SwarmSession& session) {
            session.on_chunk_failed(peer, index, ErrorCode::IntegrityFailure, SwarmSession::Clock::now());
        });
        return;
    }
    download->post([peer = channel.peer, chunk = std::move(chunk)](SwarmSession& session) {
        session.on_chunk(peer, chunk, SwarmSession::Clock::now());
    });
}

Status TransferService::launch(const storage::LocalFileEntry& entry, const FileInfo& info) {
    const auto key = crypto::file_key_from_string(entry.file_key);
    if (!key) {
        return make_error(ErrorCode::InvalidArgument, "stored file key unreadable");
    }

    SessionParams params;
    params.file_id = entry.file_id;
    params.key = *key;
    params.file_size = info.file_size;
    params.chunk_count = info.chunk_count;
    params.chunk_size = info.chunk_size;
    params.sender_checksum = entry.checksum;
    params.coordinator_checksum = info.checksum;
    params.output_path = entry.output_path;

    auto download = std::make_shared<Download>(*this, entry, std::move(params));
    std::weak_ptr<Download> weak = download;
    download->session().set_listener([this, weak](SessionPhase phase, const Status& status) {
        const auto self = weak.lock();
        if (!self) {
            return;
        }
        self->record(phase, status);
        if (is_terminal(phase)) {
            on_session_finished(self, phase, status);
        }
    });

    bool queued = false;
    std::size_t position = 0;
    {
        std::scoped_lock lock(state_mutex_);
        if (const auto it = downloads_.find(entry.file_id); it != downloads_.end() && !it->second->finished()) {
            return make_error(ErrorCode::AlreadyActive, "download already running");
        }
        downloads_[entry.file_id] = download;
        queued = running_count() >= config_.max_concurrent_downloads;
        slots_[entry.file_id] = queued ? DownloadSlot::Queued : DownloadSlot::Running;
        if (queued) {
            queue_.push_back(entry.file_id);
            position = queue_.size();
        }
    }
    refresh_access(entry.file_id, info.shared_with);
    metadata_.set_status(entry.file_id, storage::LocalFileStatus::Downloading);

    if (queued) {
        log_event(StructuredLogger::Level::Info,
                  "transfer.download_queued",
                  {{"file_id", entry.file_id}, {"position", std::to_string(position)}});
        return make_ok();
    }
    begin(download, remote_seeders(info.seeders));
    log_event(StructuredLogger::Level::Info,
              "transfer.download_started",
              {{"file_id", entry.file_id}, {"seeders", std::to_string(info.seeders.size())}});
    return make_ok();
}

void TransferService::begin(const std::shared_ptr<Download>& download, std::vector<SeederInfo> seeders) {
    download->post([download, seeders = std::move(seeders)](SwarmSession& session) {
        const auto now = SwarmSession::Clock::now();
        if (session.phase() == SessionPhase::Paused) {
            session.update_seeders(seeders, now);
            session.resume(now);
            return;
        }
        // A download paused while queued never started; its snapshot still says paused.
        download->record(SessionPhase::Downloading, make_ok());
        session.start(now);
        download->set_held(session.held().count());
        session.update_seeders(seeders, now);
    });
}

std::vector<SeederInfo> TransferService::current_seeders(const FileId& file_id) {
    const auto info = link_.get_info(file_id);
    if (!info.ok()) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.info_failed",
                  {{"file_id", file_id}, {"code", std::string(error_code_name(info.status.code))}});
        return {};
    }
    refresh_access(file_id, info.value->shared_with);
    return remote_seeders(info.value->seeders);
}

void TransferService::start_next_queued() {
    while (running_.load()) {
        std::shared_ptr<Download> next;
        {
            std::scoped_lock lock(state_mutex_);
            if (running_count() >= config_.max_concurrent_downloads) {
                return;
            }
            while (!queue_.empty() && !next) {
                const auto file_id = queue_.front();
                queue_.pop_front();
                const auto download = downloads_.find(file_id);
                const auto slot = slots_.find(file_id);
                if (download == downloads_.end() || slot == slots_.end() || slot->second != DownloadSlot::Queued ||
                    download->second->finished()) {
                    continue;
                }
                slot->second = DownloadSlot::Running;
                next = download->second;
            }
        }
        if (!next) {
            return;
        }
        const auto& file_id = next->entry().file_id;
        log_event(StructuredLogger::Level::Info, "transfer.dequeued", {{"file_id", file_id}});
        begin(next, current_seeders(file_id));
    }
}

std::size_t TransferService::running_count() const {
    std::size_t count = 0;
    for (const auto& [file_id, slot] : slots_) {
        if (slot != DownloadSlot::Running) {
            continue;
        }
        if (const auto it = downloads_.find(file_id); it != downloads_.end() && !it->second->finished()) {
            ++count;
        }
    }
    return count;
}

Status TransferService::reannounce(const storage::LocalFileEntry& entry) {
    AnnounceRequest request;
    request.file_id = entry.file_id;
    request.file_size = entry.file_size;
    request.checksum = entry.checksum;
    request.chunk_count = entry.chunk_count;
    request.available_chunks = store_.indices(entry.file_id);
    request.shared_with = entry.shared_with;
    request.upload_slots = config_.seeder_upload_slots;
    if (request.available_chunks.empty()) {
        return make_ok();
    }

    const auto announced = link_.announce(request);
    if (!announced.ok()) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.reannounce_failed",
                  {{"file_id", entry.file_id}, {"code", std::string(error_code_name(announced.status.code))}});
        if (announced.status.code == ErrorCode::AccessDenied) {
            drop_file(entry.file_id);
        }
        return announced.status;
    }
    refresh_access(entry.file_id, announced.value->shared_with);
    metadata_.update_shared_with(entry.file_id, announced.value->shared_with);
    if (entry.status == storage::LocalFileStatus::Uploading) {
        metadata_.set_status(entry.file_id, storage::LocalFileStatus::Seeding);
    }
    log_event(StructuredLogger::Level::Info,
              "transfer.reannounced",
              {{"file_id", entry.file_id}, {"chunks", std::to_string(request.available_chunks.size())}});
    return make_ok();
}

void TransferService::maybe_resume(const FileId& file_id, const std::optional<std::vector<ChunkIndex>>& advertised) {
    if (const auto existing = find_download(file_id)) {
        if (!existing->finished()) {
            return;
        }
        const auto outcome = existing->snapshot().outcome;
        if (outcome.code == ErrorCode::Cancelled || !is_retryable(outcome.code)) {
            return;
        }
    }
    const auto entry = metadata_.get(file_id);
    if (!entry || (entry->status != storage::LocalFileStatus::Downloading &&
                   entry->status != storage::LocalFileStatus::Partial)) {
        return;
    }

    const auto info = link_.get_info(file_id);
    if (!info.ok()) {
        return;
    }
    const auto available = advertised ? *advertised
                                       : advertised_chunks(remote_seeders(info.value->seeders), info.value->chunk_count);
    const auto held = ChunkBitmap::from_indices(info.value->chunk_count, store_.indices(file_id));
    const auto offered = ChunkBitmap::from_indices(info.value->chunk_count, available);
    if (!held.has_chunks_missing_from(offered)) {
        log_event(StructuredLogger::Level::Debug, "transfer.resume_skipped", {{"file_id", file_id}});
        return;
    }

    log_event(StructuredLogger::Level::Info,
              "transfer.resume",
              {{"file_id", file_id}, {"held", std::to_string(held.count())}});
    const auto registered = link_.register_leecher(file_id, held.indices());
    if (!registered.ok()) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.register_leecher_failed",
                  {{"file_id", file_id}, {"code", std::string(error_code_name(registered.code))}});
    }
    const auto status = launch(*entry, *info.value);
    if (!status.ok()) {
        log_event(StructuredLogger::Level::Warning,
                  "transfer.resume_failed",
                  {{"file_id", file_id}, {"code", std::string(error_code_name(status.code))}});
    }
}

void TransferService::on_session_finished(const std::shared_ptr<Download>& download, SessionPhase phase, const Status& status) {
    const auto& entry = download->entry();
    const auto unregistered = link_.unregister_leecher(entry.file_id);
    if (!unregistered.ok()) {
        log_event(StructuredLogger::Level::Debug, "transfer.unregister_failed", {{"file_id", entry.file_id}});
    }

    if (phase == SessionPhase::Complete) {
        metadata_.set_status(entry.file_id, storage::LocalFileStatus::Complete);
        AnnounceRequest request;
        request.file_id = entry.file_id;
        request.file_size = entry.file_size;
        request.checksum = entry.checksum;
        request.chunk_count = entry.chunk_count;
        request.available_chunks = store_.indices(entry.file_id);
        request.upload_slots = config_.seeder_upload_slots;
        const auto announced = link_.announce(request);
        if (announced.ok()) {
            refresh_access(entry.file_id, announced.value->shared_with);
        } else {
            log_event(StructuredLogger::Level::Warning,
                      "transfer.seed_announce_failed",
                      {{"file_id", entry.file_id}, {"code", std::string(error_code_name(announced.status.code))}});
        }
        log_event(StructuredLogger::Level::Info,
                  "transfer.download_complete",
                  {{"file_id", entry.file_id}, {"output", entry.output_path}});
        emit(TransferEvent{TransferEventKind::DownloadComplete, entry.file_id, status, entry.output_path});
        start_next_queued();
        return;
    }

    metadata_.set_status(entry.file_id, storage::LocalFileStatus::Partial);
    log_event(StructuredLogger::Level::Warning,
              "transfer.download_failed",
              {{"file_id", entry.file_id},
               {"code", std::string(error_code_name(status.code))},
               {"user_message", std::string(user_message(status.code))}});
    emit(TransferEvent{TransferEventKind::DownloadFailed, entry.file_id, status, entry.output_path});
    start_next_queued();
}

void TransferService::drop_file(const FileId& file_id) {
    transport_.close_file(file_id);
    std::shared_ptr<Download> download;
    {
        std::scoped_lock lock(state_mutex_);
        if (const auto it = downloads_.find(file_id); it != downloads_.end()) {
            download = it->second;
            downloads_.erase(it);
        }
        access_.erase(file_id);
        dirty_reports_.erase(file_id);
        slots_.erase(file_id);
        std::erase(queue_, file_id);
    }
    if (download) {
        download->post([](SwarmSession& session) { session.cancel(SwarmSession::Clock::now()); });
    }
    metadata_.remove(file_id);
    store_.remove_file(file_id);
}

void TransferService::refresh_access(const FileId& file_id, const std::vector<PrincipalId>& shared_with) {
    std::set<PrincipalId> updated(shared_with.begin(), shared_with.end());
    std::vector<PrincipalId> removed;
    {
        std::scoped_lock lock(state_mutex_);
        auto& current = access_[file_id];
        for (const auto& principal : current) {
            if (!updated.contains(principal)) {
                removed.push_back(principal);
            }
        }
        current = std::move(updated);
    }
    // Revoked principals lose their channels at once, in-flight uploads included.
    for (const auto& principal : removed) {
        transport_.close_principal(file_id, principal);
    }
}

bool TransferService::authorized(const PrincipalId& principal, const FileId& file_id) const {
    std::scoped_lock lock(state_mutex_);
    const auto it = access_.find(file_id);
    return it != access_.end() && it->second.contains(principal);
}

std::vector<SeederInfo> TransferService::remote_seeders(const std::vector<SeederInfo>& seeders) const {
    std::vector<SeederInfo> remote;
    remote.reserve(seeders.size());
    for (const auto& seeder : seeders) {
        if (seeder.device != link_.self()) {
            remote.push_back(seeder);
        }
    }
    return remote;
}

std::shared_ptr<TransferService::Download> TransferService::find_download(const FileId& file_id) const {
    std::scoped_lock lock(state_mutex_);
    const auto it = downloads_.find(file_id);
    return it == downloads_.end() ? nullptr : it->second;
}

void TransferService::tick_loop() {
    while (running_.load()) {
        {
            std::unique_lock lock(tick_mutex_);
            tick_cv_.wait_for(lock, config_.drain_poll_interval, [this]() { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        std::vector<std::shared_ptr<Download>> active;
        {
            std::scoped_lock lock(state_mutex_);
            for (const auto& [file_id, download] : downloads_) {
                if (const auto slot = slots_.find(file_id); slot != slots_.end() && slot->second == DownloadSlot::Running) {
                    active.push_back(download);
                }
            }
        }
        for (const auto& download : active) {
            if (!download->finished()) {
                download->post([](SwarmSession& session) { session.tick(SwarmSession::Clock::now()); });
            }
        }
        flush_chunk_reports();
    }
}

void TransferService::flush_chunk_reports() {
    const auto now = std::chrono::steady_clock::now();
    if (now - last_report_ < kChunkReportInterval) {
        return;
    }
    std::set<FileId> dirty;
    {
        std::scoped_lock lock(state_mutex_);
        dirty.swap(dirty_reports_);
    }
    last_report_ = now;
    for (const auto& file_id : dirty) {
        const auto status = link_.update_chunks(file_id, store_.indices(file_id), active_uploads_.load());
        if (!status.ok()) {
            log_event(StructuredLogger::Level::Debug,
                      "transfer.chunk_report_failed",
                      {{"file_id", file_id}, {"code", std::string(error_code_name(status.code))}});
        }
    }
}

void TransferService::emit(TransferEvent event) {
    EventHandler handler;
    {
        std::scoped_lock lock(handler_mutex_);
        handler = event_handler_;
    }
    if (handler) {
        handler(event);
    }
}

}  // namespace swarmshare
