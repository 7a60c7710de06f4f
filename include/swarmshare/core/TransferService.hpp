#pragma once

#include "swarmshare/Config.hpp"
#include "swarmshare/Error.hpp"
#include "swarmshare/SwarmTypes.hpp"
#include "swarmshare/Types.hpp"
#include "swarmshare/core/FileNotification.hpp"
#include "swarmshare/core/SwarmSession.hpp"
#include "swarmshare/core/WorkerPool.hpp"
#include "swarmshare/network/CoordinatorLink.hpp"
#include "swarmshare/protocol/PeerMessage.hpp"
#include "swarmshare/storage/ChunkStore.hpp"
#include "swarmshare/storage/MetadataStore.hpp"
#include "swarmshare/transport/TransportLayer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace swarmshare {

enum class TransferEventKind : std::uint8_t {
    DownloadComplete,
    DownloadFailed,
    FileAvailable,
    AccessRevoked
};

struct TransferEvent {
    TransferEventKind kind{TransferEventKind::DownloadComplete};
    FileId file_id;
    Status status;
    std::filesystem::path output_path;
};

struct DownloadProgress {
    SessionPhase phase{SessionPhase::Downloading};
    std::uint32_t held{0};
    std::uint32_t chunk_count{0};
    Status outcome;
    // Waiting for one of the max_concurrent_downloads slots.
    bool queued{false};
};

// Per-device client: shares files, runs downloads, serves chunks to authorized peers and keeps the
// coordinator's view of this device current. One instance per CoordinatorLink.
class TransferService {
public:
    using EventHandler = std::function<void(const TransferEvent&)>;

    TransferService(network::CoordinatorLink& link, Config config);
    ~TransferService();

    TransferService(const TransferService&) = delete;
    TransferService& operator=(const TransferService&) = delete;

    // Loads local metadata, starts the transport and installs the link handlers.
    bool start();
    void stop();

    void set_event_handler(EventHandler handler);

    // Chunks, encrypts and announces the file; the returned notification goes to the recipients
    // through the messaging layer.
    Result<FileNotification> share_file(const std::filesystem::path& path,
                                        const std::vector<PrincipalId>& recipients,
                                        std::string file_name = {},
                                        std::string mime_type = {});

    // Runs at once while fewer than max_concurrent_downloads are active; queues otherwise.
    Status start_download(const FileNotification& notification, const std::filesystem::path& output_path);
    Status cancel_download(const FileId& file_id);
    // A paused download keeps its chunks and peer knowledge but holds no connections and no slot.
    Status pause_download(const FileId& file_id);
    Status resume_download(const FileId& file_id);

    Result<std::vector<PrincipalId>> share_add(const FileId& file_id, const std::vector<PrincipalId>& targets);
    Result<std::vector<PrincipalId>> revoke(const FileId& file_id, const std::vector<PrincipalId>& targets);

    // Leaves the swarm and wipes every local trace of the file. For the creator this deletes the
    // coordinator record as well.
    Status remove_file(const FileId& file_id);

    // After the link comes back: re-announce what this device seeds and resume partial downloads
    // that can make progress.
    Status reconnect();

    [[nodiscard]] std::optional<DownloadProgress> progress(const FileId& file_id) const;

    storage::ChunkStore& chunk_store() noexcept { return store_; }
    storage::MetadataStore& metadata() noexcept { return metadata_; }
    transport::TransportLayer& transport() noexcept { return transport_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

private:
    class Download;

    enum class DownloadSlot : std::uint8_t {
        Queued,
        Running,
        Paused
    };

    void handle_push(const PushNotification& push);
    void handle_message(const transport::ChannelKey& channel, protocol::PeerMessage message);
    void handle_connection(const transport::ChannelKey& channel, bool connected);
    bool admit(const DeviceKey& peer, const FileId& file_id) const;

    void serve_request(const transport::ChannelKey& channel, const protocol::ChunkRequest& request);
    void accept_response(const transport::ChannelKey& channel, crypto::EncryptedChunk chunk);

    Status launch(const storage::LocalFileEntry& entry, const FileInfo& info);
    Status reannounce(const storage::LocalFileEntry& entry);
    void maybe_resume(const FileId& file_id, const std::optional<std::vector<ChunkIndex>>& advertised);
    void on_session_finished(const std::shared_ptr<Download>& download, SessionPhase phase, const Status& status);
    void drop_file(const FileId& file_id);

    // Starts a queued session, or resumes a paused one, with the given seeders.
    void begin(const std::shared_ptr<Download>& download, std::vector<SeederInfo> seeders);
    std::vector<SeederInfo> current_seeders(const FileId& file_id);
    void start_next_queued();
    // Callers hold state_mutex_.
    [[nodiscard]] std::size_t running_count() const;

    void refresh_access(const FileId& file_id, const std::vector<PrincipalId>& shared_with);
    [[nodiscard]] bool authorized(const PrincipalId& principal, const FileId& file_id) const;
    std::vector<SeederInfo> remote_seeders(const std::vector<SeederInfo>& seeders) const;
    std::shared_ptr<Download> find_download(const FileId& file_id) const;

    void tick_loop();
    void flush_chunk_reports();
    void emit(TransferEvent event);

    Config config_;
    network::CoordinatorLink& link_;
    storage::ChunkStore store_;
    storage::MetadataStore metadata_;
    WorkerPool pool_;
    transport::TransportLayer transport_;

    mutable std::mutex handler_mutex_;
    EventHandler event_handler_;

    mutable std::mutex state_mutex_;
    std::map<FileId, std::shared_ptr<Download>> downloads_;
    std::map<FileId, DownloadSlot> slots_;
    std::deque<FileId> queue_;
    std::map<FileId, std::set<PrincipalId>> access_;
    std::set<FileId> dirty_reports_;
    std::chrono::steady_clock::time_point last_report_{};

    std::atomic<std::uint16_t> active_uploads_{0};

    std::atomic<bool> running_{false};
    std::thread tick_thread_;
    std::mutex tick_mutex_;
    std::condition_variable tick_cv_;
};

}  // namespace swarmshare
