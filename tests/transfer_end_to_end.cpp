#include "swarmshare/coordinator/FileRegistry.hpp"
#include "swarmshare/coordinator/LocalHub.hpp"
#include "swarmshare/core/FileNotification.hpp"
#include "swarmshare/core/TransferService.hpp"
#include "swarmshare/crypto/EncryptionService.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

class EventLog {
public:
    void record(const swarmshare::TransferEvent& event) {
        std::scoped_lock lock(mutex_);
        events_.push_back(event);
        cv_.notify_all();
    }

    std::optional<swarmshare::TransferEvent> wait_for(swarmshare::TransferEventKind kind,
                                                      const swarmshare::FileId& file_id,
                                                      std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        std::optional<swarmshare::TransferEvent> found;
        cv_.wait_for(lock, timeout, [&] {
            for (const auto& event : events_) {
                if (event.kind == kind && event.file_id == file_id) {
                    found = event;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<swarmshare::TransferEvent> events_;
};

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
}

std::vector<std::uint8_t> make_content(std::size_t size, unsigned seed) {
    std::vector<std::uint8_t> content(size);
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<std::uint8_t>((i * seed + i / 97u) & 0xFFu);
    }
    return content;
}

void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
}

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(20ms);
    }
    return predicate();
}

}  // namespace

int main() {
    const auto workspace = std::filesystem::temp_directory_path() / "swarmshare_end_to_end";
    std::filesystem::remove_all(workspace);
    std::filesystem::create_directories(workspace);

    const auto source = workspace / "report.bin";
    std::vector<std::uint8_t> content(200000);
    for (std::size_t i = 0; i < content.size(); ++i) {
        content[i] = static_cast<std::uint8_t>((i * 7u + i / 251u) & 0xFFu);
    }
    {
        std::ofstream out(source, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    }

    swarmshare::Config config{};
    config.worker_threads = 2;
    config.transport_host = "127.0.0.1";
    config.transport_connect_timeout = 2s;
    config.drain_poll_interval = 50ms;

    swarmshare::coordinator::FileRegistry registry(config);
    swarmshare::coordinator::LocalHub hub(registry);
    auto alice_link = hub.make_link({"alice", "laptop"});
    auto bob_link = hub.make_link({"bob", "phone"});
    auto carol_link = hub.make_link({"carol", "desktop"});

    auto dave_link = hub.make_link({"dave", "laptop"});
    auto tablet_link = hub.make_link({"alice", "tablet"});

    // One download at a time, and a session that waits long for absent seeders.
    auto dave_config = config;
    dave_config.max_concurrent_downloads = 1;
    dave_config.request_timeout = 60s;

    swarmshare::TransferService alice(*alice_link, config);
    swarmshare::TransferService bob(*bob_link, config);
    swarmshare::TransferService carol(*carol_link, config);
    swarmshare::TransferService dave(*dave_link, dave_config);

    EventLog alice_events;
    EventLog bob_events;
    EventLog dave_events;
    alice.set_event_handler([&alice_events](const swarmshare::TransferEvent& event) { alice_events.record(event); });
    bob.set_event_handler([&bob_events](const swarmshare::TransferEvent& event) { bob_events.record(event); });
    dave.set_event_handler([&dave_events](const swarmshare::TransferEvent& event) { dave_events.record(event); });

    auto shutdown = [&]() {
        dave.stop();
        carol.stop();
        bob.stop();
        alice.stop();
        tablet_link->disconnect();
        dave_link->disconnect();
        carol_link->disconnect();
        bob_link->disconnect();
        alice_link->disconnect();
        std::filesystem::remove_all(workspace);
    };

    auto require = [&](bool condition, const char* message) {
        if (!condition) {
            std::cerr << "[TransferEndToEnd] " << message << std::endl;
            shutdown();
            return false;
        }
        return true;
    };

    if (!require(alice_link->connect().ok() && bob_link->connect().ok() && carol_link->connect().ok() &&
                     dave_link->connect().ok() && tablet_link->connect().ok(),
                 "links failed to connect")) {
        return 1;
    }
    if (!require(alice.start() && bob.start() && carol.start() && dave.start(), "services failed to start")) {
        return 1;
    }

    const auto shared = alice.share_file(source, {"bob"}, "report.bin", "application/octet-stream");
    if (!require(shared.ok(), "share failed")) {
        return 1;
    }
    const auto& notification = *shared.value;
    if (!require(notification.chunk_count == 4 && notification.file_size == content.size(), "wrong chunking")) {
        return 1;
    }
    if (!require(bob_events.wait_for(swarmshare::TransferEventKind::FileAvailable, notification.file_id, 5s).has_value(),
                 "recipient was not told about the file")) {
        return 1;
    }

    // The notification travels out of band as text.
    const auto received = swarmshare::parse_notification(swarmshare::serialize_notification(notification));
    if (!require(received.ok(), "notification did not survive serialization")) {
        return 1;
    }

    // Someone outside the share list is refused before any bytes move.
    const auto denied = carol.start_download(*received.value, workspace / "carol.bin");
    if (!require(denied.code == swarmshare::ErrorCode::AccessDenied, "outsider was allowed to download")) {
        return 1;
    }

    const auto output = workspace / "bob.bin";
    if (!require(bob.start_download(*received.value, output).ok(), "download did not start")) {
        return 1;
    }
    const auto finished = bob_events.wait_for(swarmshare::TransferEventKind::DownloadComplete, notification.file_id, 20s);
    if (!require(finished.has_value(), "download never completed")) {
        return 1;
    }
    if (!require(finished->status.ok() && read_file(output) == content, "downloaded bytes differ")) {
        return 1;
    }
    const auto progress = bob.progress(notification.file_id);
    if (!require(progress.has_value() && progress->phase == swarmshare::SessionPhase::Complete && progress->held == 4,
                 "progress not reported")) {
        return 1;
    }

    // The finished downloader seeds.
    const auto info = registry.get_info("alice", notification.file_id);
    if (!require(info.ok() && info.value->seeders.size() == 2 && info.value->leecher_count == 0,
                 "downloader did not join the seeders")) {
        return 1;
    }

    // A notification whose checksum disagrees with the coordinator is rejected.
    auto tampered = *received.value;
    tampered.checksum = std::string(64, '0');
    const auto mismatch = bob.start_download(tampered, workspace / "tampered.bin");
    if (!require(mismatch.code == swarmshare::ErrorCode::ChecksumMismatch, "tampered checksum accepted")) {
        return 1;
    }

    // Revocation wipes the recipient's copy of the chunks.
    const auto revoked = alice.revoke(notification.file_id, {"bob"});
    if (!require(revoked.ok(), "revoke failed")) {
        return 1;
    }
    if (!require(bob_events.wait_for(swarmshare::TransferEventKind::AccessRevoked, notification.file_id, 5s).has_value(),
                 "recipient never learned of the revocation")) {
        return 1;
    }
    if (!require(bob.chunk_store().chunk_count(notification.file_id) == 0 &&
                     !bob.metadata().get(notification.file_id).has_value(),
                 "revoked chunks were kept")) {
        return 1;
    }
    const auto after = registry.get_info("alice", notification.file_id);
    if (!require(after.ok() && after.value->seeders.size() == 1, "revoked seeder still listed")) {
        return 1;
    }

    // The creator's removal deletes the record.
    if (!require(alice.remove_file(notification.file_id).ok(), "remove failed")) {
        return 1;
    }
    if (!require(registry.size() == 0 && alice.chunk_store().chunk_count(notification.file_id) == 0,
                 "record or chunks survived removal")) {
        return 1;
    }

    // A partial download resumes on its own only when a push offers a chunk it lacks.
    const auto notes_source = workspace / "notes.bin";
    const auto notes_content = make_content(230000, 13u);
    write_file(notes_source, notes_content);
    const auto notes = alice.share_file(notes_source, {"bob"}, "notes.bin", "application/octet-stream");
    if (!require(notes.ok() && notes.value->chunk_count == 4, "second share failed")) {
        return 1;
    }
    const auto& notes_id = notes.value->file_id;
    if (!require(bob_events.wait_for(swarmshare::TransferEventKind::FileAvailable, notes_id, 5s).has_value(),
                 "recipient was not told about the second file")) {
        return 1;
    }
    for (swarmshare::ChunkIndex index = 0; index < 2; ++index) {
        auto chunk = alice.chunk_store().get(notes_id, index);
        if (!require(chunk.has_value(), "sender lost a chunk")) {
            return 1;
        }
        bob.chunk_store().put(std::move(*chunk));
    }
    const auto notes_output = workspace / "bob_notes.bin";
    swarmshare::storage::LocalFileEntry partial;
    partial.file_id = notes_id;
    partial.status = swarmshare::storage::LocalFileStatus::Partial;
    partial.checksum = notes.value->checksum;
    partial.chunk_count = notes.value->chunk_count;
    partial.file_size = notes.value->file_size;
    partial.shared_with = {"alice", "bob"};
    partial.file_key = swarmshare::crypto::file_key_to_string(notes.value->file_key);
    partial.file_name = "notes.bin";
    partial.output_path = notes_output.string();
    partial.sender_id = "alice";
    bob.metadata().upsert(partial);

    alice_link->disconnect();
    if (!require(tablet_link->update_chunks(notes_id, {0}, 0).ok(), "second device could not report chunks")) {
        return 1;
    }
    std::this_thread::sleep_for(500ms);
    if (!require(!bob.progress(notes_id).has_value(), "a push offering only held chunks resumed the download")) {
        return 1;
    }
    // An empty report withdraws the device from the seeders.
    if (!require(tablet_link->update_chunks(notes_id, {}, 0).ok(), "withdrawal failed")) {
        return 1;
    }
    const auto withdrawn = registry.get_info("bob", notes_id);
    if (!require(withdrawn.ok() && withdrawn.value->seeders.empty(), "withdrawn device still listed")) {
        return 1;
    }

    if (!require(alice_link->connect().ok() && alice.reconnect().ok(), "sender failed to come back")) {
        return 1;
    }
    const auto resumed = bob_events.wait_for(swarmshare::TransferEventKind::DownloadComplete, notes_id, 20s);
    if (!require(resumed.has_value() && read_file(notes_output) == notes_content,
                 "returning sender did not resume the partial download")) {
        return 1;
    }

    // Downloads beyond max_concurrent_downloads wait their turn; pausing one frees its slot.
    const auto slides_source = workspace / "slides.bin";
    const auto slides_content = make_content(150000, 29u);
    write_file(slides_source, slides_content);
    const auto slides = carol.share_file(slides_source, {"dave"}, "slides.bin", "application/octet-stream");
    const auto photo_source = workspace / "photo.bin";
    const auto photo_content = make_content(140000, 41u);
    write_file(photo_source, photo_content);
    const auto photo = alice.share_file(photo_source, {"dave"}, "photo.bin", "image/jpeg");
    if (!require(slides.ok() && photo.ok(), "shares for the queue failed")) {
        return 1;
    }
    const auto& slides_id = slides.value->file_id;
    const auto& photo_id = photo.value->file_id;
    if (!require(dave_events.wait_for(swarmshare::TransferEventKind::FileAvailable, slides_id, 5s).has_value() &&
                     dave_events.wait_for(swarmshare::TransferEventKind::FileAvailable, photo_id, 5s).has_value(),
                 "queue recipient was not told about the files")) {
        return 1;
    }

    // With its only seeder offline the first download holds the slot without finishing.
    carol_link->disconnect();
    const auto slides_output = workspace / "dave_slides.bin";
    const auto photo_output = workspace / "dave_photo.bin";
    if (!require(dave.start_download(*slides.value, slides_output).ok(), "first queued download did not start")) {
        return 1;
    }
    if (!require(dave.start_download(*photo.value, photo_output).ok(), "second download was refused")) {
        return 1;
    }
    const auto waiting = dave.progress(photo_id);
    if (!require(waiting.has_value() && waiting->queued && !dave.progress(slides_id)->queued,
                 "second download was not queued")) {
        return 1;
    }
    std::this_thread::sleep_for(300ms);
    if (!require(dave.progress(photo_id)->queued && dave.progress(photo_id)->held == 0, "queued download ran early")) {
        return 1;
    }

    if (!require(dave.pause_download(slides_id).ok(), "pause failed")) {
        return 1;
    }
    if (!require(dave.pause_download(slides_id).code == swarmshare::ErrorCode::InvalidArgument,
                 "second pause was accepted")) {
        return 1;
    }
    const auto photo_done = dave_events.wait_for(swarmshare::TransferEventKind::DownloadComplete, photo_id, 20s);
    if (!require(photo_done.has_value() && read_file(photo_output) == photo_content,
                 "queued download did not run once the slot was free")) {
        return 1;
    }
    if (!require(wait_until([&]() { return dave.progress(slides_id)->phase == swarmshare::SessionPhase::Paused; }, 2s) &&
                     dave.metadata().get(slides_id)->status == swarmshare::storage::LocalFileStatus::Paused,
                 "paused download not reported as paused")) {
        return 1;
    }

    // A returning seeder does not wake a paused download.
    if (!require(carol_link->connect().ok() && carol.reconnect().ok(), "seeder failed to come back")) {
        return 1;
    }
    std::this_thread::sleep_for(500ms);
    if (!require(dave.progress(slides_id)->phase == swarmshare::SessionPhase::Paused, "paused download resumed by itself")) {
        return 1;
    }

    if (!require(dave.resume_download(slides_id).ok(), "resume failed")) {
        return 1;
    }
    if (!require(dave.resume_download(slides_id).code == swarmshare::ErrorCode::InvalidArgument,
                 "resume of a running download was accepted")) {
        return 1;
    }
    const auto slides_done = dave_events.wait_for(swarmshare::TransferEventKind::DownloadComplete, slides_id, 20s);
    if (!require(slides_done.has_value() && read_file(slides_output) == slides_content, "resumed download did not finish")) {
        return 1;
    }

    shutdown();
    return 0;
}
