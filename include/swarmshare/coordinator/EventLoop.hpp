#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace swarmshare::coordinator {

// Single-threaded epoll reactor. Watchers and timers are managed from the loop thread;
// post() and stop() may be called from any thread; a stopped loop does not restart.
class EventLoop {
public:
    using EventCallback = std::function<void(int fd, std::uint32_t events)>;
    using Task = std::function<void()>;
    using TimerId = int;

    static constexpr std::uint32_t kEventNone = 0;
    static constexpr std::uint32_t kEventReadable = 1u << 0;
    static constexpr std::uint32_t kEventWritable = 1u << 1;
    static constexpr std::uint32_t kEventError = 1u << 2;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void add(int fd, std::uint32_t events, EventCallback callback);
    void update(int fd, std::uint32_t events);
    void remove(int fd);

    // Repeats every `interval` until cancelled.
    TimerId add_timer(std::chrono::milliseconds interval, Task task);
    void cancel_timer(TimerId id);

    void post(Task task);

    void run();
    void stop();
    [[nodiscard]] bool running() const noexcept { return running_.load(); }

private:
    struct Watcher {
        std::uint32_t events{0};
        EventCallback callback;
    };

    void wake();
    void drain_posted();
    std::uint32_t translate_events(std::uint32_t backend_mask) const;

    int backend_fd_{-1};
    int wake_fd_{-1};

    std::unordered_map<int, Watcher> watchers_;
    std::unordered_map<TimerId, Task> timers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    std::vector<Task> posted_;
    std::mutex posted_mutex_;
};

}  // namespace swarmshare::coordinator
