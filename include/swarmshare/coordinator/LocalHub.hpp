#pragma once

#include "swarmshare/Types.hpp"
#include "swarmshare/coordinator/FileRegistry.hpp"
#include "swarmshare/coordinator/SignalRouter.hpp"
#include "swarmshare/network/CoordinatorLink.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace swarmshare::coordinator {

// In-process coordinator. Links behave like network links: requests are answered synchronously,
// pushes and relays arrive on a single delivery thread in the order they were produced.
// The hub must outlive every link it hands out.
class LocalHub {
public:
    explicit LocalHub(FileRegistry& registry);
    ~LocalHub();

    LocalHub(const LocalHub&) = delete;
    LocalHub& operator=(const LocalHub&) = delete;

    std::shared_ptr<network::CoordinatorLink> make_link(DeviceKey device);

    // Runs the registry GC and delivers the resulting pushes.
    std::size_t sweep(std::chrono::system_clock::time_point now);

    [[nodiscard]] SignalRouter& router() noexcept { return router_; }

private:
    class Link;

    struct Delivery {
        std::weak_ptr<Link> link;
        protocol::SignalMessage message;
    };

    void attach(const DeviceKey& device, const std::shared_ptr<Link>& link);
    void detach(const DeviceKey& device, const Link* link);
    protocol::SignalMessage handle(const DeviceKey& caller, const protocol::SignalMessage& request);
    void flush();
    void delivery_loop();

    FileRegistry& registry_;
    SignalRouter router_;

    std::mutex links_mutex_;
    std::map<DeviceKey, std::weak_ptr<Link>> links_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Delivery> queue_;
    bool stopping_{false};
    std::thread delivery_thread_;
};

}  // namespace swarmshare::coordinator
