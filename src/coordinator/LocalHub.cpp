#include "swarmshare/coordinator/LocalHub.hpp"

#include <atomic>
#include <utility>
#include <vector>

namespace swarmshare::coordinator {

class LocalHub::Link final : public network::CoordinatorLink, public std::enable_shared_from_this<LocalHub::Link> {
public:
    Link(LocalHub& hub, DeviceKey device)
        : CoordinatorLink(std::move(device)),
          hub_(hub) {}

    ~Link() override {
        if (connected_.exchange(false)) {
            hub_.detach(self(), this);
        }
    }

    Status connect() override {
        if (connected_.exchange(true)) {
            return make_ok();
        }
        hub_.attach(self(), shared_from_this());
        return make_ok();
    }

    void disconnect() override {
        if (connected_.exchange(false)) {
            hub_.detach(self(), this);
        }
    }

    [[nodiscard]] bool connected() const override { return connected_.load(); }

    void receive(const protocol::SignalMessage& message) { deliver(message); }

protected:
    Result<protocol::ResponsePayload> exchange(protocol::SignalMessage request) override {
        if (!connected_.load()) {
            return make_failure<protocol::ResponsePayload>(ErrorCode::Unavailable, "not connected");
        }
        auto response = hub_.handle(self(), request);
        auto* payload = std::get_if<protocol::ResponsePayload>(&response.payload);
        if (payload == nullptr) {
            return make_failure<protocol::ResponsePayload>(ErrorCode::TransportFailure, "malformed response");
        }
        return make_result(std::move(*payload));
    }

private:
    LocalHub& hub_;
    std::atomic<bool> connected_{false};
};

LocalHub::LocalHub(FileRegistry& registry)
    : registry_(registry),
      router_(registry),
      delivery_thread_(&LocalHub::delivery_loop, this) {}

LocalHub::~LocalHub() {
    {
        std::scoped_lock lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }
}

std::shared_ptr<network::CoordinatorLink> LocalHub::make_link(DeviceKey device) {
    return std::make_shared<Link>(*this, std::move(device));
}

std::size_t LocalHub::sweep(std::chrono::system_clock::time_point now) {
    const auto removed = registry_.sweep_expired(now);
    flush();
    return removed;
}

void LocalHub::attach(const DeviceKey& device, const std::shared_ptr<Link>& link) {
    {
        std::scoped_lock lock(links_mutex_);
        links_[device] = link;
    }
    router_.connect(device);
}

void LocalHub::detach(const DeviceKey& device, const Link* link) {
    {
        std::scoped_lock lock(links_mutex_);
        const auto it = links_.find(device);
        if (it != links_.end()) {
            const auto current = it->second.lock();
            if (current && current.get() != link) {
                return;
            }
            links_.erase(it);
        }
    }
    router_.disconnect(device);
    flush();
}

protocol::SignalMessage LocalHub::handle(const DeviceKey& caller, const protocol::SignalMessage& request) {
    auto response = router_.handle(caller, request);
    flush();
    return response;
}

void LocalHub::flush() {
    auto outbox = router_.take_outbox();
    if (outbox.empty()) {
        return;
    }
    std::vector<Delivery> deliveries;
    {
        std::scoped_lock lock(links_mutex_);
        for (auto& outbound : outbox) {
            const auto it = links_.find(outbound.target);
            if (it == links_.end()) {
                continue;
            }
            deliveries.push_back(Delivery{it->second, std::move(outbound.message)});
        }
    }
    {
        std::scoped_lock lock(queue_mutex_);
        for (auto& delivery : deliveries) {
            queue_.push_back(std::move(delivery));
        }
    }
    queue_cv_.notify_one();
}

void LocalHub::delivery_loop() {
    while (true) {
        Delivery delivery;
        {
            std::unique_lock lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (stopping_ && queue_.empty()) {
                return;
            }
            delivery = std::move(queue_.front());
            queue_.pop_front();
        }
        if (auto link = delivery.link.lock(); link && link->connected()) {
            link->receive(delivery.message);
        }
    }
}

}  // namespace swarmshare::coordinator
