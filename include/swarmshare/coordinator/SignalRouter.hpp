#pragma once

#include "swarmshare/Types.hpp"
#include "swarmshare/coordinator/FileRegistry.hpp"
#include "swarmshare/protocol/Signal.hpp"

#include <map>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace swarmshare::coordinator {

struct OutboundSignal {
    DeviceKey target;
    protocol::SignalMessage message;
};

// Transport-independent request handling for the coordinator: dispatches decoded requests to the
// registry, relays negotiation messages, and fans registry pushes out to online devices. The network
// server and the in-process hub both drive it and drain its outbox outside any lock.
class SignalRouter {
public:
    explicit SignalRouter(FileRegistry& registry);
    ~SignalRouter();

    SignalRouter(const SignalRouter&) = delete;
    SignalRouter& operator=(const SignalRouter&) = delete;

    void connect(const DeviceKey& device);
    // Removes the device from every roster.
    void disconnect(const DeviceKey& device);
    [[nodiscard]] bool is_online(const DeviceKey& device) const;
    std::vector<DeviceKey> online_devices(const PrincipalId& principal) const;

    // Returns the response to send back to `caller`. Anything else produced is queued.
    protocol::SignalMessage handle(const DeviceKey& caller, const protocol::SignalMessage& request);

    std::vector<OutboundSignal> take_outbox();

private:
    protocol::SignalMessage relay(const DeviceKey& caller, const protocol::SignalMessage& request);
    void on_registry_event(const RegistryEvent& event);
    void queue(const DeviceKey& target, protocol::SignalMessage message);

    FileRegistry& registry_;
    std::map<PrincipalId, std::set<DeviceId>> online_;
    std::vector<OutboundSignal> outbox_;
    mutable std::mutex mutex_;
};

}  // namespace swarmshare::coordinator
