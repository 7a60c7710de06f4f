#pragma once

#include "swarmshare/Config.hpp"
#include "swarmshare/Error.hpp"
#include "swarmshare/SwarmTypes.hpp"
#include "swarmshare/Types.hpp"

#include <chrono>
#include <deque>
#include <mutex>
#include <set>
#include <unordered_map>
#include <vector>

namespace swarmshare::coordinator {

// Authorized principals for one file. The creator is always a member.
class ShareList {
public:
    ShareList() = default;
    explicit ShareList(PrincipalId creator);

    [[nodiscard]] const PrincipalId& creator() const noexcept { return creator_; }
    [[nodiscard]] bool contains(const PrincipalId& principal) const;
    [[nodiscard]] std::size_t size() const noexcept { return members_.size(); }
    std::vector<PrincipalId> members() const;

private:
    friend class AccessController;

    PrincipalId creator_;
    std::set<PrincipalId> members_;
};

struct ShareChange {
    std::vector<PrincipalId> added;
    std::vector<PrincipalId> removed;
};

class AccessController {
public:
    using Clock = std::chrono::system_clock;

    explicit AccessController(Config config = {});

    static bool can_access(const ShareList& list, const PrincipalId& principal);

    // Decides whether `actor` may perform the action; never mutates.
    Status authorize(const ShareList& list,
                     const PrincipalId& actor,
                     ShareAction action,
                     const std::vector<PrincipalId>& targets) const;

    // Applies an authorized action. A revoke never removes the creator.
    ShareChange apply(ShareList& list, ShareAction action, const std::vector<PrincipalId>& targets) const;

    // Sliding-window limit on share operations per principal. Counts the attempt when admitted.
    Status admit(const PrincipalId& actor, Clock::time_point now);

private:
    Config config_;
    std::unordered_map<PrincipalId, std::deque<Clock::time_point>> history_;
    std::mutex mutex_;
};

}  // namespace swarmshare::coordinator
