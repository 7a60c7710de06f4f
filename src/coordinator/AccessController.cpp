#include "swarmshare/coordinator/AccessController.hpp"

#include <algorithm>
#include <utility>

namespace swarmshare::coordinator {

ShareList::ShareList(PrincipalId creator)
    : creator_(std::move(creator)) {
    members_.insert(creator_);
}

bool ShareList::contains(const PrincipalId& principal) const {
    return members_.contains(principal);
}

std::vector<PrincipalId> ShareList::members() const {
    return {members_.begin(), members_.end()};
}

AccessController::AccessController(Config config)
    : config_(std::move(config)) {}

bool AccessController::can_access(const ShareList& list, const PrincipalId& principal) {
    return !principal.empty() && list.contains(principal);
}

Status AccessController::authorize(const ShareList& list,
                                   const PrincipalId& actor,
                                   ShareAction action,
                                   const std::vector<PrincipalId>& targets) const {
    if (targets.empty()) {
        return make_error(ErrorCode::InvalidArgument, "no targets");
    }
    if (std::any_of(targets.begin(), targets.end(), [](const PrincipalId& target) { return target.empty(); })) {
        return make_error(ErrorCode::InvalidArgument, "empty principal");
    }
    const bool only_self = std::all_of(targets.begin(), targets.end(), [&](const PrincipalId& target) {
        return target == actor;
    });
    if (action == ShareAction::Revoke && only_self) {
        return make_ok();
    }
    if (!can_access(list, actor)) {
        return make_error(ErrorCode::AccessDenied, "not authorized");
    }

    if (action == ShareAction::Add) {
        std::set<PrincipalId> incoming;
        for (const auto& target : targets) {
            if (!list.contains(target)) {
                incoming.insert(target);
            }
        }
        if (list.size() + incoming.size() > config_.share_max_principals) {
            return make_error(ErrorCode::ShareLimitExceeded, "share list limit reached");
        }
        return make_ok();
    }

    if (actor != list.creator()) {
        return make_error(ErrorCode::PermissionDenied, "only the creator can revoke other principals");
    }
    return make_ok();
}

ShareChange AccessController::apply(ShareList& list, ShareAction action, const std::vector<PrincipalId>& targets) const {
    ShareChange change{};
    for (const auto& target : targets) {
        if (action == ShareAction::Add) {
            if (list.members_.insert(target).second) {
                change.added.push_back(target);
            }
        } else if (target != list.creator_ && list.members_.erase(target) > 0) {
            change.removed.push_back(target);
        }
    }
    return change;
}

Status AccessController::admit(const PrincipalId& actor, Clock::time_point now) {
    std::scoped_lock lock(mutex_);
    auto& window = history_[actor];
    const auto cutoff = now - config_.share_rate_window;
    while (!window.empty() && window.front() <= cutoff) {
        window.pop_front();
    }
    if (window.size() >= config_.share_rate_limit) {
        return make_error(ErrorCode::RateLimited, "too many share operations");
    }
    window.push_back(now);

    // Keep the table from growing with principals that went quiet.
    if (history_.size() > 4096) {
        for (auto it = history_.begin(); it != history_.end();) {
            if (it->second.empty() || it->second.back() <= cutoff) {
                it = history_.erase(it);
            } else {
                ++it;
            }
        }
    }
    return make_ok();
}

}  // namespace swarmshare::coordinator
