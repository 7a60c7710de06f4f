#include "swarmshare/coordinator/AccessController.hpp"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

int main() {
    using swarmshare::ErrorCode;
    using swarmshare::ShareAction;
    using swarmshare::coordinator::AccessController;
    using swarmshare::coordinator::ShareList;

    swarmshare::Config config{};
    config.share_max_principals = 4;
    config.share_rate_limit = 3;
    config.share_rate_window = std::chrono::seconds(60);

    AccessController access(config);
    ShareList list("alice");
    assert(list.contains("alice"));
    assert(AccessController::can_access(list, "alice"));
    assert(!AccessController::can_access(list, "bob"));
    assert(!AccessController::can_access(list, ""));

    assert(access.authorize(list, "alice", ShareAction::Add, {"bob"}).ok());
    auto change = access.apply(list, ShareAction::Add, {"bob", "bob"});
    assert((change.added == std::vector<swarmshare::PrincipalId>{"bob"}));
    assert(list.size() == 2);

    // Any member may add.
    assert(access.authorize(list, "bob", ShareAction::Add, {"carol"}).ok());
    // Outsiders may not.
    assert(access.authorize(list, "mallory", ShareAction::Add, {"mallory"}).code == ErrorCode::AccessDenied);

    // Only the creator revokes others; anyone may revoke themselves.
    assert(access.authorize(list, "bob", ShareAction::Revoke, {"alice"}).code == ErrorCode::PermissionDenied);
    assert(access.authorize(list, "bob", ShareAction::Revoke, {"bob"}).ok());
    assert(access.authorize(list, "mallory", ShareAction::Revoke, {"mallory"}).ok());
    assert(access.authorize(list, "alice", ShareAction::Revoke, {"bob"}).ok());

    // The creator can never be removed.
    change = access.apply(list, ShareAction::Revoke, {"alice", "bob"});
    assert((change.removed == std::vector<swarmshare::PrincipalId>{"bob"}));
    assert(list.contains("alice"));
    assert(!list.contains("bob"));

    assert(access.authorize(list, "alice", ShareAction::Add, {}).code == ErrorCode::InvalidArgument);
    assert(access.authorize(list, "alice", ShareAction::Add, {""}).code == ErrorCode::InvalidArgument);

    // Four principals at most; members already present do not count twice.
    assert(access.authorize(list, "alice", ShareAction::Add, {"b", "c", "d"}).ok());
    assert(access.authorize(list, "alice", ShareAction::Add, {"b", "c", "d", "e"}).code ==
           ErrorCode::ShareLimitExceeded);
    access.apply(list, ShareAction::Add, {"b", "c", "d"});
    assert(access.authorize(list, "alice", ShareAction::Add, {"b"}).ok());
    assert(access.authorize(list, "alice", ShareAction::Add, {"e"}).code == ErrorCode::ShareLimitExceeded);

    const auto start = std::chrono::system_clock::now();
    assert(access.admit("alice", start).ok());
    assert(access.admit("alice", start + 1s).ok());
    assert(access.admit("alice", start + 2s).ok());
    assert(access.admit("alice", start + 3s).code == ErrorCode::RateLimited);
    assert(access.admit("bob", start + 3s).ok());
    // The window slides past the first attempt.
    assert(access.admit("alice", start + 61s).ok());
    assert(access.admit("alice", start + 61s).ok());
    assert(access.admit("alice", start + 61s).code == ErrorCode::RateLimited);

    return 0;
}
