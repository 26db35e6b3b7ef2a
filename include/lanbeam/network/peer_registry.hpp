#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanbeam::network {

struct Peer {
    std::string address;     // "ip:offer_port"
    std::string username;
    std::chrono::steady_clock::time_point last_seen;
};

enum class UpsertResult {
    ADDED,
    UPDATED,    // username changed
    REFRESHED   // last_seen only
};

enum class PeerChange {
    ADDED,
    UPDATED,
    REMOVED
};

const char* to_string(PeerChange change);

// Live peers keyed by address. The change handler must not mutate the registry.
class PeerRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using ChangeHandler = std::function<void(PeerChange, const Peer&, const std::vector<Peer>&)>;

    explicit PeerRegistry(std::chrono::milliseconds expiry_window = std::chrono::milliseconds(3000));

    UpsertResult upsert(const std::string& address, const std::string& username,
                        Clock::time_point now = Clock::now());

    std::vector<Peer> remove_expired(Clock::time_point now = Clock::now());

    // Ordered by address.
    std::vector<Peer> snapshot() const;

    // Exact "ip:port" match, or a bare IP held by exactly one peer.
    std::optional<Peer> resolve(const std::string& address) const;

    std::size_t size() const;

    // Drops every entry without notifying.
    void clear();

    void set_change_handler(ChangeHandler handler);

    std::chrono::milliseconds expiry_window() const { return expiry_window_; }

private:
    std::vector<Peer> snapshot_locked() const;
    void notify(PeerChange change, const Peer& peer, const std::vector<Peer>& peers);

    const std::chrono::milliseconds expiry_window_;

    // Held across a mutation and its notification.
    std::mutex notify_mutex_;

    mutable std::mutex peers_mutex_;
    std::map<std::string, Peer> peers_;
    ChangeHandler change_handler_;
};

}
