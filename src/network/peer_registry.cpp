#include "lanbeam/network/peer_registry.hpp"
#include "lanbeam/core/logger.hpp"
#include <exception>

namespace lanbeam::network {

const char* to_string(PeerChange change) {
    switch (change) {
        case PeerChange::ADDED:   return "added";
        case PeerChange::UPDATED: return "updated";
        case PeerChange::REMOVED: return "removed";
    }
    return "unknown";
}

PeerRegistry::PeerRegistry(std::chrono::milliseconds expiry_window)
    : expiry_window_(expiry_window) {
}

UpsertResult PeerRegistry::upsert(const std::string& address, const std::string& username,
                                  Clock::time_point now) {
    std::lock_guard<std::mutex> notify_lock(notify_mutex_);

    UpsertResult result;
    Peer changed;
    std::vector<Peer> peers;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.find(address);

        if (it == peers_.end()) {
            changed = Peer{address, username, now};
            peers_.emplace(address, changed);
            result = UpsertResult::ADDED;
        } else {
            if (now > it->second.last_seen) {
                it->second.last_seen = now;
            }
            if (it->second.username == username) {
                return UpsertResult::REFRESHED;
            }
            it->second.username = username;
            changed = it->second;
            result = UpsertResult::UPDATED;
        }

        peers = snapshot_locked();
    }

    if (result == UpsertResult::ADDED) {
        LOG_INFO("Discovered peer '{}' at {}", username, address);
        notify(PeerChange::ADDED, changed, peers);
    } else {
        LOG_INFO("Peer {} is now known as '{}'", address, username);
        notify(PeerChange::UPDATED, changed, peers);
    }

    return result;
}

std::vector<Peer> PeerRegistry::remove_expired(Clock::time_point now) {
    std::lock_guard<std::mutex> notify_lock(notify_mutex_);

    std::vector<Peer> removed;
    std::vector<Peer> peers;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        auto it = peers_.begin();
        while (it != peers_.end()) {
            if (now - it->second.last_seen > expiry_window_) {
                removed.push_back(it->second);
                it = peers_.erase(it);
            } else {
                ++it;
            }
        }

        if (removed.empty()) {
            return removed;
        }
        peers = snapshot_locked();
    }

    for (const auto& peer : removed) {
        LOG_INFO("Peer '{}' at {} timed out", peer.username, peer.address);
        notify(PeerChange::REMOVED, peer, peers);
    }

    return removed;
}

std::vector<Peer> PeerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return snapshot_locked();
}

std::optional<Peer> PeerRegistry::resolve(const std::string& address) const {
    std::lock_guard<std::mutex> lock(peers_mutex_);

    auto it = peers_.find(address);
    if (it != peers_.end()) {
        return it->second;
    }

    if (address.find(':') != std::string::npos) {
        return std::nullopt;
    }

    std::optional<Peer> match;
    const std::string prefix = address + ":";
    for (const auto& [key, peer] : peers_) {
        if (key.compare(0, prefix.size(), prefix) == 0) {
            if (match) {
                return std::nullopt;  // ambiguous
            }
            match = peer;
        }
    }
    return match;
}

std::size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    return peers_.size();
}

void PeerRegistry::clear() {
    std::lock_guard<std::mutex> notify_lock(notify_mutex_);
    std::lock_guard<std::mutex> lock(peers_mutex_);
    peers_.clear();
}

void PeerRegistry::set_change_handler(ChangeHandler handler) {
    std::lock_guard<std::mutex> notify_lock(notify_mutex_);
    std::lock_guard<std::mutex> lock(peers_mutex_);
    change_handler_ = std::move(handler);
}

std::vector<Peer> PeerRegistry::snapshot_locked() const {
    std::vector<Peer> peers;
    peers.reserve(peers_.size());
    for (const auto& [address, peer] : peers_) {
        peers.push_back(peer);
    }
    return peers;
}

void PeerRegistry::notify(PeerChange change, const Peer& peer, const std::vector<Peer>& peers) {
    ChangeHandler handler;
    {
        std::lock_guard<std::mutex> lock(peers_mutex_);
        handler = change_handler_;
    }

    if (!handler) {
        return;
    }

    try {
        handler(change, peer, peers);
    } catch (const std::exception& e) {
        LOG_ERROR("Peer change handler threw: {}", e.what());
    }
}

}
