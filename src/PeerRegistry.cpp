#include "p2pchat/PeerRegistry.hpp"
#include <algorithm>
#include <iterator>

namespace p2pchat {

    void PeerRegistry::upsert(const Endpoint& endpoint, const std::string& name, TimePoint now) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = peers.find(endpoint.key());

        if (it != peers.end()) {
            if (!name.empty()) it->second.name = name;
            it->second.lastSeen = now;
        } else {
            peers[endpoint.key()] = PeerInfo{endpoint, name, now};
        }
    }

    bool PeerRegistry::remove(const std::string& peerKey) {
        std::lock_guard<std::mutex> lock(mtx);
        return peers.erase(peerKey) > 0;
    }

    std::optional<PeerInfo> PeerRegistry::get(const std::string& peerKey) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = peers.find(peerKey);
        if (it == peers.end()) return std::nullopt;
        return it->second;
    }

    std::optional<PeerInfo> PeerRegistry::resolve(const std::string& address) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto exact = peers.find(address);
        if (exact != peers.end()) return exact->second;

        std::optional<PeerInfo> match;
        for (const auto& [key, peer] : peers) {
            if (peer.endpoint.host != address) continue;
            if (match) return std::nullopt; // ambiguous: several ports on that host
            match = peer;
        }
        return match;
    }

    bool PeerRegistry::contains(const std::string& peerKey) const {
        std::lock_guard<std::mutex> lock(mtx);
        return peers.count(peerKey) > 0;
    }

    bool PeerRegistry::isActive(const std::string& peerKey, TimePoint now) const {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = peers.find(peerKey);
        return it != peers.end() && it->second.isActive(now);
    }

    std::vector<PeerInfo> PeerRegistry::snapshot() const {
        std::vector<PeerInfo> result;
        {
            std::lock_guard<std::mutex> lock(mtx);
            result.reserve(peers.size());
            std::transform(peers.begin(), peers.end(), std::back_inserter(result),
                          [](const auto& pair) { return pair.second; });
        }

        std::sort(result.begin(), result.end(), [](const PeerInfo& a, const PeerInfo& b) {
            return a.endpoint.key() < b.endpoint.key();
        });
        return result;
    }

    size_t PeerRegistry::size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return peers.size();
    }

    void PeerRegistry::clear() {
        std::lock_guard<std::mutex> lock(mtx);
        peers.clear();
    }

} // namespace p2pchat
