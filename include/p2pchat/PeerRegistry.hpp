#ifndef P2PCHAT_PEER_REGISTRY_HPP
#define P2PCHAT_PEER_REGISTRY_HPP

#include "Types.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace p2pchat {

    /** Network address of a peer. This, not the display name, identifies a peer. */
    struct Endpoint {
        std::string host;
        uint16_t port = 0;

        std::string key() const {
            return host + ":" + std::to_string(port);
        }

        bool operator==(const Endpoint& other) const {
            return host == other.host && port == other.port;
        }

        bool operator!=(const Endpoint& other) const {
            return !(*this == other);
        }
    };

    struct PeerInfo {
        Endpoint endpoint;
        std::string name;
        TimePoint lastSeen;

        /** A peer is active while it has been heard from within the staleness window. */
        bool isActive(TimePoint now) const {
            return now - lastSeen < STALENESS_WINDOW;
        }
    };

    class PeerRegistry {
        public:
            PeerRegistry() = default;
            ~PeerRegistry() = default;

            PeerRegistry(const PeerRegistry&) = delete;
            PeerRegistry& operator=(const PeerRegistry&) = delete;

            /**
             * Inserts the peer or refreshes its name and lastSeen timestamp.
             */
            void upsert(const Endpoint& endpoint, const std::string& name, TimePoint now);

            /**
             * Removes a peer by key. Returns false if it was not known.
             */
            bool remove(const std::string& peerKey);

            /**
             * Gets a copy of a peer by its key.
             */
            std::optional<PeerInfo> get(const std::string& peerKey) const;

            /**
             * Looks up a user-supplied address: an exact "host:port" key first,
             * then a bare host that matches exactly one known peer.
             */
            std::optional<PeerInfo> resolve(const std::string& address) const;

            bool contains(const std::string& peerKey) const;

            /**
             * True if the peer is known and was seen less than STALENESS_WINDOW before `now`.
             */
            bool isActive(const std::string& peerKey, TimePoint now) const;

            /**
             * Copy of the current entries, ordered by key.
             */
            std::vector<PeerInfo> snapshot() const;

            size_t size() const;

            void clear();

        private:
            mutable std::mutex mtx;
            std::unordered_map<std::string, PeerInfo> peers; // key = host:port
    };

} // namespace p2pchat

#endif // P2PCHAT_PEER_REGISTRY_HPP
