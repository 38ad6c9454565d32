#ifndef P2PCHAT_DISCOVERY_PROBE_HPP
#define P2PCHAT_DISCOVERY_PROBE_HPP

#include "PeerRegistry.hpp"
#include "Types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace p2pchat {

    struct DiscoveryOptions {
        std::string displayName;
        uint16_t port = DEFAULT_PORT;
        std::string broadcastAddress = DEFAULT_BROADCAST_ADDRESS;
        std::chrono::milliseconds window = DISCOVERY_WINDOW;
        // replies from this host are ignored; unset = this machine's primary address
        std::optional<std::string> excludeAddress;
    };

    /**
     * One-shot discovery: broadcast a presence probe, collect the presence replies
     * that arrive within the window, report them. Listeners answer probes with a
     * unicast presence (see MessageDispatcher).
     */
    class DiscoveryProbe {
        public:
            explicit DiscoveryProbe(DiscoveryOptions options);

            /**
             * Runs the probe and returns the peers found. Blocks for the whole window.
             * @throws BindError if no UDP socket can be opened
             */
            std::vector<PeerInfo> run();

            const PeerRegistry& peers() const { return registry; }

        private:
            DiscoveryOptions options;
            PeerRegistry registry;
    };

} // namespace p2pchat

#endif // P2PCHAT_DISCOVERY_PROBE_HPP
