#ifndef P2PCHAT_PRESENCE_BROADCASTER_HPP
#define P2PCHAT_PRESENCE_BROADCASTER_HPP

#include "ChatEvents.hpp"
#include "PeerRegistry.hpp"
#include <boost/asio.hpp>
#include <atomic>
#include <chrono>
#include <string>

namespace p2pchat {

    /**
     * Announces this peer to the network: one presence datagram right away, then
     * one every `interval`. A failed send is retried after `backoff` instead.
     * Runs on the io_context it was given; delivery is best effort.
     */
    class PresenceBroadcaster {
        public:
            PresenceBroadcaster(boost::asio::io_context& io, DatagramSender& sender,
                                std::string displayName, Endpoint target,
                                std::chrono::milliseconds interval, std::chrono::milliseconds backoff);

            ~PresenceBroadcaster();

            void start();

            /** Cancels the pending timer. Safe to call from any thread, more than once. */
            void stop();

            const Endpoint& target() const { return broadcastTarget; }

            size_t sentCount() const { return sent.load(); }
            size_t failedCount() const { return failed.load(); }

        private:
            void tick();
            void schedule(std::chrono::milliseconds delay);

            boost::asio::steady_timer timer;
            DatagramSender& sender;
            std::string name;
            Endpoint broadcastTarget;
            std::chrono::milliseconds interval;
            std::chrono::milliseconds backoff;

            std::atomic<bool> running{false};
            std::atomic<size_t> sent{0};
            std::atomic<size_t> failed{0};
    };

} // namespace p2pchat

#endif // P2PCHAT_PRESENCE_BROADCASTER_HPP
