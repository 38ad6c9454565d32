#ifndef P2PCHAT_MESSAGE_DISPATCHER_HPP
#define P2PCHAT_MESSAGE_DISPATCHER_HPP

#include "ChatEvents.hpp"
#include "ChatSession.hpp"
#include "Message.hpp"
#include "PeerRegistry.hpp"
#include "Types.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace p2pchat {

    /**
     * Routes one inbound datagram: decode, classify by kind, update the registry
     * and session, and report to the listener.
     *
     * A direct message (chat, typing, read_receipt, file_offer) is accepted when
     * its recipient is our display name or when it comes from the active partner's
     * address. Anything network-originated that fails is contained here.
     */
    class MessageDispatcher {
        public:
            enum class Outcome {
                Handled,
                Ignored,     // not for us, from ourselves, or an unknown sender disconnecting
                UnknownType,
                Malformed,
                Failed       // a handler threw; logged and dropped
            };

            MessageDispatcher(const ChatConfig& config, PeerRegistry& registry, ChatSession& session,
                              DatagramSender& sender, ChatEventListener& listener);

            /**
             * Registers one of our own addresses so looped-back broadcasts are ignored.
             */
            void addSelfEndpoint(const Endpoint& endpoint);

            /**
             * Handles one datagram received from `from` at `now`. Never throws.
             */
            Outcome dispatch(const std::string& datagram, const Endpoint& from, TimePoint now) noexcept;

        private:
            Outcome route(const Message& msg, const Endpoint& from, TimePoint now);

            Outcome onPresence(const PresenceMessage& msg, const Endpoint& from, TimePoint now);
            Outcome onChat(const ChatMessage& msg, const Endpoint& from, TimePoint now);
            Outcome onDisconnect(const DisconnectMessage& msg, const Endpoint& from);
            void onRemoteCommand(const std::string& command, const Endpoint& from, TimePoint now);

            bool isForUs(const std::string& recipient, const Endpoint& from) const;
            bool isSelf(const Endpoint& from) const;

            const ChatConfig& config;
            PeerRegistry& registry;
            ChatSession& session;
            DatagramSender& sender;
            ChatEventListener& listener;

            mutable std::mutex selfMtx;
            std::vector<Endpoint> selfEndpoints;
    };

} // namespace p2pchat

#endif // P2PCHAT_MESSAGE_DISPATCHER_HPP
