#ifndef P2PCHAT_CHAT_SESSION_HPP
#define P2PCHAT_CHAT_SESSION_HPP

#include "ChatEvents.hpp"
#include "FileOffer.hpp"
#include "PeerRegistry.hpp"
#include "Types.hpp"
#include <mutex>
#include <optional>
#include <string>

namespace p2pchat {

    /**
     * The single-conversation state machine: Idle, or Active(partner).
     *
     * Thread-safe. The input loop drives the outbound actions, dispatch workers
     * drive the inbound transitions. Listener callbacks are made without the
     * session lock held.
     */
    class ChatSession {
        public:
            enum class InputResult {
                Continue,
                Exit // /quit while idle
            };

            ChatSession(const ChatConfig& config, PeerRegistry& registry,
                        DatagramSender& sender, ChatEventListener& listener);

            ChatSession(const ChatSession&) = delete;
            ChatSession& operator=(const ChatSession&) = delete;

            const std::string& localName() const { return config.displayName; }

            bool isActive() const;
            std::optional<Endpoint> partner() const;
            bool isPartner(const Endpoint& endpoint) const;

            // ---------------- transitions ----------------

            /**
             * Explicit connect: registers the peer, makes it the partner and sends
             * it a unicast presence so it learns about us immediately.
             */
            void connect(const Endpoint& endpoint, const std::string& name, TimePoint now);

            /**
             * /msg <address>. Unknown addresses are reported and leave the state unchanged.
             */
            bool selectPartner(const std::string& address);

            /**
             * Makes `endpoint` the partner if the session is idle.
             * Returns true if the session was adopted.
             */
            bool adoptIfIdle(const Endpoint& endpoint);

            /**
             * The peer went away (disconnect datagram or remote /quit). Returns true if
             * it was the partner and the session is now idle.
             */
            bool endWith(const Endpoint& endpoint);

            /**
             * Local /quit: sends a disconnect to the partner and goes idle.
             * Returns false if there was no active chat.
             */
            bool quit(TimePoint now);

            // ---------------- outbound actions ----------------

            bool sendChat(const std::string& text, TimePoint now);

            /**
             * Call while the user is producing input. Sends a typing indicator to the
             * partner at most once per TYPING_INTERVAL.
             */
            bool notifyTyping(TimePoint now);

            bool sendReadReceipt(const Endpoint& to, const std::string& recipient, TimePoint now);

            /**
             * /sendfile <path>. Hashes the file and offers it to the partner.
             * A missing file is reported and nothing is sent.
             */
            bool offerFile(const std::string& path, TimePoint now);

            // ---------------- file offers from peers ----------------

            void receiveFileOffer(const Endpoint& from, const FileOffer& offer);
            bool hasPendingOffer() const;

            /**
             * /accept or /reject. The offer is dropped either way; no payload
             * transport exists, so accepting only reports that.
             */
            bool answerFileOffer(bool accept);

            // ---------------- local commands ----------------

            void listPeers(TimePoint now);
            void clearDisplay();
            void showHelp();

            /**
             * One line of user input: a /command or chat text for the partner.
             */
            InputResult handleInput(const std::string& line, TimePoint now);

        private:
            std::optional<PeerInfo> currentPartner() const;
            std::string partnerName(const PeerInfo& partner) const;

            const ChatConfig& config;
            PeerRegistry& registry;
            DatagramSender& sender;
            ChatEventListener& listener;

            mutable std::mutex mtx;
            std::optional<PeerInfo> active;
            std::optional<TimePoint> lastTyping;

            struct PendingOffer {
                Endpoint from;
                FileOffer offer;
            };
            std::optional<PendingOffer> pendingOffer;
    };

} // namespace p2pchat

#endif // P2PCHAT_CHAT_SESSION_HPP
