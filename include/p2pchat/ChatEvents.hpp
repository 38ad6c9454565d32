#ifndef P2PCHAT_CHAT_EVENTS_HPP
#define P2PCHAT_CHAT_EVENTS_HPP

#include "FileOffer.hpp"
#include "Message.hpp"
#include "PeerRegistry.hpp"
#include <string>
#include <vector>

namespace p2pchat {

    /**
     * Outbound side of the protocol core. ChatNode sends over its UDP socket;
     * tests record what would have been sent.
     */
    class DatagramSender {
    public:
        virtual ~DatagramSender() = default;

        /**
         * Encodes and sends one datagram. Returns false on a send failure, which
         * the implementation has already logged. Never throws.
         */
        virtual bool sendTo(const Message& msg, const Endpoint& to) = 0;
    };

    /**
     * Everything the core reports to the user. The terminal front end renders
     * these; the core itself never touches stdin or stdout. Callbacks may run on
     * dispatch worker threads. Default implementations ignore the event.
     */
    class ChatEventListener {
    public:
        virtual ~ChatEventListener() = default;

        virtual void onChatMessage(const Endpoint& from, const std::string& name,
                                   const std::string& text, TimePoint when) {}
        virtual void onOwnMessage(const std::string& text, TimePoint when) {}
        virtual void onTyping(const Endpoint& from, const std::string& name) {}
        virtual void onReadReceipt(const Endpoint& from, const std::string& name) {}
        virtual void onFileOffer(const Endpoint& from, const FileOffer& offer) {}
        virtual void onFileOfferSent(const FileOffer& offer) {}
        virtual void onFileOfferAnswered(const FileOffer& offer, bool accepted) {}
        virtual void onPeerDisconnected(const Endpoint& from, const std::string& name) {}
        virtual void onChatStarted(const PeerInfo& partner) {}
        virtual void onChatEnded(const PeerInfo& partner) {}
        virtual void onPeerList(const std::vector<PeerInfo>& peers, TimePoint now) {}
        virtual void onHelp() {}
        virtual void onClearScreen() {}
        virtual void onNotice(const std::string& text) {}
        virtual void onError(const std::string& text) {}
    };

} // namespace p2pchat

#endif // P2PCHAT_CHAT_EVENTS_HPP
