#include "p2pchat/MessageDispatcher.hpp"
#include <algorithm>
#include <iostream>
#include <type_traits>

namespace p2pchat {

    MessageDispatcher::MessageDispatcher(const ChatConfig& cfg, PeerRegistry& reg, ChatSession& chat,
                                         DatagramSender& out, ChatEventListener& events)
        : config(cfg), registry(reg), session(chat), sender(out), listener(events) {}

    void MessageDispatcher::addSelfEndpoint(const Endpoint& endpoint) {
        std::lock_guard<std::mutex> lock(selfMtx);
        if (std::find(selfEndpoints.begin(), selfEndpoints.end(), endpoint) == selfEndpoints.end()) {
            selfEndpoints.push_back(endpoint);
        }
    }

    bool MessageDispatcher::isSelf(const Endpoint& from) const {
        std::lock_guard<std::mutex> lock(selfMtx);
        return std::find(selfEndpoints.begin(), selfEndpoints.end(), from) != selfEndpoints.end();
    }

    bool MessageDispatcher::isForUs(const std::string& recipient, const Endpoint& from) const {
        return recipient == config.displayName || session.isPartner(from);
    }

    MessageDispatcher::Outcome MessageDispatcher::dispatch(const std::string& datagram, const Endpoint& from,
                                                           TimePoint now) noexcept {
        try {
            Message msg;
            std::string error;

            switch (decodeMessage(datagram, msg, error)) {
                case DecodeStatus::Malformed:
                    std::cerr << "MessageDispatcher: invalid message from " << from.key() << ": " << error << std::endl;
                    return Outcome::Malformed;
                case DecodeStatus::UnknownType:
                    return Outcome::UnknownType;
                case DecodeStatus::Ok:
                    break;
            }

            if (isSelf(from)) return Outcome::Ignored;
            return route(msg, from, now);
        } catch (const std::exception& e) {
            std::cerr << "MessageDispatcher: error handling message from " << from.key() << ": " << e.what() << std::endl;
            return Outcome::Failed;
        }
    }

    MessageDispatcher::Outcome MessageDispatcher::route(const Message& message, const Endpoint& from, TimePoint now) {
        return std::visit([&](const auto& msg) -> Outcome {
            using T = std::decay_t<decltype(msg)>;

            if constexpr (std::is_same_v<T, PresenceMessage>) {
                return onPresence(msg, from, now);
            } else if constexpr (std::is_same_v<T, DisconnectMessage>) {
                return onDisconnect(msg, from);
            } else {
                // any direct message counts as having heard from the peer
                registry.upsert(from, msg.sender, now);
                if (!isForUs(msg.recipient, from)) return Outcome::Ignored;

                if constexpr (std::is_same_v<T, ChatMessage>) {
                    return onChat(msg, from, now);
                } else if constexpr (std::is_same_v<T, TypingMessage>) {
                    listener.onTyping(from, msg.sender);
                } else if constexpr (std::is_same_v<T, ReadReceiptMessage>) {
                    listener.onReadReceipt(from, msg.sender);
                } else if constexpr (std::is_same_v<T, FileOfferMessage>) {
                    session.receiveFileOffer(from, FileOffer{msg.filename, msg.size, msg.hash, msg.sender});
                }
                return Outcome::Handled;
            }
        }, message);
    }

    MessageDispatcher::Outcome MessageDispatcher::onPresence(const PresenceMessage& msg, const Endpoint& from,
                                                             TimePoint now) {
        if (msg.probe) {
            // discovery probes come from a throwaway port: answer, don't register
            PresenceMessage reply;
            reply.sender = config.displayName;
            reply.timestamp = toWireTimestamp(now);
            sender.sendTo(reply, from);
            return Outcome::Handled;
        }

        registry.upsert(from, msg.sender, now);
        return Outcome::Handled;
    }

    MessageDispatcher::Outcome MessageDispatcher::onChat(const ChatMessage& msg, const Endpoint& from, TimePoint now) {
        if (msg.text[0] == COMMAND_SIGIL) {
            onRemoteCommand(msg.text, from, now);
            return Outcome::Handled;
        }

        listener.onChatMessage(from, msg.sender, msg.text, now);
        session.adoptIfIdle(from);

        if (config.sendReadReceipts && session.isPartner(from)) {
            session.sendReadReceipt(from, msg.sender, now);
        }
        return Outcome::Handled;
    }

    void MessageDispatcher::onRemoteCommand(const std::string& text, const Endpoint& from, TimePoint now) {
        const std::string command = text.substr(0, text.find(' '));

        if (command == "/quit") {
            // the peer left; don't re-adopt it below
            session.endWith(from);
            return;
        }

        if (command == "/list") {
            session.listPeers(now);
        } else if (command == "/help") {
            session.showHelp();
        } else {
            listener.onNotice("Ignored command " + command + " from " + from.key());
        }
        session.adoptIfIdle(from);
    }

    MessageDispatcher::Outcome MessageDispatcher::onDisconnect(const DisconnectMessage& msg, const Endpoint& from) {
        auto peer = registry.get(from.key());
        if (!peer) return Outcome::Ignored;

        listener.onPeerDisconnected(from, msg.sender.value_or(peer->name));
        session.endWith(from);
        registry.remove(from.key());
        return Outcome::Handled;
    }

} // namespace p2pchat
