#include "p2pchat/ChatSession.hpp"
#include <cctype>
#include <utility>

namespace p2pchat {

    namespace {
        std::string trim(const std::string& s) {
            size_t begin = 0;
            size_t end = s.size();
            while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
            while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
            return s.substr(begin, end - begin);
        }

        // "/sendfile a b.txt" -> ("/sendfile", "a b.txt")
        std::pair<std::string, std::string> splitCommand(const std::string& line) {
            const size_t space = line.find_first_of(" \t");
            if (space == std::string::npos) return {line, ""};
            return {line.substr(0, space), trim(line.substr(space + 1))};
        }

        // receivers drop anything larger as malformed
        bool fitsDatagram(const Message& msg) {
            return encodeMessage(msg).size() <= MAX_DATAGRAM_SIZE;
        }
    }

    ChatSession::ChatSession(const ChatConfig& cfg, PeerRegistry& reg,
                             DatagramSender& out, ChatEventListener& events)
        : config(cfg), registry(reg), sender(out), listener(events) {}

    bool ChatSession::isActive() const {
        std::lock_guard<std::mutex> lock(mtx);
        return active.has_value();
    }

    std::optional<Endpoint> ChatSession::partner() const {
        std::lock_guard<std::mutex> lock(mtx);
        if (!active) return std::nullopt;
        return active->endpoint;
    }

    bool ChatSession::isPartner(const Endpoint& endpoint) const {
        std::lock_guard<std::mutex> lock(mtx);
        return active && active->endpoint == endpoint;
    }

    std::optional<PeerInfo> ChatSession::currentPartner() const {
        std::lock_guard<std::mutex> lock(mtx);
        return active;
    }

    std::string ChatSession::partnerName(const PeerInfo& partner) const {
        auto known = registry.get(partner.endpoint.key());
        if (known && !known->name.empty()) return known->name;
        return partner.name;
    }

    // ------------------------------------------------------------
    // Transiciones
    // ------------------------------------------------------------
    void ChatSession::connect(const Endpoint& endpoint, const std::string& name, TimePoint now) {
        registry.upsert(endpoint, name, now);
        PeerInfo peer{endpoint, name, now};
        {
            std::lock_guard<std::mutex> lock(mtx);
            active = peer;
            lastTyping.reset();
        }
        listener.onChatStarted(peer);

        PresenceMessage presence;
        presence.sender = config.displayName;
        presence.timestamp = toWireTimestamp(now);
        sender.sendTo(presence, endpoint);
    }

    bool ChatSession::selectPartner(const std::string& address) {
        auto peer = registry.resolve(address);
        if (!peer) {
            listener.onError("User " + address + " not found");
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(mtx);
            active = *peer;
            lastTyping.reset();
        }
        listener.onChatStarted(*peer);
        return true;
    }

    bool ChatSession::adoptIfIdle(const Endpoint& endpoint) {
        PeerInfo peer = registry.get(endpoint.key()).value_or(PeerInfo{endpoint, "", Clock::now()});
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (active) return false;
            active = peer;
            lastTyping.reset();
        }
        listener.onChatStarted(peer);
        return true;
    }

    bool ChatSession::endWith(const Endpoint& endpoint) {
        PeerInfo ended;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!active || active->endpoint != endpoint) return false;
            ended = *active;
            active.reset();
        }
        listener.onChatEnded(ended);
        return true;
    }

    bool ChatSession::quit(TimePoint now) {
        PeerInfo ended;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!active) return false;
            ended = *active;
            active.reset();
        }

        DisconnectMessage bye;
        bye.sender = config.displayName;
        bye.timestamp = toWireTimestamp(now);
        sender.sendTo(bye, ended.endpoint);

        ended.name = partnerName(ended);
        listener.onChatEnded(ended);
        return true;
    }

    // ------------------------------------------------------------
    // Acciones salientes
    // ------------------------------------------------------------
    bool ChatSession::sendChat(const std::string& text, TimePoint now) {
        auto partner = currentPartner();
        if (!partner) {
            listener.onError("No active chat. Use /msg <address> to pick a peer");
            return false;
        }

        ChatMessage msg;
        msg.sender = config.displayName;
        msg.recipient = partnerName(*partner);
        msg.text = text;
        msg.timestamp = toWireTimestamp(now);

        if (msg.recipient.empty()) {
            listener.onError("Partner " + partner->endpoint.key() + " has no known name yet");
            return false;
        }
        if (!fitsDatagram(msg)) {
            listener.onError("Message too long (limit " + std::to_string(MAX_DATAGRAM_SIZE) + " bytes per datagram)");
            return false;
        }

        if (!sender.sendTo(msg, partner->endpoint)) {
            listener.onError("Failed to send message to " + partner->endpoint.key());
            return false;
        }
        listener.onOwnMessage(text, now);
        return true;
    }

    bool ChatSession::notifyTyping(TimePoint now) {
        PeerInfo partner;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!active) return false;
            if (lastTyping && now - *lastTyping < TYPING_INTERVAL) return false;
            lastTyping = now;
            partner = *active;
        }

        TypingMessage msg;
        msg.sender = config.displayName;
        msg.recipient = partnerName(partner);
        msg.timestamp = toWireTimestamp(now);
        if (msg.recipient.empty()) return false;
        return sender.sendTo(msg, partner.endpoint);
    }

    bool ChatSession::sendReadReceipt(const Endpoint& to, const std::string& recipient, TimePoint now) {
        ReadReceiptMessage msg;
        msg.sender = config.displayName;
        msg.recipient = recipient;
        msg.timestamp = toWireTimestamp(now);
        return sender.sendTo(msg, to);
    }

    bool ChatSession::offerFile(const std::string& path, TimePoint now) {
        auto partner = currentPartner();
        if (!partner) {
            listener.onError("No active chat to send a file to");
            return false;
        }

        FileOffer offer;
        try {
            offer = buildFileOffer(path, config.displayName);
        } catch (const FileNotFoundError& e) {
            listener.onError(e.what());
            return false;
        } catch (const std::exception& e) {
            listener.onError(std::string("Cannot offer file: ") + e.what());
            return false;
        }

        FileOfferMessage msg;
        msg.sender = offer.sender;
        msg.recipient = partnerName(*partner);
        msg.filename = offer.filename;
        msg.size = offer.size;
        msg.hash = offer.hash;
        msg.timestamp = toWireTimestamp(now);

        if (msg.recipient.empty()) {
            listener.onError("Partner " + partner->endpoint.key() + " has no known name yet");
            return false;
        }
        if (!fitsDatagram(msg)) {
            listener.onError("File name too long to offer: " + offer.filename);
            return false;
        }

        if (!sender.sendTo(msg, partner->endpoint)) {
            listener.onError("Failed to send file offer to " + partner->endpoint.key());
            return false;
        }
        listener.onFileOfferSent(offer);
        return true;
    }

    // ------------------------------------------------------------
    // Ofertas entrantes
    // ------------------------------------------------------------
    void ChatSession::receiveFileOffer(const Endpoint& from, const FileOffer& offer) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            pendingOffer = PendingOffer{from, offer};
        }
        listener.onFileOffer(from, offer);
    }

    bool ChatSession::hasPendingOffer() const {
        std::lock_guard<std::mutex> lock(mtx);
        return pendingOffer.has_value();
    }

    bool ChatSession::answerFileOffer(bool accept) {
        FileOffer offer;
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (!pendingOffer) return false;
            offer = pendingOffer->offer;
            pendingOffer.reset();
        }
        listener.onFileOfferAnswered(offer, accept);
        return true;
    }

    // ------------------------------------------------------------
    // Comandos locales
    // ------------------------------------------------------------
    void ChatSession::listPeers(TimePoint now) {
        listener.onPeerList(registry.snapshot(), now);
    }

    void ChatSession::clearDisplay() {
        listener.onClearScreen();
    }

    void ChatSession::showHelp() {
        listener.onHelp();
    }

    ChatSession::InputResult ChatSession::handleInput(const std::string& rawLine, TimePoint now) {
        const std::string line = trim(rawLine);
        if (line.empty()) return InputResult::Continue;

        if (line[0] != COMMAND_SIGIL) {
            sendChat(line, now);
            return InputResult::Continue;
        }

        const auto [command, argument] = splitCommand(line);

        if (command == "/quit") {
            if (!quit(now)) return InputResult::Exit;
        } else if (command == "/list") {
            listPeers(now);
        } else if (command == "/clear") {
            clearDisplay();
        } else if (command == "/help") {
            showHelp();
        } else if (command == "/msg") {
            if (argument.empty()) listener.onError("Usage: /msg <address>");
            else selectPartner(argument);
        } else if (command == "/sendfile") {
            if (argument.empty()) listener.onError("Usage: /sendfile <path>");
            else offerFile(argument, now);
        } else if (command == "/accept" || command == "/reject") {
            if (!answerFileOffer(command == "/accept")) listener.onError("No pending file offer");
        } else {
            listener.onError("Unknown command " + command + ". Type /help for commands");
        }
        return InputResult::Continue;
    }

} // namespace p2pchat
