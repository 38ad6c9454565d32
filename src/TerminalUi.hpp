#ifndef P2PCHAT_TERMINAL_UI_HPP
#define P2PCHAT_TERMINAL_UI_HPP

#include "p2pchat/ChatEvents.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace p2pchat {

    /**
     * Plain-text rendering of chat events on stdout/stderr.
     */
    class TerminalUi : public ChatEventListener {
        public:
            void onChatMessage(const Endpoint& from, const std::string& name,
                               const std::string& text, TimePoint when) override;
            void onOwnMessage(const std::string& text, TimePoint when) override;
            void onTyping(const Endpoint& from, const std::string& name) override;
            void onReadReceipt(const Endpoint& from, const std::string& name) override;
            void onFileOffer(const Endpoint& from, const FileOffer& offer) override;
            void onFileOfferSent(const FileOffer& offer) override;
            void onFileOfferAnswered(const FileOffer& offer, bool accepted) override;
            void onPeerDisconnected(const Endpoint& from, const std::string& name) override;
            void onChatStarted(const PeerInfo& partner) override;
            void onChatEnded(const PeerInfo& partner) override;
            void onPeerList(const std::vector<PeerInfo>& peers, TimePoint now) override;
            void onHelp() override;
            void onClearScreen() override;
            void onNotice(const std::string& text) override;
            void onError(const std::string& text) override;

            void print(const std::string& line);

        private:
            std::mutex outMtx;
    };

    /**
     * Reads whole lines from stdin without blocking longer than the poll timeout,
     * so the caller can keep checking for shutdown between keystrokes.
     */
    class StdinLineReader {
        public:
            enum class Status { Line, Timeout, Closed };

            Status poll(std::chrono::milliseconds timeout, std::string& line);

        private:
            bool takeLine(std::string& line);

            std::string buffer;
            bool closed = false;
    };

} // namespace p2pchat

#endif // P2PCHAT_TERMINAL_UI_HPP
