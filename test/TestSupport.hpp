#ifndef P2PCHAT_TEST_SUPPORT_HPP
#define P2PCHAT_TEST_SUPPORT_HPP

#include "p2pchat/ChatEvents.hpp"
#include "p2pchat/Message.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace p2pchat {
namespace testing_support {

    // -----------------------
    // Records outbound datagrams instead of sending them
    // -----------------------
    class RecordingSender : public DatagramSender {
    public:
        bool sendTo(const Message& msg, const Endpoint& to) override {
            std::lock_guard<std::mutex> lock(mtx);
            sent.emplace_back(msg, to);
            return !failSends;
        }

        std::vector<std::pair<Message, Endpoint>> all() const {
            std::lock_guard<std::mutex> lock(mtx);
            return sent;
        }

        size_t count() const {
            std::lock_guard<std::mutex> lock(mtx);
            return sent.size();
        }

        size_t countOf(MessageType type) const {
            std::lock_guard<std::mutex> lock(mtx);
            size_t n = 0;
            for (const auto& entry : sent) {
                if (messageType(entry.first) == type) ++n;
            }
            return n;
        }

        std::pair<Message, Endpoint> last() const {
            std::lock_guard<std::mutex> lock(mtx);
            return sent.back();
        }

        void setFailing(bool fail) {
            std::lock_guard<std::mutex> lock(mtx);
            failSends = fail;
        }

    private:
        mutable std::mutex mtx;
        std::vector<std::pair<Message, Endpoint>> sent;
        bool failSends = false;
    };

    // -----------------------
    // Records every event the core reports
    // -----------------------
    class RecordingListener : public ChatEventListener {
    public:
        struct Received {
            Endpoint from;
            std::string name;
            std::string text;
        };

        void onChatMessage(const Endpoint& from, const std::string& name,
                           const std::string& text, TimePoint) override {
            std::lock_guard<std::mutex> lock(mtx);
            chats.push_back({from, name, text});
        }
        void onOwnMessage(const std::string& text, TimePoint) override {
            std::lock_guard<std::mutex> lock(mtx);
            own.push_back(text);
        }
        void onTyping(const Endpoint&, const std::string& name) override {
            std::lock_guard<std::mutex> lock(mtx);
            typing.push_back(name);
        }
        void onReadReceipt(const Endpoint&, const std::string& name) override {
            std::lock_guard<std::mutex> lock(mtx);
            receipts.push_back(name);
        }
        void onFileOffer(const Endpoint&, const FileOffer& offer) override {
            std::lock_guard<std::mutex> lock(mtx);
            offers.push_back(offer);
        }
        void onFileOfferSent(const FileOffer& offer) override {
            std::lock_guard<std::mutex> lock(mtx);
            offersSent.push_back(offer);
        }
        void onFileOfferAnswered(const FileOffer&, bool accepted) override {
            std::lock_guard<std::mutex> lock(mtx);
            answers.push_back(accepted);
        }
        void onPeerDisconnected(const Endpoint& from, const std::string&) override {
            std::lock_guard<std::mutex> lock(mtx);
            disconnected.push_back(from);
        }
        void onChatStarted(const PeerInfo& partner) override {
            std::lock_guard<std::mutex> lock(mtx);
            started.push_back(partner);
        }
        void onChatEnded(const PeerInfo& partner) override {
            std::lock_guard<std::mutex> lock(mtx);
            ended.push_back(partner);
        }
        void onPeerList(const std::vector<PeerInfo>& peers, TimePoint) override {
            std::lock_guard<std::mutex> lock(mtx);
            lists.push_back(peers);
        }
        void onHelp() override {
            std::lock_guard<std::mutex> lock(mtx);
            ++helps;
        }
        void onClearScreen() override {
            std::lock_guard<std::mutex> lock(mtx);
            ++clears;
        }
        void onNotice(const std::string& text) override {
            std::lock_guard<std::mutex> lock(mtx);
            notices.push_back(text);
        }
        void onError(const std::string& text) override {
            std::lock_guard<std::mutex> lock(mtx);
            errors.push_back(text);
        }

        template <class F>
        auto read(F f) const {
            std::lock_guard<std::mutex> lock(mtx);
            return f(*this);
        }

        std::vector<Received> chats;
        std::vector<std::string> own;
        std::vector<std::string> typing;
        std::vector<std::string> receipts;
        std::vector<FileOffer> offers;
        std::vector<FileOffer> offersSent;
        std::vector<bool> answers;
        std::vector<Endpoint> disconnected;
        std::vector<PeerInfo> started;
        std::vector<PeerInfo> ended;
        std::vector<std::vector<PeerInfo>> lists;
        int helps = 0;
        int clears = 0;
        std::vector<std::string> notices;
        std::vector<std::string> errors;

    private:
        mutable std::mutex mtx;
    };

    // -----------------------
    // HELPER FUNCTIONS
    // -----------------------

    /** Polls `condition` until it holds or `timeout` expires. */
    inline bool waitFor(const std::function<bool()>& condition,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (condition()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    /** Appends the crc32 line to a hand-written datagram body. */
    inline std::string withChecksum(const std::string& body) {
        char hex[9];
        std::snprintf(hex, sizeof(hex), "%08x", crc32_buf(body.data(), body.size()));
        return body + "crc32=" + hex + "\n";
    }

    /** A file under the system temp directory, removed on destruction. */
    class TempFile {
    public:
        explicit TempFile(const std::string& contents, const std::string& name = "") {
            std::random_device rd;
            const std::string base = name.empty() ? "p2pchat_test_" + std::to_string(rd()) + ".bin" : name;
            dir = std::filesystem::temp_directory_path() / ("p2pchat_" + std::to_string(rd()));
            std::filesystem::create_directories(dir);
            filePath = dir / base;
            std::ofstream out(filePath, std::ios::binary);
            out << contents;
        }

        ~TempFile() {
            std::error_code ec;
            std::filesystem::remove_all(dir, ec);
        }

        std::string path() const { return filePath.string(); }
        std::string directory() const { return dir.string(); }

    private:
        std::filesystem::path dir;
        std::filesystem::path filePath;
    };

    inline PresenceMessage presenceFrom(const std::string& name) {
        PresenceMessage m;
        m.sender = name;
        m.timestamp = 1700000000000ULL;
        return m;
    }

    inline ChatMessage chatFrom(const std::string& sender, const std::string& recipient, const std::string& text) {
        ChatMessage m;
        m.sender = sender;
        m.recipient = recipient;
        m.text = text;
        m.timestamp = 1700000000000ULL;
        return m;
    }

} // namespace testing_support
} // namespace p2pchat

#endif // P2PCHAT_TEST_SUPPORT_HPP
