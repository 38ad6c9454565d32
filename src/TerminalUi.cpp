#include "TerminalUi.hpp"
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace p2pchat {

    namespace {
        std::string clockTime(TimePoint when) {
            std::time_t t = Clock::to_time_t(when);
            std::tm local{};
            localtime_r(&t, &local);
            std::ostringstream out;
            out << std::put_time(&local, "%H:%M:%S");
            return out.str();
        }

        std::string who(const std::string& name, const Endpoint& from) {
            return (name.empty() ? std::string("?") : name) + "@" + from.host;
        }

        const char* HELP_TEXT =
            "\nAvailable commands:\n"
            "  /list             - List all available peers\n"
            "  /msg <ip[:port]>  - Switch chat to specific peer\n"
            "  /sendfile <file>  - Offer a file to current chat partner\n"
            "  /accept, /reject  - Answer a pending file offer\n"
            "  /clear            - Clear the screen\n"
            "  /quit             - Exit current chat or application\n"
            "  /help             - Show this help message\n"
            "\nUsage examples:\n"
            "  Start listening:  p2p-chat listen 5000\n"
            "  Connect to peer:  p2p-chat connect alice 192.168.1.100 5000\n"
            "  Discover peers:   p2p-chat discover 5000\n";
    }

    void TerminalUi::print(const std::string& line) {
        std::lock_guard<std::mutex> lock(outMtx);
        std::cout << line << std::endl;
    }

    void TerminalUi::onChatMessage(const Endpoint& from, const std::string& name,
                                   const std::string& text, TimePoint when) {
        print("\n[" + clockTime(when) + "] " + who(name, from) + ": " + text);
    }

    void TerminalUi::onOwnMessage(const std::string& text, TimePoint when) {
        print("\r[" + clockTime(when) + "] You: " + text);
    }

    void TerminalUi::onTyping(const Endpoint&, const std::string& name) {
        std::lock_guard<std::mutex> lock(outMtx);
        std::cout << "\r" << name << " is typing..." << std::flush;
    }

    void TerminalUi::onReadReceipt(const Endpoint&, const std::string& name) {
        print("\n[Message read by " + name + "]");
    }

    void TerminalUi::onFileOffer(const Endpoint& from, const FileOffer& offer) {
        std::ostringstream out;
        out << "\nFile offer from " << who(offer.sender, from) << ":\n"
            << "  Filename: " << offer.filename << "\n"
            << "  Size: " << offer.size << " bytes\n"
            << "  Hash: " << offer.hash.substr(0, 16) << "...\n"
            << "Accept file? Type /accept or /reject";
        print(out.str());
    }

    void TerminalUi::onFileOfferSent(const FileOffer& offer) {
        print("File offer sent: " + offer.filename + " (" + std::to_string(offer.size) + " bytes)\n"
              "Waiting for response...");
    }

    void TerminalUi::onFileOfferAnswered(const FileOffer& offer, bool accepted) {
        if (accepted) {
            print("Accepted " + offer.filename + ". Payload transfer is not available; only the offer was exchanged.");
        } else {
            print("File rejected");
        }
    }

    void TerminalUi::onPeerDisconnected(const Endpoint& from, const std::string& name) {
        print("\n" + who(name, from) + " has disconnected");
    }

    void TerminalUi::onChatStarted(const PeerInfo& partner) {
        print("Now chatting with " + who(partner.name, partner.endpoint));
    }

    void TerminalUi::onChatEnded(const PeerInfo& partner) {
        print("Left chat with " + who(partner.name, partner.endpoint));
    }

    void TerminalUi::onPeerList(const std::vector<PeerInfo>& peers, TimePoint now) {
        std::ostringstream out;
        out << "\nAvailable peers:\n";
        if (peers.empty()) {
            out << "  No peers discovered\n";
        } else {
            for (const auto& peer : peers) {
                out << "  " << peer.name << " @ " << peer.endpoint.key()
                    << " [" << (peer.isActive(now) ? "Active" : "Inactive") << "]\n";
            }
        }
        print(out.str());
    }

    void TerminalUi::onHelp() {
        print(HELP_TEXT);
    }

    void TerminalUi::onClearScreen() {
        std::lock_guard<std::mutex> lock(outMtx);
        std::cout << "\033[2J\033[H" << std::flush;
    }

    void TerminalUi::onNotice(const std::string& text) {
        print(text);
    }

    void TerminalUi::onError(const std::string& text) {
        std::lock_guard<std::mutex> lock(outMtx);
        std::cerr << text << std::endl;
    }

    // ------------------------------------------------------------
    // Lectura de stdin
    // ------------------------------------------------------------
    bool StdinLineReader::takeLine(std::string& line) {
        const size_t newline = buffer.find('\n');
        if (newline == std::string::npos) {
            if (!closed || buffer.empty()) return false;
            line.swap(buffer); // last line without a newline
            buffer.clear();
            return true;
        }
        line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        return true;
    }

    StdinLineReader::Status StdinLineReader::poll(std::chrono::milliseconds timeout, std::string& line) {
        if (takeLine(line)) return Status::Line;
        if (closed) return Status::Closed;

        pollfd fd{STDIN_FILENO, POLLIN, 0};
        const int ready = ::poll(&fd, 1, static_cast<int>(timeout.count()));
        if (ready <= 0) return Status::Timeout; // EINTR lands here too

        char chunk[1024];
        const ssize_t got = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (got < 0 && errno == EINTR) return Status::Timeout;
        if (got <= 0) closed = true;
        else buffer.append(chunk, static_cast<size_t>(got));

        if (takeLine(line)) return Status::Line;
        return closed ? Status::Closed : Status::Timeout;
    }

} // namespace p2pchat
