#include <iostream>
#include <csignal>
#include <atomic>
#include <optional>
#include <string>
#include <utility>

#include "p2pchat/ChatNode.hpp"
#include "p2pchat/DiscoveryProbe.hpp"
#include "p2pchat/Network.hpp"
#include "TerminalUi.hpp"

using namespace p2pchat;

static std::atomic<bool> g_running(true);

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

static void usage() {
    std::cout << "Usage:\n"
              << "  p2p-chat listen [port]\n"
              << "  p2p-chat connect <username> <ip> [port]\n"
              << "  p2p-chat discover [port]" << std::endl;
}

static std::optional<uint16_t> parsePort(int argc, char** argv, int index) {
    if (argc <= index) return DEFAULT_PORT;
    try {
        size_t used = 0;
        unsigned long value = std::stoul(argv[index], &used);
        if (used == std::string(argv[index]).size() && value > 0 && value <= 65535) {
            return static_cast<uint16_t>(value);
        }
    } catch (const std::exception&) {}
    std::cerr << "Invalid port: " << argv[index] << std::endl;
    return std::nullopt;
}

static std::string promptDisplayName(StdinLineReader& reader) {
    std::cout << "Enter your username: " << std::flush;
    std::string line;
    while (g_running) {
        auto status = reader.poll(INPUT_POLL, line);
        if (status == StdinLineReader::Status::Closed) break;
        if (status == StdinLineReader::Status::Line) {
            auto begin = line.find_first_not_of(" \t\r");
            if (begin == std::string::npos) break;
            auto end = line.find_last_not_of(" \t\r");
            return line.substr(begin, end - begin + 1);
        }
    }
    return localHostName();
}

static std::optional<Endpoint> resolvePeer(const std::string& host, uint16_t port) {
    boost::asio::io_context io;
    udp::resolver resolver(io);
    boost::system::error_code ec;
    auto results = resolver.resolve(udp::v4(), host, std::to_string(port), ec);
    if (ec || results.empty()) {
        std::cerr << "Cannot resolve " << host << ": " << ec.message() << std::endl;
        return std::nullopt;
    }
    return fromUdp(results.begin()->endpoint());
}

/**
 * Interactive loop shared by listen and connect. In connect mode the loop ends
 * once the conversation with the connected peer is over.
 */
static void runChat(ChatNode& node, StdinLineReader& reader, bool exitWhenIdle) {
    ChatSession& session = node.session();
    std::string line;

    while (g_running) {
        if (exitWhenIdle && !session.isActive()) break;

        auto status = reader.poll(INPUT_POLL, line);
        if (status == StdinLineReader::Status::Closed) break;
        if (status != StdinLineReader::Status::Line) continue;

        const auto now = Clock::now();
        if (!line.empty() && line[0] != COMMAND_SIGIL) session.notifyTyping(now);
        if (session.handleInput(line, now) == ChatSession::InputResult::Exit) break;
    }

    if (session.isActive()) session.quit(Clock::now());
}

static int runNode(ChatConfig config, const std::optional<std::pair<std::string, Endpoint>>& peer,
                   StdinLineReader& reader) {
    TerminalUi ui;
    ChatNode node(config, ui);

    try {
        node.start();
    } catch (const BindError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    ui.print("[*] Listening on port " + std::to_string(node.localPort()));
    ui.print("[*] Your username: " + node.settings().displayName);
    ui.print("[*] Your IP: " + localPrimaryAddress());

    if (peer) {
        node.session().connect(peer->second, peer->first, Clock::now());
    }
    ui.print("Type /help for commands");

    runChat(node, reader, peer.has_value());

    ui.print("Shutting down...");
    node.stop();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 1;
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    const std::string command = argv[1];
    StdinLineReader reader;

    if (command == "listen") {
        auto port = parsePort(argc, argv, 2);
        if (!port) return 1;

        ChatConfig config;
        config.port = *port;
        config.displayName = promptDisplayName(reader);
        return runNode(config, std::nullopt, reader);
    }

    if (command == "connect") {
        if (argc < 4) {
            std::cout << "Usage: p2p-chat connect <username> <ip> [port]" << std::endl;
            return 1;
        }
        const std::string peerName = argv[2];
        if (peerName.find_first_not_of(" \t") == std::string::npos) {
            std::cerr << "Peer username must not be empty" << std::endl;
            return 1;
        }
        auto port = parsePort(argc, argv, 4);
        if (!port) return 1;

        auto endpoint = resolvePeer(argv[3], *port);
        if (!endpoint) return 1;

        ChatConfig config;
        config.port = *port;
        config.displayName = promptDisplayName(reader);
        return runNode(config, std::make_pair(peerName, *endpoint), reader);
    }

    if (command == "discover") {
        auto port = parsePort(argc, argv, 2);
        if (!port) return 1;

        DiscoveryOptions options;
        options.displayName = localHostName();
        options.port = *port;

        std::cout << "Discovering peers on local network..." << std::endl;
        try {
            DiscoveryProbe probe(options);
            auto peers = probe.run();
            TerminalUi ui;
            ui.onPeerList(peers, Clock::now());
        } catch (const BindError& e) {
            std::cerr << e.what() << std::endl;
            return 1;
        }
        return 0;
    }

    std::cout << "Unknown command" << std::endl;
    usage();
    return 1;
}
