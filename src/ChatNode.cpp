#include "p2pchat/ChatNode.hpp"
#include <algorithm>
#include <iostream>
#include <utility>

namespace p2pchat {

    ChatNode::ChatNode(ChatConfig cfg, ChatEventListener& events)
        : config(std::move(cfg)),
          io(),
          workGuard(boost::asio::make_work_guard(io)),
          socket(io),
          chatSession(config, registry, *this, events),
          messageDispatcher(config, registry, chatSession, *this, events) {}

    ChatNode::~ChatNode() {
        stop();
    }

    void ChatNode::start() {
        if (running.load()) return;

        boost::system::error_code ec;
        socket.open(udp::v4(), ec);
        if (ec) throw BindError("Failed to open UDP socket: " + ec.message());

        socket.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (ec) std::cerr << "ChatNode: cannot set SO_REUSEADDR: " << ec.message() << std::endl;
        socket.set_option(boost::asio::socket_base::broadcast(true), ec);
        if (ec) std::cerr << "ChatNode: cannot enable broadcast: " << ec.message() << std::endl;

        socket.bind(udp::endpoint(boost::asio::ip::address_v4::any(), config.port), ec);
        if (ec) {
            boost::system::error_code closeError;
            socket.close(closeError);
            throw BindError("Failed to bind to port " + std::to_string(config.port) + ": " + ec.message());
        }

        boundPort.store(socket.local_endpoint(ec).port());

        // own broadcasts come back to us
        messageDispatcher.addSelfEndpoint(Endpoint{localPrimaryAddress(), boundPort.load()});
        messageDispatcher.addSelfEndpoint(Endpoint{"127.0.0.1", boundPort.load()});

        workers = std::make_unique<boost::asio::thread_pool>(std::max<size_t>(1, config.dispatchWorkers));
        running.store(true);

        if (config.broadcastPresence) {
            Endpoint target{config.broadcastAddress,
                            config.broadcastPort != 0 ? config.broadcastPort : boundPort.load()};
            broadcaster = std::make_unique<PresenceBroadcaster>(io, *this, config.displayName, target,
                                                                config.presenceInterval, config.presenceBackoff);
            broadcaster->start();
        }

        doReceive();

        ioThread = std::thread([this] {
            try {
                io.run();
            } catch (const std::exception& e) {
                std::cerr << "ChatNode: IO context error: " << e.what() << std::endl;
            }
        });
    }

    void ChatNode::stop() {
        if (!running.exchange(false)) return;

        if (broadcaster) broadcaster->stop();

        // close on the io thread, where the pending receive lives
        boost::asio::post(io, [this] { closeSocket(); });
        workGuard.reset();

        if (ioThread.joinable()) ioThread.join();
        if (workers) workers->join();

        closeSocket(); // no-op unless the io thread died before running the close
    }

    void ChatNode::closeSocket() {
        std::lock_guard<std::mutex> lock(sendMtx);
        if (!socket.is_open()) return;
        boost::system::error_code ec;
        socket.close(ec);
    }

    bool ChatNode::sendTo(const Message& msg, const Endpoint& to) {
        udp::endpoint destination;
        if (!toUdp(to, destination)) {
            std::cerr << "ChatNode: invalid destination address " << to.host << std::endl;
            return false;
        }

        const std::string payload = encodeMessage(msg);
        if (payload.size() > MAX_DATAGRAM_SIZE) {
            std::cerr << "ChatNode: refusing to send " << messageTypeToString(messageType(msg))
                      << " of " << payload.size() << " bytes to " << to.key() << std::endl;
            return false;
        }

        boost::system::error_code ec;
        {
            std::lock_guard<std::mutex> lock(sendMtx);
            if (!socket.is_open()) return false;
            socket.send_to(boost::asio::buffer(payload), destination, 0, ec);
        }

        if (ec) {
            std::cerr << "ChatNode: failed to send " << messageTypeToString(messageType(msg))
                      << " to " << to.key() << ": " << ec.message() << std::endl;
            return false;
        }
        return true;
    }

    void ChatNode::doReceive() {
        socket.async_receive_from(boost::asio::buffer(recvBuf), remote,
            [this](const boost::system::error_code& ec, size_t length) {
                if (ec) {
                    if (ec == boost::asio::error::operation_aborted || !running.load()) return;
                    std::cerr << "ChatNode: receive error: " << ec.message() << std::endl;
                } else {
                    onDatagram(length);
                }
                if (running.load() && socket.is_open()) doReceive();
            });
    }

    void ChatNode::onDatagram(size_t length) {
        if (pending.load() >= config.maxPendingDatagrams) {
            dropped++;
            std::cerr << "ChatNode: dispatch queue full, dropping datagram from "
                      << fromUdp(remote).key() << std::endl;
            return;
        }

        pending++;
        boost::asio::post(*workers, [this, datagram = std::string(recvBuf.data(), length), from = fromUdp(remote)] {
            messageDispatcher.dispatch(datagram, from, Clock::now());
            pending--;
        });
    }

} // namespace p2pchat
