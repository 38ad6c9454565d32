#include "p2pchat/DiscoveryProbe.hpp"
#include "p2pchat/Message.hpp"
#include "p2pchat/Network.hpp"
#include <array>
#include <functional>
#include <iostream>
#include <utility>

namespace p2pchat {

    DiscoveryProbe::DiscoveryProbe(DiscoveryOptions opts) : options(std::move(opts)) {}

    std::vector<PeerInfo> DiscoveryProbe::run() {
        registry.clear();
        const std::string excluded = options.excludeAddress.value_or(localPrimaryAddress());

        boost::asio::io_context io;
        udp::socket sock(io);
        boost::system::error_code ec;

        sock.open(udp::v4(), ec);
        if (ec) throw BindError("Failed to open UDP socket: " + ec.message());
        sock.set_option(boost::asio::socket_base::broadcast(true), ec);
        if (ec) std::cerr << "DiscoveryProbe: cannot enable broadcast: " << ec.message() << std::endl;
        sock.bind(udp::endpoint(boost::asio::ip::address_v4::any(), 0), ec);
        if (ec) throw BindError("Failed to bind discovery socket: " + ec.message());

        // 1. Probe
        PresenceMessage probe;
        probe.sender = options.displayName;
        probe.timestamp = toWireTimestamp(Clock::now());
        probe.probe = true;

        udp::endpoint target;
        if (!toUdp(Endpoint{options.broadcastAddress, options.port}, target)) {
            std::cerr << "DiscoveryProbe: invalid broadcast address " << options.broadcastAddress << std::endl;
        } else {
            const std::string payload = encodeMessage(probe);
            sock.send_to(boost::asio::buffer(payload), target, 0, ec);
            if (ec) std::cerr << "DiscoveryProbe: failed to send probe: " << ec.message() << std::endl;
        }

        // 2. Collect replies until the window closes
        bool windowClosed = false;
        boost::asio::steady_timer deadline(io, options.window);
        deadline.async_wait([&sock, &windowClosed](const boost::system::error_code&) {
            windowClosed = true;
            boost::system::error_code ignored;
            sock.cancel(ignored);
        });

        std::array<char, MAX_DATAGRAM_SIZE + 1> buffer{};
        udp::endpoint sender;
        std::function<void()> receive = [&] {
            sock.async_receive_from(boost::asio::buffer(buffer), sender,
                [&](const boost::system::error_code& rec, size_t length) {
                    if (windowClosed || rec == boost::asio::error::operation_aborted) return;
                    if (!rec) {
                        Message msg;
                        std::string error;
                        const Endpoint from = fromUdp(sender);
                        const DecodeStatus status = decodeMessage(std::string(buffer.data(), length), msg, error);

                        if (status == DecodeStatus::Malformed) {
                            std::cerr << "DiscoveryProbe: invalid message from " << from.key() << ": " << error << std::endl;
                        } else if (status == DecodeStatus::Ok && from.host != excluded) {
                            if (auto presence = std::get_if<PresenceMessage>(&msg); presence && !presence->probe) {
                                registry.upsert(from, presence->sender, Clock::now());
                            }
                        }
                    }
                    receive();
                });
        };
        receive();

        io.run();

        sock.close(ec);
        return registry.snapshot();
    }

} // namespace p2pchat
