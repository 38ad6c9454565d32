#include "p2pchat/Network.hpp"

namespace p2pchat {

    Endpoint fromUdp(const udp::endpoint& ep) {
        return Endpoint{ep.address().to_string(), ep.port()};
    }

    bool toUdp(const Endpoint& ep, udp::endpoint& out) {
        boost::system::error_code ec;
        auto address = boost::asio::ip::make_address(ep.host, ec);
        if (ec) return false;
        out = udp::endpoint(address, ep.port);
        return true;
    }

    std::string localPrimaryAddress() {
        boost::asio::io_context io;
        udp::socket probe(io);
        boost::system::error_code ec;

        probe.connect(udp::endpoint(boost::asio::ip::make_address_v4("8.8.8.8"), 80), ec);
        if (ec) return "127.0.0.1";

        auto local = probe.local_endpoint(ec);
        if (ec) return "127.0.0.1";
        return local.address().to_string();
    }

    std::string localHostName() {
        boost::system::error_code ec;
        std::string name = boost::asio::ip::host_name(ec);
        if (ec || name.empty()) return "anonymous";
        return name;
    }

} // namespace p2pchat
