#ifndef P2PCHAT_NETWORK_HPP
#define P2PCHAT_NETWORK_HPP

#include "PeerRegistry.hpp"
#include <boost/asio.hpp>
#include <stdexcept>
#include <string>

namespace p2pchat {

    using udp = boost::asio::ip::udp;

    /** A UDP socket could not be opened or bound (port in use, permission denied). */
    class BindError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    Endpoint fromUdp(const udp::endpoint& ep);

    /** Returns false if the host is not a literal IPv4/IPv6 address. */
    bool toUdp(const Endpoint& ep, udp::endpoint& out);

    /**
     * Address of the interface that routes to the outside world, found by
     * connecting a UDP socket (no packet is sent). Falls back to 127.0.0.1.
     */
    std::string localPrimaryAddress();

    std::string localHostName();

} // namespace p2pchat

#endif // P2PCHAT_NETWORK_HPP
