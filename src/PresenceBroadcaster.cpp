#include "p2pchat/PresenceBroadcaster.hpp"
#include <iostream>
#include <utility>

namespace p2pchat {

    PresenceBroadcaster::PresenceBroadcaster(boost::asio::io_context& io, DatagramSender& out,
                                             std::string displayName, Endpoint target,
                                             std::chrono::milliseconds every, std::chrono::milliseconds retry)
        : timer(io), sender(out), name(std::move(displayName)), broadcastTarget(std::move(target)),
          interval(every), backoff(retry) {}

    PresenceBroadcaster::~PresenceBroadcaster() {
        running.store(false);
    }

    void PresenceBroadcaster::start() {
        if (running.exchange(true)) return;
        boost::asio::post(timer.get_executor(), [this] { tick(); });
    }

    void PresenceBroadcaster::stop() {
        if (!running.exchange(false)) return;
        boost::asio::post(timer.get_executor(), [this] { timer.cancel(); });
    }

    void PresenceBroadcaster::tick() {
        if (!running.load()) return;

        PresenceMessage presence;
        presence.sender = name;
        presence.timestamp = toWireTimestamp(Clock::now());

        if (sender.sendTo(presence, broadcastTarget)) {
            sent++;
            schedule(interval);
        } else {
            failed++;
            std::cerr << "PresenceBroadcaster: error broadcasting presence, retrying in "
                      << backoff.count() << "ms" << std::endl;
            schedule(backoff);
        }
    }

    void PresenceBroadcaster::schedule(std::chrono::milliseconds delay) {
        timer.expires_after(delay);
        timer.async_wait([this](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            tick();
        });
    }

} // namespace p2pchat
