#ifndef P2PCHAT_TYPES_HPP
#define P2PCHAT_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace p2pchat {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // ============================================================
    //  PROTOCOL
    // ============================================================
    inline constexpr uint32_t PROTOCOL_VERSION = 1;
    inline constexpr uint16_t DEFAULT_PORT = 5000;
    inline constexpr size_t   MAX_DATAGRAM_SIZE = 4096;
    inline constexpr size_t   SHA256_HEX_LENGTH = 64;
    inline constexpr char     COMMAND_SIGIL = '/';
    inline constexpr const char* DEFAULT_BROADCAST_ADDRESS = "255.255.255.255";

    // ============================================================
    //  TIMING
    // ============================================================
    inline constexpr std::chrono::seconds PRESENCE_INTERVAL{30};
    inline constexpr std::chrono::seconds PRESENCE_BACKOFF{5};
    inline constexpr std::chrono::seconds STALENESS_WINDOW{60};
    inline constexpr std::chrono::seconds TYPING_INTERVAL{3};
    inline constexpr std::chrono::seconds DISCOVERY_WINDOW{5};
    inline constexpr std::chrono::milliseconds INPUT_POLL{100};

    // ============================================================
    //  DISPATCH LIMITS
    // ============================================================
    inline constexpr size_t DISPATCH_WORKERS = 2;
    inline constexpr size_t MAX_PENDING_DATAGRAMS = 1024;

    /**
     * Per-process settings. Defaults match the constants above; main() fills
     * in the display name and port from the command line.
     */
    struct ChatConfig {
        std::string displayName;
        uint16_t port = DEFAULT_PORT;
        std::string broadcastAddress = DEFAULT_BROADCAST_ADDRESS;
        uint16_t broadcastPort = 0; // 0 = same as port
        bool broadcastPresence = true;
        bool sendReadReceipts = true;
        std::chrono::milliseconds presenceInterval = PRESENCE_INTERVAL;
        std::chrono::milliseconds presenceBackoff = PRESENCE_BACKOFF;
        size_t dispatchWorkers = DISPATCH_WORKERS;
        size_t maxPendingDatagrams = MAX_PENDING_DATAGRAMS;
    };

    /** Milliseconds since the Unix epoch, as carried in the timestamp field. */
    inline uint64_t toWireTimestamp(TimePoint t) {
        return static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count());
    }

    inline TimePoint fromWireTimestamp(uint64_t ms) {
        return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
    }

} // namespace p2pchat

#endif // P2PCHAT_TYPES_HPP
