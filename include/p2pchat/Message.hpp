#ifndef P2PCHAT_MESSAGE_HPP
#define P2PCHAT_MESSAGE_HPP

#include "Types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace p2pchat {

    // ============================================================
    //  MESSAGE KINDS
    // ============================================================
    enum class MessageType : uint8_t {
        PRESENCE     = 1,
        CHAT         = 2,
        TYPING       = 3,
        READ_RECEIPT = 4,
        FILE_OFFER   = 5,
        DISCONNECT   = 6
    };

    // ============================================================
    //  PER-KIND PAYLOADS
    // ============================================================
    struct PresenceMessage {
        std::string sender;
        std::optional<uint64_t> timestamp;
        bool probe = false; // discovery probe, answered with a unicast presence
    };

    struct ChatMessage {
        std::string sender;
        std::string recipient;
        std::string text;
        std::optional<uint64_t> timestamp;
    };

    struct TypingMessage {
        std::string sender;
        std::string recipient;
        std::optional<uint64_t> timestamp;
    };

    struct ReadReceiptMessage {
        std::string sender;
        std::string recipient;
        std::optional<uint64_t> timestamp;
    };

    struct FileOfferMessage {
        std::string sender;
        std::string recipient;
        std::string filename; // basename only
        uint64_t size = 0;
        std::string hash;     // SHA-256, lowercase hex
        std::optional<uint64_t> timestamp;
    };

    struct DisconnectMessage {
        std::optional<std::string> sender;
        std::optional<uint64_t> timestamp;
    };

    using Message = std::variant<PresenceMessage, ChatMessage, TypingMessage,
                                 ReadReceiptMessage, FileOfferMessage, DisconnectMessage>;

    bool operator==(const PresenceMessage& a, const PresenceMessage& b);
    bool operator==(const ChatMessage& a, const ChatMessage& b);
    bool operator==(const TypingMessage& a, const TypingMessage& b);
    bool operator==(const ReadReceiptMessage& a, const ReadReceiptMessage& b);
    bool operator==(const FileOfferMessage& a, const FileOfferMessage& b);
    bool operator==(const DisconnectMessage& a, const DisconnectMessage& b);

    enum class DecodeStatus {
        Ok,
        UnknownType, // well-formed datagram of a kind this build does not know
        Malformed
    };

    // ============================================================
    //  CODEC
    // ============================================================

    /** Serializes a Message to its datagram form:
     * version=1\ntype=<kind>\n<key>=<escaped value>\n...crc32=<8 hex>\n
     * The checksum covers every byte before the crc32 line.
     */
    std::string encodeMessage(const Message& msg);

    /** Parses a datagram into a Message.
     *  - Never throws. On UnknownType or Malformed, `error` says why and `out`
     *    is left untouched.
     *  - Missing optional fields stay absent; unknown keys are ignored.
     */
    DecodeStatus decodeMessage(const std::string& datagram, Message& out, std::string& error);

    /** Calcula el CRC32 de un buffer */
    uint32_t crc32_buf(const void* data, size_t len);

    MessageType messageType(const Message& msg);

    /** Wire name of a kind ("presence", "chat", ...). */
    std::string messageTypeToString(MessageType t);

    std::optional<MessageType> messageTypeFromString(const std::string& name);

    /** Display name of the sender, empty for an anonymous disconnect. */
    std::string senderName(const Message& msg);

} // namespace p2pchat

#endif // P2PCHAT_MESSAGE_HPP
