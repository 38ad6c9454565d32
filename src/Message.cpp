#include "p2pchat/Message.hpp"
#include <zlib.h>
#include <cctype>
#include <cstdio>
#include <map>
#include <stdexcept>
#include <sstream>
#include <type_traits>

namespace p2pchat {

    namespace {

        const std::string CRC_KEY = "crc32=";

        // ------------------------------------------------------------
        // Escapado de valores
        // ------------------------------------------------------------
        std::string escapeValue(const std::string& value) {
            std::string out;
            out.reserve(value.size());
            for (char c : value) {
                switch (c) {
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n";  break;
                    case '\r': out += "\\r";  break;
                    default:   out.push_back(c);
                }
            }
            return out;
        }

        bool unescapeValue(const std::string& raw, std::string& out) {
            out.clear();
            out.reserve(raw.size());
            for (size_t i = 0; i < raw.size(); ++i) {
                if (raw[i] != '\\') {
                    out.push_back(raw[i]);
                    continue;
                }
                if (++i == raw.size()) return false;
                switch (raw[i]) {
                    case '\\': out.push_back('\\'); break;
                    case 'n':  out.push_back('\n'); break;
                    case 'r':  out.push_back('\r'); break;
                    default:   return false;
                }
            }
            return true;
        }

        bool parseUnsigned(const std::string& text, uint64_t& value) {
            if (text.empty() || text.size() > 20) return false;
            for (char c : text) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
            try {
                value = std::stoull(text);
            } catch (const std::exception&) {
                return false;
            }
            return true;
        }

        bool isHexDigest(const std::string& text) {
            if (text.size() != SHA256_HEX_LENGTH) return false;
            for (char c : text) {
                if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }

        std::string crcHex(uint32_t crc) {
            char buf[9];
            std::snprintf(buf, sizeof(buf), "%08x", crc);
            return buf;
        }

        // ------------------------------------------------------------
        // Escritura de campos
        // ------------------------------------------------------------
        class FieldWriter {
        public:
            explicit FieldWriter(MessageType type) {
                put("version", std::to_string(PROTOCOL_VERSION));
                put("type", messageTypeToString(type));
            }

            void put(const std::string& key, const std::string& value) {
                body << key << '=' << escapeValue(value) << '\n';
            }

            void put(const std::string& key, const std::optional<uint64_t>& value) {
                if (value) put(key, std::to_string(*value));
            }

            std::string finish() const {
                std::string out = body.str();
                out += CRC_KEY + crcHex(crc32_buf(out.data(), out.size())) + "\n";
                return out;
            }

        private:
            std::ostringstream body;
        };

        using Fields = std::map<std::string, std::string>;

        // ------------------------------------------------------------
        // Lectura de campos
        // ------------------------------------------------------------
        class FieldReader {
        public:
            explicit FieldReader(const Fields& f) : fields(f) {}

            bool required(const std::string& key, std::string& out) {
                auto it = fields.find(key);
                if (it == fields.end() || it->second.empty()) {
                    error = "missing field '" + key + "'";
                    return false;
                }
                out = it->second;
                return true;
            }

            std::optional<std::string> optional(const std::string& key) const {
                auto it = fields.find(key);
                if (it == fields.end()) return std::nullopt;
                return it->second;
            }

            bool timestamp(std::optional<uint64_t>& out) {
                auto raw = optional("timestamp");
                if (!raw) return true;
                uint64_t value = 0;
                if (!parseUnsigned(*raw, value)) {
                    error = "invalid timestamp '" + *raw + "'";
                    return false;
                }
                out = value;
                return true;
            }

            const std::string& lastError() const { return error; }

        private:
            const Fields& fields;
            std::string error;
        };

        bool splitFields(const std::string& body, Fields& fields, std::string& error) {
            std::istringstream in(body);
            std::string line;
            while (std::getline(in, line)) {
                if (line.empty()) continue;
                const size_t eq = line.find('=');
                if (eq == std::string::npos || eq == 0) {
                    error = "line without key";
                    return false;
                }
                std::string value;
                if (!unescapeValue(line.substr(eq + 1), value)) {
                    error = "bad escape sequence";
                    return false;
                }
                if (!fields.emplace(line.substr(0, eq), value).second) {
                    error = "duplicate key '" + line.substr(0, eq) + "'";
                    return false;
                }
            }
            return true;
        }

        bool decodeFields(MessageType type, const Fields& fields, Message& out, std::string& error) {
            FieldReader reader(fields);
            bool ok = false;

            switch (type) {
                case MessageType::PRESENCE: {
                    PresenceMessage m;
                    ok = reader.required("sender", m.sender) && reader.timestamp(m.timestamp);
                    auto probe = reader.optional("probe");
                    m.probe = probe && *probe == "1";
                    if (ok) out = m;
                    break;
                }
                case MessageType::CHAT: {
                    ChatMessage m;
                    ok = reader.required("sender", m.sender) && reader.required("recipient", m.recipient)
                        && reader.required("text", m.text) && reader.timestamp(m.timestamp);
                    if (ok) out = m;
                    break;
                }
                case MessageType::TYPING: {
                    TypingMessage m;
                    ok = reader.required("sender", m.sender) && reader.required("recipient", m.recipient)
                        && reader.timestamp(m.timestamp);
                    if (ok) out = m;
                    break;
                }
                case MessageType::READ_RECEIPT: {
                    ReadReceiptMessage m;
                    ok = reader.required("sender", m.sender) && reader.required("recipient", m.recipient)
                        && reader.timestamp(m.timestamp);
                    if (ok) out = m;
                    break;
                }
                case MessageType::FILE_OFFER: {
                    FileOfferMessage m;
                    std::string size;
                    ok = reader.required("sender", m.sender) && reader.required("recipient", m.recipient)
                        && reader.required("filename", m.filename) && reader.required("size", size)
                        && reader.required("hash", m.hash) && reader.timestamp(m.timestamp);
                    if (!ok) break;
                    if (!parseUnsigned(size, m.size)) {
                        error = "invalid size '" + size + "'";
                        return false;
                    }
                    if (!isHexDigest(m.hash)) {
                        error = "invalid hash";
                        return false;
                    }
                    if (m.filename.find('/') != std::string::npos || m.filename.find('\\') != std::string::npos
                        || m.filename == "." || m.filename == "..") {
                        error = "filename is not a basename";
                        return false;
                    }
                    out = m;
                    break;
                }
                case MessageType::DISCONNECT: {
                    DisconnectMessage m;
                    m.sender = reader.optional("sender");
                    ok = reader.timestamp(m.timestamp);
                    if (ok) out = m;
                    break;
                }
            }

            if (!ok) error = reader.lastError();
            return ok;
        }

        template <class> inline constexpr bool always_false = false;

    } // namespace

    // ------------------------------------------------------------
    // Igualdad
    // ------------------------------------------------------------
    bool operator==(const PresenceMessage& a, const PresenceMessage& b) {
        return a.sender == b.sender && a.timestamp == b.timestamp && a.probe == b.probe;
    }

    bool operator==(const ChatMessage& a, const ChatMessage& b) {
        return a.sender == b.sender && a.recipient == b.recipient && a.text == b.text && a.timestamp == b.timestamp;
    }

    bool operator==(const TypingMessage& a, const TypingMessage& b) {
        return a.sender == b.sender && a.recipient == b.recipient && a.timestamp == b.timestamp;
    }

    bool operator==(const ReadReceiptMessage& a, const ReadReceiptMessage& b) {
        return a.sender == b.sender && a.recipient == b.recipient && a.timestamp == b.timestamp;
    }

    bool operator==(const FileOfferMessage& a, const FileOfferMessage& b) {
        return a.sender == b.sender && a.recipient == b.recipient && a.filename == b.filename
            && a.size == b.size && a.hash == b.hash && a.timestamp == b.timestamp;
    }

    bool operator==(const DisconnectMessage& a, const DisconnectMessage& b) {
        return a.sender == b.sender && a.timestamp == b.timestamp;
    }

    // ------------------------------------------------------------
    // CRC32
    // ------------------------------------------------------------
    uint32_t crc32_buf(const void* data, size_t length) {
        return static_cast<uint32_t>(::crc32(0L,
            reinterpret_cast<const unsigned char*>(data),
            static_cast<uInt>(length)));
    }

    // ------------------------------------------------------------
    // SERIALIZACIÓN
    // ------------------------------------------------------------
    std::string encodeMessage(const Message& message) {
        FieldWriter writer(messageType(message));

        std::visit([&writer](const auto& m) {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, PresenceMessage>) {
                writer.put("sender", m.sender);
                if (m.probe) writer.put("probe", "1");
            } else if constexpr (std::is_same_v<T, ChatMessage>) {
                writer.put("sender", m.sender);
                writer.put("recipient", m.recipient);
                writer.put("text", m.text);
            } else if constexpr (std::is_same_v<T, TypingMessage> || std::is_same_v<T, ReadReceiptMessage>) {
                writer.put("sender", m.sender);
                writer.put("recipient", m.recipient);
            } else if constexpr (std::is_same_v<T, FileOfferMessage>) {
                writer.put("sender", m.sender);
                writer.put("recipient", m.recipient);
                writer.put("filename", m.filename);
                writer.put("size", std::to_string(m.size));
                writer.put("hash", m.hash);
            } else if constexpr (std::is_same_v<T, DisconnectMessage>) {
                if (m.sender) writer.put("sender", *m.sender);
            } else {
                static_assert(always_false<T>, "unhandled message kind");
            }
            writer.put("timestamp", m.timestamp);
        }, message);

        return writer.finish();
    }

    // ------------------------------------------------------------
    // PARSEO
    // ------------------------------------------------------------
    DecodeStatus decodeMessage(const std::string& datagram, Message& out, std::string& error) {
        if (datagram.empty()) {
            error = "empty datagram";
            return DecodeStatus::Malformed;
        }
        if (datagram.size() > MAX_DATAGRAM_SIZE) {
            error = "datagram exceeds " + std::to_string(MAX_DATAGRAM_SIZE) + " bytes";
            return DecodeStatus::Malformed;
        }

        // 1. Separar el checksum (ultima linea)
        std::string trimmed = datagram;
        if (trimmed.back() == '\n') trimmed.pop_back();
        size_t crcPos = trimmed.rfind('\n');
        crcPos = (crcPos == std::string::npos) ? 0 : crcPos + 1;
        if (trimmed.compare(crcPos, CRC_KEY.size(), CRC_KEY) != 0) {
            error = "missing checksum";
            return DecodeStatus::Malformed;
        }

        // 2. Validar CRC32
        const std::string body = trimmed.substr(0, crcPos);
        const std::string received = trimmed.substr(crcPos + CRC_KEY.size());
        if (received != crcHex(crc32_buf(body.data(), body.size()))) {
            error = "checksum mismatch";
            return DecodeStatus::Malformed;
        }

        // 3. Campos
        Fields fields;
        if (!splitFields(body, fields, error)) return DecodeStatus::Malformed;

        auto version = fields.find("version");
        if (version == fields.end() || version->second != std::to_string(PROTOCOL_VERSION)) {
            error = "unsupported protocol version";
            return DecodeStatus::Malformed;
        }

        auto typeField = fields.find("type");
        if (typeField == fields.end() || typeField->second.empty()) {
            error = "missing field 'type'";
            return DecodeStatus::Malformed;
        }
        auto type = messageTypeFromString(typeField->second);
        if (!type) {
            error = "unknown message type '" + typeField->second + "'";
            return DecodeStatus::UnknownType;
        }

        // 4. Construir mensaje final
        Message decoded;
        if (!decodeFields(*type, fields, decoded, error)) return DecodeStatus::Malformed;
        out = std::move(decoded);
        return DecodeStatus::Ok;
    }

    // ------------------------------------------------------------
    // UTILIDADES
    // ------------------------------------------------------------
    MessageType messageType(const Message& msg) {
        switch (msg.index()) {
            case 0:  return MessageType::PRESENCE;
            case 1:  return MessageType::CHAT;
            case 2:  return MessageType::TYPING;
            case 3:  return MessageType::READ_RECEIPT;
            case 4:  return MessageType::FILE_OFFER;
            default: return MessageType::DISCONNECT;
        }
    }

    std::string messageTypeToString(MessageType type) {
        switch (type) {
            case MessageType::PRESENCE:     return "presence";
            case MessageType::CHAT:         return "chat";
            case MessageType::TYPING:       return "typing";
            case MessageType::READ_RECEIPT: return "read_receipt";
            case MessageType::FILE_OFFER:   return "file_offer";
            case MessageType::DISCONNECT:   return "disconnect";
            default:                        return "unknown";
        }
    }

    std::optional<MessageType> messageTypeFromString(const std::string& name) {
        static const std::map<std::string, MessageType> kinds = {
            {"presence",     MessageType::PRESENCE},
            {"chat",         MessageType::CHAT},
            {"typing",       MessageType::TYPING},
            {"read_receipt", MessageType::READ_RECEIPT},
            {"file_offer",   MessageType::FILE_OFFER},
            {"disconnect",   MessageType::DISCONNECT},
        };
        auto it = kinds.find(name);
        if (it == kinds.end()) return std::nullopt;
        return it->second;
    }

    std::string senderName(const Message& msg) {
        return std::visit([](const auto& m) -> std::string {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, DisconnectMessage>) {
                return m.sender.value_or("");
            } else {
                return m.sender;
            }
        }, msg);
    }

} // namespace p2pchat
