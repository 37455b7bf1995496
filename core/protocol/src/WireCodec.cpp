#include "WireCodec.h"
#include "TransferErrors.h"
#include "Encoding.h"
#include "LoggerMacros.h"

#include <openssl/crypto.h>
#include <algorithm>
#include <charconv>
#include <functional>
#include <optional>
#include <sstream>
#include <unistd.h>

namespace TermXfer {

namespace {

const std::string COMPONENT = "WireCodec";

/**
 * One entry per wire key. encode returns nullopt when the field holds its
 * default and must be omitted.
 */
struct FieldCodec {
    const char* key;
    std::function<std::optional<std::string>(const Message&)> encode;
    std::function<void(Message&, const std::string&)> decode;
};

template<typename E>
FieldCodec enumField(const char* key, E Message::*member, E defaultValue,
                     bool (*parse)(const std::string&, E&)) {
    return FieldCodec{
        key,
        [member, defaultValue](const Message& m) -> std::optional<std::string> {
            if (m.*member == defaultValue) return std::nullopt;
            return std::string(toString(m.*member));
        },
        [key, member, parse](Message& m, const std::string& raw) {
            E value{};
            if (!parse(raw, value)) {
                throw ProtocolError(std::string("Unknown value for ") + key + ": " + raw);
            }
            m.*member = value;
        }
    };
}

FieldCodec intField(const char* key, int64_t Message::*member, int64_t defaultValue) {
    return FieldCodec{
        key,
        [member, defaultValue](const Message& m) -> std::optional<std::string> {
            if (m.*member == defaultValue) return std::nullopt;
            return std::to_string(m.*member);
        },
        [key, member](Message& m, const std::string& raw) {
            int64_t value = 0;
            auto first = raw.data();
            auto last = raw.data() + raw.size();
            auto [ptr, ec] = std::from_chars(first, last, value);
            if (ec != std::errc() || ptr != last || raw.empty()) {
                throw ProtocolError(std::string("Invalid integer for ") + key + ": " + raw);
            }
            m.*member = value;
        }
    };
}

FieldCodec safeStringField(const char* key, std::string Message::*member) {
    return FieldCodec{
        key,
        [member](const Message& m) -> std::optional<std::string> {
            if ((m.*member).empty()) return std::nullopt;
            return Encoding::safeString(m.*member);
        },
        [member](Message& m, const std::string& raw) {
            m.*member = Encoding::safeString(raw);
        }
    };
}

std::vector<uint8_t> decodeBase64Field(const char* key, const std::string& raw) {
    try {
        return Encoding::base64Decode(raw);
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(std::string("Invalid base64 in ") + key + ": " + e.what());
    }
}

FieldCodec textField(const char* key, std::string Message::*member) {
    return FieldCodec{
        key,
        [member](const Message& m) -> std::optional<std::string> {
            if ((m.*member).empty()) return std::nullopt;
            return Encoding::base64Encode(m.*member);
        },
        [key, member](Message& m, const std::string& raw) {
            auto bytes = decodeBase64Field(key, raw);
            m.*member = std::string(bytes.begin(), bytes.end());
        }
    };
}

FieldCodec bytesField(const char* key, std::vector<uint8_t> Message::*member) {
    return FieldCodec{
        key,
        [member](const Message& m) -> std::optional<std::string> {
            if ((m.*member).empty()) return std::nullopt;
            return Encoding::base64Encode(m.*member);
        },
        [key, member](Message& m, const std::string& raw) {
            m.*member = decodeBase64Field(key, raw);
        }
    };
}

const std::vector<FieldCodec>& fieldCodecs() {
    static const std::vector<FieldCodec> codecs = {
        enumField("ac", &Message::action, Action::Invalid, &parseAction),
        enumField("zip", &Message::compression, CompressionType::None, &parseCompression),
        enumField("ft", &Message::fileType, FileType::Regular, &parseFileType),
        enumField("tt", &Message::transmissionType, TransmissionType::Simple, &parseTransmissionType),
        safeStringField("id", &Message::transferId),
        safeStringField("fid", &Message::fileId),
        textField("pw", &Message::bypass),
        intField("q", &Message::quiet, 0),
        intField("mod", &Message::mtime, -1),
        intField("prm", &Message::permissions, -1),
        intField("sz", &Message::size, -1),
        textField("n", &Message::name),
        textField("st", &Message::status),
        safeStringField("pr", &Message::parent),
        bytesField("d", &Message::data),
    };
    return codecs;
}

const FieldCodec* findField(const std::string& key) {
    for (const auto& codec : fieldCodecs()) {
        if (key == codec.key) {
            return &codec;
        }
    }
    return nullptr;
}

void appendEscaped(std::string& out, const std::string& value) {
    for (char c : value) {
        out += c;
        if (c == ';') {
            out += ';';
        }
    }
}

const std::string OSC_PREFIX = "\x1b]" + std::to_string(FILE_TRANSFER_CODE) + ";";
const std::string ST = "\x1b\\";

} // namespace

std::string WireCodec::serialize(const Message& message) {
    std::string out;
    for (const auto& codec : fieldCodecs()) {
        auto value = codec.encode(message);
        if (!value) {
            continue;
        }
        if (!out.empty()) {
            out += ';';
        }
        out += codec.key;
        out += '=';
        appendEscaped(out, *value);
    }
    return out;
}

Message WireCodec::deserialize(const std::string& text) {
    Message message;
    size_t pos = 0;
    const size_t n = text.size();

    while (pos < n) {
        auto eq = text.find('=', pos);
        auto sep = text.find(';', pos);
        if (sep == pos) {
            // Empty pair
            ++pos;
            continue;
        }
        if (eq == std::string::npos || (sep != std::string::npos && sep < eq)) {
            throw ProtocolError("Malformed field in message: missing '='");
        }
        std::string key = text.substr(pos, eq - pos);

        std::string value;
        size_t i = eq + 1;
        while (i < n) {
            char c = text[i];
            if (c == ';') {
                if (i + 1 < n && text[i + 1] == ';') {
                    value += ';';
                    i += 2;
                    continue;
                }
                break;
            }
            value += c;
            ++i;
        }
        pos = i + 1;

        const FieldCodec* codec = findField(key);
        if (codec == nullptr) {
            LOG_DEBUG_COMP_IF("Ignoring unknown field: " + key, COMPONENT);
            continue;
        }
        codec->decode(message, value);
    }

    if (message.action == Action::Invalid) {
        throw ProtocolError("No valid action specified in message");
    }
    return message;
}

std::string WireCodec::wrapEscapeCode(const std::string& payload) {
    return OSC_PREFIX + payload + ST;
}

std::string WireCodec::unwrapEscapeCode(const std::string& envelope) {
    if (envelope.compare(0, OSC_PREFIX.size(), OSC_PREFIX) != 0) {
        throw ProtocolError("Not a file transfer escape code");
    }
    size_t end = envelope.size();
    if (end >= OSC_PREFIX.size() + ST.size() &&
        envelope.compare(end - ST.size(), ST.size(), ST) == 0) {
        end -= ST.size();
    } else if (end > OSC_PREFIX.size() && envelope[end - 1] == '\a') {
        end -= 1;
    } else {
        throw ProtocolError("Unterminated file transfer escape code");
    }
    return envelope.substr(OSC_PREFIX.size(), end - OSC_PREFIX.size());
}

std::string WireCodec::encodeBypass(const std::string& transferId, const std::string& secret) {
    return "sha256:" + Encoding::sha256Hex(transferId + ";" + secret);
}

bool WireCodec::checkBypass(const std::string& secret, const std::string& transferId,
                            const std::string& token) {
    auto colon = token.find(':');
    std::string scheme = colon == std::string::npos ? token : token.substr(0, colon);
    if (scheme != "sha256") {
        LOG_ERROR_COMP("Bypass token received with unsupported scheme: " + scheme, COMPONENT);
        return false;
    }
    if (secret.empty()) {
        return false;
    }
    std::string expected = encodeBypass(transferId, secret);
    return expected.size() == token.size() &&
           CRYPTO_memcmp(expected.data(), token.data(), token.size()) == 0;
}

std::vector<Message> WireCodec::splitForTransfer(const std::vector<uint8_t>& payload,
                                                 const std::string& transferId,
                                                 const std::string& fileId,
                                                 bool markLast,
                                                 size_t chunkSize) {
    std::vector<Message> messages;
    size_t offset = 0;
    while (offset < payload.size()) {
        size_t len = std::min(chunkSize, payload.size() - offset);
        bool last = offset + len >= payload.size();
        Message msg(markLast && last ? Action::EndData : Action::Data, transferId, fileId);
        msg.data.assign(payload.begin() + offset, payload.begin() + offset + len);
        messages.push_back(std::move(msg));
        offset += len;
    }
    return messages;
}

std::string WireCodec::randomTransferId() {
    std::ostringstream oss;
    oss << std::hex << static_cast<unsigned long>(::getpid());
    auto rnd = Encoding::randomBytes(2);
    return oss.str() + Encoding::toHex(rnd.data(), rnd.size());
}

} // namespace TermXfer
