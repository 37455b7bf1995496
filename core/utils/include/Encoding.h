#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace TermXfer {

/**
 * @brief Text encodings used on the escape-code channel.
 *
 * Base64 is the unpadded standard alphabet; decoding also accepts padded
 * input. Digest and random helpers are backed by OpenSSL libcrypto.
 */
class Encoding {
public:
    static std::string base64Encode(const uint8_t* data, size_t len);
    static std::string base64Encode(const std::vector<uint8_t>& data) {
        return base64Encode(data.data(), data.size());
    }
    static std::string base64Encode(const std::string& text) {
        return base64Encode(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    }

    /**
     * @throws std::invalid_argument if the input is not valid base64
     */
    static std::vector<uint8_t> base64Decode(const std::string& encoded);

    static std::string toHex(const uint8_t* data, size_t len);
    static std::string sha256Hex(const std::string& text);
    static std::vector<uint8_t> randomBytes(size_t count);

    /**
     * @brief Drop every character outside [0-9a-zA-Z_:./@-]
     */
    static std::string safeString(const std::string& value);

    /**
     * @brief Replace C0/C1 control characters so the text is inert on a terminal
     */
    static std::string sanitizeControlCodes(const std::string& text, char replacement = '?');
};

} // namespace TermXfer
