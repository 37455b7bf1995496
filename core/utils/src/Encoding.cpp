#include "Encoding.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace TermXfer {

std::string Encoding::base64Encode(const uint8_t* data, size_t len) {
    if (len == 0) {
        return {};
    }
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(static_cast<size_t>(written));
    while (!out.empty() && out.back() == '=') {
        out.pop_back();
    }
    return out;
}

std::vector<uint8_t> Encoding::base64Decode(const std::string& encoded) {
    std::string padded = encoded;
    while (!padded.empty() && padded.back() == '=') {
        padded.pop_back();
    }
    if (padded.size() % 4 == 1) {
        throw std::invalid_argument("Invalid base64 length");
    }
    size_t padding = (4 - padded.size() % 4) % 4;
    padded.append(padding, '=');
    if (padded.empty()) {
        return {};
    }

    std::vector<uint8_t> out(padded.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(padded.data()),
                            static_cast<int>(padded.size()));
    if (n < 0) {
        throw std::invalid_argument("Invalid base64 data");
    }
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

std::string Encoding::toHex(const uint8_t* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

std::string Encoding::sha256Hex(const std::string& text) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        throw std::runtime_error("Failed to allocate EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, text.data(), text.size()) != 1 ||
        EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("Failed to compute SHA-256 digest");
    }
    EVP_MD_CTX_free(ctx);
    return toHex(hash, hashLen);
}

std::vector<uint8_t> Encoding::randomBytes(size_t count) {
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return out;
}

std::string Encoding::safeString(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
            c == '_' || c == ':' || c == '.' || c == '/' || c == '@' || c == '-') {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string Encoding::sanitizeControlCodes(const std::string& text, char replacement) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (c < 0x20 || c == 0x7f) {
            out.push_back(replacement);
            continue;
        }
        // C1 controls are U+0080..U+009F, encoded as 0xC2 0x80..0x9F
        if (c == 0xC2 && i + 1 < text.size()) {
            unsigned char next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x80 && next <= 0x9F) {
                out.push_back(replacement);
                ++i;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

} // namespace TermXfer
