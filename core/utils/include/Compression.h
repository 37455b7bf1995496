#pragma once

/**
 * @file Compression.h
 * @brief Streaming compression used for file chunks on the wire.
 *
 * Uses zlib deflate/inflate in zlib (RFC 1950) format. A stream is fed
 * chunk by chunk; the compressor's flush() returns the trailer that must be
 * appended to the last chunk.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct z_stream_s;

namespace TermXfer {

enum class CompressionLevel {
    None = 0,
    Fast = 1,
    Default = 6,
    Best = 9
};

class StreamCompressor {
public:
    virtual ~StreamCompressor() = default;

    virtual std::vector<uint8_t> compress(const uint8_t* data, size_t len) = 0;
    virtual std::vector<uint8_t> flush() = 0;
    virtual bool isIdentity() const { return false; }

    std::vector<uint8_t> compress(const std::vector<uint8_t>& data) {
        return compress(data.data(), data.size());
    }
};

class StreamDecompressor {
public:
    virtual ~StreamDecompressor() = default;

    /**
     * @brief Decompress one chunk of the stream
     * @param isLast true for the final chunk; the stream must then be complete
     * @throws std::runtime_error on corrupt input
     */
    virtual std::vector<uint8_t> decompress(const uint8_t* data, size_t len, bool isLast) = 0;

    std::vector<uint8_t> decompress(const std::vector<uint8_t>& data, bool isLast = false) {
        return decompress(data.data(), data.size(), isLast);
    }
};

class IdentityCompressor : public StreamCompressor {
public:
    using StreamCompressor::compress;
    std::vector<uint8_t> compress(const uint8_t* data, size_t len) override {
        return std::vector<uint8_t>(data, data + len);
    }
    std::vector<uint8_t> flush() override { return {}; }
    bool isIdentity() const override { return true; }
};

class IdentityDecompressor : public StreamDecompressor {
public:
    using StreamDecompressor::decompress;
    std::vector<uint8_t> decompress(const uint8_t* data, size_t len, bool) override {
        return std::vector<uint8_t>(data, data + len);
    }
};

class ZlibCompressor : public StreamCompressor {
public:
    explicit ZlibCompressor(CompressionLevel level = CompressionLevel::Default);
    ~ZlibCompressor() override;

    ZlibCompressor(const ZlibCompressor&) = delete;
    ZlibCompressor& operator=(const ZlibCompressor&) = delete;

    using StreamCompressor::compress;

    std::vector<uint8_t> compress(const uint8_t* data, size_t len) override;
    std::vector<uint8_t> flush() override;

private:
    std::unique_ptr<z_stream_s> stream_;
    bool finished_ = false;
};

class ZlibDecompressor : public StreamDecompressor {
public:
    ZlibDecompressor();
    ~ZlibDecompressor() override;

    ZlibDecompressor(const ZlibDecompressor&) = delete;
    ZlibDecompressor& operator=(const ZlibDecompressor&) = delete;

    using StreamDecompressor::decompress;

    std::vector<uint8_t> decompress(const uint8_t* data, size_t len, bool isLast) override;

private:
    std::unique_ptr<z_stream_s> stream_;
    bool streamEnded_ = false;
};

/**
 * @brief Minimum file size for which compression is attempted
 */
constexpr int64_t MIN_COMPRESS_SIZE = 4096;

/**
 * @brief Guess from the file name whether content is worth compressing.
 *
 * Archives, compressed streams and media containers return false.
 */
bool shouldBeCompressed(const std::string& path);

} // namespace TermXfer
