#include "Compression.h"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <cstring>
#include <stdexcept>
#include <unordered_set>

namespace TermXfer {

namespace {
    constexpr size_t OUT_CHUNK = 32768;
}

ZlibCompressor::ZlibCompressor(CompressionLevel level)
    : stream_(std::make_unique<z_stream_s>()) {
    std::memset(stream_.get(), 0, sizeof(z_stream_s));
    if (deflateInit(stream_.get(), static_cast<int>(level)) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib deflate stream");
    }
}

ZlibCompressor::~ZlibCompressor() {
    deflateEnd(stream_.get());
}

std::vector<uint8_t> ZlibCompressor::compress(const uint8_t* data, size_t len) {
    if (finished_) {
        throw std::runtime_error("Cannot compress after the stream was flushed");
    }
    std::vector<uint8_t> compressed;
    if (len == 0) {
        return compressed;
    }

    stream_->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    stream_->avail_in = static_cast<uInt>(len);

    std::vector<uint8_t> outbuffer(OUT_CHUNK);
    do {
        stream_->next_out = outbuffer.data();
        stream_->avail_out = static_cast<uInt>(outbuffer.size());
        int ret = deflate(stream_.get(), Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR) {
            throw std::runtime_error("zlib deflate failed");
        }
        size_t produced = outbuffer.size() - stream_->avail_out;
        compressed.insert(compressed.end(), outbuffer.begin(), outbuffer.begin() + produced);
    } while (stream_->avail_out == 0);

    return compressed;
}

std::vector<uint8_t> ZlibCompressor::flush() {
    std::vector<uint8_t> trailer;
    if (finished_) {
        return trailer;
    }
    finished_ = true;

    stream_->next_in = nullptr;
    stream_->avail_in = 0;
    std::vector<uint8_t> outbuffer(OUT_CHUNK);
    int ret;
    do {
        stream_->next_out = outbuffer.data();
        stream_->avail_out = static_cast<uInt>(outbuffer.size());
        ret = deflate(stream_.get(), Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            throw std::runtime_error("zlib deflate failed while finishing stream");
        }
        size_t produced = outbuffer.size() - stream_->avail_out;
        trailer.insert(trailer.end(), outbuffer.begin(), outbuffer.begin() + produced);
    } while (ret != Z_STREAM_END);

    return trailer;
}

ZlibDecompressor::ZlibDecompressor()
    : stream_(std::make_unique<z_stream_s>()) {
    std::memset(stream_.get(), 0, sizeof(z_stream_s));
    if (inflateInit(stream_.get()) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib inflate stream");
    }
}

ZlibDecompressor::~ZlibDecompressor() {
    inflateEnd(stream_.get());
}

std::vector<uint8_t> ZlibDecompressor::decompress(const uint8_t* data, size_t len, bool isLast) {
    std::vector<uint8_t> decompressed;
    if (streamEnded_) {
        if (len > 0) {
            throw std::runtime_error("Data received after the end of the compressed stream");
        }
        return decompressed;
    }

    stream_->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
    stream_->avail_in = static_cast<uInt>(len);

    std::vector<uint8_t> outbuffer(OUT_CHUNK);
    while (true) {
        stream_->next_out = outbuffer.data();
        stream_->avail_out = static_cast<uInt>(outbuffer.size());
        int ret = inflate(stream_.get(), Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            throw std::runtime_error(std::string("zlib inflate failed: ") +
                                     (stream_->msg ? stream_->msg : "corrupt stream"));
        }
        size_t produced = outbuffer.size() - stream_->avail_out;
        decompressed.insert(decompressed.end(), outbuffer.begin(), outbuffer.begin() + produced);
        if (ret == Z_STREAM_END) {
            streamEnded_ = true;
            break;
        }
        // Spare output space means inflate consumed everything it could
        if (stream_->avail_out != 0) {
            break;
        }
    }

    if (isLast && !streamEnded_) {
        throw std::runtime_error("Compressed stream is truncated");
    }
    return decompressed;
}

bool shouldBeCompressed(const std::string& path) {
    static const std::unordered_set<std::string> incompressible = {
        "zip", "gz", "tgz", "bz2", "tbz2", "xz", "txz", "zst", "lz4", "lzma", "7z", "rar",
        "jar", "apk", "deb", "rpm", "whl", "epub", "docx", "xlsx", "pptx", "odt",
        "jpg", "jpeg", "png", "gif", "webp", "avif", "heic", "jxl",
        "mp3", "ogg", "opus", "flac", "aac", "m4a",
        "mp4", "m4v", "mkv", "webm", "avi", "mov", "wmv"
    };

    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return true;
    }
    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return incompressible.find(ext) == incompressible.end();
}

} // namespace TermXfer
