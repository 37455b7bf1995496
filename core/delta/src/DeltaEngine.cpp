#include "DeltaEngine.h"
#include "TransferErrors.h"
#include <openssl/evp.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace TermXfer {

namespace {

    constexpr size_t MAX_LITERAL = 64 * 1024;

    uint32_t readU32(const uint8_t* p) {
        return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
               (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
    }

    uint64_t readU64(const uint8_t* p) {
        return (static_cast<uint64_t>(readU32(p)) << 32) | readU32(p + 4);
    }

    size_t consume(JobBuffers& buffers, size_t count) {
        count = std::min(count, buffers.availIn);
        buffers.nextIn += count;
        buffers.availIn -= count;
        return count;
    }

} // namespace

// ---------------------------------------------------------------------------
// DeltaJob

JobStatus DeltaJob::iterate(JobBuffers& buffers) {
    flushPending(buffers);
    while (!hasPending() && !finished_) {
        if (!step(buffers)) {
            break;
        }
        flushPending(buffers);
    }
    return finished() ? JobStatus::Done : JobStatus::Blocked;
}

size_t DeltaJob::flushPending(JobBuffers& buffers) {
    size_t n = std::min(pending_.size() - pendingPos_, buffers.availOut);
    if (n == 0) {
        return 0;
    }
    std::memcpy(buffers.nextOut, pending_.data() + pendingPos_, n);
    buffers.nextOut += n;
    buffers.availOut -= n;
    pendingPos_ += n;
    if (pendingPos_ == pending_.size()) {
        pending_.clear();
        pendingPos_ = 0;
    }
    return n;
}

void DeltaJob::emit(const uint8_t* data, size_t len) {
    pending_.insert(pending_.end(), data, data + len);
}

void DeltaJob::emitU32(uint32_t value) {
    uint8_t buf[4] = {
        static_cast<uint8_t>(value >> 24), static_cast<uint8_t>(value >> 16),
        static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value)
    };
    emit(buf, sizeof(buf));
}

void DeltaJob::emitU64(uint64_t value) {
    emitU32(static_cast<uint32_t>(value >> 32));
    emitU32(static_cast<uint32_t>(value));
}

// ---------------------------------------------------------------------------
// DeltaEngine

uint32_t DeltaEngine::blockLengthFor(int64_t expectedSize) {
    if (expectedSize <= 0) {
        return DEFAULT_BLOCK_LENGTH;
    }
    auto bl = static_cast<uint32_t>(std::lround(std::sqrt(static_cast<double>(expectedSize))));
    return std::clamp(bl, MIN_BLOCK_LENGTH, MAX_BLOCK_LENGTH);
}

uint32_t DeltaEngine::calculateAdler32(const uint8_t* data, size_t len) {
    RollingAdler32 adler;
    adler.init(data, len);
    return adler.get();
}

std::vector<uint8_t> DeltaEngine::calculateStrong(const uint8_t* data, size_t len, uint32_t strongLength) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_Digest(data, len, hash, &hashLen, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to compute SHA-256 digest");
    }
    hashLen = std::min(hashLen, strongLength);
    return std::vector<uint8_t>(hash, hash + hashLen);
}

void Signature::buildIndex() {
    index.clear();
    index.reserve(blocks.size());
    for (size_t i = 0; i < blocks.size(); ++i) {
        index[blocks[i].weak].push_back(i);
    }
}

// ---------------------------------------------------------------------------
// SignatureJob

SignatureJob::SignatureJob(uint32_t blockLength, uint32_t strongLength)
    : blockLength_(blockLength), strongLength_(strongLength) {
    if (blockLength_ == 0 || blockLength_ > DeltaEngine::MAX_BLOCK_LENGTH) {
        throw std::invalid_argument("Invalid signature block length");
    }
    if (strongLength_ == 0 || strongLength_ > DeltaEngine::STRONG_LENGTH) {
        throw std::invalid_argument("Invalid strong hash length");
    }
    block_.reserve(blockLength_);
}

bool SignatureJob::step(JobBuffers& buffers) {
    if (!headerSent_) {
        emit(DeltaEngine::SIGNATURE_MAGIC, sizeof(DeltaEngine::SIGNATURE_MAGIC));
        emitU32(blockLength_);
        emitU32(strongLength_);
        headerSent_ = true;
        return true;
    }
    if (buffers.availIn > 0) {
        size_t take = std::min(static_cast<size_t>(blockLength_) - block_.size(), buffers.availIn);
        block_.insert(block_.end(), buffers.nextIn, buffers.nextIn + take);
        consume(buffers, take);
        if (block_.size() == blockLength_) {
            emitBlock();
        }
        return true;
    }
    if (buffers.eof) {
        if (!block_.empty()) {
            emitBlock();
        }
        markFinished();
        return true;
    }
    return false;
}

void SignatureJob::emitBlock() {
    emitU32(DeltaEngine::calculateAdler32(block_.data(), block_.size()));
    auto strong = DeltaEngine::calculateStrong(block_.data(), block_.size(), strongLength_);
    emit(strong.data(), strong.size());
    block_.clear();
}

// ---------------------------------------------------------------------------
// LoadSignatureJob

bool LoadSignatureJob::step(JobBuffers& buffers) {
    if (buffers.availIn > 0) {
        buffer_.insert(buffer_.end(), buffers.nextIn, buffers.nextIn + buffers.availIn);
        consume(buffers, buffers.availIn);

        size_t off = 0;
        if (!headerRead_ && buffer_.size() >= 12) {
            if (std::memcmp(buffer_.data(), DeltaEngine::SIGNATURE_MAGIC, 4) != 0) {
                throw ProtocolError("Invalid signature magic");
            }
            signature_.blockLength = readU32(buffer_.data() + 4);
            signature_.strongLength = readU32(buffer_.data() + 8);
            if (signature_.blockLength == 0 || signature_.blockLength > DeltaEngine::MAX_BLOCK_LENGTH) {
                throw ProtocolError("Signature has invalid block length: " + std::to_string(signature_.blockLength));
            }
            if (signature_.strongLength == 0 || signature_.strongLength > DeltaEngine::STRONG_LENGTH) {
                throw ProtocolError("Signature has invalid strong hash length");
            }
            headerRead_ = true;
            off = 12;
        }
        if (headerRead_) {
            const size_t recordLen = 4 + signature_.strongLength;
            while (buffer_.size() - off >= recordLen) {
                Signature::Block block;
                block.weak = readU32(buffer_.data() + off);
                block.strong.assign(buffer_.begin() + off + 4, buffer_.begin() + off + recordLen);
                signature_.blocks.push_back(std::move(block));
                off += recordLen;
            }
        }
        buffer_.erase(buffer_.begin(), buffer_.begin() + off);
        return true;
    }
    if (buffers.eof) {
        if (!headerRead_ || !buffer_.empty()) {
            throw ProtocolError("insufficient input data");
        }
        signature_.buildIndex();
        markFinished();
        return true;
    }
    return false;
}

Signature LoadSignatureJob::release() {
    if (!finished()) {
        throw ProtocolError("insufficient input data");
    }
    return std::move(signature_);
}

// ---------------------------------------------------------------------------
// DeltaGenJob

DeltaGenJob::DeltaGenJob(Signature signature) : signature_(std::move(signature)) {
    if (signature_.blockLength == 0) {
        throw std::invalid_argument("Delta generation needs a loaded signature");
    }
    if (signature_.index.empty() && !signature_.blocks.empty()) {
        signature_.buildIndex();
    }
}

bool DeltaGenJob::matchAt(size_t pos, size_t len, uint32_t weak, size_t& blockIndex) {
    auto it = signature_.index.find(weak);
    if (it == signature_.index.end()) {
        return false;
    }
    auto strong = DeltaEngine::calculateStrong(window_.data() + pos, len, signature_.strongLength);
    for (size_t candidate : it->second) {
        if (signature_.blocks[candidate].strong == strong) {
            blockIndex = candidate;
            return true;
        }
    }
    return false;
}

void DeltaGenJob::flushCopy() {
    while (copyPending_ && copyLength_ > 0) {
        uint32_t len = static_cast<uint32_t>(std::min<uint64_t>(copyLength_, UINT32_MAX));
        uint8_t op = DeltaEngine::OP_COPY;
        emit(&op, 1);
        emitU64(copyOffset_);
        emitU32(len);
        copyOffset_ += len;
        copyLength_ -= len;
    }
    copyPending_ = false;
}

void DeltaGenJob::emitCopy(uint64_t offset, uint32_t length) {
    if (copyPending_ && copyOffset_ + copyLength_ == offset) {
        copyLength_ += length;
        return;
    }
    flushCopy();
    copyPending_ = true;
    copyOffset_ = offset;
    copyLength_ = length;
}

void DeltaGenJob::flushLiteral(size_t end) {
    if (end <= literalStart_) {
        return;
    }
    flushCopy();
    uint8_t op = DeltaEngine::OP_LITERAL;
    emit(&op, 1);
    emitU32(static_cast<uint32_t>(end - literalStart_));
    emit(window_.data() + literalStart_, end - literalStart_);
    literalStart_ = end;
}

void DeltaGenJob::compact() {
    if (literalStart_ < DeltaEngine::IO_UNIT) {
        return;
    }
    window_.erase(window_.begin(), window_.begin() + literalStart_);
    pos_ -= literalStart_;
    literalStart_ = 0;
}

bool DeltaGenJob::step(JobBuffers& buffers) {
    if (!headerSent_) {
        emit(DeltaEngine::DELTA_MAGIC, sizeof(DeltaEngine::DELTA_MAGIC));
        headerSent_ = true;
        return true;
    }

    const size_t bl = signature_.blockLength;
    bool progressed = false;
    compact();

    if (buffers.availIn > 0 && window_.size() - pos_ < bl + DeltaEngine::IO_UNIT) {
        size_t take = std::min(buffers.availIn, DeltaEngine::IO_UNIT);
        window_.insert(window_.end(), buffers.nextIn, buffers.nextIn + take);
        consume(buffers, take);
        progressed = true;
    }

    while (!hasPending() && window_.size() - pos_ >= bl) {
        if (!rollingValid_) {
            rolling_.init(window_.data() + pos_, bl);
            rollingValid_ = true;
        }
        size_t blockIndex = 0;
        if (matchAt(pos_, bl, rolling_.get(), blockIndex)) {
            flushLiteral(pos_);
            emitCopy(static_cast<uint64_t>(blockIndex) * bl, static_cast<uint32_t>(bl));
            pos_ += bl;
            literalStart_ = pos_;
            rollingValid_ = false;
            progressed = true;
            continue;
        }
        if (pos_ + bl >= window_.size()) {
            // Need the next byte to roll
            break;
        }
        rolling_.roll(window_[pos_], window_[pos_ + bl], bl);
        ++pos_;
        progressed = true;
        if (pos_ - literalStart_ >= MAX_LITERAL) {
            flushLiteral(pos_);
        }
    }

    if (progressed || hasPending()) {
        return true;
    }

    if (buffers.eof && buffers.availIn == 0) {
        size_t remaining = window_.size() - pos_;
        if (remaining > 0 && remaining < bl) {
            size_t blockIndex = 0;
            uint32_t weak = DeltaEngine::calculateAdler32(window_.data() + pos_, remaining);
            if (matchAt(pos_, remaining, weak, blockIndex)) {
                flushLiteral(pos_);
                emitCopy(static_cast<uint64_t>(blockIndex) * bl, static_cast<uint32_t>(remaining));
                pos_ = window_.size();
                literalStart_ = pos_;
            }
        }
        flushLiteral(window_.size());
        flushCopy();
        uint8_t op = DeltaEngine::OP_END;
        emit(&op, 1);
        pos_ = literalStart_ = window_.size();
        markFinished();
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// PatchJob

PatchJob::PatchJob(ReadAt readAt)
    : readAt_(std::move(readAt)), scratch_(DeltaEngine::IO_UNIT) {
    if (!readAt_) {
        throw std::invalid_argument("Patch job needs a base file reader");
    }
}

size_t PatchJob::pull(JobBuffers& buffers, size_t count) {
    if (header_.size() >= count) {
        return 0;
    }
    size_t take = std::min(count - header_.size(), buffers.availIn);
    header_.insert(header_.end(), buffers.nextIn, buffers.nextIn + take);
    return consume(buffers, take);
}

bool PatchJob::step(JobBuffers& buffers) {
    if (copyRemaining_ > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(copyRemaining_, scratch_.size()));
        size_t got = readAt_(scratch_.data(), want, copyOffset_);
        if (got == 0) {
            throw ProtocolError("Delta copies past the end of the base file");
        }
        emit(scratch_.data(), got);
        copyOffset_ += got;
        copyRemaining_ -= got;
        return true;
    }

    if (literalRemaining_ > 0) {
        if (buffers.availIn == 0) {
            if (buffers.eof) {
                throw ProtocolError("insufficient input data");
            }
            return false;
        }
        size_t n = static_cast<size_t>(std::min<uint64_t>(literalRemaining_,
                                                          std::min(buffers.availIn, DeltaEngine::IO_UNIT)));
        emit(buffers.nextIn, n);
        consume(buffers, n);
        literalRemaining_ -= n;
        return true;
    }

    size_t needed = magicRead_ ? 1 : sizeof(DeltaEngine::DELTA_MAGIC);
    if (magicRead_ && !header_.empty()) {
        switch (header_[0]) {
            case DeltaEngine::OP_LITERAL: needed = 1 + 4; break;
            case DeltaEngine::OP_COPY: needed = 1 + 8 + 4; break;
            case DeltaEngine::OP_END: needed = 1; break;
            default:
                throw ProtocolError("Unknown delta opcode: " + std::to_string(header_[0]));
        }
    }

    size_t pulled = pull(buffers, needed);
    if (header_.size() < needed) {
        if (pulled > 0) {
            return true;
        }
        if (buffers.eof) {
            throw ProtocolError("insufficient input data");
        }
        return false;
    }

    if (!magicRead_) {
        if (std::memcmp(header_.data(), DeltaEngine::DELTA_MAGIC, sizeof(DeltaEngine::DELTA_MAGIC)) != 0) {
            throw ProtocolError("Invalid delta magic");
        }
        magicRead_ = true;
        header_.clear();
        return true;
    }

    if (needed == 1 && header_[0] != DeltaEngine::OP_END) {
        // Opcode alone, its operands follow on the next step
        return true;
    }

    switch (header_[0]) {
        case DeltaEngine::OP_LITERAL:
            literalRemaining_ = readU32(header_.data() + 1);
            break;
        case DeltaEngine::OP_COPY:
            copyOffset_ = readU64(header_.data() + 1);
            copyRemaining_ = readU32(header_.data() + 9);
            break;
        case DeltaEngine::OP_END:
            markFinished();
            break;
        default:
            break;
    }
    header_.clear();
    return true;
}

} // namespace TermXfer
