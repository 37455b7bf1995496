#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace TermXfer {

/**
 * @brief Input/output windows handed to DeltaJob::iterate.
 *
 * The job advances nextIn/availIn past what it consumed and nextOut/availOut
 * past what it produced. eof tells the job no input follows availIn.
 */
struct JobBuffers {
    const uint8_t* nextIn = nullptr;
    size_t availIn = 0;
    bool eof = false;
    uint8_t* nextOut = nullptr;
    size_t availOut = 0;
};

enum class JobStatus {
    Done,
    Blocked
};

/**
 * @brief One phase of the delta algorithm as a resumable state machine.
 *
 * iterate() consumes bounded input and emits bounded output. It returns
 * Done only after the final byte of output has been handed out.
 */
class DeltaJob {
public:
    virtual ~DeltaJob() = default;

    JobStatus iterate(JobBuffers& buffers);

    virtual size_t inputBufferSize() const = 0;
    virtual size_t outputBufferSize() const = 0;

    bool finished() const { return finished_ && !hasPending(); }

protected:
    /**
     * @brief Advance the job by one unit of work
     * @return false if nothing could be done with the given buffers
     */
    virtual bool step(JobBuffers& buffers) = 0;

    void emit(const uint8_t* data, size_t len);
    void emitU32(uint32_t value);
    void emitU64(uint64_t value);
    void markFinished() { finished_ = true; }
    bool hasPending() const { return pendingPos_ < pending_.size(); }

private:
    size_t flushPending(JobBuffers& buffers);

    std::vector<uint8_t> pending_;
    size_t pendingPos_ = 0;
    bool finished_ = false;
};

/**
 * @brief Rolling Adler-32 over a fixed window
 */
struct RollingAdler32 {
    uint32_t a = 1;
    uint32_t b = 0;
    static constexpr uint32_t MOD_ADLER = 65521;

    void init(const uint8_t* data, size_t len) {
        a = 1;
        b = 0;
        for (size_t i = 0; i < len; ++i) {
            a = (a + data[i]) % MOD_ADLER;
            b = (b + a) % MOD_ADLER;
        }
    }

    // Remove oldByte from the front of a window of windowSize bytes, append newByte
    void roll(uint8_t oldByte, uint8_t newByte, size_t windowSize) {
        a = (a - oldByte + newByte + MOD_ADLER) % MOD_ADLER;
        b = (b - static_cast<uint32_t>((windowSize * oldByte) % MOD_ADLER) + a - 1 + MOD_ADLER) % MOD_ADLER;
    }

    uint32_t get() const {
        return (b << 16) | a;
    }
};

/**
 * @brief Block fingerprints of a base file
 */
struct Signature {
    struct Block {
        uint32_t weak;
        std::vector<uint8_t> strong;
    };

    uint32_t blockLength = 0;
    uint32_t strongLength = 0;
    std::vector<Block> blocks;

    /// weak checksum -> indices into blocks
    std::unordered_map<uint32_t, std::vector<size_t>> index;

    void buildIndex();
};

class DeltaEngine {
public:
    static constexpr uint32_t DEFAULT_BLOCK_LENGTH = 6 * 1024;
    static constexpr uint32_t MIN_BLOCK_LENGTH = 64;
    static constexpr uint32_t MAX_BLOCK_LENGTH = 1024 * 1024;
    static constexpr uint32_t STRONG_LENGTH = 32;
    static constexpr size_t IO_UNIT = 64 * 1024;

    static constexpr uint8_t SIGNATURE_MAGIC[4] = {'T', 'X', 'S', '1'};
    static constexpr uint8_t DELTA_MAGIC[4] = {'T', 'X', 'D', '1'};

    static constexpr uint8_t OP_LITERAL = 'L';
    static constexpr uint8_t OP_COPY = 'C';
    static constexpr uint8_t OP_END = 'E';

    /// Square root of the expected size, clamped; DEFAULT_BLOCK_LENGTH for unknown sizes.
    static uint32_t blockLengthFor(int64_t expectedSize);

    static uint32_t calculateAdler32(const uint8_t* data, size_t len);
    static std::vector<uint8_t> calculateStrong(const uint8_t* data, size_t len, uint32_t strongLength);
};

/**
 * @brief Base stream -> signature
 */
class SignatureJob : public DeltaJob {
public:
    explicit SignatureJob(uint32_t blockLength = DeltaEngine::DEFAULT_BLOCK_LENGTH,
                          uint32_t strongLength = DeltaEngine::STRONG_LENGTH);

    size_t inputBufferSize() const override { return 4 * static_cast<size_t>(blockLength_); }
    size_t outputBufferSize() const override { return 4 * (4 + static_cast<size_t>(strongLength_)) + 12; }

protected:
    bool step(JobBuffers& buffers) override;

private:
    void emitBlock();

    uint32_t blockLength_;
    uint32_t strongLength_;
    bool headerSent_ = false;
    std::vector<uint8_t> block_;
};

/**
 * @brief Signature stream -> in-memory Signature. Produces no output.
 */
class LoadSignatureJob : public DeltaJob {
public:
    size_t inputBufferSize() const override { return DeltaEngine::IO_UNIT; }
    size_t outputBufferSize() const override { return 0; }

    const Signature& signature() const { return signature_; }
    Signature release();

protected:
    bool step(JobBuffers& buffers) override;

private:
    std::vector<uint8_t> buffer_;
    bool headerRead_ = false;
    Signature signature_;
};

/**
 * @brief Signature + new stream -> delta
 */
class DeltaGenJob : public DeltaJob {
public:
    explicit DeltaGenJob(Signature signature);

    size_t inputBufferSize() const override { return DeltaEngine::IO_UNIT; }
    size_t outputBufferSize() const override { return 4 * DeltaEngine::IO_UNIT; }

protected:
    bool step(JobBuffers& buffers) override;

private:
    bool matchAt(size_t pos, size_t len, uint32_t weak, size_t& blockIndex);
    void flushLiteral(size_t end);
    void emitCopy(uint64_t offset, uint32_t length);
    void flushCopy();
    void compact();

    Signature signature_;
    bool headerSent_ = false;
    std::vector<uint8_t> window_;
    size_t pos_ = 0;        // start of the candidate block within window_
    size_t literalStart_ = 0;
    bool rollingValid_ = false;
    RollingAdler32 rolling_;

    bool copyPending_ = false;
    uint64_t copyOffset_ = 0;
    uint64_t copyLength_ = 0;
};

/**
 * @brief Base reader + delta stream -> reconstructed output
 *
 * The base is read through a random-access callback that fills at most
 * len bytes at offset and returns the count read (0 past the end).
 */
class PatchJob : public DeltaJob {
public:
    using ReadAt = std::function<size_t(uint8_t* buffer, size_t len, uint64_t offset)>;

    explicit PatchJob(ReadAt readAt);

    size_t inputBufferSize() const override { return DeltaEngine::IO_UNIT; }
    size_t outputBufferSize() const override { return 4 * DeltaEngine::IO_UNIT; }

protected:
    bool step(JobBuffers& buffers) override;

private:
    size_t pull(JobBuffers& buffers, size_t count);

    ReadAt readAt_;
    std::vector<uint8_t> header_;
    bool magicRead_ = false;
    uint64_t literalRemaining_ = 0;
    uint64_t copyOffset_ = 0;
    uint64_t copyRemaining_ = 0;
    std::vector<uint8_t> scratch_;
};

} // namespace TermXfer
