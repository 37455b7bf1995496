#pragma once

#include "DeltaEngine.h"
#include <deque>
#include <functional>
#include <memory>
#include <vector>

namespace TermXfer {

/**
 * @brief Outcome of feeding one input chunk to a job
 *
 * leftover holds input the job did not take; it must be prepended to the
 * next chunk.
 */
struct DriveResult {
    std::vector<std::vector<uint8_t>> outputs;
    bool finished = false;
    std::vector<uint8_t> leftover;
};

/// Fills at most len bytes, returns the count; 0 means the source is exhausted.
using ByteSource = std::function<size_t(uint8_t* buffer, size_t len)>;

class DeltaCodec {
public:
    /**
     * @brief Feed one chunk of input to a job
     *
     * Without eof, loops until the input is consumed or some output is
     * produced. With eof, loops until the job is done.
     *
     * @throws ProtocolError "too much input" when input is fed to a finished
     *         job, "insufficient input data" when eof arrives before the job
     *         can finish
     */
    static DriveResult drive(DeltaJob& job, const uint8_t* data, size_t len, bool eof = false);
    static DriveResult drive(DeltaJob& job, const std::vector<uint8_t>& input, bool eof = false) {
        return drive(job, input.data(), input.size(), eof);
    }

    /// Signal end of input and collect the remaining output.
    static std::vector<uint8_t> finish(DeltaJob& job);

    static std::unique_ptr<SignatureJob> makeSignature(int64_t expectedSize = -1);
    static std::unique_ptr<LoadSignatureJob> makeSignatureLoader();
    static std::unique_ptr<DeltaGenJob> makeDelta(Signature signature);
    static std::unique_ptr<PatchJob> makePatch(PatchJob::ReadAt readAt);
};

/**
 * @brief Lazy sequence of output chunks produced by driving a job over a source
 *
 * Finite and not restartable. The job is owned by the stream and released
 * by close() or when the last chunk has been returned.
 */
class DeltaStream {
public:
    DeltaStream(std::unique_ptr<DeltaJob> job, ByteSource source);

    DeltaStream(const DeltaStream&) = delete;
    DeltaStream& operator=(const DeltaStream&) = delete;
    DeltaStream(DeltaStream&&) = default;
    DeltaStream& operator=(DeltaStream&&) = default;

    /**
     * @brief Produce the next output chunk
     * @return false once the sequence is exhausted
     * @throws ProtocolError if the source ends before the job finishes
     */
    bool next(std::vector<uint8_t>& chunk);

    bool exhausted() const { return finished_ && outputs_.empty(); }
    void close();

private:
    std::unique_ptr<DeltaJob> job_;
    ByteSource source_;
    std::deque<std::vector<uint8_t>> outputs_;
    std::vector<uint8_t> leftover_;
    bool sourceDone_ = false;
    bool finished_ = false;
};

DeltaStream driveOverStream(std::unique_ptr<DeltaJob> job, ByteSource source);

} // namespace TermXfer
