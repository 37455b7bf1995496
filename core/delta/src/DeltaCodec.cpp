#include "DeltaCodec.h"
#include "TransferErrors.h"
#include "LoggerMacros.h"
#include <algorithm>

namespace TermXfer {

namespace {
    const std::string COMPONENT = "DeltaCodec";
}

DriveResult DeltaCodec::drive(DeltaJob& job, const uint8_t* data, size_t len, bool eof) {
    DriveResult result;
    if (job.finished()) {
        if (len > 0) {
            throw ProtocolError("too much input");
        }
        result.finished = true;
        return result;
    }

    JobBuffers buffers;
    buffers.nextIn = data;
    buffers.availIn = len;
    buffers.eof = eof;

    std::vector<uint8_t> out(std::max<size_t>(job.outputBufferSize(), 1));
    int idle = 0;
    while (true) {
        buffers.nextOut = out.data();
        buffers.availOut = out.size();
        size_t inBefore = buffers.availIn;

        JobStatus status = job.iterate(buffers);

        size_t produced = out.size() - buffers.availOut;
        if (produced > 0) {
            result.outputs.emplace_back(out.begin(), out.begin() + produced);
        }
        if (status == JobStatus::Done) {
            result.finished = true;
            break;
        }
        if (!eof && (buffers.availIn == 0 || produced > 0)) {
            break;
        }
        if (produced == 0 && inBefore == buffers.availIn) {
            if (++idle > 1) {
                throw ProtocolError(eof ? "insufficient input data"
                                        : "delta engine consumed no input and produced no output");
            }
        } else {
            idle = 0;
        }
    }

    if (buffers.availIn > 0) {
        result.leftover.assign(buffers.nextIn, buffers.nextIn + buffers.availIn);
    }
    return result;
}

std::vector<uint8_t> DeltaCodec::finish(DeltaJob& job) {
    auto result = drive(job, nullptr, 0, true);
    if (!result.finished) {
        throw ProtocolError("insufficient input data");
    }
    std::vector<uint8_t> out;
    for (auto& chunk : result.outputs) {
        out.insert(out.end(), chunk.begin(), chunk.end());
    }
    return out;
}

std::unique_ptr<SignatureJob> DeltaCodec::makeSignature(int64_t expectedSize) {
    uint32_t blockLength = DeltaEngine::blockLengthFor(expectedSize);
    LOG_DEBUG_COMP_IF("Signature job with block length " + std::to_string(blockLength), COMPONENT);
    return std::make_unique<SignatureJob>(blockLength, DeltaEngine::STRONG_LENGTH);
}

std::unique_ptr<LoadSignatureJob> DeltaCodec::makeSignatureLoader() {
    return std::make_unique<LoadSignatureJob>();
}

std::unique_ptr<DeltaGenJob> DeltaCodec::makeDelta(Signature signature) {
    LOG_DEBUG_COMP_IF("Delta job against " + std::to_string(signature.blocks.size()) + " blocks", COMPONENT);
    return std::make_unique<DeltaGenJob>(std::move(signature));
}

std::unique_ptr<PatchJob> DeltaCodec::makePatch(PatchJob::ReadAt readAt) {
    return std::make_unique<PatchJob>(std::move(readAt));
}

DeltaStream::DeltaStream(std::unique_ptr<DeltaJob> job, ByteSource source)
    : job_(std::move(job)), source_(std::move(source)) {
    if (!job_ || !source_) {
        throw std::invalid_argument("DeltaStream needs a job and a source");
    }
}

bool DeltaStream::next(std::vector<uint8_t>& chunk) {
    while (outputs_.empty() && !finished_) {
        if (!job_) {
            return false;
        }
        DriveResult result;
        if (sourceDone_) {
            result = DeltaCodec::drive(*job_, leftover_, true);
            if (!result.finished) {
                throw ProtocolError("insufficient input data");
            }
        } else if (leftover_.size() >= job_->inputBufferSize()) {
            result = DeltaCodec::drive(*job_, leftover_, false);
        } else {
            std::vector<uint8_t> block(job_->inputBufferSize());
            size_t n = source_(block.data(), block.size());
            if (n == 0) {
                sourceDone_ = true;
                continue;
            }
            block.resize(n);
            if (!leftover_.empty()) {
                block.insert(block.begin(), leftover_.begin(), leftover_.end());
            }
            result = DeltaCodec::drive(*job_, block, false);
        }

        leftover_ = std::move(result.leftover);
        for (auto& out : result.outputs) {
            outputs_.push_back(std::move(out));
        }
        if (result.finished) {
            if (!leftover_.empty()) {
                throw ProtocolError("too much input");
            }
            finished_ = true;
        }
    }

    if (outputs_.empty()) {
        close();
        return false;
    }
    chunk = std::move(outputs_.front());
    outputs_.pop_front();
    if (exhausted()) {
        close();
    }
    return true;
}

void DeltaStream::close() {
    job_.reset();
    source_ = nullptr;
    leftover_.clear();
}

DeltaStream driveOverStream(std::unique_ptr<DeltaJob> job, ByteSource source) {
    return DeltaStream(std::move(job), std::move(source));
}

} // namespace TermXfer
