#include "ProgressTracker.h"

namespace TermXfer {

ProgressTracker::ProgressTracker(int64_t totalSizeOfAllFiles, std::chrono::seconds window)
    : totalSizeOfAllFiles_(totalSizeOfAllFiles)
    , totalBytesToTransfer_(totalSizeOfAllFiles)
    , window_(window) {}

void ProgressTracker::startTransfer() {
    startedAt_ = now();
    samples_.push_back({0, startedAt_});
}

void ProgressTracker::changeActiveFile(SendFile& file) {
    activeFile_ = &file;
    file.transmitStartedAt = now();
}

void ProgressTracker::onTransmit(int64_t amount) {
    if (activeFile_) {
        activeFile_->transmittedBytes += amount;
    }
    totalTransferred_ += amount;

    Clock::time_point at = now();
    samples_.push_back({amount, at});
    while (samples_.size() > 2 && at - samples_.front().at > window_) {
        samples_.pop_front();
    }

    windowSeconds_ = std::chrono::duration<double>(at - samples_.front().at).count();
    windowAmount_ = 0;
    for (const auto& s : samples_) {
        windowAmount_ += s.amount;
    }
}

void ProgressTracker::onFileProgress(SendFile&, int64_t delta) {
    totalReportedProgress_ += delta;
}

void ProgressTracker::onFileDone(SendFile& file) {
    file.doneAt = now();
}

double ProgressTracker::bytesPerSecond() const {
    if (windowSeconds_ <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(windowAmount_) / windowSeconds_;
}

double ProgressTracker::etaSeconds() const {
    double rate = bytesPerSecond();
    if (rate <= 0.0) {
        return -1.0;
    }
    int64_t remaining = totalBytesToTransfer_ - totalReportedProgress_;
    return remaining > 0 ? static_cast<double>(remaining) / rate : 0.0;
}

double ProgressTracker::etaSeconds(const SendFile& file) const {
    double rate = bytesPerSecond();
    if (rate <= 0.0) {
        return -1.0;
    }
    int64_t remaining = file.fileSize - file.reportedProgress;
    return remaining > 0 ? static_cast<double>(remaining) / rate : 0.0;
}

} // namespace TermXfer
