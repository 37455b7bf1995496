#pragma once

#include "SendFile.h"

#include <chrono>
#include <cstdint>
#include <deque>

namespace TermXfer {

/**
 * @brief Rolling throughput estimate for a push transfer
 *
 * Every transmitted chunk is recorded as a sample. Samples older than the
 * window are dropped (at least two are always kept), and the remaining
 * samples give the rate used for the ETA.
 */
class ProgressTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProgressTracker(int64_t totalSizeOfAllFiles,
                             std::chrono::seconds window = std::chrono::seconds(30));

    void startTransfer();
    void changeActiveFile(SendFile& file);
    void onTransmit(int64_t amount);
    void onFileProgress(SendFile& file, int64_t delta);
    void onFileDone(SendFile& file);

    /// Bytes per second over the sample window, 0 before two samples exist.
    double bytesPerSecond() const;

    /// Seconds until totalBytesToTransfer() is acknowledged, negative when unknown.
    double etaSeconds() const;

    /// Seconds until file is fully acknowledged at the current rate, negative when unknown.
    double etaSeconds(const SendFile& file) const;

    int64_t totalSizeOfAllFiles() const { return totalSizeOfAllFiles_; }
    int64_t totalBytesToTransfer() const { return totalBytesToTransfer_; }
    int64_t totalTransferred() const { return totalTransferred_; }
    int64_t totalReportedProgress() const { return totalReportedProgress_; }
    SendFile* activeFile() const { return activeFile_; }
    Clock::time_point startedAt() const { return startedAt_; }

    /// Testing hook: pin the clock used for new samples.
    void setNowForTesting(Clock::time_point now) { fixedNow_ = now; hasFixedNow_ = true; }

private:
    struct Sample {
        int64_t amount;
        Clock::time_point at;
    };

    Clock::time_point now() const { return hasFixedNow_ ? fixedNow_ : Clock::now(); }

    int64_t totalSizeOfAllFiles_;
    int64_t totalBytesToTransfer_;
    std::chrono::seconds window_;
    SendFile* activeFile_{nullptr};
    int64_t totalTransferred_{0};
    int64_t totalReportedProgress_{0};
    std::deque<Sample> samples_;
    int64_t windowAmount_{0};
    double windowSeconds_{0.0};
    Clock::time_point startedAt_{};

    bool hasFixedNow_{false};
    Clock::time_point fixedNow_{};
};

} // namespace TermXfer
