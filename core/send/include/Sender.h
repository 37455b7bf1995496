#pragma once

#include "SendManager.h"
#include "HostInterfaces.h"
#include "TransferSettings.h"

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace TermXfer {

struct SendOptions {
    std::string bypassSecret;   // skips the permission round-trip when non-empty
    bool useRsync{false};       // transmit deltas against existing remote files
    std::string transferId;     // random when empty
};

/**
 * @brief Drives a push transfer over the escape-code channel
 *
 * Writes go through an outbound queue: when the channel refuses a payload
 * the queue is retried after TransferSettings::retryDelay. Every deferred
 * step runs from the host's timer scheduler.
 *
 * Usage:
 *   Sender sender(channel, timers, std::move(files), settings, options);
 *   sender.setCompletionCallback([](int code) { ... });
 *   sender.start();
 *   // feed replies: sender.onMessage(WireCodec::deserialize(payload));
 */
class Sender {
public:
    using CompletionCallback = std::function<void(int exitCode)>;
    using FileDoneCallback = std::function<void(const SendFile&)>;
    /// Same tuple as ProgressCallback, scoped to one file.
    using FileProgressCallback = std::function<void(const SendFile&, int64_t bytesSoFar, int64_t totalBytes,
                                                    double bytesPerSecond, double etaSeconds)>;

    Sender(ITransferChannel& channel, ITimerScheduler& timers, SendFileList files,
           const TransferSettings& settings, const SendOptions& options = {});
    ~Sender();

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    void setCompletionCallback(CompletionCallback cb) { completion_ = std::move(cb); }
    void setProgressCallback(ProgressCallback cb) { progressCb_ = std::move(cb); }
    void setFileDoneCallback(FileDoneCallback cb) { fileDoneCb_ = std::move(cb); }
    void setFileProgressCallback(FileProgressCallback cb) { fileProgressCb_ = std::move(cb); }

    /// Send the opening message, and the file metadata too when a bypass secret is used.
    void start();

    /// Handle one reply from the terminal. Replies for other transfer ids are ignored.
    void onMessage(const Message& msg);

    /// The channel can accept writes again.
    void onWriteReady();

    /// Send cancel and give up after the grace period if the terminal does not confirm.
    void cancel();

    bool finished() const { return exitCode_.has_value(); }
    std::optional<int> exitCode() const { return exitCode_; }

    /// One line per failed file, empty when every file succeeded.
    std::string failureReport() const;

    SendManager& manager() { return manager_; }
    const SendManager& manager() const { return manager_; }
    const std::string& transferId() const { return manager_.transferId(); }

private:
    void sendMessage(const Message& msg);
    void flushOutbound();
    void onWritingFinished();
    void scheduleTick();
    void scheduleRetry();
    void loopTick();
    void checkForTransmitOk();
    void startTransfer();
    void transmitNextChunk();
    void transferFinished();
    void sendFileMetadata();
    void finish(int code);
    void reportProgress();
    void reportFileProgress(const SendFile& file);

    template<typename F>
    void defer(std::chrono::milliseconds delay, F&& fn);

    ITransferChannel& channel_;
    ITimerScheduler& timers_;
    TransferSettings settings_;
    SendManager manager_;

    bool usesBypass_;
    std::deque<std::string> outbound_;
    bool retryScheduled_{false};
    bool tickScheduled_{false};
    bool transmitStarted_{false};
    bool fileMetadataSent_{false};
    std::optional<int> quitAfterWriteCode_;
    std::optional<int> exitCode_;

    CompletionCallback completion_;
    ProgressCallback progressCb_;
    FileDoneCallback fileDoneCb_;
    FileProgressCallback fileProgressCb_;

    std::shared_ptr<bool> alive_;
};

} // namespace TermXfer
