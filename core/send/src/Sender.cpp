#include "Sender.h"
#include "TransferErrors.h"
#include "WireCodec.h"
#include "Encoding.h"
#include "LoggerMacros.h"

#include <sstream>

namespace TermXfer {

namespace {
    const std::string COMPONENT = "Sender";
}

Sender::Sender(ITransferChannel& channel, ITimerScheduler& timers, SendFileList files,
               const TransferSettings& settings, const SendOptions& options)
    : channel_(channel)
    , timers_(timers)
    , settings_(settings)
    , manager_(options.transferId.empty() ? WireCodec::randomTransferId() : options.transferId,
               std::move(files), options.bypassSecret, options.useRsync, settings.chunkSize)
    , usesBypass_(!options.bypassSecret.empty())
    , alive_(std::make_shared<bool>(true)) {
    manager_.setFileProgressCallback([this](SendFile& f, int64_t) {
        reportFileProgress(f);
        reportProgress();
    });
    manager_.setFileDoneCallback([this](SendFile& f) {
        if (fileDoneCb_) {
            fileDoneCb_(f);
        }
    });
}

Sender::~Sender() {
    alive_.reset();
}

template<typename F>
void Sender::defer(std::chrono::milliseconds delay, F&& fn) {
    std::weak_ptr<bool> token = alive_;
    timers_.callAfter(delay, [token, fn = std::forward<F>(fn)]() mutable {
        if (token.lock()) {
            fn();
        }
    });
}

void Sender::start() {
    LOG_INFO_COMP_IF("Requesting permission for transfer " + transferId() + " of " +
                     std::to_string(manager_.files().size()) + " files", COMPONENT);
    sendMessage(manager_.startTransferMessage());
    if (usesBypass_) {
        // No need to wait for the permission reply before announcing files
        sendFileMetadata();
    }
}

void Sender::sendMessage(const Message& msg) {
    outbound_.push_back(WireCodec::serialize(msg));
    flushOutbound();
}

void Sender::flushOutbound() {
    while (!outbound_.empty()) {
        if (!channel_.write(outbound_.front())) {
            scheduleRetry();
            return;
        }
        outbound_.pop_front();
    }
    onWritingFinished();
}

void Sender::scheduleRetry() {
    if (retryScheduled_) {
        return;
    }
    retryScheduled_ = true;
    defer(settings_.retryDelay, [this]() {
        retryScheduled_ = false;
        flushOutbound();
    });
}

void Sender::onWriteReady() {
    if (!outbound_.empty()) {
        flushOutbound();
    }
}

void Sender::onWritingFinished() {
    auto chunkSize = manager_.takeCurrentChunkSize();
    if (chunkSize) {
        manager_.progress().onTransmit(*chunkSize);
        reportProgress();
    }
    if (quitAfterWriteCode_) {
        finish(*quitAfterWriteCode_);
        return;
    }
    if (manager_.state() == SendState::PermissionGranted && (!transmitStarted_ || chunkSize)) {
        scheduleTick();
    }
}

void Sender::scheduleTick() {
    if (tickScheduled_) {
        return;
    }
    tickScheduled_ = true;
    defer(std::chrono::milliseconds(0), [this]() {
        tickScheduled_ = false;
        loopTick();
    });
}

void Sender::loopTick() {
    if (finished() || quitAfterWriteCode_) {
        return;
    }
    SendState state = manager_.state();
    if (state != SendState::PermissionGranted && state != SendState::Complete) {
        return;
    }
    if (transmitStarted_) {
        transmitNextChunk();
    } else {
        checkForTransmitOk();
    }
}

void Sender::checkForTransmitOk() {
    manager_.updateCollectiveStatuses();
    if (manager_.allAcknowledged()) {
        transferFinished();
        return;
    }
    startTransfer();
}

void Sender::startTransfer() {
    if (!manager_.activeFile()) {
        manager_.activateNextReadyFile();
    }
    if (manager_.activeFile()) {
        transmitStarted_ = true;
        manager_.progress().startTransfer();
        transmitNextChunk();
    }
}

void Sender::transmitNextChunk() {
    std::vector<Message> chunks = manager_.nextChunks();
    if (chunks.empty()) {
        if (manager_.allAcknowledged()) {
            transferFinished();
        }
        return;
    }
    for (const auto& msg : chunks) {
        outbound_.push_back(WireCodec::serialize(msg));
    }
    flushOutbound();
}

void Sender::transferFinished() {
    quitAfterWriteCode_ = manager_.failedFiles().empty() ? 0 : 1;
    LOG_INFO_COMP_IF("All files acknowledged for transfer " + transferId(), COMPONENT);
    sendMessage(Message(Action::Finish, transferId()));
}

void Sender::sendFileMetadata() {
    if (fileMetadataSent_) {
        return;
    }
    fileMetadataSent_ = true;
    for (const auto& msg : manager_.fileMetadata()) {
        outbound_.push_back(WireCodec::serialize(msg));
    }
    flushOutbound();
}

void Sender::onMessage(const Message& msg) {
    if (finished() || quitAfterWriteCode_) {
        return;
    }
    if (msg.transferId != transferId()) {
        return;
    }
    if (msg.action == Action::Status && msg.status == StatusCode::CANCELED) {
        LOG_INFO_COMP_IF("Terminal confirmed cancellation of " + transferId(), COMPONENT);
        finish(1);
        return;
    }
    if (manager_.state() == SendState::Canceled) {
        return;
    }

    SendState before = manager_.state();
    manager_.onFileTransferResponse(msg);
    if (before == SendState::WaitingForPermission) {
        if (manager_.state() == SendState::PermissionDenied) {
            LOG_ERROR_COMP("Permission denied for transfer " + transferId() + ": " +
                           Encoding::sanitizeControlCodes(msg.status), COMPONENT);
            finish(1);
            return;
        }
        if (manager_.state() == SendState::PermissionGranted) {
            LOG_INFO_COMP_IF("Permission granted for transfer " + transferId(), COMPONENT);
            sendFileMetadata();
        }
    }
    scheduleTick();
}

void Sender::cancel() {
    if (finished() || quitAfterWriteCode_) {
        return;
    }
    if (manager_.state() == SendState::Canceled) {
        LOG_INFO_COMP_IF("Waiting for the terminal to confirm cancellation", COMPONENT);
        return;
    }
    LOG_WARN_COMP("Cancelling transfer " + transferId() + ", transferred files are in an undefined state",
                  COMPONENT);
    manager_.setState(SendState::Canceled);
    sendMessage(Message(Action::Cancel, transferId()));
    defer(std::chrono::duration_cast<std::chrono::milliseconds>(settings_.cancelGrace),
          [this]() { finish(1); });
}

void Sender::finish(int code) {
    if (exitCode_) {
        return;
    }
    exitCode_ = code;
    outbound_.clear();
    LOG_INFO_COMP_IF("Transfer " + transferId() + " finished with code " + std::to_string(code), COMPONENT);
    if (completion_) {
        completion_(code);
    }
}

void Sender::reportProgress() {
    if (!progressCb_) {
        return;
    }
    const ProgressTracker& p = manager_.progress();
    progressCb_(p.totalReportedProgress(), p.totalBytesToTransfer(), p.bytesPerSecond(), p.etaSeconds());
}

void Sender::reportFileProgress(const SendFile& file) {
    if (!fileProgressCb_) {
        return;
    }
    const ProgressTracker& p = manager_.progress();
    fileProgressCb_(file, file.reportedProgress, file.fileSize, p.bytesPerSecond(), p.etaSeconds(file));
}

std::string Sender::failureReport() const {
    std::ostringstream oss;
    for (const SendFile* f : manager_.failedFiles()) {
        oss << f->displayName << ": " << Encoding::sanitizeControlCodes(f->errorMessage) << "\n";
    }
    return oss.str();
}

} // namespace TermXfer
