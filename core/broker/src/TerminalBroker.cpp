#include "TerminalBroker.h"
#include "TransferErrors.h"
#include "WireCodec.h"
#include "LoggerMacros.h"

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace TermXfer {

namespace {
    const std::string COMPONENT = "TerminalBroker";

    constexpr size_t SIGNATURE_BATCH_SIZE = 4096;
    constexpr std::chrono::milliseconds SIGNATURE_RETRY_DELAY{100};
    constexpr std::chrono::milliseconds EXPIRY_SWEEP_INTERVAL{60 * 1000};

    const char* RECEIVE_PROMPT =
        "The remote machine wants to send some files to this computer. Do you want to allow the transfer?";
    const char* SEND_PROMPT =
        "The remote machine wants to read some files from this computer. Do you want to allow the transfer?";
}

TerminalBroker::TerminalBroker(ITransferChannel& channel, IPermissionPrompt& prompt, ITimerScheduler& timers,
                               TransferSettings settings, PathContext paths)
    : channel_(channel)
    , prompt_(prompt)
    , timers_(timers)
    , settings_(std::move(settings))
    , paths_(std::move(paths))
    , alive_(std::make_shared<bool>(true)) {
}

TerminalBroker::~TerminalBroker() {
    alive_.reset();
    for (auto& entry : activeReceives_) {
        entry.second->close();
    }
    activeReceives_.clear();
    for (auto& entry : activeSends_) {
        entry.second->close();
    }
    activeSends_.clear();
}

template<typename F>
void TerminalBroker::defer(std::chrono::milliseconds delay, F&& fn) {
    std::weak_ptr<bool> token = alive_;
    timers_.callAfter(delay, [token, fn = std::forward<F>(fn)]() mutable {
        if (token.lock()) {
            fn();
        }
    });
}

const ActiveReceive* TerminalBroker::findReceive(const std::string& id) const {
    auto it = activeReceives_.find(id);
    return it == activeReceives_.end() ? nullptr : it->second.get();
}

const ActiveSend* TerminalBroker::findSend(const std::string& id) const {
    auto it = activeSends_.find(id);
    return it == activeSends_.end() ? nullptr : it->second.get();
}

std::optional<bool> TerminalBroker::checkBypass(const Message& cmd) const {
    if (cmd.bypass.empty()) {
        return std::nullopt;
    }
    return WireCodec::checkBypass(settings_.bypassSecret, cmd.transferId, cmd.bypass);
}

void TerminalBroker::dropReceive(const std::string& id) {
    auto it = activeReceives_.find(id);
    if (it == activeReceives_.end()) {
        return;
    }
    std::unique_ptr<ActiveReceive> ar = std::move(it->second);
    activeReceives_.erase(it);
    ar->close();
}

void TerminalBroker::dropSend(const std::string& id) {
    auto it = activeSends_.find(id);
    if (it == activeSends_.end()) {
        return;
    }
    std::unique_ptr<ActiveSend> asd = std::move(it->second);
    activeSends_.erase(it);
    asd->close();
}

void TerminalBroker::pruneExpired() {
    Clock::time_point t = now();
    std::vector<std::string> expired;
    for (const auto& entry : activeReceives_) {
        if (entry.second->isExpired(t, settings_.expireTime)) {
            expired.push_back(entry.first);
        }
    }
    for (const auto& id : expired) {
        LOG_WARN_COMP("Dropping idle receive " + id, COMPONENT);
        dropReceive(id);
    }
    expired.clear();
    for (const auto& entry : activeSends_) {
        if (entry.second->isExpired(t, settings_.expireTime)) {
            expired.push_back(entry.first);
        }
    }
    for (const auto& id : expired) {
        LOG_WARN_COMP("Dropping idle send " + id, COMPONENT);
        dropSend(id);
    }
}

void TerminalBroker::scheduleExpirySweep() {
    if (sweepScheduled_ || (activeReceives_.empty() && activeSends_.empty())) {
        return;
    }
    sweepScheduled_ = true;
    defer(EXPIRY_SWEEP_INTERVAL, [this]() {
        sweepScheduled_ = false;
        pruneExpired();
        scheduleExpirySweep();
    });
}

void TerminalBroker::handleSerializedCommand(const std::string& payload) {
    Message cmd;
    try {
        cmd = WireCodec::deserialize(payload);
    } catch (const ProtocolError& e) {
        LOG_ERROR_COMP(std::string("Failed to parse file transmission command with error: ") + e.what(), COMPONENT);
        return;
    }
    handleCommand(cmd);
}

void TerminalBroker::handleCommand(const Message& cmd) {
    if (cmd.transferId.empty()) {
        LOG_ERROR_COMP("File transmission command without id received, ignoring", COMPONENT);
        return;
    }
    LOG_DEBUG_COMP_IF("Received " + cmd.describe(), COMPONENT);
    if (cmd.action == Action::Cancel) {
        if (activeReceives_.count(cmd.transferId)) {
            handleReceiveCmd(cmd);
            return;
        }
        if (activeSends_.count(cmd.transferId)) {
            handleSendCmd(cmd);
            return;
        }
    }
    pruneExpired();
    if (activeReceives_.count(cmd.transferId) || cmd.action == Action::Send) {
        handleReceiveCmd(cmd);
    }
    if (activeSends_.count(cmd.transferId) || cmd.action == Action::Receive) {
        handleSendCmd(cmd);
    }
}

void TerminalBroker::onWriteReady() {
    if (!pendingReplies_.empty()) {
        if (!pendingTimer_) {
            pendingTimer_ = true;
            defer(std::chrono::milliseconds(0), [this]() { tryPending(); });
        }
    }
    if (!activeSends_.empty()) {
        pumpSends();
    }
}

// Push into this machine

void TerminalBroker::handleReceiveCmd(const Message& cmd) {
    auto it = activeReceives_.find(cmd.transferId);
    if (it == activeReceives_.end()) {
        if (cmd.action != Action::Send) {
            LOG_ERROR_COMP(std::string("File transmission command ") + toString(cmd.action) +
                           " received for unknown or rejected id: " + cmd.transferId + ", ignoring", COMPONENT);
            return;
        }
        if (activeReceives_.size() >= settings_.maxActiveReceives) {
            LOG_ERROR_COMP("New file transmission send with too many active receives, ignoring", COMPONENT);
            return;
        }
        auto ar = std::make_unique<ActiveReceive>(cmd.transferId, cmd.quiet, checkBypass(cmd), paths_, now());
        if (fileClosedObserver_) {
            ar->setFileClosedObserver(fileClosedObserver_);
        }
        activeReceives_.emplace(cmd.transferId, std::move(ar));
        scheduleExpirySweep();
        startReceive(cmd.transferId);
        return;
    }

    ActiveReceive& ar = *it->second;
    if (cmd.action == Action::Send) {
        LOG_ERROR_COMP("File transmission send received for already active id, aborting", COMPONENT);
        dropReceive(cmd.transferId);
        return;
    }
    if (!ar.accepted) {
        LOG_ERROR_COMP(std::string("File transmission command ") + toString(cmd.action) +
                       " received for pending id: " + cmd.transferId + ", aborting", COMPONENT);
        dropReceive(cmd.transferId);
        return;
    }
    ar.touch(now());

    switch (cmd.action) {
        case Action::Cancel: {
            bool acks = ar.sendAcknowledgements;
            std::string id = ar.id;
            LOG_INFO_COMP_IF("Receive " + id + " canceled by the sender", COMPONENT);
            dropReceive(id);
            if (acks) {
                sendStatusResponse(StatusCode::CANCELED, id);
            }
            break;
        }
        case Action::File:
            handleFileStart(ar, cmd);
            break;
        case Action::Data:
        case Action::EndData:
            handleFileData(ar, cmd);
            break;
        case Action::Finish:
            handleFinish(ar);
            break;
        default:
            LOG_ERROR_COMP(std::string("Transmission receive command with unknown action: ") +
                           toString(cmd.action) + ", ignoring", COMPONENT);
            break;
    }
}

void TerminalBroker::startReceive(const std::string& id) {
    ActiveReceive& ar = *activeReceives_.at(id);
    if (ar.bypassOk) {
        handleSendConfirmation(*ar.bypassOk, id);
        return;
    }
    std::weak_ptr<bool> token = alive_;
    prompt_.askYesNo(RECEIVE_PROMPT, [this, token, id](bool confirmed) {
        if (token.lock()) {
            handleSendConfirmation(confirmed, id);
        }
    });
}

void TerminalBroker::handleSendConfirmation(bool confirmed, const std::string& id) {
    auto it = activeReceives_.find(id);
    if (it == activeReceives_.end()) {
        return;
    }
    ActiveReceive& ar = *it->second;
    if (confirmed) {
        ar.accepted = true;
        LOG_INFO_COMP_IF("Receive " + id + " accepted", COMPONENT);
        if (ar.sendAcknowledgements) {
            sendStatusResponse(StatusCode::OK, id);
        }
        return;
    }
    bool sendErrors = ar.sendErrors;
    LOG_INFO_COMP_IF("Receive " + id + " refused", COMPONENT);
    dropReceive(id);
    if (sendErrors) {
        sendStatusResponse(StatusCode::EPERM_CODE, id, "", "User refused the transfer");
    }
}

void TerminalBroker::handleFileStart(ActiveReceive& ar, const Message& cmd) {
    DestFile* df = nullptr;
    try {
        df = &ar.startFile(cmd);
    } catch (const TransmissionError& e) {
        if (ar.sendErrors) {
            sendTransmissionError(ar.id, e);
        }
        return;
    } catch (const std::runtime_error& e) {
        LOG_ERROR_COMP(std::string("Transmission protocol failed to start file with error: ") + e.what(), COMPONENT);
        if (ar.sendErrors) {
            sendTransmissionError(ar.id, TransmissionError(StatusCode::EINVAL_CODE, e.what(), cmd.fileId));
        }
        return;
    }

    if (df->fileType == FileType::Directory) {
        std::error_code ec;
        fs::create_directories(df->name, ec);
        if (ec) {
            sendFailOnOsError(ec.value(), "Failed to create directory", ar.id, ar.sendErrors, df->fileId);
        } else if (ar.sendAcknowledgements) {
            sendStatusResponse(StatusCode::OK, ar.id, df->fileId, "", df->name);
        }
        return;
    }

    bool rsync = df->existingSize > -1 && df->transmissionType == TransmissionType::Rsync &&
                 df->fileType == FileType::Regular && ar.sendAcknowledgements;
    df->transmissionType = rsync ? TransmissionType::Rsync : TransmissionType::Simple;
    if (!ar.sendAcknowledgements) {
        return;
    }
    sendStatusResponse(StatusCode::STARTED, ar.id, df->fileId, "", df->name, df->existingSize,
                       df->transmissionType);
    if (rsync) {
        df->signatureIterator();
        ar.pendingSignatures.push_back(df->fileId);
        std::string id = ar.id;
        defer(std::chrono::milliseconds(0), [this, id]() { transmitRsyncSignature(id); });
    }
}

void TerminalBroker::handleFileData(ActiveReceive& ar, const Message& cmd) {
    int64_t before = 0;
    auto existing = ar.files.find(cmd.fileId);
    if (existing != ar.files.end()) {
        before = existing->second->bytesWritten;
    }
    try {
        DestFile& df = ar.addData(cmd);
        if (df.failed) {
            return;
        }
        if (df.closed && commitHook_ && df.fileType == FileType::Regular) {
            commitHook_(ar.id, df);
        }
        if (ar.sendAcknowledgements) {
            if (df.closed) {
                sendStatusResponse(StatusCode::OK, ar.id, df.fileId, "", df.name, df.bytesWritten);
            } else if (df.bytesWritten > before) {
                sendStatusResponse(StatusCode::PROGRESS, ar.id, df.fileId, "", "", df.bytesWritten);
            }
        }
    } catch (const TransmissionError& e) {
        if (ar.sendErrors) {
            sendTransmissionError(ar.id, e);
        }
    } catch (const std::system_error& e) {
        LOG_ERROR_COMP(std::string("Transmission protocol failed to write data to file with error: ") + e.what(),
                       COMPONENT);
        sendFailOnOsError(e.code().value(), e.what(), ar.id, ar.sendErrors, cmd.fileId);
    } catch (const std::runtime_error& e) {
        LOG_ERROR_COMP(std::string("Transmission protocol failed to write data to file with error: ") + e.what(),
                       COMPONENT);
        if (ar.sendErrors) {
            sendTransmissionError(ar.id, TransmissionError(StatusCode::EINVAL_CODE, e.what(), cmd.fileId));
        }
    }
}

void TerminalBroker::handleFinish(ActiveReceive& ar) {
    std::string id = ar.id;
    ar.commit();
    LOG_INFO_COMP_IF("Receive " + id + " finished with " + std::to_string(ar.files.size()) + " entries",
                     COMPONENT);
    dropReceive(id);
}

void TerminalBroker::transmitRsyncSignature(const std::string& id) {
    auto it = activeReceives_.find(id);
    if (it == activeReceives_.end()) {
        return;
    }
    ActiveReceive& ar = *it->second;

    if (!pendingReplies_.empty()) {
        // STARTED must reach the sender before its signature
        defer(SIGNATURE_RETRY_DELAY, [this, id]() { transmitRsyncSignature(id); });
        return;
    }
    while (!ar.signaturePendingChunks.empty()) {
        if (!writeMessage(ar.signaturePendingChunks.front(), false, false)) {
            defer(SIGNATURE_RETRY_DELAY, [this, id]() { transmitRsyncSignature(id); });
            return;
        }
        ar.signaturePendingChunks.pop_front();
    }
    if (ar.pendingSignatures.empty()) {
        return;
    }

    std::string fileId = ar.pendingSignatures.front();
    auto fit = ar.files.find(fileId);
    if (fit == ar.files.end() || fit->second->closed) {
        ar.pendingSignatures.pop_front();
        defer(std::chrono::milliseconds(0), [this, id]() { transmitRsyncSignature(id); });
        return;
    }
    PatchFile& patch = fit->second->signatureIterator();

    std::vector<uint8_t> batch;
    bool finished = false;
    try {
        std::vector<uint8_t> piece;
        while (batch.size() < SIGNATURE_BATCH_SIZE) {
            if (!patch.nextSignatureChunk(piece)) {
                finished = true;
                ar.pendingSignatures.pop_front();
                break;
            }
            batch.insert(batch.end(), piece.begin(), piece.end());
        }
    } catch (const std::system_error& e) {
        ar.pendingSignatures.pop_front();
        sendFailOnOsError(e.code().value(), "Failed to read signature", id, ar.sendErrors, fileId);
        return;
    } catch (const ProtocolError& e) {
        ar.pendingSignatures.pop_front();
        if (ar.sendErrors) {
            sendTransmissionError(id, TransmissionError(StatusCode::EINVAL_CODE, e.what(), fileId));
        }
        return;
    }

    bool hasCapacity = true;
    auto emit = [&](const Message& msg) {
        if (hasCapacity && writeMessage(msg, false, false)) {
            return;
        }
        hasCapacity = false;
        ar.signaturePendingChunks.push_back(msg);
    };
    for (const auto& msg : WireCodec::splitForTransfer(batch, id, fileId, false)) {
        emit(msg);
    }
    if (finished) {
        emit(Message(Action::EndData, id, fileId));
    }
    defer(std::chrono::milliseconds(0), [this, id]() { transmitRsyncSignature(id); });
}

// Pull from this machine

void TerminalBroker::handleSendCmd(const Message& cmd) {
    auto it = activeSends_.find(cmd.transferId);
    if (it == activeSends_.end()) {
        if (cmd.action != Action::Receive) {
            LOG_ERROR_COMP(std::string("File transmission command ") + toString(cmd.action) +
                           " received for unknown or rejected id: " + cmd.transferId + ", ignoring", COMPONENT);
            return;
        }
        if (activeSends_.size() >= settings_.maxActiveSends) {
            LOG_ERROR_COMP("New file transmission receive with too many active sends, ignoring", COMPONENT);
            return;
        }
        activeSends_.emplace(cmd.transferId, std::make_unique<ActiveSend>(cmd.transferId, cmd.quiet, checkBypass(cmd),
                                                                          cmd.size, paths_, now()));
        scheduleExpirySweep();
        startSend(cmd.transferId);
        return;
    }

    ActiveSend& asd = *it->second;
    std::string id = asd.id;
    if (cmd.action == Action::Receive) {
        LOG_ERROR_COMP("File transmission receive received for already active id, aborting", COMPONENT);
        dropSend(id);
        return;
    }
    if (cmd.action == Action::File) {
        try {
            if (asd.metadataSent) {
                asd.addSendFile(cmd, now());
            } else {
                asd.addFileSpec(cmd, now());
            }
        } catch (const TransmissionError& e) {
            bool sendErrors = asd.sendErrors;
            dropSend(id);
            if (sendErrors) {
                sendTransmissionError(id, e);
            }
            return;
        } catch (const std::system_error& e) {
            sendFailOnOsError(e.code().value(), "Failed to add send file", id, asd.sendErrors, cmd.fileId);
            dropSend(id);
            return;
        }
        if (asd.metadataSent) {
            pumpSendChunks(id);
        } else if (asd.specComplete() && asd.accepted) {
            sendMetadataForSendTransfer(asd);
        }
        return;
    }
    if (cmd.action == Action::Data || cmd.action == Action::EndData) {
        try {
            asd.addSignatureData(cmd, now());
        } catch (const TransmissionError& e) {
            bool sendErrors = asd.sendErrors;
            dropSend(id);
            if (sendErrors) {
                sendTransmissionError(id, e);
            }
            return;
        }
        pumpSendChunks(id);
        if (!activeSends_.count(id)) {
            return;
        }
    } else if (cmd.action == Action::Status || cmd.action == Action::Finish) {
        LOG_INFO_COMP_IF("Send " + id + " finished by the requestor", COMPONENT);
        dropSend(id);
        return;
    }
    if (!asd.accepted) {
        LOG_ERROR_COMP(std::string("File transmission command ") + toString(cmd.action) +
                       " received for pending id: " + id + ", aborting", COMPONENT);
        dropSend(id);
        return;
    }
    asd.lastActivityAt = now();
    if (cmd.action == Action::Cancel) {
        bool acks = asd.sendAcknowledgements;
        dropSend(id);
        if (acks) {
            sendStatusResponse(StatusCode::CANCELED, id);
        }
    }
}

void TerminalBroker::startSend(const std::string& id) {
    ActiveSend& asd = *activeSends_.at(id);
    if (asd.bypassOk) {
        handleReceiveConfirmation(*asd.bypassOk, id);
        return;
    }
    std::weak_ptr<bool> token = alive_;
    prompt_.askYesNo(SEND_PROMPT, [this, token, id](bool confirmed) {
        if (token.lock()) {
            handleReceiveConfirmation(confirmed, id);
        }
    });
}

void TerminalBroker::handleReceiveConfirmation(bool confirmed, const std::string& id) {
    auto it = activeSends_.find(id);
    if (it == activeSends_.end()) {
        return;
    }
    ActiveSend& asd = *it->second;
    if (!confirmed) {
        bool sendErrors = asd.sendErrors;
        LOG_INFO_COMP_IF("Send " + id + " refused", COMPONENT);
        dropSend(id);
        if (sendErrors) {
            sendStatusResponse(StatusCode::EPERM_CODE, id, "", "User refused the transfer");
        }
        return;
    }
    asd.accepted = true;
    LOG_INFO_COMP_IF("Send " + id + " accepted", COMPONENT);
    if (asd.sendAcknowledgements) {
        sendStatusResponse(StatusCode::OK, id);
    }
    if (asd.specComplete()) {
        sendMetadataForSendTransfer(asd);
    }
}

void TerminalBroker::sendMetadataForSendTransfer(ActiveSend& asd) {
    std::string id = asd.id;
    bool sent = false;
    for (auto& entry : iterFileMetadata(asd.fileSpecs, paths_)) {
        sent = true;
        if (auto* err = std::get_if<TransmissionError>(&entry)) {
            if (asd.sendErrors) {
                sendTransmissionError(id, *err);
            }
        } else {
            Message& msg = std::get<Message>(entry);
            msg.transferId = id;
            writeMessage(msg);
        }
    }
    if (sent) {
        sendStatusResponse(StatusCode::OK, id, "", "", paths_.home());
        asd.metadataSent = true;
    } else {
        sendStatusResponse(StatusCode::ENOENT_CODE, id, "", "No files found");
        dropSend(id);
    }
}

void TerminalBroker::pumpSendChunks(const std::string& id) {
    if (!pendingReplies_.empty()) {
        scheduleSendPump();
        return;
    }
    while (true) {
        auto it = activeSends_.find(id);
        if (it == activeSends_.end()) {
            return;
        }
        ActiveSend& asd = *it->second;
        std::optional<Message> msg;
        try {
            msg = asd.nextChunk(now(), settings_.chunkSize);
        } catch (const TransmissionError& e) {
            bool sendErrors = asd.sendErrors;
            dropSend(id);
            if (sendErrors) {
                sendTransmissionError(id, e);
            }
            return;
        } catch (const std::system_error& e) {
            sendFailOnOsError(e.code().value(), "Failed to read data from file", id, asd.sendErrors,
                              asd.activeFileId());
            dropSend(id);
            return;
        }
        if (!msg) {
            return;
        }
        msg->transferId = id;
        if (!writeMessage(*msg, false, false)) {
            asd.returnChunk(std::move(*msg));
            scheduleSendPump();
            return;
        }
    }
}

void TerminalBroker::scheduleSendPump() {
    if (sendPumpScheduled_) {
        return;
    }
    sendPumpScheduled_ = true;
    defer(settings_.sendPumpDelay, [this]() {
        sendPumpScheduled_ = false;
        pumpSends();
    });
}

void TerminalBroker::pumpSends() {
    std::vector<std::string> ids;
    for (const auto& entry : activeSends_) {
        if (entry.second->metadataSent) {
            ids.push_back(entry.first);
        }
    }
    for (const auto& id : ids) {
        pumpSendChunks(id);
    }
}

// Replies

bool TerminalBroker::writeMessage(const Message& msg, bool appendLeft, bool usePending) {
    if (usePending && !appendLeft && !pendingReplies_.empty()) {
        // Keep replies in order behind the ones already waiting
        pendingReplies_.push_back(msg);
        startPendingTimer();
        return false;
    }
    if (channel_.write(WireCodec::serialize(msg))) {
        return true;
    }
    if (usePending) {
        if (appendLeft) {
            pendingReplies_.push_front(msg);
        } else {
            pendingReplies_.push_back(msg);
        }
        startPendingTimer();
    }
    return false;
}

void TerminalBroker::startPendingTimer() {
    if (pendingTimer_) {
        return;
    }
    pendingTimer_ = true;
    defer(settings_.retryDelay, [this]() { tryPending(); });
}

void TerminalBroker::tryPending() {
    pendingTimer_ = false;
    while (!pendingReplies_.empty()) {
        Message payload = std::move(pendingReplies_.front());
        pendingReplies_.pop_front();
        auto ar = activeReceives_.find(payload.transferId);
        auto asd = activeSends_.find(payload.transferId);
        bool live = ar != activeReceives_.end() || asd != activeSends_.end();
        bool verdict = payload.action == Action::Status && payload.fileId.empty();
        if (!live && !verdict) {
            continue;
        }
        if (!writeMessage(payload, true)) {
            break;
        }
        if (ar != activeReceives_.end()) {
            ar->second->touch(now());
        } else if (asd != activeSends_.end()) {
            asd->second->lastActivityAt = now();
        }
    }
    pruneExpired();
}

bool TerminalBroker::sendStatusResponse(const std::string& code, const std::string& requestId,
                                        const std::string& fileId, const std::string& msg,
                                        const std::string& name, int64_t size, TransmissionType ttype) {
    TransmissionError err(code, msg, fileId, true, name, size, ttype);
    return writeMessage(err.asMessage(requestId));
}

bool TerminalBroker::sendTransmissionError(const std::string& requestId, const TransmissionError& err) {
    if (err.transmit()) {
        return writeMessage(err.asMessage(requestId));
    }
    return true;
}

void TerminalBroker::sendFailOnOsError(int err, const std::string& msg, const std::string& requestId,
                                       bool sendErrors, const std::string& fileId) {
    LOG_ERROR_COMP(msg + " (" + errnoName(err) + ") for transfer " + requestId, COMPONENT);
    if (sendErrors) {
        sendTransmissionError(requestId, TransmissionError::fromErrno(err, msg, fileId));
    }
}

} // namespace TermXfer
