#include "SendManager.h"
#include "TransferErrors.h"
#include "WireCodec.h"
#include "Encoding.h"
#include "LoggerMacros.h"

#include <cerrno>

namespace TermXfer {

namespace {
    const std::string COMPONENT = "Sender";

    int64_t totalPayloadSize(const SendFileList& files) {
        int64_t total = 0;
        for (const auto& f : files) {
            if (f->fileType == FileType::Regular && f->fileSize > 0) {
                total += f->fileSize;
            }
        }
        return total;
    }
}

const char* toString(SendState state) {
    switch (state) {
        case SendState::WaitingForPermission: return "waiting_for_permission";
        case SendState::PermissionGranted: return "permission_granted";
        case SendState::PermissionDenied: return "permission_denied";
        case SendState::Canceled: return "canceled";
        case SendState::Complete: return "complete";
    }
    return "unknown";
}

SendManager::SendManager(std::string transferId, SendFileList files,
                         const std::string& bypassSecret, bool useRsync, size_t chunkSize)
    : transferId_(std::move(transferId))
    , files_(std::move(files))
    , useRsync_(useRsync)
    , chunkSize_(chunkSize)
    , progress_(totalPayloadSize(files_)) {
    if (!bypassSecret.empty()) {
        bypass_ = WireCodec::encodeBypass(transferId_, bypassSecret);
    }
    for (auto& f : files_) {
        fidMap_[f->fileId] = f.get();
    }
}

SendFile* SendManager::findFile(const std::string& fileId) const {
    auto it = fidMap_.find(fileId);
    return it == fidMap_.end() ? nullptr : it->second;
}

SendFile* SendManager::activeFile() const {
    if (activeIdx_) {
        SendFile* f = files_[*activeIdx_].get();
        if (f->state == FileState::Transmitting) {
            return f;
        }
    }
    return nullptr;
}

SendFile* SendManager::activateNextReadyFile() {
    if (activeIdx_) {
        files_[*activeIdx_]->transmitEndedAt = SendFile::Clock::now();
    }
    for (size_t i = 0; i < files_.size(); ++i) {
        SendFile& f = *files_[i];
        if (f.state == FileState::Transmitting && linkTargetSettled(f)) {
            activeIdx_ = i;
            updateCollectiveStatuses();
            progress_.changeActiveFile(f);
            return &f;
        }
    }
    activeIdx_.reset();
    updateCollectiveStatuses();
    return nullptr;
}

bool SendManager::linkTargetSettled(const SendFile& file) const {
    if (file.fileType != FileType::Hardlink) {
        return true;
    }
    // The terminal links to whatever inode the target path holds, so an
    // rsync patch that later replaces the target must land first
    const std::string prefix = "fid:";
    if (file.hardLinkTarget.compare(0, prefix.size(), prefix) != 0) {
        return true;
    }
    SendFile* target = findFile(file.hardLinkTarget.substr(prefix.size()));
    return !target || target->state == FileState::Acknowledged;
}

void SendManager::updateCollectiveStatuses() {
    bool foundNotStarted = false;
    bool foundNotDone = false;
    for (const auto& f : files_) {
        if (f->state != FileState::Acknowledged) {
            foundNotDone = true;
        }
        if (f->state == FileState::WaitingForStart) {
            foundNotStarted = true;
        }
        if (foundNotStarted && foundNotDone) {
            break;
        }
    }
    allAcknowledged_ = !foundNotDone;
    allStarted_ = !foundNotStarted;
    if (allAcknowledged_ && state_ == SendState::PermissionGranted) {
        state_ = SendState::Complete;
    }
}

Message SendManager::startTransferMessage() const {
    Message msg(Action::Send, transferId_);
    msg.bypass = bypass_;
    return msg;
}

std::vector<Message> SendManager::fileMetadata() {
    std::vector<Message> out;
    out.reserve(files_.size());
    for (auto& f : files_) {
        Message msg = f->metadataMessage(useRsync_);
        msg.transferId = transferId_;
        out.push_back(std::move(msg));
    }
    return out;
}

std::vector<Message> SendManager::nextChunks() {
    std::vector<Message> out;
    for (;;) {
        if (!activeFile()) {
            activateNextReadyFile();
        }
        SendFile* af = activeFile();
        if (!af) {
            return out;
        }

        std::vector<uint8_t> chunk;
        int64_t uncompressed = 0;
        try {
            while (af->state != FileState::Finished && chunk.empty()) {
                SendFile::Chunk c = af->nextChunk(chunkSize_);
                uncompressed += static_cast<int64_t>(c.uncompressedSize);
                chunk = std::move(c.data);
            }
        } catch (const std::runtime_error& e) {
            // Move on to the next ready file
            failFile(*af, e.what());
            continue;
        }
        currentChunkSize_ = uncompressed;

        bool isLast = af->state == FileState::Finished;
        if (!chunk.empty()) {
            out = WireCodec::splitForTransfer(chunk, transferId_, af->fileId, isLast);
        } else if (isLast) {
            out.emplace_back(Action::EndData, transferId_, af->fileId);
        }
        return out;
    }
}

std::optional<int64_t> SendManager::takeCurrentChunkSize() {
    auto sz = currentChunkSize_;
    currentChunkSize_.reset();
    return sz;
}

void SendManager::failFile(SendFile& file, const std::string& message) {
    LOG_ERROR_COMP("Failed to read " + file.displayName + ": " + message, COMPONENT);
    file.closeSource();
    file.errorMessage = errnoName(EIO) + ":" + message;
    file.state = FileState::Acknowledged;
    progress_.onFileDone(file);
    if (fileDone_) {
        fileDone_(file);
    }
    if (activeIdx_ && files_[*activeIdx_].get() == &file) {
        activeIdx_.reset();
    }
    updateCollectiveStatuses();
}

void SendManager::reportProgress(SendFile& file, int64_t reported) {
    if (reported < 0) {
        return;
    }
    int64_t change = reported - file.reportedProgress;
    file.reportedProgress = reported;
    progress_.onFileProgress(file, change);
    if (fileProgress_) {
        fileProgress_(file, change);
    }
}

void SendManager::onFileStatusUpdate(const Message& msg) {
    SendFile* file = findFile(msg.fileId);
    if (!file) {
        return;
    }
    if (msg.status == StatusCode::STARTED) {
        file->remoteFinalPath = msg.name;
        file->remoteInitialSize = msg.size;
        if (file->fileType == FileType::Directory) {
            file->state = FileState::Finished;
        } else {
            file->state = msg.transmissionType == TransmissionType::Rsync ? FileState::WaitingForData
                                                                           : FileState::Transmitting;
        }
        updateCollectiveStatuses();
    } else if (msg.status == StatusCode::PROGRESS) {
        reportProgress(*file, msg.size);
    } else {
        if (!msg.name.empty() && file->remoteFinalPath.empty()) {
            file->remoteFinalPath = msg.name;
        }
        file->closeSource();
        file->state = FileState::Acknowledged;
        if (msg.status == StatusCode::OK) {
            if (file->fileType == FileType::Regular) {
                reportProgress(*file, msg.size);
            }
        } else {
            file->errorMessage = msg.status;
            LOG_WARN_COMP("Terminal reported failure for " + file->displayName + ": " +
                          Encoding::sanitizeControlCodes(msg.status), COMPONENT);
        }
        progress_.onFileDone(*file);
        if (fileDone_) {
            fileDone_(*file);
        }
        if (activeIdx_ && files_[*activeIdx_].get() == file) {
            activeIdx_.reset();
        }
        updateCollectiveStatuses();
    }
}

void SendManager::onSignatureDataReceived(const Message& msg) {
    SendFile* file = findFile(msg.fileId);
    if (!file || file->state != FileState::WaitingForData) {
        return;
    }
    try {
        file->addSignatureData(msg.data, msg.action == Action::EndData);
    } catch (const std::runtime_error& e) {
        failFile(*file, e.what());
        return;
    }
    if (msg.action == Action::EndData) {
        updateCollectiveStatuses();
    }
}

void SendManager::onFileTransferResponse(const Message& msg) {
    if (msg.action == Action::Status) {
        if (!msg.fileId.empty()) {
            onFileStatusUpdate(msg);
        } else if (state_ == SendState::WaitingForPermission) {
            state_ = msg.status == StatusCode::OK ? SendState::PermissionGranted : SendState::PermissionDenied;
            LOG_INFO_COMP_IF("Transfer " + transferId_ + " " + toString(state_), COMPONENT);
        }
    } else if (msg.action == Action::Data || msg.action == Action::EndData) {
        if (!msg.fileId.empty()) {
            onSignatureDataReceived(msg);
        }
    }
}

std::vector<const SendFile*> SendManager::failedFiles() const {
    std::vector<const SendFile*> out;
    for (const auto& f : files_) {
        if (!f->errorMessage.empty()) {
            out.push_back(f.get());
        }
    }
    return out;
}

} // namespace TermXfer
