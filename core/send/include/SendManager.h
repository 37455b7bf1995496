#pragma once

#include "FileDiscovery.h"
#include "ProgressTracker.h"
#include "WireMessage.h"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace TermXfer {

enum class SendState {
    WaitingForPermission,
    PermissionGranted,
    PermissionDenied,
    Canceled,
    Complete
};

const char* toString(SendState state);

/**
 * @brief Protocol state of one push transfer
 *
 * Produces the messages of the transfer and folds the terminal's replies
 * into the per-file state machines. It performs no I/O on the channel; the
 * Sender owns the channel and the timers.
 */
class SendManager {
public:
    using FileProgressCallback = std::function<void(SendFile&, int64_t change)>;
    using FileDoneCallback = std::function<void(SendFile&)>;

    SendManager(std::string transferId, SendFileList files,
                const std::string& bypassSecret = "", bool useRsync = false,
                size_t chunkSize = 1024 * 1024);

    void setFileProgressCallback(FileProgressCallback cb) { fileProgress_ = std::move(cb); }
    void setFileDoneCallback(FileDoneCallback cb) { fileDone_ = std::move(cb); }

    /// The file currently streaming, or null if it left the transmitting state.
    SendFile* activeFile() const;

    /// Pick the first transmitting file. A hard link waits until its target is acknowledged.
    SendFile* activateNextReadyFile();
    void updateCollectiveStatuses();

    /// The opening send message, carrying the bypass token when a secret was given.
    Message startTransferMessage() const;

    /// One file message per entry, in discovery order.
    std::vector<Message> fileMetadata();

    /**
     * @brief Data messages for the next chunk of the active file
     *
     * Empty when no file is ready to transmit. A local read failure marks
     * only the affected file as failed and moves on to the next ready file.
     */
    std::vector<Message> nextChunks();

    /// Uncompressed size of the chunk produced by the last nextChunks(), if any.
    std::optional<int64_t> takeCurrentChunkSize();

    void onFileTransferResponse(const Message& msg);

    SendState state() const { return state_; }
    void setState(SendState state) { state_ = state; }
    bool allAcknowledged() const { return allAcknowledged_; }
    bool allStarted() const { return allStarted_; }

    const std::string& transferId() const { return transferId_; }
    const SendFileList& files() const { return files_; }
    ProgressTracker& progress() { return progress_; }
    const ProgressTracker& progress() const { return progress_; }

    /// Files that finished with an error status, in discovery order.
    std::vector<const SendFile*> failedFiles() const;

private:
    void onFileStatusUpdate(const Message& msg);
    void onSignatureDataReceived(const Message& msg);
    void failFile(SendFile& file, const std::string& message);
    bool linkTargetSettled(const SendFile& file) const;
    void reportProgress(SendFile& file, int64_t reported);
    SendFile* findFile(const std::string& fileId) const;

    std::string transferId_;
    SendFileList files_;
    std::map<std::string, SendFile*> fidMap_;
    std::string bypass_;
    bool useRsync_;
    size_t chunkSize_;

    SendState state_{SendState::WaitingForPermission};
    bool allAcknowledged_{false};
    bool allStarted_{false};
    std::optional<size_t> activeIdx_;
    std::optional<int64_t> currentChunkSize_;

    ProgressTracker progress_;
    FileProgressCallback fileProgress_;
    FileDoneCallback fileDone_;
};

} // namespace TermXfer
