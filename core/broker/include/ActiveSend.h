#pragma once

#include "WireMessage.h"
#include "TransferErrors.h"
#include "Compression.h"
#include "DeltaCodec.h"
#include "FileGuard.h"
#include "PathUtils.h"

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <utility>
#include <variant>
#include <vector>

namespace TermXfer {

/// Upper bound on file specs in one pull request.
constexpr size_t MAX_FILE_SPECS = 8192;

/// Upper bound on data requests queued for one pull.
constexpr size_t MAX_QUEUED_FILES = 32768;

using FileSpec = std::pair<std::string, std::string>; // (spec id, path)
using MetadataEntry = std::variant<Message, TransmissionError>;

/**
 * @brief Enumerate the terminal's filesystem for a pull request
 *
 * Produces one file message per matching entry, directories recursively.
 * The name carries the absolute path, status a per-request counter, and
 * parent the counter of the containing directory. Entries sharing an inode
 * after the first are sent as links whose data names the first one, and a
 * symlink whose target is part of the listing carries that target's counter.
 * Specs that cannot be read yield a TransmissionError for their spec id;
 * errors come first.
 */
std::vector<MetadataEntry> iterFileMetadata(const std::vector<FileSpec>& specs, const PathContext& paths);

/**
 * @brief A file the terminal streams to a requestor
 */
class SourceFile {
public:
    /**
     * @throws TransmissionError for a directory, std::system_error if the
     *         file cannot be opened
     */
    SourceFile(const Message& msg, const PathContext& paths);

    SourceFile(const SourceFile&) = delete;
    SourceFile& operator=(const SourceFile&) = delete;

    bool readyToTransmit() const { return !transmitted && !waitingForSignature; }

    /**
     * @brief Read, optionally diff, and compress the next piece
     * @return compressed bytes and the uncompressed length
     * @throws std::system_error on read failure
     */
    std::pair<std::vector<uint8_t>, size_t> nextChunk(size_t chunkSize = 1024 * 1024);

    /// Feed the requestor's signature of its copy.
    void addSignatureData(const std::vector<uint8_t>& data, bool isLast);

    bool usesRsync() const { return rsync_; }

    void close();

    std::string fileId;
    std::string path;
    TransmissionType transmissionType;
    bool waitingForSignature{false};
    bool transmitted{false};

private:
    struct stat stat_;
    bool rsync_{false};
    std::string target_;
    FileGuard file_;
    std::unique_ptr<StreamCompressor> compressor_;
    std::unique_ptr<LoadSignatureJob> signatureLoader_;
    std::unique_ptr<DeltaStream> delta_;
};

/**
 * @brief A pull the terminal is serving
 *
 * Collects the requested file specs, then after the metadata reply queues
 * the data requests and streams each file in order.
 */
class ActiveSend {
public:
    using Clock = std::chrono::steady_clock;

    ActiveSend(std::string id, int64_t quiet, std::optional<bool> bypassOk, int64_t numOfArgs,
               const PathContext& paths, Clock::time_point now);

    bool specComplete() const { return expectedNumOfArgs <= static_cast<int64_t>(fileSpecs.size()); }

    /// @throws TransmissionError when too many specs arrive
    void addFileSpec(const Message& msg, Clock::time_point now);

    /// @throws TransmissionError, std::system_error
    void addSendFile(const Message& msg, Clock::time_point now);

    /// @throws TransmissionError for an unknown or non-rsync file
    void addSignatureData(const Message& msg, Clock::time_point now);

    bool isExpired(Clock::time_point now, std::chrono::minutes expireTime) const {
        return now - lastActivityAt > expireTime;
    }

    /**
     * @brief Next message to write, pending chunks first
     * @return nothing when no file is ready
     * @throws std::system_error on read failure
     */
    std::optional<Message> nextChunk(Clock::time_point now, size_t chunkSize);

    /// Put back a chunk the channel refused.
    void returnChunk(Message msg) { pendingChunks.push_front(std::move(msg)); }

    /// File id of the file being streamed, empty when idle.
    std::string activeFileId() const { return activeFile_ ? activeFile_->fileId : std::string(); }

    void close();

    std::string id;
    int64_t expectedNumOfArgs;
    std::optional<bool> bypassOk;
    bool accepted{false};
    Clock::time_point lastActivityAt;
    bool sendAcknowledgements;
    bool sendErrors;
    std::vector<FileSpec> fileSpecs;
    std::deque<Message> pendingChunks;
    bool metadataSent{false};

private:
    SourceFile* findQueued(const std::string& fileId);

    const PathContext& paths_;
    std::vector<std::unique_ptr<SourceFile>> queuedFiles_;
    std::unique_ptr<SourceFile> activeFile_;
};

} // namespace TermXfer
