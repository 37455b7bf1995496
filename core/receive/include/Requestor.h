#pragma once

#include "WireMessage.h"
#include "Compression.h"
#include "PathUtils.h"
#include "Result.h"

#include <cstdint>
#include <fstream>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace TermXfer {

enum class RequestState {
    WaitingForPermission,
    WaitingForFileMetadata,
    Transferring,
    Canceled
};

const char* toString(RequestState state);

/**
 * @brief One entry of the terminal's filesystem matched by a file spec
 */
struct RemoteFile {
    size_t specId{0};
    std::string fileId;          // local id used to request data
    std::string remoteId;        // id assigned by the terminal
    std::string remotePath;
    std::string displayName;
    std::string parent;          // remote id of the containing directory
    std::string remoteTarget;    // remote id a link points at
    FileType fileType{FileType::Regular};
    int64_t expectedSize{-1};
    int64_t mtime{-1};
    int64_t permissions{-1};
    CompressionType compression{CompressionType::None};

    std::string expandedLocalPath;
    std::string symlinkValue;
    int64_t bytesWritten{0};
    bool done{false};

    std::unique_ptr<StreamDecompressor> decompressor;
    std::unique_ptr<std::ofstream> output;
};

/**
 * @brief Pull flow: fetch files from the terminal's filesystem
 *
 * Emits one receive message declaring how many specs follow and one file
 * message per spec. The terminal answers with one file message per match,
 * status messages for failed specs and a final OK carrying its home
 * directory. Data for each requested entry is then written under the local
 * destination, and links and directories are created once every entry has
 * arrived.
 *
 * Response handling returns an Error when the transfer must be abandoned;
 * the caller then sends cancelMessage().
 */
class Requestor {
public:
    /**
     * @param specs remote paths, "~/" relative to the terminal's home
     * @param dest local destination; a directory when it ends in '/', already is one, or more
     *             than one entry is received. A lone file is written to dest itself.
     *             Ignored in mirror mode, where the remote layout is reproduced under the local home.
     */
    Requestor(std::string transferId, std::vector<std::string> specs, std::string dest,
              PathContext local, const std::string& bypassSecret = "", bool mirror = false);

    std::vector<Message> startTransfer() const;

    VoidResult onFileTransferResponse(const Message& msg);

    /// Fails when a spec was rejected by the terminal or matched nothing.
    VoidResult checkSpecs() const;

    /// Map every remote entry to its local path. Requires the metadata phase to be over.
    void collectFiles();

    /// Data requests for every regular file and symlink.
    std::vector<Message> requestFiles();

    /// False once every requested entry has been written. With nothing to
    /// fetch the caller calls finalize() directly.
    bool hasPendingData() const { return !toTransfer_.empty(); }

    /// Create directories, hard links and symlinks and apply metadata.
    VoidResult finalize();

    Message cancelMessage();
    Message finishMessage() const { return Message(Action::Finish, transferId_); }

    RequestState state() const { return state_; }
    bool transferDone() const { return transferDone_; }
    const std::string& transferId() const { return transferId_; }
    const std::string& remoteHome() const { return remoteHome_; }
    const std::vector<std::string>& specs() const { return specs_; }
    const std::vector<size_t>& specCounts() const { return specCounts_; }
    const std::map<size_t, std::string>& failedSpecs() const { return failedSpecs_; }
    const std::vector<std::unique_ptr<RemoteFile>>& files() const { return files_; }
    int64_t totalBytesWritten() const { return totalBytesWritten_; }

private:
    VoidResult handleMetadata(const Message& msg);
    VoidResult handleData(const Message& msg);
    VoidResult writeData(RemoteFile& file, const Message& msg);
    bool parseSpecId(const std::string& fid, size_t& out) const;
    std::string localBaseForSpec(size_t specId, const std::vector<std::string>& specPaths) const;
    bool destIsDirectory() const;
    Result<std::string> localPathOfRemote(const std::map<std::string, RemoteFile*>& byRemoteId,
                                          const std::string& remoteId, const std::string& kind) const;

    std::string transferId_;
    std::vector<std::string> specs_;
    std::string dest_;
    PathContext local_;
    std::string bypass_;
    bool mirror_;

    RequestState state_{RequestState::WaitingForPermission};
    std::vector<size_t> specCounts_;
    std::map<size_t, std::string> failedSpecs_;
    std::string remoteHome_;
    std::vector<std::unique_ptr<RemoteFile>> files_;
    std::map<std::string, RemoteFile*> toTransfer_;
    uint64_t fileCounter_{0};
    int64_t totalBytesWritten_{0};
    bool transferDone_{false};
};

} // namespace TermXfer
