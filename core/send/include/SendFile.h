#pragma once

#include "WireMessage.h"
#include "Compression.h"
#include "DeltaCodec.h"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <utility>
#include <vector>

namespace TermXfer {

enum class FileState {
    WaitingForStart,
    WaitingForData,
    Transmitting,
    Finished,
    Acknowledged
};

const char* toString(FileState state);

/// Files at or below this size are always sent whole.
constexpr int64_t MIN_RSYNC_SIZE = 4096;

/**
 * @brief One filesystem entry being pushed to the terminal side
 *
 * Directories and links carry only metadata; regular files stream their
 * content (or a delta against the remote copy) through nextChunk().
 */
class SendFile {
public:
    using Clock = std::chrono::steady_clock;
    using FileHash = std::pair<uint64_t, uint64_t>; // (device, inode)

    struct Chunk {
        std::vector<uint8_t> data;  // compressed payload
        size_t uncompressedSize = 0;
    };

    SendFile(std::string localPath, std::string expandedLocalPath, uint64_t counter,
             const struct stat& st, const std::string& remoteBase, FileType type);

    /**
     * @brief Produce the next chunk of payload
     *
     * Moves the file to Finished after its last chunk. The last chunk of a
     * compressed stream includes the compressor trailer.
     *
     * @throws std::runtime_error if the local file cannot be read
     */
    Chunk nextChunk(size_t chunkSize = 1024 * 1024);

    /// The file message announcing this entry. Fixes transmission type and compression.
    Message metadataMessage(bool useRsync);

    /// Feed signature bytes received from the terminal; end_data starts the delta.
    void addSignatureData(const std::vector<uint8_t>& data, bool isLast);

    bool rsyncCapable() const { return fileType == FileType::Regular && fileSize > MIN_RSYNC_SIZE; }
    bool compressionCapable() const {
        return rsyncCapable() && shouldBeCompressed(expandedLocalPath);
    }

    void closeSource();

    static std::string remotePathFor(const std::string& localPath, const std::string& remoteBase);

    FileState state{FileState::WaitingForStart};
    std::string localPath;
    std::string displayName;
    std::string expandedLocalPath;
    std::string fileId;
    uint32_t permissions{0};
    int64_t mtime{-1};
    int64_t fileSize{0};
    int64_t bytesToTransmit{0};
    FileHash fileHash{0, 0};
    std::string remotePath;
    FileType fileType{FileType::Regular};
    std::string hardLinkTarget;
    std::string symbolicLinkTarget;

    TransmissionType transmissionType{TransmissionType::Simple};
    CompressionType compression{CompressionType::None};

    std::string remoteFinalPath;
    int64_t remoteInitialSize{-1};
    std::string errorMessage;
    int64_t transmittedBytes{0};
    int64_t reportedProgress{0};
    Clock::time_point transmitStartedAt{};
    Clock::time_point transmitEndedAt{};
    Clock::time_point doneAt{};

private:
    void startDeltaCalculation();
    std::shared_ptr<std::ifstream> openSource();

    std::unique_ptr<StreamCompressor> compressor_;
    std::shared_ptr<std::ifstream> source_;
    int64_t readOffset_{0};
    std::unique_ptr<LoadSignatureJob> signatureLoader_;
    std::unique_ptr<DeltaStream> deltaStream_;
};

} // namespace TermXfer
