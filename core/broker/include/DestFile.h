#pragma once

#include "WireMessage.h"
#include "Compression.h"
#include "DeltaCodec.h"
#include "FileGuard.h"
#include "PathUtils.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TermXfer {

/**
 * @brief Destination of an rsync transmission
 *
 * First streams the signature of the existing file, then patches the
 * incoming delta against it into a temporary file in the same directory.
 * close() replaces the original with the patched copy.
 */
class PatchFile {
public:
    PatchFile(std::string path, int64_t expectedSize);
    ~PatchFile();

    PatchFile(const PatchFile&) = delete;
    PatchFile& operator=(const PatchFile&) = delete;

    /**
     * @brief Next piece of the signature of the existing file
     * @return false once the whole signature has been produced
     * @throws std::system_error if the existing file cannot be read
     */
    bool nextSignatureChunk(std::vector<uint8_t>& chunk);

    /**
     * @brief Apply a piece of the delta
     * @throws ProtocolError on a corrupt delta, std::system_error on I/O failure
     */
    void write(const uint8_t* data, size_t len);

    /// Finish the patch and move the result over the original.
    void close();

    /// Drop the temporary file, leaving the original untouched.
    void discard() noexcept;

    int64_t tell() const { return written_; }
    bool signatureDone() const { return signatureDone_; }

private:
    void openSource();
    void writeOutputs(const std::vector<std::vector<uint8_t>>& outputs);

    std::string path_;
    int64_t expectedSize_;
    FileGuard src_;
    FileGuard dest_;
    std::string tempPath_;
    std::unique_ptr<DeltaStream> signature_;
    std::unique_ptr<PatchJob> patcher_;
    bool signatureDone_{false};
    bool closed_{false};
    int64_t written_{0};
};

/**
 * @brief One entry being received by the terminal
 *
 * Created by a file message, fed by data and end_data. Regular files are
 * decompressed and written to disk (or patched when rsync was negotiated),
 * links collect their target and are created on end_data, directories
 * accept no data.
 */
class DestFile {
public:
    using FileMap = std::map<std::string, std::unique_ptr<DestFile>>;

    DestFile(const Message& msg, const PathContext& paths);
    ~DestFile();

    DestFile(const DestFile&) = delete;
    DestFile& operator=(const DestFile&) = delete;

    /**
     * @throws TransmissionError for protocol misuse, std::system_error for
     *         OS failures, std::runtime_error for corrupt compressed data
     */
    void writeData(const FileMap& allFiles, const std::vector<uint8_t>& data, bool isLast);

    /// Start an rsync transmission against the existing file.
    PatchFile& signatureIterator();

    /// Commit the content written so far. @throws std::system_error
    void close();

    /// Release every resource without committing. Safe to call repeatedly.
    void discard() noexcept;

    void makeParentDirs() const;
    void applyMetadata(bool isSymlink = false) const;
    void unlinkExistingIfNeeded(bool force = false);

    /// Invoked once when the file releases its resources.
    void setClosedObserver(std::function<void(const DestFile&)> observer) { onClosed_ = std::move(observer); }

    std::string name;
    std::string fileId;
    int64_t mtime{-1};
    int64_t permissions{-1};
    FileType fileType{FileType::Regular};
    TransmissionType transmissionType{TransmissionType::Simple};
    int64_t declaredSize{-1};
    int64_t existingSize{-1};
    bool needsUnlink{false};
    bool closed{false};
    bool failed{false};
    int64_t bytesWritten{0};

private:
    void writeRegular(const std::vector<uint8_t>& data, bool isLast);
    void writeLink(const FileMap& allFiles, const std::vector<uint8_t>& data, bool isLast);
    void notifyClosed();

    std::string linkTarget_;
    std::unique_ptr<StreamDecompressor> decompressor_;
    std::unique_ptr<PatchFile> patch_;
    FileGuard output_;
    bool released_{false};
    std::function<void(const DestFile&)> onClosed_;
};

} // namespace TermXfer
