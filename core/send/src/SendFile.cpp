#include "SendFile.h"
#include "Encoding.h"
#include "TransferErrors.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>

namespace TermXfer {

const char* toString(FileState state) {
    switch (state) {
        case FileState::WaitingForStart: return "waiting_for_start";
        case FileState::WaitingForData: return "waiting_for_data";
        case FileState::Transmitting: return "transmitting";
        case FileState::Finished: return "finished";
        case FileState::Acknowledged: return "acknowledged";
    }
    return "unknown";
}

SendFile::SendFile(std::string local, std::string expanded, uint64_t counter,
                   const struct stat& st, const std::string& remoteBase, FileType type)
    : localPath(std::move(local))
    , expandedLocalPath(std::move(expanded))
    , fileType(type) {
    displayName = Encoding::sanitizeControlCodes(localPath);
    permissions = static_cast<uint32_t>(st.st_mode & 07777);
    mtime = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
    fileSize = bytesToTransmit = static_cast<int64_t>(st.st_size);
    fileHash = {static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
    remotePath = remotePathFor(localPath, remoteBase);

    std::ostringstream oss;
    oss << std::hex << counter;
    fileId = oss.str();
}

std::string SendFile::remotePathFor(const std::string& localPath, const std::string& remoteBase) {
    if (remoteBase.empty()) {
        return localPath;
    }
    if (remoteBase.back() == '/') {
        std::string trimmed = localPath;
        while (trimmed.size() > 1 && trimmed.back() == '/') {
            trimmed.pop_back();
        }
        return remoteBase + std::filesystem::path(trimmed).filename().string();
    }
    return remoteBase;
}

Message SendFile::metadataMessage(bool useRsync) {
    transmissionType = rsyncCapable() && useRsync ? TransmissionType::Rsync : TransmissionType::Simple;
    compression = compressionCapable() ? CompressionType::Zlib : CompressionType::None;
    if (compression == CompressionType::Zlib) {
        compressor_ = std::make_unique<ZlibCompressor>();
    } else {
        compressor_ = std::make_unique<IdentityCompressor>();
    }

    Message msg(Action::File);
    msg.compression = compression;
    msg.fileType = fileType;
    msg.name = remotePath;
    msg.permissions = permissions;
    msg.mtime = mtime;
    msg.fileId = fileId;
    msg.transmissionType = transmissionType;
    if (fileType == FileType::Regular) {
        msg.size = fileSize;
    }
    return msg;
}

std::shared_ptr<std::ifstream> SendFile::openSource() {
    if (!source_) {
        auto stream = std::make_shared<std::ifstream>(expandedLocalPath, std::ios::binary);
        if (!*stream) {
            throw std::system_error(errno, std::generic_category(), "Failed to open " + expandedLocalPath);
        }
        source_ = std::move(stream);
    }
    return source_;
}

void SendFile::closeSource() {
    deltaStream_.reset();
    signatureLoader_.reset();
    source_.reset();
}

SendFile::Chunk SendFile::nextChunk(size_t chunkSize) {
    Chunk chunk;
    if (fileType == FileType::Symlink || fileType == FileType::Hardlink) {
        state = FileState::Finished;
        const std::string& target = fileType == FileType::Symlink ? symbolicLinkTarget : hardLinkTarget;
        chunk.data.assign(target.begin(), target.end());
        chunk.uncompressedSize = chunk.data.size();
        return chunk;
    }
    if (fileType == FileType::Directory) {
        state = FileState::Finished;
        return chunk;
    }

    bool isLast = false;
    std::vector<uint8_t> raw;
    if (deltaStream_) {
        if (!deltaStream_->next(raw)) {
            isLast = true;
            deltaStream_.reset();
        }
    } else {
        auto src = openSource();
        size_t want = static_cast<size_t>(std::min<int64_t>(static_cast<int64_t>(chunkSize),
                                                            std::max<int64_t>(fileSize - readOffset_, 0)));
        raw.resize(want);
        if (want > 0) {
            src->read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(want));
            if (src->bad()) {
                throw std::system_error(errno, std::generic_category(), "Failed to read " + expandedLocalPath);
            }
            raw.resize(static_cast<size_t>(src->gcount()));
        }
        readOffset_ += static_cast<int64_t>(raw.size());
        isLast = raw.empty() || readOffset_ >= fileSize;
    }

    if (!compressor_) {
        compressor_ = std::make_unique<IdentityCompressor>();
    }
    chunk.uncompressedSize = raw.size();
    chunk.data = compressor_->compress(raw);
    if (isLast) {
        if (!compressor_->isIdentity()) {
            auto trailer = compressor_->flush();
            chunk.data.insert(chunk.data.end(), trailer.begin(), trailer.end());
        }
        state = FileState::Finished;
        closeSource();
    }
    return chunk;
}

void SendFile::addSignatureData(const std::vector<uint8_t>& data, bool isLast) {
    if (state != FileState::WaitingForData) {
        return;
    }
    if (!signatureLoader_) {
        signatureLoader_ = DeltaCodec::makeSignatureLoader();
    }
    auto result = DeltaCodec::drive(*signatureLoader_, data);
    if (!result.leftover.empty()) {
        throw ProtocolError("Signature loader did not consume its input");
    }
    if (isLast) {
        DeltaCodec::finish(*signatureLoader_);
        startDeltaCalculation();
    }
}

void SendFile::startDeltaCalculation() {
    state = FileState::Transmitting;
    Signature signature = signatureLoader_->release();
    signatureLoader_.reset();
    LOG_DEBUG_COMP_IF("Starting delta for " + displayName + " against " +
                      std::to_string(signature.blocks.size()) + " remote blocks", "Sender");

    auto src = openSource();
    std::string path = expandedLocalPath;
    ByteSource source = [src, path](uint8_t* buffer, size_t len) -> size_t {
        src->read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(len));
        if (src->bad()) {
            throw std::system_error(errno, std::generic_category(), "Failed to read " + path);
        }
        return static_cast<size_t>(src->gcount());
    };
    deltaStream_ = std::make_unique<DeltaStream>(DeltaCodec::makeDelta(std::move(signature)), std::move(source));
}

} // namespace TermXfer
