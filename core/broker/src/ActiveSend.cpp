#include "ActiveSend.h"
#include "WireCodec.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <dirent.h>
#include <fcntl.h>
#include <filesystem>
#include <map>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace TermXfer {

namespace {
    const std::string COMPONENT = "TerminalBroker";

    using InodeKey = std::pair<uint64_t, uint64_t>;

    bool fileTypeOf(const struct stat& st, FileType& out) {
        if (S_ISLNK(st.st_mode)) {
            out = FileType::Symlink;
        } else if (S_ISDIR(st.st_mode)) {
            out = FileType::Directory;
        } else if (S_ISREG(st.st_mode)) {
            out = FileType::Regular;
        } else {
            return false;
        }
        return true;
    }

    /// Groups file messages by inode, remembering first-seen order.
    class MetadataCollector {
    public:
        /// @return the message, or nothing for unsupported file types
        Message* add(const std::string& path, const std::string& specId, const struct stat& st,
                     const std::string& parent) {
            FileType type;
            if (!fileTypeOf(st, type)) {
                return nullptr;
            }
            Message msg(Action::File, "", specId);
            msg.mtime = static_cast<int64_t>(st.st_mtim.tv_sec) * 1000000000LL + st.st_mtim.tv_nsec;
            msg.permissions = static_cast<int64_t>(st.st_mode & 07777);
            msg.name = path;
            msg.status = std::to_string(counter_++);
            msg.size = static_cast<int64_t>(st.st_size);
            msg.fileType = type;
            msg.parent = parent;

            InodeKey key{static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
            auto it = index_.find(key);
            if (it == index_.end()) {
                it = index_.emplace(key, groups_.size()).first;
                groups_.emplace_back();
            }
            auto& group = groups_[it->second];
            group.push_back(std::make_unique<Message>(std::move(msg)));
            return group.back().get();
        }

        void addDirectory(const Message& dir, const std::string& specId) {
            std::vector<std::string> names;
            DIR* d = ::opendir(dir.name.c_str());
            if (!d) {
                return;
            }
            while (struct dirent* entry = ::readdir(d)) {
                std::string name = entry->d_name;
                if (name != "." && name != "..") {
                    names.push_back(name);
                }
            }
            ::closedir(d);
            std::sort(names.begin(), names.end());

            for (const auto& name : names) {
                std::string child = (fs::path(dir.name) / name).string();
                struct stat st;
                if (::lstat(child.c_str(), &st) != 0) {
                    continue;
                }
                Message* msg = add(child, specId, st, dir.status);
                if (msg && msg->fileType == FileType::Directory) {
                    addDirectory(*msg, specId);
                }
            }
        }

        void emit(std::vector<MetadataEntry>& out) const {
            for (const auto& group : groups_) {
                Message base = *group.front();
                resolveSymlink(base);
                out.emplace_back(base);
                if (group.size() > 1 && base.fileType == FileType::Regular) {
                    for (size_t i = 1; i < group.size(); ++i) {
                        if (group[i]->fileType != FileType::Regular) {
                            continue;
                        }
                        Message link = *group[i];
                        link.fileType = FileType::Hardlink;
                        link.setData(base.status);
                        out.emplace_back(std::move(link));
                    }
                }
            }
        }

    private:
        void resolveSymlink(Message& msg) const {
            if (msg.fileType != FileType::Symlink) {
                return;
            }
            char* resolved = ::realpath(msg.name.c_str(), nullptr);
            if (!resolved) {
                return;
            }
            std::string dest(resolved);
            ::free(resolved);
            struct stat st;
            if (::lstat(dest.c_str(), &st) != 0) {
                return;
            }
            auto it = index_.find({static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)});
            if (it != index_.end()) {
                msg.setData(groups_[it->second].front()->status);
            }
        }

        uint64_t counter_{0};
        std::map<InodeKey, size_t> index_;
        std::vector<std::vector<std::unique_ptr<Message>>> groups_;
    };
}

std::vector<MetadataEntry> iterFileMetadata(const std::vector<FileSpec>& specs, const PathContext& paths) {
    std::vector<MetadataEntry> out;
    MetadataCollector collector;

    for (const auto& spec : specs) {
        const std::string& specId = spec.first;
        std::string path = paths.resolveRemoteName(spec.second);

        struct stat st;
        if (::lstat(path.c_str(), &st) != 0) {
            out.emplace_back(TransmissionError(errnoName(errno), "Failed to read spec", specId));
            continue;
        }
        if (::faccessat(AT_FDCWD, path.c_str(), R_OK, AT_SYMLINK_NOFOLLOW) != 0) {
            out.emplace_back(TransmissionError(StatusCode::EPERM_CODE, "No permission to read spec", specId));
            continue;
        }
        Message* msg = collector.add(path, specId, st, "");
        if (!msg) {
            out.emplace_back(TransmissionError(StatusCode::EINVAL_CODE, "Not a valid filetype", specId));
            continue;
        }
        if (msg->fileType == FileType::Directory) {
            collector.addDirectory(*msg, specId);
        }
    }

    collector.emit(out);
    return out;
}

// SourceFile

SourceFile::SourceFile(const Message& msg, const PathContext& paths)
    : fileId(msg.fileId)
    , path(paths.resolveRemoteName(msg.name))
    , transmissionType(msg.transmissionType) {
    rsync_ = waitingForSignature = transmissionType == TransmissionType::Rsync;
    if (::lstat(path.c_str(), &stat_) != 0) {
        throw std::system_error(errno, std::generic_category(), "Failed to stat " + path);
    }
    if (S_ISDIR(stat_.st_mode)) {
        throw TransmissionError(StatusCode::EINVAL_CODE, "Cannot send a directory", fileId);
    }
    compressor_ = std::make_unique<IdentityCompressor>();
    if (S_ISLNK(stat_.st_mode)) {
        std::error_code ec;
        target_ = fs::read_symlink(path, ec).string();
        if (ec) {
            throw std::system_error(ec, "Failed to read link " + path);
        }
    } else {
        file_.reset(::open(path.c_str(), O_RDONLY | O_CLOEXEC));
        if (!file_) {
            throw std::system_error(errno, std::generic_category(), "Failed to open " + path);
        }
        if (msg.compression == CompressionType::Zlib) {
            compressor_ = std::make_unique<ZlibCompressor>();
        }
    }
    if (rsync_) {
        signatureLoader_ = DeltaCodec::makeSignatureLoader();
    }
}

void SourceFile::addSignatureData(const std::vector<uint8_t>& data, bool isLast) {
    if (!signatureLoader_) {
        throw TransmissionError(StatusCode::EINVAL_CODE,
                                "Signature data for file that is not using rsync: " + fileId, fileId);
    }
    DriveResult result = DeltaCodec::drive(*signatureLoader_, data, isLast);
    if (!result.leftover.empty()) {
        throw ProtocolError("too much input");
    }
    if (!isLast) {
        return;
    }
    if (!result.finished) {
        throw ProtocolError("insufficient input data");
    }
    Signature signature = signatureLoader_->release();
    signatureLoader_.reset();
    delta_ = std::make_unique<DeltaStream>(
        DeltaCodec::makeDelta(std::move(signature)),
        [this](uint8_t* buffer, size_t len) { return file_.read(buffer, len, path); });
    waitingForSignature = false;
}

std::pair<std::vector<uint8_t>, size_t> SourceFile::nextChunk(size_t chunkSize) {
    std::vector<uint8_t> data;
    if (!target_.empty()) {
        transmitted = true;
        data.assign(target_.begin(), target_.end());
    } else if (!file_) {
        transmitted = true;
    } else if (!delta_) {
        data.resize(chunkSize);
        size_t n = file_.read(data.data(), data.size(), path);
        data.resize(n);
        off_t pos = ::lseek(file_.get(), 0, SEEK_CUR);
        if (n == 0 || pos >= stat_.st_size) {
            transmitted = true;
        }
    } else {
        if (!delta_->next(data) || delta_->exhausted()) {
            transmitted = true;
        }
    }

    size_t uncompressed = data.size();
    std::vector<uint8_t> chunk = compressor_->compress(data);
    if (transmitted) {
        if (!compressor_->isIdentity()) {
            std::vector<uint8_t> tail = compressor_->flush();
            chunk.insert(chunk.end(), tail.begin(), tail.end());
        }
        close();
    }
    return {std::move(chunk), uncompressed};
}

void SourceFile::close() {
    delta_.reset();
    signatureLoader_.reset();
    file_.reset();
}

// ActiveSend

ActiveSend::ActiveSend(std::string sendId, int64_t quiet, std::optional<bool> bypass, int64_t numOfArgs,
                       const PathContext& paths, Clock::time_point now)
    : id(std::move(sendId))
    , expectedNumOfArgs(numOfArgs)
    , bypassOk(bypass)
    , lastActivityAt(now)
    , sendAcknowledgements(quiet < 1)
    , sendErrors(quiet < 2)
    , paths_(paths) {
}

void ActiveSend::addFileSpec(const Message& msg, Clock::time_point now) {
    lastActivityAt = now;
    if (fileSpecs.size() > MAX_FILE_SPECS || specComplete()) {
        throw TransmissionError(StatusCode::EINVAL_CODE, "Too many file specs");
    }
    fileSpecs.emplace_back(msg.fileId, msg.name);
}

void ActiveSend::addSendFile(const Message& msg, Clock::time_point now) {
    lastActivityAt = now;
    if (queuedFiles_.size() > MAX_QUEUED_FILES) {
        throw TransmissionError(StatusCode::EINVAL_CODE, "Too many queued files");
    }
    auto file = std::make_unique<SourceFile>(msg, paths_);
    auto it = std::find_if(queuedFiles_.begin(), queuedFiles_.end(),
                           [&](const std::unique_ptr<SourceFile>& f) { return f->fileId == msg.fileId; });
    if (it != queuedFiles_.end()) {
        *it = std::move(file);
    } else {
        queuedFiles_.push_back(std::move(file));
    }
}

SourceFile* ActiveSend::findQueued(const std::string& fileId) {
    for (auto& f : queuedFiles_) {
        if (f->fileId == fileId) {
            return f.get();
        }
    }
    return nullptr;
}

void ActiveSend::addSignatureData(const Message& msg, Clock::time_point now) {
    lastActivityAt = now;
    SourceFile* file = findQueued(msg.fileId);
    if (!file) {
        throw TransmissionError(StatusCode::EINVAL_CODE, "Signature data for unknown file_id: " + msg.fileId);
    }
    if (!file->usesRsync() || !file->waitingForSignature) {
        throw TransmissionError(StatusCode::EINVAL_CODE,
                                "Signature data for file that is not using rsync: " + msg.fileId);
    }
    try {
        file->addSignatureData(msg.data, msg.action == Action::EndData);
    } catch (const ProtocolError& e) {
        throw TransmissionError(StatusCode::EINVAL_CODE, e.what(), msg.fileId);
    }
}

std::optional<Message> ActiveSend::nextChunk(Clock::time_point now, size_t chunkSize) {
    lastActivityAt = now;
    if (!pendingChunks.empty()) {
        Message msg = std::move(pendingChunks.front());
        pendingChunks.pop_front();
        return msg;
    }
    if (!activeFile_) {
        auto it = std::find_if(queuedFiles_.begin(), queuedFiles_.end(),
                               [](const std::unique_ptr<SourceFile>& f) { return f->readyToTransmit(); });
        if (it == queuedFiles_.end()) {
            return std::nullopt;
        }
        activeFile_ = std::move(*it);
        queuedFiles_.erase(it);
    }

    std::unique_ptr<SourceFile> af;
    std::vector<uint8_t> chunk;
    std::string fileId = activeFile_->fileId;
    while (true) {
        try {
            chunk = activeFile_->nextChunk(chunkSize).first;
        } catch (const ProtocolError& e) {
            throw TransmissionError(StatusCode::EINVAL_CODE, e.what(), fileId);
        }
        if (activeFile_->transmitted) {
            af = std::move(activeFile_);
            break;
        }
        if (!chunk.empty()) {
            break;
        }
    }
    bool last = af != nullptr;
    if (!chunk.empty()) {
        for (auto& msg : WireCodec::splitForTransfer(chunk, id, fileId, last)) {
            pendingChunks.push_back(std::move(msg));
        }
        Message msg = std::move(pendingChunks.front());
        pendingChunks.pop_front();
        return msg;
    }
    if (last) {
        return Message(Action::EndData, id, fileId);
    }
    return std::nullopt;
}

void ActiveSend::close() {
    if (activeFile_) {
        activeFile_->close();
        activeFile_.reset();
    }
    for (auto& f : queuedFiles_) {
        f->close();
    }
    queuedFiles_.clear();
    pendingChunks.clear();
}

} // namespace TermXfer
