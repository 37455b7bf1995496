#include "DestFile.h"
#include "TransferErrors.h"
#include "LoggerMacros.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace TermXfer {

namespace {
    const std::string COMPONENT = "TerminalBroker";

    std::string parentOf(const std::string& path) {
        return fs::path(path).parent_path().string();
    }

    void createParents(const std::string& path) {
        std::string parent = parentOf(path);
        if (parent.empty()) {
            return;
        }
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::system_error(ec, "Failed to create directory " + parent);
        }
    }
}

// PatchFile

PatchFile::PatchFile(std::string path, int64_t expectedSize)
    : path_(std::move(path)), expectedSize_(expectedSize) {
}

PatchFile::~PatchFile() {
    discard();
}

void PatchFile::openSource() {
    src_.reset(::open(path_.c_str(), O_RDONLY | O_CLOEXEC));
    if (!src_) {
        throw std::system_error(errno, std::generic_category(), "Failed to open " + path_);
    }
}

bool PatchFile::nextSignatureChunk(std::vector<uint8_t>& chunk) {
    if (signatureDone_) {
        return false;
    }
    if (!signature_) {
        openSource();
        signature_ = std::make_unique<DeltaStream>(
            DeltaCodec::makeSignature(expectedSize_),
            [this](uint8_t* buffer, size_t len) { return src_.read(buffer, len, path_); });
    }
    if (!signature_->next(chunk)) {
        signatureDone_ = true;
        signature_.reset();
        return false;
    }
    return true;
}

void PatchFile::write(const uint8_t* data, size_t len) {
    if (closed_) {
        throw TransmissionError(StatusCode::EINVAL_CODE, "Cannot write to a closed file");
    }
    if (!dest_) {
        if (!src_) {
            openSource();
        }
        std::string templ = (fs::path(parentOf(path_)) / ("." + fs::path(path_).filename().string() + ".XXXXXX")).string();
        int fd = ::mkstemp(&templ[0]);
        if (fd < 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to create temporary file next to " + path_);
        }
        dest_.reset(fd);
        tempPath_ = templ;
        patcher_ = DeltaCodec::makePatch([this](uint8_t* buffer, size_t n, uint64_t offset) {
            return src_.readAt(buffer, n, offset, path_);
        });
    }

    std::vector<uint8_t> input(data, data + len);
    while (!input.empty()) {
        DriveResult result = DeltaCodec::drive(*patcher_, input);
        for (const auto& out : result.outputs) {
            dest_.writeAll(out.data(), out.size(), tempPath_);
            written_ += static_cast<int64_t>(out.size());
        }
        if (result.finished && !result.leftover.empty()) {
            throw ProtocolError("too much input");
        }
        input = std::move(result.leftover);
    }
}

void PatchFile::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    signature_.reset();
    if (!dest_) {
        src_.reset();
        return;
    }
    std::vector<uint8_t> tail = DeltaCodec::finish(*patcher_);
    if (!tail.empty()) {
        dest_.writeAll(tail.data(), tail.size(), tempPath_);
        written_ += static_cast<int64_t>(tail.size());
    }
    patcher_.reset();
    dest_.close(tempPath_);
    src_.reset();

    struct stat st;
    if (::stat(path_.c_str(), &st) == 0) {
        ::chmod(tempPath_.c_str(), st.st_mode & 07777);
    }
    if (::rename(tempPath_.c_str(), path_.c_str()) != 0) {
        int err = errno;
        ::unlink(tempPath_.c_str());
        tempPath_.clear();
        throw std::system_error(err, std::generic_category(), "Failed to replace " + path_);
    }
    tempPath_.clear();
}

void PatchFile::discard() noexcept {
    closed_ = true;
    signature_.reset();
    patcher_.reset();
    dest_.reset();
    src_.reset();
    if (!tempPath_.empty()) {
        ::unlink(tempPath_.c_str());
        tempPath_.clear();
    }
}

// DestFile

DestFile::DestFile(const Message& msg, const PathContext& paths)
    : name(paths.resolveRemoteName(msg.name))
    , fileId(msg.fileId)
    , mtime(msg.mtime)
    , permissions(msg.permissions)
    , fileType(msg.fileType)
    , transmissionType(msg.transmissionType)
    , declaredSize(msg.size) {
    struct stat st;
    if (::lstat(name.c_str(), &st) == 0) {
        existingSize = static_cast<int64_t>(st.st_size);
        needsUnlink = st.st_nlink > 1 || S_ISLNK(st.st_mode);
    }
    if (permissions >= 0) {
        permissions &= 07777;
    }
    if (msg.compression == CompressionType::Zlib) {
        decompressor_ = std::make_unique<ZlibDecompressor>();
    } else {
        decompressor_ = std::make_unique<IdentityDecompressor>();
    }
    closed = fileType == FileType::Directory;
}

DestFile::~DestFile() {
    discard();
}

void DestFile::notifyClosed() {
    if (released_) {
        return;
    }
    released_ = true;
    if (onClosed_) {
        onClosed_(*this);
    }
}

void DestFile::makeParentDirs() const {
    createParents(name);
}

void DestFile::applyMetadata(bool isSymlink) const {
    PathUtils::applyMetadata(name, permissions, mtime, isSymlink);
}

void DestFile::unlinkExistingIfNeeded(bool force) {
    if (force || needsUnlink) {
        if (::unlink(name.c_str()) != 0 && errno != ENOENT) {
            throw std::system_error(errno, std::generic_category(), "Failed to remove " + name);
        }
        needsUnlink = false;
    }
}

PatchFile& DestFile::signatureIterator() {
    if (!patch_) {
        patch_ = std::make_unique<PatchFile>(name, existingSize);
    }
    return *patch_;
}

void DestFile::writeData(const FileMap& allFiles, const std::vector<uint8_t>& data, bool isLast) {
    if (fileType == FileType::Directory) {
        throw TransmissionError(StatusCode::EISDIR_CODE, "Cannot write data to a directory entry", fileId);
    }
    if (closed) {
        throw TransmissionError(StatusCode::EINVAL_CODE, "Cannot write to a closed file", fileId);
    }
    if (fileType == FileType::Symlink || fileType == FileType::Hardlink) {
        writeLink(allFiles, data, isLast);
    } else {
        writeRegular(data, isLast);
    }
}

void DestFile::writeLink(const FileMap& allFiles, const std::vector<uint8_t>& data, bool isLast) {
    linkTarget_.append(data.begin(), data.end());
    if (!isLast) {
        return;
    }
    makeParentDirs();
    unlinkExistingIfNeeded(true);

    std::string lt;
    auto lookup = [&](const std::string& id) -> const DestFile& {
        auto it = allFiles.find(id);
        if (it == allFiles.end()) {
            throw TransmissionError(StatusCode::EINVAL_CODE, "Link target " + id + " is not part of this transfer", fileId);
        }
        return *it->second;
    };

    if (linkTarget_.rfind("fid:", 0) == 0) {
        lt = lookup(linkTarget_.substr(4)).name;
        if (fileType == FileType::Symlink) {
            lt = PathUtils::relativeTo(lt, parentOf(name));
        }
    } else if (linkTarget_.rfind("fid_abs:", 0) == 0) {
        lt = lookup(linkTarget_.substr(8)).name;
    } else if (linkTarget_.rfind("path:", 0) == 0) {
        lt = linkTarget_.substr(5);
        if (fileType == FileType::Hardlink && !fs::path(lt).is_absolute()) {
            lt = (fs::path(parentOf(name)) / lt).lexically_normal().string();
        }
    } else {
        throw TransmissionError(StatusCode::EINVAL_CODE, "Unknown link target type", fileId);
    }

    if (fileType == FileType::Symlink) {
        if (::symlink(lt.c_str(), name.c_str()) != 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to create symlink " + name);
        }
    } else {
        if (::link(lt.c_str(), name.c_str()) != 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to create hard link " + name);
        }
    }
    close();
    applyMetadata(true);
}

void DestFile::writeRegular(const std::vector<uint8_t>& data, bool isLast) {
    std::vector<uint8_t> decompressed = decompressor_->decompress(data, isLast);

    if (patch_) {
        patch_->write(decompressed.data(), decompressed.size());
        bytesWritten = patch_->tell();
    } else {
        if (declaredSize >= 0 && bytesWritten + static_cast<int64_t>(decompressed.size()) > declaredSize) {
            throw TransmissionError(errnoName(EFBIG), "Received more data than the declared size", fileId);
        }
        if (!output_) {
            makeParentDirs();
            unlinkExistingIfNeeded();
            mode_t mode = permissions >= 0 ? static_cast<mode_t>(permissions) : 0644;
            output_.reset(::open(name.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, mode));
            if (!output_) {
                throw std::system_error(errno, std::generic_category(), "Failed to open " + name);
            }
        }
        output_.writeAll(decompressed.data(), decompressed.size(), name);
        bytesWritten += static_cast<int64_t>(decompressed.size());
    }

    if (isLast) {
        close();
        applyMetadata();
    }
}

void DestFile::close() {
    if (closed) {
        return;
    }
    closed = true;
    if (patch_) {
        std::unique_ptr<PatchFile> patch = std::move(patch_);
        patch->close();
        bytesWritten = patch->tell();
    }
    output_.close(name);
    notifyClosed();
}

void DestFile::discard() noexcept {
    closed = true;
    if (patch_) {
        patch_->discard();
        patch_.reset();
    }
    output_.reset();
    notifyClosed();
}

} // namespace TermXfer
