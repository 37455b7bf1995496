#include "Requestor.h"
#include "TransferErrors.h"
#include "WireCodec.h"
#include "Encoding.h"
#include "LoggerMacros.h"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <functional>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace TermXfer {

namespace {

    const std::string COMPONENT = "Requestor";

    std::string posixBaseName(const std::string& path) {
        std::string trimmed = path;
        while (trimmed.size() > 1 && trimmed.back() == '/') {
            trimmed.pop_back();
        }
        auto pos = trimmed.rfind('/');
        return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
    }

    std::string posixDirName(const std::string& path) {
        return fs::path(path).parent_path().string();
    }

    std::string posixCommonPath(const std::vector<std::string>& paths) {
        if (paths.empty()) {
            return "";
        }
        std::vector<fs::path> common(fs::path(paths.front()).begin(), fs::path(paths.front()).end());
        for (size_t i = 1; i < paths.size(); ++i) {
            fs::path p(paths[i]);
            size_t n = 0;
            for (auto it = p.begin(); it != p.end() && n < common.size() && *it == common[n]; ++it) {
                ++n;
            }
            common.resize(n);
        }
        fs::path result;
        for (const auto& part : common) {
            result /= part;
        }
        return result.string();
    }

    Error osError(const std::string& what, int err) {
        return Error(what + ": " + std::strerror(err), err, COMPONENT);
    }

    Error osError(const std::string& what, const std::error_code& ec) {
        return Error(what + ": " + ec.message(), ec.value(), COMPONENT);
    }

    void removeIfExists(const std::string& path) {
        std::error_code ec;
        fs::remove(path, ec);
    }

} // namespace

const char* toString(RequestState state) {
    switch (state) {
        case RequestState::WaitingForPermission: return "waiting_for_permission";
        case RequestState::WaitingForFileMetadata: return "waiting_for_file_metadata";
        case RequestState::Transferring: return "transferring";
        case RequestState::Canceled: return "canceled";
    }
    return "unknown";
}

Requestor::Requestor(std::string transferId, std::vector<std::string> specs, std::string dest,
                     PathContext local, const std::string& bypassSecret, bool mirror)
    : transferId_(std::move(transferId))
    , specs_(std::move(specs))
    , dest_(std::move(dest))
    , local_(std::move(local))
    , mirror_(mirror)
    , specCounts_(specs_.size(), 0) {
    if (!bypassSecret.empty()) {
        bypass_ = WireCodec::encodeBypass(transferId_, bypassSecret);
    }
}

std::vector<Message> Requestor::startTransfer() const {
    std::vector<Message> out;
    Message receive(Action::Receive, transferId_);
    receive.bypass = bypass_;
    receive.size = static_cast<int64_t>(specs_.size());
    out.push_back(std::move(receive));
    for (size_t i = 0; i < specs_.size(); ++i) {
        Message spec(Action::File, transferId_, std::to_string(i));
        spec.name = specs_[i];
        out.push_back(std::move(spec));
    }
    return out;
}

bool Requestor::parseSpecId(const std::string& fid, size_t& out) const {
    const char* first = fid.data();
    const char* last = fid.data() + fid.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return !fid.empty() && ec == std::errc() && ptr == last && out < specs_.size();
}

VoidResult Requestor::onFileTransferResponse(const Message& msg) {
    switch (state_) {
        case RequestState::WaitingForPermission:
            if (msg.action != Action::Status) {
                return Error("Unexpected response from terminal: " + msg.describe(), 0, COMPONENT);
            }
            if (msg.status != StatusCode::OK) {
                return Error("Permission for transfer denied", EPERM, COMPONENT);
            }
            state_ = RequestState::WaitingForFileMetadata;
            LOG_INFO_COMP_IF("Permission granted for " + transferId_, COMPONENT);
            return Ok();
        case RequestState::WaitingForFileMetadata:
            return handleMetadata(msg);
        case RequestState::Transferring:
            return handleData(msg);
        case RequestState::Canceled:
            return Ok();
    }
    return Ok();
}

VoidResult Requestor::handleMetadata(const Message& msg) {
    size_t specId = 0;
    if (msg.action == Action::Status) {
        if (!msg.fileId.empty()) {
            if (!parseSpecId(msg.fileId, specId)) {
                return Error("Unexpected response from terminal: " + msg.describe(), 0, COMPONENT);
            }
            failedSpecs_[specId] = msg.status;
            return Ok();
        }
        if (msg.status != StatusCode::OK) {
            return Error(Encoding::sanitizeControlCodes(msg.status), 0, COMPONENT);
        }
        state_ = RequestState::Transferring;
        remoteHome_ = msg.name;
        LOG_DEBUG_COMP_IF("Metadata complete with " + std::to_string(files_.size()) + " entries", COMPONENT);
        return Ok();
    }
    if (msg.action != Action::File || !parseSpecId(msg.fileId, specId)) {
        return Error("Unexpected response from terminal: " + msg.describe(), 0, COMPONENT);
    }

    specCounts_[specId]++;
    auto file = std::make_unique<RemoteFile>();
    file->specId = specId;
    file->fileId = std::to_string(++fileCounter_);
    file->remoteId = msg.status;
    file->remotePath = msg.name;
    file->displayName = Encoding::sanitizeControlCodes(msg.name);
    file->parent = msg.parent;
    file->remoteTarget = msg.dataAsString();
    file->fileType = msg.fileType;
    file->expectedSize = msg.size;
    file->mtime = msg.mtime;
    file->permissions = msg.permissions;
    files_.push_back(std::move(file));
    return Ok();
}

VoidResult Requestor::checkSpecs() const {
    if (!failedSpecs_.empty()) {
        std::string msg = "Failed to process some sources:";
        for (const auto& [specId, status] : failedSpecs_) {
            msg += " " + specs_[specId] + ": " + Encoding::sanitizeControlCodes(status) + ";";
        }
        msg.pop_back();
        return Error(msg, 0, COMPONENT);
    }
    std::string missing;
    for (size_t i = 0; i < specCounts_.size(); ++i) {
        if (specCounts_[i] == 0) {
            missing += (missing.empty() ? "" : ", ") + specs_[i];
        }
    }
    if (!missing.empty()) {
        return Error("No matches found for: " + missing, ENOENT, COMPONENT);
    }
    return Ok();
}

std::string Requestor::localBaseForSpec(size_t specId, const std::vector<std::string>& specPaths) const {
    if (mirror_) {
        return posixDirName(local_.absPath(local_.expandHome(specPaths[specId])));
    }
    std::string destPath = (fs::path(dest_) / posixBaseName(specPaths[specId])).string();
    return posixDirName(local_.absPath(local_.expandHome(destPath)));
}

bool Requestor::destIsDirectory() const {
    if ((!dest_.empty() && dest_.back() == '/') || files_.size() > 1) {
        return true;
    }
    std::error_code ec;
    return fs::is_directory(local_.absPath(local_.expandHome(dest_)), ec);
}

void Requestor::collectFiles() {
    std::vector<std::vector<RemoteFile*>> bySpec(specs_.size());
    for (auto& f : files_) {
        bySpec[f->specId].push_back(f.get());
    }

    std::vector<std::string> specPaths(specs_.size());
    for (size_t i = 0; i < specs_.size(); ++i) {
        specPaths[i] = bySpec[i].empty() ? specs_[i] : bySpec[i].front()->remotePath;
    }
    if (mirror_) {
        std::string common = posixCommonPath(specPaths);
        std::string home = remoteHome_;
        while (!home.empty() && home.back() == '/') {
            home.pop_back();
        }
        if (!common.empty() && common.rfind(home + "/", 0) == 0) {
            for (auto& p : specPaths) {
                p = "~/" + fs::path(p).lexically_relative(home).string();
            }
        }
    }

    if (!mirror_ && !destIsDirectory() && files_.size() == 1) {
        // A lone file takes the destination name
        files_.front()->expandedLocalPath = local_.absPath(local_.expandHome(dest_));
    }

    for (size_t specId = 0; specId < specs_.size(); ++specId) {
        std::string base = localBaseForSpec(specId, specPaths);
        std::map<std::string, RemoteFile*> byRemoteId;
        for (RemoteFile* f : bySpec[specId]) {
            byRemoteId[f->remoteId] = f;
        }

        std::set<RemoteFile*> visiting;
        std::function<std::string(RemoteFile&)> localPathFor = [&](RemoteFile& f) -> std::string {
            if (!f.expandedLocalPath.empty()) {
                return f.expandedLocalPath;
            }
            std::string parentDir = base;
            auto parent = f.parent.empty() ? byRemoteId.end() : byRemoteId.find(f.parent);
            if (parent != byRemoteId.end() && parent->second != &f && visiting.insert(&f).second) {
                parentDir = localPathFor(*parent->second);
                visiting.erase(&f);
            }
            f.expandedLocalPath = (fs::path(parentDir) / posixBaseName(f.remotePath)).string();
            return f.expandedLocalPath;
        };
        for (RemoteFile* f : bySpec[specId]) {
            localPathFor(*f);
        }
    }

    toTransfer_.clear();
    for (auto& f : files_) {
        if (f->fileType == FileType::Regular || f->fileType == FileType::Symlink) {
            if (f->fileType == FileType::Regular && f->expectedSize > MIN_COMPRESS_SIZE &&
                shouldBeCompressed(f->remotePath)) {
                f->compression = CompressionType::Zlib;
                f->decompressor = std::make_unique<ZlibDecompressor>();
            } else {
                f->decompressor = std::make_unique<IdentityDecompressor>();
            }
            toTransfer_[f->fileId] = f.get();
        }
    }
}

std::vector<Message> Requestor::requestFiles() {
    std::vector<Message> out;
    for (auto& f : files_) {
        if (toTransfer_.count(f->fileId) == 0) {
            continue;
        }
        Message req(Action::File, transferId_, f->fileId);
        req.name = f->remotePath;
        req.compression = f->compression;
        out.push_back(std::move(req));
    }
    LOG_INFO_COMP_IF("Requesting " + std::to_string(out.size()) + " files", COMPONENT);
    return out;
}

VoidResult Requestor::handleData(const Message& msg) {
    if (msg.action == Action::Status) {
        if (!msg.fileId.empty() && msg.status != StatusCode::OK) {
            return Error("Terminal failed to send " + msg.fileId + ": " +
                         Encoding::sanitizeControlCodes(msg.status), 0, COMPONENT);
        }
        return Ok();
    }
    if (msg.action != Action::Data && msg.action != Action::EndData) {
        return Ok();
    }
    auto it = toTransfer_.find(msg.fileId);
    if (it == toTransfer_.end()) {
        return Error("Got data for unknown file id: " + msg.fileId, 0, COMPONENT);
    }
    RemoteFile& file = *it->second;
    auto written = writeData(file, msg);
    if (!written) {
        return written;
    }
    if (msg.action == Action::EndData) {
        file.done = true;
        toTransfer_.erase(it);
        if (toTransfer_.empty()) {
            return finalize();
        }
    }
    return Ok();
}

VoidResult Requestor::writeData(RemoteFile& file, const Message& msg) {
    bool isLast = msg.action == Action::EndData;
    std::vector<uint8_t> data;
    try {
        data = file.decompressor->decompress(msg.data, isLast);
    } catch (const std::runtime_error& e) {
        return Error(std::string("Corrupt data for ") + file.displayName + ": " + e.what(), 0, COMPONENT);
    }

    if (file.fileType == FileType::Symlink) {
        file.symlinkValue.append(data.begin(), data.end());
        return Ok();
    }

    if (!file.output) {
        std::error_code ec;
        std::string parent = posixDirName(file.expandedLocalPath);
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                return osError("Failed to create " + parent, ec);
            }
        }
        removeIfExists(file.expandedLocalPath);
        file.output = std::make_unique<std::ofstream>(file.expandedLocalPath,
                                                      std::ios::binary | std::ios::trunc);
        if (!*file.output) {
            return osError("Failed to open " + file.expandedLocalPath, errno);
        }
    }
    if (!data.empty()) {
        file.output->write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!*file.output) {
            return osError("Failed to write " + file.expandedLocalPath, errno);
        }
        file.bytesWritten += static_cast<int64_t>(data.size());
        totalBytesWritten_ += static_cast<int64_t>(data.size());
    }
    if (isLast) {
        file.output->close();
        if (file.output->fail()) {
            return osError("Failed to close " + file.expandedLocalPath, errno);
        }
    }
    return Ok();
}

Result<std::string> Requestor::localPathOfRemote(const std::map<std::string, RemoteFile*>& byRemoteId,
                                                 const std::string& remoteId, const std::string& kind) const {
    auto it = byRemoteId.find(remoteId);
    if (it == byRemoteId.end()) {
        return Error(kind + " with remote id: " + remoteId + " not found", ENOENT, COMPONENT);
    }
    return it->second->expandedLocalPath;
}

VoidResult Requestor::finalize() {
    transferDone_ = true;
    std::map<std::string, RemoteFile*> byRemoteId;
    for (auto& f : files_) {
        byRemoteId.emplace(f->remoteId, f.get());
    }

    for (auto& fp : files_) {
        RemoteFile& f = *fp;
        std::error_code ec;
        if (f.fileType == FileType::Directory) {
            fs::create_directories(f.expandedLocalPath, ec);
            if (ec) {
                return osError("Failed to create directory " + f.expandedLocalPath, ec);
            }
        } else if (f.fileType == FileType::Hardlink) {
            auto target = localPathOfRemote(byRemoteId, f.remoteTarget, "Hard link");
            if (!target) {
                return target.error();
            }
            fs::create_directories(posixDirName(f.expandedLocalPath), ec);
            removeIfExists(f.expandedLocalPath);
            fs::create_hard_link(target.value(), f.expandedLocalPath, ec);
            if (ec) {
                return osError("Failed to create hardlink " + f.expandedLocalPath, ec);
            }
        } else if (f.fileType == FileType::Symlink) {
            std::string linkTarget = f.symlinkValue;
            if (!f.remoteTarget.empty()) {
                auto target = localPathOfRemote(byRemoteId, f.remoteTarget, "Symbolic link");
                if (!target) {
                    return target.error();
                }
                linkTarget = target.value();
                if (f.symlinkValue.empty() || f.symlinkValue.front() != '/') {
                    linkTarget = PathUtils::relativeTo(linkTarget, posixDirName(f.expandedLocalPath));
                }
            }
            fs::create_directories(posixDirName(f.expandedLocalPath), ec);
            removeIfExists(f.expandedLocalPath);
            fs::create_symlink(linkTarget, f.expandedLocalPath, ec);
            if (ec) {
                return osError("Failed to create symlink " + f.expandedLocalPath, ec);
            }
        }

        try {
            PathUtils::applyMetadata(f.expandedLocalPath, f.permissions, f.mtime,
                                     f.fileType == FileType::Symlink);
        } catch (const std::system_error& e) {
            LOG_DEBUG_COMP_IF(std::string("Metadata not applied: ") + e.what(), COMPONENT);
        }
    }
    LOG_INFO_COMP_IF("Received " + std::to_string(files_.size()) + " entries for " + transferId_, COMPONENT);
    return Ok();
}

Message Requestor::cancelMessage() {
    state_ = RequestState::Canceled;
    return Message(Action::Cancel, transferId_);
}

} // namespace TermXfer
