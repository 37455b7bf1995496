#include "FileDiscovery.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace TermXfer {

namespace {

    const std::string COMPONENT = "Sender";

    std::string stripTrailingSlashes(std::string path) {
        while (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        return path;
    }

    std::string baseName(const std::string& path) {
        return fs::path(stripTrailingSlashes(path)).filename().string();
    }

    std::string commonPath(const std::vector<std::string>& paths) {
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
        return stripTrailingSlashes(result.string());
    }

    std::string readLink(const std::string& path) {
        std::vector<char> buf(4096);
        while (true) {
            ssize_t n = ::readlink(path.c_str(), buf.data(), buf.size());
            if (n < 0) {
                throw std::system_error(errno, std::generic_category(), "Failed to read link " + path);
            }
            if (static_cast<size_t>(n) < buf.size()) {
                return std::string(buf.data(), static_cast<size_t>(n));
            }
            buf.resize(buf.size() * 2);
        }
    }

} // namespace

FileDiscovery::FileDiscovery(PathContext paths) : paths_(std::move(paths)) {}

void FileDiscovery::process(const std::vector<std::string>& roots, const std::string& remoteBase,
                            uint64_t& counter, SendFileList& out) const {
    for (const auto& x : roots) {
        std::string expanded = paths_.expandHome(x);
        struct stat st{};
        if (::lstat(expanded.c_str(), &st) != 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to stat " + x);
        }

        if (S_ISDIR(st.st_mode)) {
            out.push_back(std::make_unique<SendFile>(x, expanded, counter++, st, remoteBase, FileType::Directory));
            std::string childBase;
            if (!remoteBase.empty()) {
                childBase = stripTrailingSlashes(remoteBase) + "/" + baseName(x) + "/";
            } else {
                childBase = stripTrailingSlashes(x) + "/";
            }

            std::vector<std::string> names;
            std::error_code ec;
            for (fs::directory_iterator it(expanded, ec), end; !ec && it != end; it.increment(ec)) {
                names.push_back(it->path().filename().string());
            }
            if (ec) {
                throw std::system_error(ec, "Failed to list " + x);
            }
            std::sort(names.begin(), names.end());

            std::vector<std::string> children;
            children.reserve(names.size());
            for (const auto& name : names) {
                children.push_back(stripTrailingSlashes(x) + "/" + name);
            }
            process(children, childBase, counter, out);
        } else if (S_ISLNK(st.st_mode)) {
            out.push_back(std::make_unique<SendFile>(x, expanded, counter++, st, remoteBase, FileType::Symlink));
        } else if (S_ISREG(st.st_mode)) {
            out.push_back(std::make_unique<SendFile>(x, expanded, counter++, st, remoteBase, FileType::Regular));
        } else {
            LOG_DEBUG_COMP_IF("Skipping special file: " + x, COMPONENT);
        }
    }
}

SendFileList FileDiscovery::processMirrored(const std::vector<std::string>& args) const {
    std::vector<std::string> paths;
    paths.reserve(args.size());
    for (const auto& a : args) {
        paths.push_back(paths_.absPath(paths_.expandHome(a)));
    }

    std::string common = commonPath(paths);
    std::string home = stripTrailingSlashes(paths_.home());
    if (!common.empty() && common.rfind(home + "/", 0) == 0) {
        for (auto& p : paths) {
            p = paths_.homeRelative(p);
        }
    }

    SendFileList files;
    uint64_t counter = 1;
    process(paths, "", counter, files);
    return files;
}

SendFileList FileDiscovery::processNormal(const std::vector<std::string>& args) const {
    if (args.size() < 2) {
        throw std::invalid_argument("Must specify at least one local path and one remote path");
    }
    std::vector<std::string> locals(args.begin(), args.end() - 1);
    std::string remoteBase = args.back();
    if (locals.size() > 1 && remoteBase.back() != '/') {
        remoteBase += '/';
    }

    std::vector<std::string> paths;
    paths.reserve(locals.size());
    for (const auto& a : locals) {
        paths.push_back(paths_.absPath(paths_.expandHome(a)));
    }

    SendFileList files;
    uint64_t counter = 1;
    process(paths, remoteBase, counter, files);
    return files;
}

void FileDiscovery::linkDuplicates(SendFileList& files) const {
    std::map<SendFile::FileHash, std::vector<SendFile*>> groups;
    for (auto& f : files) {
        groups[f->fileHash].push_back(f.get());
    }
    for (auto& [hash, group] : groups) {
        for (size_t i = 1; i < group.size(); ++i) {
            group[i]->fileType = FileType::Hardlink;
            group[i]->hardLinkTarget = "fid:" + group[0]->fileId;
        }
    }

    auto it = files.begin();
    while (it != files.end()) {
        SendFile& f = **it;
        if (f.fileType != FileType::Symlink) {
            ++it;
            continue;
        }
        std::string linkDest;
        try {
            linkDest = readLink(f.expandedLocalPath);
        } catch (const std::system_error& e) {
            LOG_WARN_COMP(std::string("Dropping unreadable symlink: ") + e.what(), COMPONENT);
            it = files.erase(it);
            continue;
        }
        f.symbolicLinkTarget = "path:" + linkDest;

        bool isAbs = !linkDest.empty() && linkDest.front() == '/';
        std::string resolved = isAbs ? linkDest
                                     : (fs::path(f.expandedLocalPath).parent_path() / linkDest).string();
        struct stat st{};
        if (::stat(resolved.c_str(), &st) == 0) {
            SendFile::FileHash key{static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
            auto found = groups.find(key);
            if (found != groups.end() && !found->second.empty()) {
                f.symbolicLinkTarget = std::string(isAbs ? "fid_abs:" : "fid:") + found->second.front()->fileId;
            }
        }
        ++it;
    }
}

SendFileList FileDiscovery::filesForSend(SendMode mode, const std::vector<std::string>& args) const {
    SendFileList files = mode == SendMode::Mirror ? processMirrored(args) : processNormal(args);
    linkDuplicates(files);
    LOG_INFO_COMP_IF("Found " + std::to_string(files.size()) + " files and directories to send", COMPONENT);
    return files;
}

} // namespace TermXfer
