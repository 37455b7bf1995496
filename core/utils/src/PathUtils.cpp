#include "PathUtils.h"
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <pwd.h>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace TermXfer {

std::filesystem::path PathUtils::getHome() {
    if (const char* home = std::getenv("HOME")) {
        if (*home) {
            return std::filesystem::path(home);
        }
    }
    if (const passwd* pw = getpwuid(getuid())) {
        if (pw->pw_dir) {
            return std::filesystem::path(pw->pw_dir);
        }
    }
    throw std::runtime_error("Unable to determine the home directory");
}

std::string PathUtils::normalize(const std::string& path) {
    std::string normal = std::filesystem::path(path).lexically_normal().string();
    if (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal;
}

void PathUtils::applyMetadata(const std::string& path, int64_t permissions, int64_t mtimeNs, bool noFollow) {
    int flags = noFollow ? AT_SYMLINK_NOFOLLOW : 0;
    if (permissions >= 0) {
        if (fchmodat(AT_FDCWD, path.c_str(), static_cast<mode_t>(permissions & 07777), flags) != 0) {
            if (!(noFollow && (errno == ENOTSUP || errno == EOPNOTSUPP))) {
                throw std::system_error(errno, std::generic_category(), "Failed to set permissions of " + path);
            }
        }
    }
    if (mtimeNs >= 0) {
        timespec times[2];
        times[0].tv_sec = times[1].tv_sec = static_cast<time_t>(mtimeNs / 1000000000LL);
        times[0].tv_nsec = times[1].tv_nsec = static_cast<long>(mtimeNs % 1000000000LL);
        if (utimensat(AT_FDCWD, path.c_str(), times, flags) != 0) {
            throw std::system_error(errno, std::generic_category(), "Failed to set mtime of " + path);
        }
    }
}

std::string PathUtils::relativeTo(const std::string& target, const std::string& baseDir) {
    return std::filesystem::path(target).lexically_relative(baseDir).string();
}

PathContext::PathContext()
    : home_(PathUtils::getHome().string())
    , cwd_(std::filesystem::current_path().string()) {}

PathContext::PathContext(std::string home, std::string cwd)
    : home_(std::move(home))
    , cwd_(std::move(cwd)) {}

std::string PathContext::expandHome(const std::string& path) const {
    if (path == "~") {
        return home_;
    }
    if (path.rfind("~/", 0) == 0) {
        return (std::filesystem::path(home_) / path.substr(2)).string();
    }
    return path;
}

std::string PathContext::absPath(const std::string& path, bool useHome) const {
    std::filesystem::path p(path);
    if (p.is_relative()) {
        p = std::filesystem::path(useHome ? home_ : cwd_) / p;
    }
    return PathUtils::normalize(p.string());
}

std::string PathContext::resolveRemoteName(const std::string& name) const {
    std::string expanded = expandHome(name);
    return absPath(expanded, true);
}

std::string PathContext::homeRelative(const std::string& absolute) const {
    std::string home = PathUtils::normalize(home_);
    if (home.empty() || home == "/") {
        return absolute;
    }
    if (absolute == home) {
        return "~";
    }
    if (absolute.rfind(home + "/", 0) == 0) {
        return "~/" + absolute.substr(home.size() + 1);
    }
    return absolute;
}

} // namespace TermXfer
