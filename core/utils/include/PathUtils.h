#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace TermXfer {

/**
 * @brief Home and working directory used to resolve transfer paths.
 *
 * Components take a PathContext instead of consulting the process
 * environment, so tests and embedders can pin both directories.
 */
class PathContext {
public:
    /// Resolve from $HOME (falling back to the passwd entry) and the process cwd.
    PathContext();
    PathContext(std::string home, std::string cwd);

    const std::string& home() const { return home_; }
    const std::string& cwd() const { return cwd_; }

    /// "~" and "~/x" are expanded against home(); other paths are returned unchanged.
    std::string expandHome(const std::string& path) const;

    /// Make path absolute against cwd() (or home() when useHome), lexically normalized.
    std::string absPath(const std::string& path, bool useHome = false) const;

    /// Expand "~", then make absolute relative to home(). Used for names received from the wire.
    std::string resolveRemoteName(const std::string& name) const;

    /// "~/rel" when absolute is inside home(), otherwise absolute unchanged.
    std::string homeRelative(const std::string& absolute) const;

private:
    std::string home_;
    std::string cwd_;
};

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::string normalize(const std::string& path);

    /**
     * @brief Apply permission bits and mtime (ns) to path; -1 leaves a field untouched
     *
     * With noFollow the link itself is updated; a filesystem that cannot
     * change link permissions is not an error.
     *
     * @throws std::system_error on failure
     */
    static void applyMetadata(const std::string& path, int64_t permissions, int64_t mtimeNs, bool noFollow = false);

    /// Path of target relative to the directory baseDir, both absolute.
    static std::string relativeTo(const std::string& target, const std::string& baseDir);
};

} // namespace TermXfer
