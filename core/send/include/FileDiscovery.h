#pragma once

#include "SendFile.h"
#include "PathUtils.h"

#include <memory>
#include <string>
#include <vector>

namespace TermXfer {

enum class SendMode {
    Normal,  // last argument is the remote destination
    Mirror   // remote paths mirror the local ones
};

using SendFileList = std::vector<std::unique_ptr<SendFile>>;

/**
 * @brief Walks the local roots of a push transfer
 *
 * Directories are listed before their contents. Entries sharing a
 * (device, inode) are collapsed into hard links to the first one, and
 * symlinks pointing at another transferred entry reference it by file id.
 */
class FileDiscovery {
public:
    explicit FileDiscovery(PathContext paths);

    /**
     * @throws std::invalid_argument if normal mode is given fewer than two paths
     * @throws std::system_error if a root cannot be stat'ed
     */
    SendFileList filesForSend(SendMode mode, const std::vector<std::string>& args) const;

private:
    void process(const std::vector<std::string>& paths, const std::string& remoteBase,
                 uint64_t& counter, SendFileList& out) const;
    SendFileList processMirrored(const std::vector<std::string>& args) const;
    SendFileList processNormal(const std::vector<std::string>& args) const;
    void linkDuplicates(SendFileList& files) const;

    PathContext paths_;
};

} // namespace TermXfer
