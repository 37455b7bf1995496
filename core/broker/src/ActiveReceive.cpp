#include "ActiveReceive.h"
#include "TransferErrors.h"
#include "LoggerMacros.h"

#include <algorithm>
#include <system_error>
#include <vector>

namespace TermXfer {

namespace {
    const std::string COMPONENT = "TerminalBroker";
}

ActiveReceive::ActiveReceive(std::string transferId, int64_t quiet, std::optional<bool> bypass,
                             const PathContext& paths, Clock::time_point now)
    : id(std::move(transferId))
    , bypassOk(bypass)
    , lastActivityAt(now)
    , sendAcknowledgements(quiet < 1)
    , sendErrors(quiet < 2)
    , paths_(paths) {
}

ActiveReceive::~ActiveReceive() {
    close();
}

void ActiveReceive::setFileClosedObserver(std::function<void(const std::string&, const DestFile&)> observer) {
    closedObserver_ = std::move(observer);
}

DestFile& ActiveReceive::startFile(const Message& msg) {
    if (files.count(msg.fileId)) {
        throw TransmissionError(StatusCode::EINVAL_CODE, "The file_id " + msg.fileId + " already exists",
                                msg.fileId);
    }
    auto df = std::make_unique<DestFile>(msg, paths_);
    if (closedObserver_) {
        std::string transferId = id;
        auto observer = closedObserver_;
        df->setClosedObserver([transferId, observer](const DestFile& f) { observer(transferId, f); });
    }
    DestFile& ref = *df;
    files.emplace(msg.fileId, std::move(df));
    return ref;
}

DestFile& ActiveReceive::addData(const Message& msg) {
    auto it = files.find(msg.fileId);
    if (it == files.end()) {
        throw TransmissionError(StatusCode::EINVAL_CODE, "Cannot write to a file without first starting it",
                                msg.fileId);
    }
    DestFile& df = *it->second;
    if (df.failed) {
        return df;
    }
    try {
        df.writeData(files, msg.data, msg.action == Action::EndData);
    } catch (const std::exception&) {
        df.failed = true;
        df.discard();
        throw;
    }
    return df;
}

void ActiveReceive::commit() {
    std::vector<DestFile*> directories;
    for (auto& entry : files) {
        if (entry.second->fileType == FileType::Directory) {
            directories.push_back(entry.second.get());
        }
    }
    std::sort(directories.begin(), directories.end(), [](const DestFile* a, const DestFile* b) {
        return std::count(a->name.begin(), a->name.end(), '/') > std::count(b->name.begin(), b->name.end(), '/');
    });
    for (DestFile* df : directories) {
        try {
            df->applyMetadata();
        } catch (const std::system_error& e) {
            LOG_DEBUG_COMP_IF("Could not apply metadata to " + df->name + ": " + e.what(), COMPONENT);
        }
    }
}

void ActiveReceive::close() noexcept {
    pendingSignatures.clear();
    signaturePendingChunks.clear();
    for (auto& entry : files) {
        entry.second->discard();
    }
    files.clear();
}

} // namespace TermXfer
