#pragma once

#include "DestFile.h"
#include "WireMessage.h"
#include "PathUtils.h"

#include <chrono>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace TermXfer {

/**
 * @brief A push the terminal is receiving
 *
 * Owns the DestFiles announced by the remote end. Dropping the receive
 * (finish, cancel, expiry) releases every file exactly once.
 */
class ActiveReceive {
public:
    using Clock = std::chrono::steady_clock;

    ActiveReceive(std::string id, int64_t quiet, std::optional<bool> bypassOk,
                  const PathContext& paths, Clock::time_point now);
    ~ActiveReceive();

    ActiveReceive(const ActiveReceive&) = delete;
    ActiveReceive& operator=(const ActiveReceive&) = delete;

    bool isExpired(Clock::time_point now, std::chrono::minutes expireTime) const {
        return now - lastActivityAt > expireTime;
    }

    void touch(Clock::time_point now) { lastActivityAt = now; }

    /**
     * @brief Register the entry announced by a file message
     * @throws TransmissionError if the file id is already in use
     */
    DestFile& startFile(const Message& msg);

    /**
     * @brief Route a data or end_data message to its file
     *
     * A file that failed earlier swallows further data. Any failure marks
     * the file failed before propagating.
     *
     * @throws TransmissionError, std::system_error or std::runtime_error
     */
    DestFile& addData(const Message& msg);

    /// Apply directory metadata, deepest first. Failures are logged and skipped.
    void commit();

    /// Release every file without committing. Idempotent.
    void close() noexcept;

    void setFileClosedObserver(std::function<void(const std::string&, const DestFile&)> observer);

    std::string id;
    DestFile::FileMap files;
    bool accepted{false};
    std::optional<bool> bypassOk;
    Clock::time_point lastActivityAt;
    bool sendAcknowledgements;
    bool sendErrors;

    /// Files whose signature is still to be streamed to the sender, by file id.
    std::deque<std::string> pendingSignatures;

    /// Signature messages that could not be written yet.
    std::deque<Message> signaturePendingChunks;

private:
    const PathContext& paths_;
    std::function<void(const std::string&, const DestFile&)> closedObserver_;
};

} // namespace TermXfer
