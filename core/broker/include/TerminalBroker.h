#pragma once

#include "ActiveReceive.h"
#include "ActiveSend.h"
#include "HostInterfaces.h"
#include "TransferSettings.h"
#include "PathUtils.h"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace TermXfer {

/**
 * @brief Terminal side of the file transfer protocol
 *
 * Fed one deserialized payload at a time by the host. Keeps a registry of
 * active receives (pushes into this machine) and active sends (pulls from
 * it), asks the user for permission unless a valid bypass token was given,
 * and writes replies through the channel. Replies the channel refuses are
 * queued and retried from a timer; signature and file streams are pumped
 * from timers as the channel accepts them.
 *
 * Everything runs on the host's event loop; no method blocks.
 */
class TerminalBroker {
public:
    using Clock = std::chrono::steady_clock;

    /// Run on each regular file completed by end_data, before it is acknowledged.
    /// Throwing std::runtime_error fails that file.
    using CommitHook = std::function<void(const std::string& transferId, const DestFile&)>;

    /// Observes each DestFile releasing its resources: (transfer id, file).
    using FileClosedObserver = std::function<void(const std::string&, const DestFile&)>;

    TerminalBroker(ITransferChannel& channel, IPermissionPrompt& prompt, ITimerScheduler& timers,
                   TransferSettings settings, PathContext paths = PathContext());
    ~TerminalBroker();

    TerminalBroker(const TerminalBroker&) = delete;
    TerminalBroker& operator=(const TerminalBroker&) = delete;

    /// Entry point for one serialized message (the OSC envelope already stripped).
    void handleSerializedCommand(const std::string& payload);

    void handleCommand(const Message& cmd);

    /// The channel has room again.
    void onWriteReady();

    /// Drop every transfer idle for longer than the expiry time.
    void pruneExpired();

    void setCommitHook(CommitHook hook) { commitHook_ = std::move(hook); }
    void setFileClosedObserver(FileClosedObserver observer) { fileClosedObserver_ = std::move(observer); }
    void setClock(std::function<Clock::time_point()> clock) { clock_ = std::move(clock); }

    size_t activeReceiveCount() const { return activeReceives_.size(); }
    size_t activeSendCount() const { return activeSends_.size(); }
    const ActiveReceive* findReceive(const std::string& id) const;
    const ActiveSend* findSend(const std::string& id) const;
    size_t pendingReplyCount() const { return pendingReplies_.size(); }

private:
    Clock::time_point now() const { return clock_ ? clock_() : Clock::now(); }

    template<typename F>
    void defer(std::chrono::milliseconds delay, F&& fn);

    std::optional<bool> checkBypass(const Message& cmd) const;
    void scheduleExpirySweep();

    // Push into this machine
    void handleReceiveCmd(const Message& cmd);
    void startReceive(const std::string& id);
    void handleSendConfirmation(bool confirmed, const std::string& id);
    void handleFileStart(ActiveReceive& ar, const Message& cmd);
    void handleFileData(ActiveReceive& ar, const Message& cmd);
    void handleFinish(ActiveReceive& ar);
    void transmitRsyncSignature(const std::string& id);
    void dropReceive(const std::string& id);

    // Pull from this machine
    void handleSendCmd(const Message& cmd);
    void startSend(const std::string& id);
    void handleReceiveConfirmation(bool confirmed, const std::string& id);
    void sendMetadataForSendTransfer(ActiveSend& asd);
    void pumpSendChunks(const std::string& id);
    void pumpSends();
    void scheduleSendPump();
    void dropSend(const std::string& id);

    // Replies
    bool writeMessage(const Message& msg, bool appendLeft = false, bool usePending = true);
    bool sendStatusResponse(const std::string& code, const std::string& requestId,
                            const std::string& fileId = "", const std::string& msg = "",
                            const std::string& name = "", int64_t size = -1,
                            TransmissionType ttype = TransmissionType::Simple);
    bool sendTransmissionError(const std::string& requestId, const TransmissionError& err);
    void sendFailOnOsError(int err, const std::string& msg, const std::string& requestId,
                           bool sendErrors, const std::string& fileId = "");
    void startPendingTimer();
    void tryPending();

    ITransferChannel& channel_;
    IPermissionPrompt& prompt_;
    ITimerScheduler& timers_;
    TransferSettings settings_;
    PathContext paths_;

    std::map<std::string, std::unique_ptr<ActiveReceive>> activeReceives_;
    std::map<std::string, std::unique_ptr<ActiveSend>> activeSends_;
    std::deque<Message> pendingReplies_;
    bool pendingTimer_{false};
    bool sendPumpScheduled_{false};
    bool sweepScheduled_{false};

    CommitHook commitHook_;
    FileClosedObserver fileClosedObserver_;
    std::function<Clock::time_point()> clock_;
    std::shared_ptr<bool> alive_;
};

} // namespace TermXfer
