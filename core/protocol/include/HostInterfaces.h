#pragma once

/**
 * @file HostInterfaces.h
 * @brief Narrow contracts to the host terminal.
 *
 * The transfer components never block. They write through a channel that
 * may refuse a payload, ask for permission through a prompt that answers
 * later and defer work through a timer scheduler.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace TermXfer {

/**
 * @brief The escape-code channel to the other party
 */
class ITransferChannel {
public:
    virtual ~ITransferChannel() = default;

    /**
     * @brief Queue one serialized message for writing
     * @return false if the write buffer is full; the caller retries later
     */
    virtual bool write(const std::string& payload) = 0;
};

/**
 * @brief Interactive yes/no confirmation
 */
class IPermissionPrompt {
public:
    virtual ~IPermissionPrompt() = default;

    /// done may be invoked synchronously or at any later time.
    virtual void askYesNo(const std::string& message, std::function<void(bool)> done) = 0;
};

/**
 * @brief Deferred execution on the host event loop
 */
class ITimerScheduler {
public:
    virtual ~ITimerScheduler() = default;

    virtual void callAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
};

/// Observational progress: bytes so far, total, throughput and ETA in seconds.
using ProgressCallback = std::function<void(int64_t bytesSoFar, int64_t totalBytes,
                                            double bytesPerSecond, double etaSeconds)>;

} // namespace TermXfer
