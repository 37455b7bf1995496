#pragma once

#include "WireMessage.h"
#include <cstdint>
#include <stdexcept>
#include <string>

namespace TermXfer {

/// Status codes exchanged in status messages besides errno names.
namespace StatusCode {
    constexpr const char* OK = "OK";
    constexpr const char* STARTED = "STARTED";
    constexpr const char* CANCELED = "CANCELED";
    constexpr const char* PROGRESS = "PROGRESS";
    constexpr const char* EINVAL_CODE = "EINVAL";
    constexpr const char* EPERM_CODE = "EPERM";
    constexpr const char* EISDIR_CODE = "EISDIR";
    constexpr const char* ENOENT_CODE = "ENOENT";
}

/**
 * @brief Malformed or out-of-sequence message. Fatal to one transfer.
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * @brief The user declined a transfer.
 */
class PermissionDenied : public std::runtime_error {
public:
    explicit PermissionDenied(const std::string& msg = "User refused the transfer")
        : std::runtime_error(msg) {}
};

/**
 * @brief Structured failure reported to the remote end as a status message.
 *
 * Rendered as "CODE:message" (or just "CODE" when there is no message).
 */
class TransmissionError : public std::runtime_error {
public:
    TransmissionError(std::string code = StatusCode::EINVAL_CODE,
                      std::string msg = "Generic error",
                      std::string fileId = "",
                      bool transmit = true,
                      std::string name = "",
                      int64_t size = -1,
                      TransmissionType ttype = TransmissionType::Simple);

    const std::string& code() const { return code_; }
    const std::string& humanMessage() const { return humanMessage_; }
    const std::string& fileId() const { return fileId_; }
    const std::string& name() const { return name_; }
    int64_t size() const { return size_; }
    TransmissionType transmissionType() const { return ttype_; }
    bool transmit() const { return transmit_; }

    std::string statusText() const;
    Message asMessage(const std::string& transferId) const;

    /// Build from an OS errno, the code being the errno name.
    static TransmissionError fromErrno(int err, const std::string& msg, const std::string& fileId = "");

private:
    std::string code_;
    std::string humanMessage_;
    std::string fileId_;
    bool transmit_;
    std::string name_;
    int64_t size_;
    TransmissionType ttype_;
};

/// Symbolic name of an errno value ("ENOENT", "EACCES", ...), "EFAIL" if unknown.
std::string errnoName(int err);

/// Split "CODE:message" into its parts. message is empty when there is no ':'.
void splitStatus(const std::string& status, std::string& code, std::string& message);

} // namespace TermXfer
