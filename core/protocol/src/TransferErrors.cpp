#include "TransferErrors.h"
#include <cerrno>

namespace TermXfer {

TransmissionError::TransmissionError(std::string code, std::string msg, std::string fileId,
                                     bool transmit, std::string name, int64_t size,
                                     TransmissionType ttype)
    : std::runtime_error(msg.empty() ? code : code + ":" + msg),
      code_(std::move(code)),
      humanMessage_(std::move(msg)),
      fileId_(std::move(fileId)),
      transmit_(transmit),
      name_(std::move(name)),
      size_(size),
      ttype_(ttype) {}

std::string TransmissionError::statusText() const {
    if (humanMessage_.empty()) {
        return code_;
    }
    return code_ + ":" + humanMessage_;
}

Message TransmissionError::asMessage(const std::string& transferId) const {
    Message msg(Action::Status, transferId, fileId_);
    msg.status = statusText();
    msg.name = name_;
    msg.size = size_;
    msg.transmissionType = ttype_;
    return msg;
}

TransmissionError TransmissionError::fromErrno(int err, const std::string& msg, const std::string& fileId) {
    return TransmissionError(errnoName(err), msg, fileId);
}

std::string errnoName(int err) {
    switch (err) {
        case EPERM: return "EPERM";
        case ENOENT: return "ENOENT";
        case EIO: return "EIO";
        case ENXIO: return "ENXIO";
        case EBADF: return "EBADF";
        case EAGAIN: return "EAGAIN";
        case ENOMEM: return "ENOMEM";
        case EACCES: return "EACCES";
        case EBUSY: return "EBUSY";
        case EEXIST: return "EEXIST";
        case EXDEV: return "EXDEV";
        case ENODEV: return "ENODEV";
        case ENOTDIR: return "ENOTDIR";
        case EISDIR: return "EISDIR";
        case EINVAL: return "EINVAL";
        case ENFILE: return "ENFILE";
        case EMFILE: return "EMFILE";
        case ETXTBSY: return "ETXTBSY";
        case EFBIG: return "EFBIG";
        case ENOSPC: return "ENOSPC";
        case ESPIPE: return "ESPIPE";
        case EROFS: return "EROFS";
        case EMLINK: return "EMLINK";
        case ENAMETOOLONG: return "ENAMETOOLONG";
        case ENOTEMPTY: return "ENOTEMPTY";
        case ELOOP: return "ELOOP";
        case EDQUOT: return "EDQUOT";
        case ENOTSUP: return "ENOTSUP";
        default: return "EFAIL";
    }
}

void splitStatus(const std::string& status, std::string& code, std::string& message) {
    auto colon = status.find(':');
    if (colon == std::string::npos) {
        code = status;
        message.clear();
    } else {
        code = status.substr(0, colon);
        message = status.substr(colon + 1);
    }
}

} // namespace TermXfer
