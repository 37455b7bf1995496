#include "WireMessage.h"
#include <sstream>

namespace TermXfer {

const char* toString(Action action) {
    switch (action) {
        case Action::Send: return "send";
        case Action::File: return "file";
        case Action::Data: return "data";
        case Action::EndData: return "end_data";
        case Action::Receive: return "receive";
        case Action::Invalid: return "invalid";
        case Action::Cancel: return "cancel";
        case Action::Status: return "status";
        case Action::Finish: return "finish";
    }
    return "invalid";
}

const char* toString(CompressionType compression) {
    return compression == CompressionType::Zlib ? "zlib" : "none";
}

const char* toString(FileType type) {
    switch (type) {
        case FileType::Regular: return "regular";
        case FileType::Directory: return "directory";
        case FileType::Symlink: return "symlink";
        case FileType::Hardlink: return "link";
    }
    return "regular";
}

const char* toString(TransmissionType type) {
    switch (type) {
        case TransmissionType::Simple: return "simple";
        case TransmissionType::Resume: return "resume";
        case TransmissionType::Rsync: return "rsync";
    }
    return "simple";
}

bool parseAction(const std::string& name, Action& out) {
    static const Action all[] = {
        Action::Send, Action::File, Action::Data, Action::EndData, Action::Receive,
        Action::Invalid, Action::Cancel, Action::Status, Action::Finish
    };
    for (Action a : all) {
        if (name == toString(a)) {
            out = a;
            return true;
        }
    }
    return false;
}

bool parseCompression(const std::string& name, CompressionType& out) {
    if (name == "zlib") {
        out = CompressionType::Zlib;
    } else if (name == "none") {
        out = CompressionType::None;
    } else {
        return false;
    }
    return true;
}

bool parseFileType(const std::string& name, FileType& out) {
    if (name == "regular") {
        out = FileType::Regular;
    } else if (name == "directory") {
        out = FileType::Directory;
    } else if (name == "symlink") {
        out = FileType::Symlink;
    } else if (name == "link" || name == "hardlink") {
        out = FileType::Hardlink;
    } else {
        return false;
    }
    return true;
}

bool parseTransmissionType(const std::string& name, TransmissionType& out) {
    if (name == "simple") {
        out = TransmissionType::Simple;
    } else if (name == "resume") {
        out = TransmissionType::Resume;
    } else if (name == "rsync") {
        out = TransmissionType::Rsync;
    } else {
        return false;
    }
    return true;
}

std::string Message::describe() const {
    std::ostringstream oss;
    oss << "Message(ac=" << toString(action);
    if (!transferId.empty()) oss << ", id=" << transferId;
    if (!fileId.empty()) oss << ", fid=" << fileId;
    if (fileType != FileType::Regular) oss << ", ft=" << toString(fileType);
    if (transmissionType != TransmissionType::Simple) oss << ", tt=" << toString(transmissionType);
    if (compression != CompressionType::None) oss << ", zip=" << toString(compression);
    if (size >= 0) oss << ", sz=" << size;
    if (!name.empty()) oss << ", n=" << name;
    if (!status.empty()) oss << ", st=" << status;
    if (!data.empty()) oss << ", d=" << data.size() << " bytes";
    oss << ")";
    return oss.str();
}

bool Message::operator==(const Message& other) const {
    return action == other.action &&
           compression == other.compression &&
           fileType == other.fileType &&
           transmissionType == other.transmissionType &&
           transferId == other.transferId &&
           fileId == other.fileId &&
           bypass == other.bypass &&
           quiet == other.quiet &&
           mtime == other.mtime &&
           permissions == other.permissions &&
           size == other.size &&
           name == other.name &&
           status == other.status &&
           parent == other.parent &&
           data == other.data;
}

} // namespace TermXfer
