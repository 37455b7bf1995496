#pragma once

/**
 * @file WireMessage.h
 * @brief The unit of the file transfer protocol.
 *
 * One Message is carried per escape-code envelope. Every field has a
 * declared default; fields at their default are omitted on the wire.
 */

#include <cstdint>
#include <string>
#include <vector>

namespace TermXfer {

enum class Action {
    Send,
    File,
    Data,
    EndData,
    Receive,
    Invalid,
    Cancel,
    Status,
    Finish
};

enum class CompressionType {
    Zlib,
    None
};

enum class FileType {
    Regular,
    Directory,
    Symlink,
    Hardlink
};

enum class TransmissionType {
    Simple,
    Resume,
    Rsync
};

const char* toString(Action action);
const char* toString(CompressionType compression);
const char* toString(FileType type);
const char* toString(TransmissionType type);

/**
 * @brief Parse an enum from its wire name
 * @return false if the name is unknown
 */
bool parseAction(const std::string& name, Action& out);
bool parseCompression(const std::string& name, CompressionType& out);
bool parseFileType(const std::string& name, FileType& out);
bool parseTransmissionType(const std::string& name, TransmissionType& out);

struct Message {
    Action action{Action::Invalid};                          // ac
    CompressionType compression{CompressionType::None};      // zip
    FileType fileType{FileType::Regular};                    // ft
    TransmissionType transmissionType{TransmissionType::Simple}; // tt
    std::string transferId;                                  // id
    std::string fileId;                                      // fid
    std::string bypass;                                      // pw
    int64_t quiet{0};                                        // q
    int64_t mtime{-1};                                       // mod, nanoseconds
    int64_t permissions{-1};                                 // prm
    int64_t size{-1};                                        // sz
    std::string name;                                        // n
    std::string status;                                      // st
    std::string parent;                                      // pr
    std::vector<uint8_t> data;                               // d

    Message() = default;
    explicit Message(Action a) : action(a) {}
    Message(Action a, std::string id, std::string fid = "")
        : action(a), transferId(std::move(id)), fileId(std::move(fid)) {}

    std::string dataAsString() const {
        return std::string(data.begin(), data.end());
    }
    void setData(const std::string& text) {
        data.assign(text.begin(), text.end());
    }

    /// Short human readable form for logs, data is summarized by length.
    std::string describe() const;

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
};

} // namespace TermXfer
