#pragma once

#include "WireMessage.h"
#include <string>
#include <vector>

namespace TermXfer {

/// Numeric tag of the OSC envelope that carries transfer messages.
constexpr int FILE_TRANSFER_CODE = 5113;

/// Size of the data payload in each message produced by splitForTransfer.
constexpr size_t WIRE_CHUNK_SIZE = 4096;

/**
 * @brief Serialization of Message to and from its key=value text form.
 *
 * Pairs are joined by ';' and a ';' inside a value is written as ";;".
 * name, status and bypass are base64 of their UTF-8 text, data is base64
 * of raw bytes and id, fid and pr are restricted to [0-9a-zA-Z_:./@-].
 */
class WireCodec {
public:
    static std::string serialize(const Message& message);

    /**
     * @throws ProtocolError if the text is malformed or has no valid action
     */
    static Message deserialize(const std::string& text);

    /// "ESC ] 5113 ; payload ESC \"
    static std::string wrapEscapeCode(const std::string& payload);

    /**
     * @brief Strip the OSC envelope
     * @throws ProtocolError if the text is not a transfer envelope
     */
    static std::string unwrapEscapeCode(const std::string& envelope);

    static std::string encodeBypass(const std::string& transferId, const std::string& secret);

    /**
     * @brief Verify a bypass token received in a send/receive message
     *
     * Only the "sha256:" scheme is understood. An empty secret never matches.
     */
    static bool checkBypass(const std::string& secret, const std::string& transferId,
                            const std::string& token);

    /**
     * @brief Cut a payload into data messages of WIRE_CHUNK_SIZE bytes
     *
     * When markLast is set the final message is end_data. An empty payload
     * yields no messages.
     */
    static std::vector<Message> splitForTransfer(const std::vector<uint8_t>& payload,
                                                 const std::string& transferId,
                                                 const std::string& fileId,
                                                 bool markLast,
                                                 size_t chunkSize = WIRE_CHUNK_SIZE);

    /// hex(pid) followed by four random hex digits
    static std::string randomTransferId();
};

} // namespace TermXfer
