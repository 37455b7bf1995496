#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace TermXfer {

class Config;

/**
 * @brief Tunables shared by the sender, requestor and broker.
 *
 * Built once from Config and handed to constructors.
 */
struct TransferSettings {
    std::string bypassSecret;
    std::chrono::minutes expireTime{10};
    size_t maxActiveReceives{10};
    size_t maxActiveSends{10};
    size_t chunkSize{1024 * 1024};
    std::chrono::milliseconds retryDelay{200};
    std::chrono::milliseconds sendPumpDelay{50};
    std::chrono::seconds cancelGrace{5};

    static TransferSettings fromConfig(const Config& config);
};

} // namespace TermXfer
