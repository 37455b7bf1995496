#include "TransferSettings.h"
#include "Config.h"
#include "LoggerMacros.h"

namespace TermXfer {

TransferSettings TransferSettings::fromConfig(const Config& config) {
    TransferSettings settings;
    settings.bypassSecret = config.get("transfer.bypass_secret", "");

    int expire = config.getInt("transfer.expire_minutes", 10);
    if (expire <= 0) {
        LOG_WARN_COMP("transfer.expire_minutes must be positive, using 10", "Config");
        expire = 10;
    }
    settings.expireTime = std::chrono::minutes(expire);

    settings.maxActiveReceives = config.getSize("transfer.max_active_receives", 10);
    settings.maxActiveSends = config.getSize("transfer.max_active_sends", 10);

    size_t chunk = config.getSize("transfer.chunk_size", 1024 * 1024);
    if (chunk < 4096) {
        LOG_WARN_COMP("transfer.chunk_size below 4096, clamping", "Config");
        chunk = 4096;
    }
    settings.chunkSize = chunk;

    settings.retryDelay = std::chrono::milliseconds(config.getInt("transfer.retry_delay_ms", 200));
    settings.sendPumpDelay = std::chrono::milliseconds(config.getInt("transfer.send_pump_delay_ms", 50));
    settings.cancelGrace = std::chrono::seconds(config.getInt("transfer.cancel_grace_seconds", 5));
    return settings;
}

} // namespace TermXfer
