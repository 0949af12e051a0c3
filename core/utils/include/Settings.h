#pragma once

#include "Config.h"
#include "Logger.h"
#include "Result.h"

#include <cstdint>
#include <map>
#include <string>

namespace Chunkwise {

    /**
     * @brief Typed view over a Config with every default filled in
     *
     * Built once at startup and passed by const reference to the
     * components that need it.
     */
    struct Settings {
        // network
        uint16_t port = 5001;
        std::string receiverHost = "0.0.0.0";
        std::string senderTarget = "127.0.0.1";
        int timeoutSeconds = 30;          // 0 disables socket timeouts
        size_t bufferSize = 4096;

        // transfer
        size_t chunkSizeBytes = 1024 * 1024;
        int maxRetries = 3;               // total attempts per unit
        bool resumeEnabled = true;
        std::string stateFile = "transfer_state.json";
        std::string workDir = ".";

        // receiver
        std::string storageDir = ".";
        bool acceptUnknownUnits = true;

        // compression
        bool compressionEnabled = true;
        int compressionLevel = 6;

        // security
        bool encryptionEnabled = true;
        std::string keyFile = "secret.key";

        // logging
        LogLevel logLevel = LogLevel::INFO;
        std::string logFile = "chunkwise.log";
        size_t logMaxSizeMb = 10;

        // priority
        bool priorityEnabled = true;
        int defaultPriority = 3;
        std::map<int, std::string> priorityLevels = {
            {1, "CRITICAL"}, {2, "HIGH"}, {3, "NORMAL"}, {4, "LOW"}
        };

        // status / monitoring
        std::string senderStatusFile = "sender_status.json";
        std::string receiverStatusFile = "receiver_status.json";
        bool showProgress = true;

        /// Validate the raw values in @p config and build Settings from them.
        /// Fails with InvalidConfig naming the offending key.
        static Result<Settings> fromConfig(const Config& config);

        static bool isValidPriority(int priority) { return priority >= 1 && priority <= 4; }

        /// Out-of-range priorities map to defaultPriority
        int normalizePriority(int priority) const;

        std::string priorityName(int priority) const;
    };

}
