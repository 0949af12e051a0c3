#include "Settings.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace Chunkwise {

    namespace {

        bool isInteger(const std::string& value, long long minValue, long long maxValue) {
            if (value.empty()) return false;
            try {
                size_t used = 0;
                long long parsed = std::stoll(value, &used);
                return used == value.size() && parsed >= minValue && parsed <= maxValue;
            } catch (const std::logic_error&) {
                return false;
            }
        }

        bool isBoolean(const std::string& value) {
            std::string lower = value;
            std::transform(lower.begin(), lower.end(), lower.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return lower == "1" || lower == "0" || lower == "true" || lower == "false" ||
                   lower == "yes" || lower == "no" || lower == "on" || lower == "off";
        }

        Config::Validator intRange(long long minValue, long long maxValue) {
            return [minValue, maxValue](const std::string&, const std::string& value) {
                return isInteger(value, minValue, maxValue);
            };
        }

        Config::Validator boolean() {
            return [](const std::string&, const std::string& value) { return isBoolean(value); };
        }

        Config::Validator nonEmpty() {
            return [](const std::string&, const std::string& value) { return !value.empty(); };
        }

    }

    Result<Settings> Settings::fromConfig(const Config& config) {
        const std::unordered_map<std::string, Config::Validator> schema = {
            {"network.port", intRange(1, 65535)},
            {"network.timeout", intRange(0, 86400)},
            {"network.buffer_size", intRange(1, 64 * 1024 * 1024)},
            {"network.receiver_host", nonEmpty()},
            {"network.sender_target", nonEmpty()},
            {"transfer.chunk_size_mb", intRange(1, 4096)},
            {"transfer.chunk_size_bytes", intRange(1, 4096LL * 1024 * 1024)},
            {"transfer.max_retries", intRange(-1000, 1000)},
            {"transfer.enable_resume", boolean()},
            {"receiver.accept_unknown_units", boolean()},
            {"compression.enabled", boolean()},
            {"compression.level", intRange(0, 9)},
            {"security.enabled", boolean()},
            {"logging.max_size_mb", intRange(0, 1024 * 1024)},
            {"priority.enabled", boolean()},
            {"priority.default", intRange(1, 4)},
            {"monitoring.show_progress", boolean()},
        };

        std::string badKey = config.validate(schema);
        if (!badKey.empty()) {
            return Err<Settings>(ErrorCode::InvalidConfig,
                                 "Invalid value for " + badKey + ": '" + config.get(badKey) + "'");
        }

        Settings s;
        s.port = static_cast<uint16_t>(config.getInt("network.port", s.port));
        s.receiverHost = config.get("network.receiver_host", s.receiverHost);
        s.senderTarget = config.get("network.sender_target", s.senderTarget);
        s.timeoutSeconds = config.getInt("network.timeout", s.timeoutSeconds);
        s.bufferSize = config.getSize("network.buffer_size", s.bufferSize);

        if (config.hasKey("transfer.chunk_size_bytes")) {
            s.chunkSizeBytes = config.getSize("transfer.chunk_size_bytes", s.chunkSizeBytes);
        } else {
            s.chunkSizeBytes = config.getSize("transfer.chunk_size_mb", 1) * 1024 * 1024;
        }
        s.maxRetries = std::max(1, config.getInt("transfer.max_retries", s.maxRetries));
        s.resumeEnabled = config.getBool("transfer.enable_resume", s.resumeEnabled);
        s.stateFile = config.get("transfer.state_file", s.stateFile);
        s.workDir = config.get("transfer.work_dir", s.workDir);

        s.storageDir = config.get("receiver.storage_dir", s.storageDir);
        s.acceptUnknownUnits = config.getBool("receiver.accept_unknown_units", s.acceptUnknownUnits);

        s.compressionEnabled = config.getBool("compression.enabled", s.compressionEnabled);
        s.compressionLevel = config.getInt("compression.level", s.compressionLevel);

        s.encryptionEnabled = config.getBool("security.enabled", s.encryptionEnabled);
        s.keyFile = config.get("security.key_file", s.keyFile);

        s.logLevel = parseLogLevel(config.get("logging.level", "INFO"));
        s.logFile = config.get("logging.file", s.logFile);
        s.logMaxSizeMb = config.getSize("logging.max_size_mb", s.logMaxSizeMb);

        s.priorityEnabled = config.getBool("priority.enabled", s.priorityEnabled);
        s.defaultPriority = config.getInt("priority.default", s.defaultPriority);
        for (int level = 1; level <= 4; ++level) {
            std::string key = "priority.level." + std::to_string(level);
            if (config.hasKey(key)) {
                s.priorityLevels[level] = config.get(key);
            }
        }

        s.senderStatusFile = config.get("status.sender_file", s.senderStatusFile);
        s.receiverStatusFile = config.get("status.receiver_file", s.receiverStatusFile);
        s.showProgress = config.getBool("monitoring.show_progress", s.showProgress);

        return s;
    }

    int Settings::normalizePriority(int priority) const {
        return isValidPriority(priority) ? priority : defaultPriority;
    }

    std::string Settings::priorityName(int priority) const {
        auto it = priorityLevels.find(normalizePriority(priority));
        return it != priorityLevels.end() ? it->second : "NORMAL";
    }

}
