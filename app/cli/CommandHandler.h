#pragma once

#include "Arguments.h"

#include <cstdint>
#include <string>

namespace Chunkwise {

class Logger;
struct Settings;

/// Process exit status of the chunkwise CLI
namespace ExitStatus {
    constexpr int Ok = 0;
    constexpr int Failed = 1;           // ERROR or a failed command
    constexpr int Usage = 2;
    constexpr int Partial = 3;          // COMPLETED_WITH_ERRORS
    constexpr int Integrity = 4;        // verification failure or IntegrityMismatch
    constexpr int Interrupted = 130;
}

/**
 * @brief Context passed to all command handlers
 */
struct CommandContext {
    const Settings& settings;
    Logger& logger;
    Arguments args;
};

/**
 * @brief Base class for command handler categories
 */
class CommandHandler {
public:
    explicit CommandHandler(CommandContext& ctx) : ctx_(ctx) {}
    virtual ~CommandHandler() = default;

    CommandHandler(const CommandHandler&) = delete;
    CommandHandler& operator=(const CommandHandler&) = delete;

protected:
    CommandContext& ctx_;

    static std::string formatBytes(uint64_t bytes);

    /// Report a failure on stderr and through the logger
    int fail(const std::string& message, int code = ExitStatus::Failed);
};

} // namespace Chunkwise
