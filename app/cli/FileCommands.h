#pragma once

#include "CommandHandler.h"

namespace Chunkwise {

/**
 * @brief Handles the commands that work on local files only
 *
 * Commands: verify, reassemble, keygen, status
 */
class FileCommands : public CommandHandler {
public:
    explicit FileCommands(CommandContext& ctx) : CommandHandler(ctx) {}

    int handleVerify();
    int handleReassemble();
    int handleKeygen();

    /// Print the last snapshot written by a running or finished sender/receiver
    int handleStatus();
};

} // namespace Chunkwise
