#pragma once

#include "CommandHandler.h"

#include <memory>
#include <string>

namespace Chunkwise {

class StatusSink;

/**
 * @brief Handles the commands that move data
 *
 * Commands: produce, send, receive
 */
class TransferCommands : public CommandHandler {
public:
    explicit TransferCommands(CommandContext& ctx) : CommandHandler(ctx) {}

    int handleProduce();
    int handleSend();
    int handleReceive();

private:
    std::unique_ptr<StatusSink> statusFileSink(const std::string& path) const;
};

} // namespace Chunkwise
