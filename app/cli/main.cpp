#include "CommandHandler.h"
#include "Config.h"
#include "FileCommands.h"
#include "Interrupt.h"
#include "Logger.h"
#include "Settings.h"
#include "TransferCommands.h"

#include <filesystem>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <vector>

using namespace Chunkwise;

namespace {

// Used when --config is not given; missing files are skipped
const std::vector<std::string> DEFAULT_CONFIG_PATHS = {"config/chunkwise.conf", "chunkwise.conf"};

struct CommandOptions {
    std::set<std::string> valueOptions;
    std::set<std::string> flags;
};

const std::map<std::string, CommandOptions> COMMANDS = {
    {"produce",    {{"--priority", "--work-dir"}, {}}},
    {"send",       {{"--host", "--port", "--work-dir"}, {}}},
    {"receive",    {{"--host", "--port", "--storage-dir"}, {}}},
    {"verify",     {{"--dir"}, {}}},
    {"reassemble", {{"--dir", "--output"}, {"--force"}}},
    {"keygen",     {{"--key-file"}, {}}},
    {"status",     {{"--role"}, {}}},
};

void printUsage(const char* argv0) {
    std::cout << "Chunkwise - chunked, encrypted, resumable file transfer" << std::endl;
    std::cout << "\nUsage: " << argv0 << " [--config FILE] <command> [options]" << std::endl;
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  produce <file> [--priority N] [--work-dir DIR]   Split, compress and encrypt a file" << std::endl;
    std::cout << "  send [--host HOST] [--port P] [--work-dir DIR]   Deliver a produced file to a receiver" << std::endl;
    std::cout << "  receive [--host HOST] [--port P] [--storage-dir DIR]" << std::endl;
    std::cout << "                                                   Accept one transfer" << std::endl;
    std::cout << "  verify [--dir DIR]                               Check received chunks against the manifest" << std::endl;
    std::cout << "  reassemble [--dir DIR] [--output FILE] [--force] Rebuild and verify the original file" << std::endl;
    std::cout << "  keygen [--key-file FILE]                         Create a new 256-bit key file" << std::endl;
    std::cout << "  status [--role sender|receiver]                  Show the last live status snapshot" << std::endl;
    std::cout << "\nExit codes: 0 success, 1 error, 2 usage, 3 completed with failed units," << std::endl;
    std::cout << "            4 verification or integrity failure, 130 interrupted" << std::endl;
}

void configureLogger(Logger& logger, const Settings& settings) {
    logger.setLevel(settings.logLevel);
    logger.setMaxFileSize(settings.logMaxSizeMb);
    logger.setComponent("Chunkwise");
    if (!settings.logFile.empty() && !logger.setLogFile(settings.logFile)) {
        logger.warn("Cannot open log file " + settings.logFile + ", logging to console only", "CLI");
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> tokens(argv + 1, argv + argc);

    std::string configPath;
    if (tokens.size() >= 2 && tokens[0] == "--config") {
        configPath = tokens[1];
        tokens.erase(tokens.begin(), tokens.begin() + 2);
    }

    if (tokens.empty() || tokens[0] == "--help" || tokens[0] == "help") {
        printUsage(argv[0]);
        return tokens.empty() ? ExitStatus::Usage : ExitStatus::Ok;
    }

    const std::string command = tokens[0];
    auto entry = COMMANDS.find(command);
    if (entry == COMMANDS.end()) {
        std::cerr << "Unknown command: " << command << std::endl;
        printUsage(argv[0]);
        return ExitStatus::Usage;
    }

    auto args = Arguments::parse(std::vector<std::string>(tokens.begin() + 1, tokens.end()),
                                 entry->second.valueOptions, entry->second.flags);
    if (!args) {
        std::cerr << "Error: " << args.error().message << std::endl;
        return ExitStatus::Usage;
    }

    Config config;
    bool configLoaded = true;
    if (!configPath.empty()) {
        if (!config.loadFromFile(configPath)) {
            std::cerr << "Error: cannot read configuration file " << configPath << std::endl;
            return ExitStatus::Failed;
        }
    } else {
        std::vector<std::string> present;
        for (const auto& candidate : DEFAULT_CONFIG_PATHS) {
            std::error_code ec;
            if (std::filesystem::exists(candidate, ec)) {
                present.push_back(candidate);
            }
        }
        configLoaded = config.loadLayered(present);
    }

    auto settings = Settings::fromConfig(config);
    if (!settings) {
        std::cerr << "Error: " << settings.error().toString() << std::endl;
        return ExitStatus::Failed;
    }

    Logger logger;
    configureLogger(logger, *settings);
    installInterruptHandlers();
    if (!configLoaded) {
        logger.debug("No configuration file found, using defaults", "CLI");
    }

    CommandContext ctx{*settings, logger, std::move(*args)};
    logger.debug("Running command '" + command + "'", "CLI");

    if (command == "produce" || command == "send" || command == "receive") {
        TransferCommands transfer(ctx);
        if (command == "produce") return transfer.handleProduce();
        if (command == "send") return transfer.handleSend();
        return transfer.handleReceive();
    }

    FileCommands files(ctx);
    if (command == "verify") return files.handleVerify();
    if (command == "reassemble") return files.handleReassemble();
    if (command == "keygen") return files.handleKeygen();
    return files.handleStatus();
}
