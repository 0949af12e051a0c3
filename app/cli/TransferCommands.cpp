#include "TransferCommands.h"
#include "ChunkProducer.h"
#include "ConsoleProgressSink.h"
#include "DeliveryScheduler.h"
#include "Interrupt.h"
#include "KeyProvider.h"
#include "Logger.h"
#include "ReceiverSession.h"
#include "Settings.h"
#include "TransferState.h"

#include <filesystem>
#include <iostream>

namespace Chunkwise {

std::unique_ptr<StatusSink> TransferCommands::statusFileSink(const std::string& path) const {
    if (path.empty()) {
        return std::make_unique<NullStatusSink>();
    }
    return std::make_unique<JsonFileStatusSink>(path, ctx_.logger);
}

int TransferCommands::handleProduce() {
    const auto& settings = ctx_.settings;
    if (ctx_.args.positional().size() != 1) {
        return fail("Usage: chunkwise produce <file> [--priority N] [--work-dir DIR]", ExitStatus::Usage);
    }
    const std::string source = ctx_.args.positional().front();

    auto priority = ctx_.args.intValue("--priority", settings.defaultPriority, 1, 4);
    if (!priority) {
        return fail(priority.error().message, ExitStatus::Usage);
    }

    ProduceOptions options;
    options.chunkSizeBytes = settings.chunkSizeBytes;
    options.priority = *priority;
    options.defaultPriority = settings.defaultPriority;
    options.priorityName = settings.priorityName(*priority);
    options.compressionLevel = settings.compressionLevel;
    options.compressionEnabled = settings.compressionEnabled;
    options.encryptionEnabled = settings.encryptionEnabled;

    const std::string workDir = ctx_.args.valueOr("--work-dir", settings.workDir);

    FileKeyProvider keys(settings.keyFile);
    ChunkProducer producer(ctx_.logger, settings.encryptionEnabled ? &keys : nullptr);
    auto manifest = producer.produce(source, workDir, options);
    if (!manifest) {
        return fail("Chunking failed: " + manifest.error().toString());
    }

    uint64_t stored = 0;
    for (const auto& chunk : manifest->chunks) {
        stored += chunk.size;
    }

    std::cout << "Produced " << manifest->chunks.size() << " chunk(s) for " << manifest->originalFilename
              << " in " << workDir << std::endl;
    std::cout << "  Original size: " << formatBytes(manifest->originalSize) << std::endl;
    std::cout << "  Stored size:   " << formatBytes(stored) << std::endl;
    std::cout << "  SHA-256:       " << manifest->originalHash << std::endl;
    std::cout << "  Priority:      " << manifest->priority << " (" << manifest->priorityName << ")" << std::endl;
    return ExitStatus::Ok;
}

int TransferCommands::handleSend() {
    const auto& settings = ctx_.settings;
    const std::string host = ctx_.args.valueOr("--host", settings.senderTarget);
    const std::string workDir = ctx_.args.valueOr("--work-dir", settings.workDir);
    auto port = ctx_.args.intValue("--port", settings.port, 1, 65535);
    if (!port) {
        return fail(port.error().message, ExitStatus::Usage);
    }

    const auto manifestPath = (std::filesystem::path(workDir) / Manifest::UNIT_NAME).string();
    auto manifest = Manifest::loadFromFile(manifestPath, settings.defaultPriority);
    if (!manifest) {
        return fail("Cannot load " + manifestPath + ": " + manifest.error().message);
    }
    auto valid = manifest->validate(settings.defaultPriority);
    if (!valid) {
        return fail("Invalid manifest " + manifestPath + ": " + valid.error().message);
    }

    TransferState transferState(settings.resumeEnabled ? settings.stateFile : std::string(), ctx_.logger);
    transferState.load();

    auto statusFile = statusFileSink(settings.senderStatusFile);
    ConsoleProgressSink console(*statusFile);
    StatusSink& status = settings.showProgress ? static_cast<StatusSink&>(console) : *statusFile;

    DeliveryOptions options;
    options.timeoutSeconds = settings.timeoutSeconds;
    options.bufferSize = settings.bufferSize;
    options.maxRetries = settings.maxRetries;
    options.priorityEnabled = settings.priorityEnabled;

    DeliveryScheduler scheduler(options, transferState, ctx_.logger, status);
    SendReport report;
    {
        InterruptWatcher watcher([&scheduler]() { scheduler.cancel(); });
        report = scheduler.run(*manifest, workDir, host, static_cast<uint16_t>(*port));
    }

    std::cout << "Sender finished: " << senderStateToString(report.state) << " (" << report.unitsSent
              << " sent, " << report.unitsSkipped << " skipped, " << report.failedUnits.size() << " failed of "
              << report.totalUnits << ")" << std::endl;

    switch (report.state) {
        case SenderState::Completed:
            return ExitStatus::Ok;
        case SenderState::CompletedWithErrors:
            std::cout << "Failed units (re-run send to retry only these):" << std::endl;
            for (const auto& name : report.failedUnits) {
                std::cout << "  - " << name << std::endl;
            }
            return ExitStatus::Partial;
        default:
            if (report.error && report.error->code == ErrorCode::Cancelled) {
                std::cerr << "Interrupted" << std::endl;
                return ExitStatus::Interrupted;
            }
            return fail(report.error ? report.error->toString() : "Transfer failed");
    }
}

int TransferCommands::handleReceive() {
    const auto& settings = ctx_.settings;
    auto port = ctx_.args.intValue("--port", settings.port, 0, 65535);
    if (!port) {
        return fail(port.error().message, ExitStatus::Usage);
    }

    ReceiverOptions options;
    options.host = ctx_.args.valueOr("--host", settings.receiverHost);
    options.port = static_cast<uint16_t>(*port);
    options.timeoutSeconds = settings.timeoutSeconds;
    options.bufferSize = settings.bufferSize;
    options.storageDir = ctx_.args.valueOr("--storage-dir", settings.storageDir);
    options.acceptUnknownUnits = settings.acceptUnknownUnits;
    options.defaultPriority = settings.defaultPriority;

    auto statusFile = statusFileSink(settings.receiverStatusFile);
    ConsoleProgressSink console(*statusFile);
    StatusSink& status = settings.showProgress ? static_cast<StatusSink&>(console) : *statusFile;

    ReceiverSession session(options, ctx_.logger, status);
    auto bound = session.bind();
    if (!bound) {
        return fail("Cannot start receiver: " + bound.error().message);
    }

    ReceiveReport report;
    {
        InterruptWatcher watcher([&session]() { session.stop(); });
        report = session.run();
    }

    std::cout << "Receiver finished: " << receiverStateToString(report.state) << " (" << report.unitsAccepted
              << " accepted, " << report.unitsRejected << " rejected, " << formatBytes(report.bytesReceived)
              << ")" << std::endl;

    switch (report.state) {
        case ReceiverState::Completed:
            if (report.manifest) {
                std::cout << "Next: chunkwise verify --dir " << options.storageDir << std::endl;
            }
            return ExitStatus::Ok;
        case ReceiverState::Stopped:
            std::cerr << "Interrupted" << std::endl;
            return ExitStatus::Interrupted;
        default:
            return fail(report.error ? report.error->toString() : "Session failed");
    }
}

} // namespace Chunkwise
