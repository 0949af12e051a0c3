#include "ReceiverSession.h"
#include "FileUtils.h"
#include "Logger.h"
#include "SHA256.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace Chunkwise {

namespace {

constexpr size_t HASH_PREFIX = 8;

std::string shortHash(const std::string& hash) {
    return hash.substr(0, std::min(hash.size(), HASH_PREFIX));
}

} // namespace

const char* receiverStateToString(ReceiverState state) {
    switch (state) {
        case ReceiverState::Waiting: return "WAITING";
        case ReceiverState::Connected: return "CONNECTED";
        case ReceiverState::ReceivingUnit: return "RECEIVING_UNIT";
        case ReceiverState::Completed: return "COMPLETED";
        case ReceiverState::Error: return "ERROR";
        case ReceiverState::Stopped: return "STOPPED";
        default: return "UNKNOWN";
    }
}

ReceiverSession::ReceiverSession(const ReceiverOptions& options, Logger& logger, StatusSink& status)
    : options_(options), logger_(logger), status_(status) {
    if (options_.bufferSize == 0) {
        options_.bufferSize = 4096;
    }
}

Result<void> ReceiverSession::bind() {
    auto dirReady = FileUtils::ensureDirectory(options_.storageDir);
    if (!dirReady) {
        return dirReady;
    }

    const auto manifestPath = std::filesystem::path(options_.storageDir) / Manifest::UNIT_NAME;
    std::error_code ec;
    if (std::filesystem::exists(manifestPath, ec)) {
        auto loaded = Manifest::loadFromFile(manifestPath.string(), options_.defaultPriority);
        if (loaded && loaded->validate(options_.defaultPriority)) {
            logger_.info("Loaded existing manifest for " + loaded->originalFilename + " (" +
                         std::to_string(loaded->chunks.size()) + " chunks)", "Receiver");
            manifest_ = std::move(*loaded);
        } else {
            logger_.warn("Ignoring unusable manifest at " + manifestPath.string(), "Receiver");
        }
    }

    auto listening = listener_.listen(options_.host, options_.port);
    if (!listening) {
        logger_.error(listening.error().message, "Receiver");
        return listening;
    }
    logger_.info("Listening on " + options_.host + ":" + std::to_string(listener_.port()), "Receiver");
    return Ok();
}

void ReceiverSession::stop() {
    stopRequested_ = true;
    std::lock_guard<std::mutex> lock(connMutex_);
    if (activeConn_) {
        activeConn_->shutdown();
    }
}

void ReceiverSession::attach(TcpConnection* conn) {
    std::lock_guard<std::mutex> lock(connMutex_);
    activeConn_ = conn;
    if (conn && stopRequested_) {
        conn->shutdown();
    }
}

void ReceiverSession::setState(ReceiverState state) {
    state_ = state;
    logger_.debug(std::string("State -> ") + receiverStateToString(state), "Receiver");
    publish();
}

void ReceiverSession::publish() {
    status_.publish("receiver", receiverStateToString(state_.load()), progress_);
}

ReceiveReport ReceiverSession::finish(ReceiveReport report, ReceiverState state, std::optional<Error> error) {
    report.state = state;
    report.error = std::move(error);
    report.manifest = manifest_;
    progress_.errorMessage = report.error ? report.error->toString() : "";
    progress_.unitsDone = report.unitsAccepted;
    setState(state);
    return report;
}

ReceiveReport ReceiverSession::run() {
    ReceiveReport report;
    progress_ = StatusReport{};
    if (manifest_) {
        progress_.totalUnits = manifest_->chunks.size() + 1;
    }
    setState(ReceiverState::Waiting);

    if (!listener_.isOpen()) {
        return finish(report, ReceiverState::Error, Error{ErrorCode::ConnectionFailed, "Listener is not bound"});
    }

    logger_.info("Waiting for sender on port " + std::to_string(listener_.port()) + "...", "Receiver");
    auto accepted = listener_.accept(stopRequested_);
    // One peer per session; later connection attempts are refused
    listener_.close();
    if (!accepted) {
        if (accepted.error().code == ErrorCode::Cancelled) {
            logger_.info("Stopped before a sender connected", "Receiver");
            return finish(report, ReceiverState::Stopped, accepted.error());
        }
        logger_.error(accepted.error().message, "Receiver");
        return finish(report, ReceiverState::Error, accepted.error());
    }

    TcpConnection conn = std::move(*accepted);
    attach(&conn);
    logger_.info("Connected by " + conn.peer(), "Receiver");
    setState(ReceiverState::Connected);

    auto timeoutSet = conn.setTimeout(options_.timeoutSeconds);
    if (!timeoutSet) {
        attach(nullptr);
        return finish(report, ReceiverState::Error, timeoutSet.error());
    }

    std::optional<Error> fatal;
    bool done = false;
    while (!done) {
        if (stopRequested_) {
            fatal = Error{ErrorCode::Cancelled, "Stopped by operator"};
            break;
        }

        auto line = conn.readLine();
        if (!line) {
            fatal = line.error();
            break;
        }

        if (Protocol::isDoneLine(*line)) {
            logger_.info("Sender finished", "Receiver");
            done = true;
            break;
        }

        auto announcement = Protocol::parseAnnouncement(*line);
        if (!announcement) {
            logger_.warn("Rejecting announcement: " + announcement.error().message, "Receiver");
            ++report.unitsRejected;
            auto answered = conn.sendString(Protocol::ACK_BAD);
            if (!answered) {
                fatal = answered.error();
                break;
            }
            continue;
        }

        auto received = receiveUnit(conn, *announcement, report);
        if (!received) {
            fatal = received.error();
            break;
        }
    }

    attach(nullptr);
    conn.close();

    if (fatal) {
        if (stopRequested_) {
            logger_.info("Session stopped", "Receiver");
            return finish(report, ReceiverState::Stopped, Error{ErrorCode::Cancelled, "Stopped by operator"});
        }
        logger_.error("Session failed: " + fatal->toString(), "Receiver");
        return finish(report, ReceiverState::Error, fatal);
    }

    logger_.info("Session complete: " + std::to_string(report.unitsAccepted) + " accepted, " +
                 std::to_string(report.unitsRejected) + " rejected", "Receiver");
    return finish(report, ReceiverState::Completed);
}

Result<void> ReceiverSession::receiveUnit(TcpConnection& conn, const Protocol::Announcement& unit,
                                          ReceiveReport& report) {
    setState(ReceiverState::ReceivingUnit);
    progress_.currentUnit = unit.name;
    progress_.currentIndex = report.unitsReceived + 1;
    progress_.currentSize = unit.size;
    progress_.bytesCurrent = 0;
    publish();

    const bool safe = Protocol::isSafeUnitName(unit.name);
    const std::string finalPath = (std::filesystem::path(options_.storageDir) / unit.name).string();
    const std::string partPath = safe ? finalPath + ".part" : std::string();

    if (!safe) {
        logger_.warn("Unsafe unit name '" + unit.name + "', draining " + std::to_string(unit.size) + " bytes",
                     "Receiver");
    } else {
        logger_.info("Receiving " + unit.name + " (" + std::to_string(unit.size) + " bytes)", "Receiver");
    }

    bool writeFailed = false;
    auto digest = consumePayload(conn, unit.size, partPath, writeFailed);
    if (!digest) {
        if (!partPath.empty()) {
            FileUtils::removeQuietly(partPath);
        }
        return digest.error();
    }

    ++report.unitsReceived;
    report.bytesReceived += unit.size;
    progress_.bytesCurrent = unit.size;

    Verdict verdict = Verdict::Reject;
    if (safe && !writeFailed) {
        if (unit.name == Manifest::UNIT_NAME) {
            auto judged = judgeManifest(partPath);
            if (!judged) {
                FileUtils::removeQuietly(partPath);
                return judged.error();
            }
            verdict = *judged;
        } else {
            verdict = judgeChunk(unit.name, *digest);
        }
    }

    if (verdict == Verdict::Accept) {
        std::error_code ec;
        std::filesystem::rename(partPath, finalPath, ec);
        if (ec) {
            logger_.error("Failed to store " + unit.name + ": " + ec.message(), "Receiver");
            verdict = Verdict::Reject;
        }
    }
    if (verdict == Verdict::Reject && !partPath.empty()) {
        FileUtils::removeQuietly(partPath);
    }

    auto answered = conn.sendString(verdict == Verdict::Accept ? Protocol::ACK_OK : Protocol::ACK_BAD);
    if (!answered) {
        return answered.error();
    }

    if (verdict == Verdict::Accept) {
        ++report.unitsAccepted;
    } else {
        ++report.unitsRejected;
    }
    progress_.unitsDone = report.unitsAccepted;
    setState(ReceiverState::Connected);
    return Ok();
}

Result<std::string> ReceiverSession::consumePayload(TcpConnection& conn, uint64_t size,
                                                    const std::string& partPath, bool& writeFailed) {
    std::ofstream out;
    if (!partPath.empty()) {
        out.open(partPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            logger_.error("Cannot write " + partPath + ", payload will be discarded", "Receiver");
            writeFailed = true;
        }
    }

    SHA256 hasher;
    std::vector<uint8_t> buffer(options_.bufferSize);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        auto got = conn.readSome(buffer.data(), want);
        if (!got) {
            logger_.error("Connection failed with " + std::to_string(remaining) + " of " +
                          std::to_string(size) + " payload bytes outstanding", "Receiver");
            return got.error();
        }

        hasher.update(buffer.data(), *got);
        if (!writeFailed && out.is_open()) {
            out.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(*got));
            if (!out) {
                logger_.error("Write to " + partPath + " failed, payload will be discarded", "Receiver");
                writeFailed = true;
            }
        }
        remaining -= *got;
    }

    if (out.is_open()) {
        out.close();
        if (!out && !writeFailed) {
            logger_.error("Failed to flush " + partPath, "Receiver");
            writeFailed = true;
        }
    }
    return hasher.finalHex();
}

ReceiverSession::Verdict ReceiverSession::judgeChunk(const std::string& name, const std::string& actualHash) {
    const ChunkDescriptor* expected = manifest_ ? manifest_->findChunk(name) : nullptr;
    if (!expected) {
        if (options_.acceptUnknownUnits) {
            logger_.warn("Accepting " + name + " without verification (not in manifest)", "Receiver");
            return Verdict::Accept;
        }
        logger_.warn("Rejecting " + name + ": not in manifest", "Receiver");
        return Verdict::Reject;
    }

    if (expected->hash != actualHash) {
        logger_.error("Hash mismatch for " + name + ": expected " + shortHash(expected->hash) +
                      "..., got " + shortHash(actualHash) + "...", "Receiver");
        return Verdict::Reject;
    }

    logger_.info(name + " verified", "Receiver");
    return Verdict::Accept;
}

Result<ReceiverSession::Verdict> ReceiverSession::judgeManifest(const std::string& partPath) {
    auto loaded = Manifest::loadFromFile(partPath, options_.defaultPriority);
    if (!loaded) {
        return Error{ErrorCode::MalformedManifest, loaded.error().message};
    }
    auto valid = loaded->validate(options_.defaultPriority);
    if (!valid) {
        return valid.error();
    }

    logger_.info("Manifest received for " + loaded->originalFilename + ": " +
                 std::to_string(loaded->chunks.size()) + " chunks, " +
                 std::to_string(loaded->originalSize) + " bytes", "Receiver");
    manifest_ = std::move(*loaded);
    progress_.totalUnits = manifest_->chunks.size() + 1;
    return Verdict::Accept;
}

} // namespace Chunkwise
