#include "DeliveryScheduler.h"
#include "Logger.h"
#include "TcpConnection.h"
#include "TransferState.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace Chunkwise {

namespace {

std::string formatSize(uint64_t bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / (1024.0 * 1024.0)) << " MB";
    return ss.str();
}

} // namespace

const char* senderStateToString(SenderState state) {
    switch (state) {
        case SenderState::Idle: return "IDLE";
        case SenderState::Connecting: return "CONNECTING";
        case SenderState::Connected: return "CONNECTED";
        case SenderState::Sending: return "SENDING";
        case SenderState::Completed: return "COMPLETED";
        case SenderState::CompletedWithErrors: return "COMPLETED_WITH_ERRORS";
        case SenderState::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

DeliveryScheduler::DeliveryScheduler(const DeliveryOptions& options, TransferState& state,
                                     Logger& logger, StatusSink& status)
    : options_(options), transferState_(state), logger_(logger), status_(status) {
    options_.maxRetries = std::max(1, options_.maxRetries);
    if (options_.bufferSize == 0) {
        options_.bufferSize = 4096;
    }
}

std::vector<DeliveryUnit> DeliveryScheduler::planUnits(const Manifest& manifest, bool priorityEnabled) {
    std::vector<DeliveryUnit> chunks;
    for (const auto& chunk : manifest.chunksByIndex()) {
        DeliveryUnit unit;
        unit.name = chunk.name;
        unit.priority = Manifest::isValidPriority(chunk.priority) ? chunk.priority : manifest.priority;
        chunks.push_back(std::move(unit));
    }

    if (priorityEnabled) {
        std::stable_sort(chunks.begin(), chunks.end(),
                         [](const DeliveryUnit& a, const DeliveryUnit& b) { return a.priority < b.priority; });
    }

    std::vector<DeliveryUnit> plan;
    plan.reserve(chunks.size() + 1);
    DeliveryUnit manifestUnit;
    manifestUnit.name = Manifest::UNIT_NAME;
    manifestUnit.priority = manifest.priority;
    manifestUnit.isManifest = true;
    plan.push_back(std::move(manifestUnit));
    plan.insert(plan.end(), chunks.begin(), chunks.end());
    return plan;
}

void DeliveryScheduler::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(connMutex_);
    if (activeConn_) {
        activeConn_->shutdown();
    }
}

void DeliveryScheduler::attach(TcpConnection* conn) {
    std::lock_guard<std::mutex> lock(connMutex_);
    activeConn_ = conn;
    // cancel() may have run before the connection existed
    if (conn && cancelled_) {
        conn->shutdown();
    }
}

void DeliveryScheduler::setState(SenderState state) {
    state_ = state;
    logger_.debug(std::string("State -> ") + senderStateToString(state), "Sender");
    publish();
}

void DeliveryScheduler::publish() {
    status_.publish("sender", senderStateToString(state_.load()), progress_);
}

SendReport DeliveryScheduler::finish(SendReport report, SenderState state, std::optional<Error> error) {
    report.state = state;
    report.error = std::move(error);
    progress_.errorMessage = report.error ? report.error->toString() : "";
    progress_.unitsDone = report.unitsSent + report.unitsSkipped;
    setState(state);
    return report;
}

SendReport DeliveryScheduler::run(const Manifest& manifest, const std::string& workDir,
                                  const std::string& host, uint16_t port) {
    SendReport report;
    const auto plan = planUnits(manifest, options_.priorityEnabled);
    report.totalUnits = plan.size();

    progress_ = StatusReport{};
    progress_.totalUnits = plan.size();

    logger_.info("Transfer of " + manifest.originalFilename + ": " + std::to_string(plan.size()) +
                 " unit(s), priority " + std::to_string(manifest.priority) + " (" + manifest.priorityName + ")",
                 "Sender");
    for (const auto& unit : plan) {
        logger_.debug((transferState_.isCompleted(unit.name) ? "[DONE]    " : "[PENDING] ") + unit.name +
                      " priority " + std::to_string(unit.priority), "Sender");
    }

    setState(SenderState::Connecting);
    if (cancelled_) {
        return finish(report, SenderState::Error, Error{ErrorCode::Cancelled, "Cancelled before connecting"});
    }

    logger_.info("Connecting to " + host + ":" + std::to_string(port) + "...", "Sender");
    auto connected = TcpConnection::connect(host, port, options_.timeoutSeconds);
    if (!connected) {
        logger_.error("Failed to connect to receiver: " + connected.error().message, "Sender");
        return finish(report, SenderState::Error, connected.error());
    }

    TcpConnection conn = std::move(*connected);
    attach(&conn);
    logger_.info("Connected to " + conn.peer(), "Sender");
    setState(SenderState::Connected);
    setState(SenderState::Sending);

    std::optional<Error> fatal;
    for (size_t i = 0; i < plan.size(); ++i) {
        const auto& unit = plan[i];
        if (cancelled_) {
            fatal = Error{ErrorCode::Cancelled, "Cancelled by operator"};
            break;
        }

        progress_.currentUnit = unit.name;
        progress_.currentIndex = i + 1;

        if (transferState_.isCompleted(unit.name)) {
            logger_.info("Skipping " + unit.name + " (already confirmed)", "Sender");
            ++report.unitsSkipped;
            progress_.unitsDone = report.unitsSent + report.unitsSkipped;
            continue;
        }

        if (deliverUnit(conn, unit, workDir, report) == UnitOutcome::Fatal) {
            fatal = report.error;
            break;
        }
        progress_.unitsDone = report.unitsSent + report.unitsSkipped;
    }

    if (!fatal) {
        auto done = conn.sendString(std::string(Protocol::DONE_LINE) + "\n");
        if (!done) {
            fatal = cancelled_ ? Error{ErrorCode::Cancelled, "Cancelled by operator"} : done.error();
        }
    }

    attach(nullptr);
    conn.close();

    if (fatal) {
        logger_.error("Transfer aborted: " + fatal->toString(), "Sender");
        return finish(report, SenderState::Error, fatal);
    }

    if (report.failedUnits.empty()) {
        logger_.info("Transfer complete: " + std::to_string(report.unitsSent) + " sent, " +
                     std::to_string(report.unitsSkipped) + " skipped", "Sender");
        return finish(report, SenderState::Completed);
    }

    std::string failed;
    for (const auto& name : report.failedUnits) {
        failed += (failed.empty() ? "" : ", ") + name;
    }
    logger_.error("Transfer finished with " + std::to_string(report.failedUnits.size()) +
                  " failed unit(s): " + failed + ". Re-run to resend them.", "Sender");
    return finish(report, SenderState::CompletedWithErrors);
}

DeliveryScheduler::UnitOutcome DeliveryScheduler::deliverUnit(TcpConnection& conn, const DeliveryUnit& unit,
                                                              const std::string& workDir, SendReport& report) {
    const std::string path = (std::filesystem::path(workDir) / unit.name).string();

    std::error_code ec;
    uint64_t size = 0;
    bool readable = std::filesystem::is_regular_file(path, ec);
    if (readable) {
        size = std::filesystem::file_size(path, ec);
        readable = !ec && std::ifstream(path, std::ios::binary).is_open();
    }
    if (!readable) {
        Error error{ErrorCode::SendFailure, "Unit file " + path + " is missing or unreadable"};
        logger_.error(error.message, "Sender");
        report.failedUnits.push_back(unit.name);
        return UnitOutcome::Failed;
    }

    progress_.currentSize = size;
    for (int attempt = 1; attempt <= options_.maxRetries; ++attempt) {
        if (cancelled_) {
            report.error = Error{ErrorCode::Cancelled, "Cancelled by operator"};
            return UnitOutcome::Fatal;
        }

        logger_.info("Sending " + unit.name + " (" + formatSize(size) + "), attempt " +
                     std::to_string(attempt) + "/" + std::to_string(options_.maxRetries), "Sender");
        progress_.bytesCurrent = 0;
        publish();

        auto ack = sendOnce(conn, unit, path, size);
        if (!ack) {
            if (cancelled_) {
                report.error = Error{ErrorCode::Cancelled, "Cancelled by operator"};
                return UnitOutcome::Fatal;
            }
            if (ack.error().code == ErrorCode::ConnectionTimeout) {
                // A late reply to this attempt would be read as the next unit's ack
                report.error = Error{ErrorCode::ConnectionLost,
                                     unit.name + ": " + ack.error().message + ", stream out of sync"};
                return UnitOutcome::Fatal;
            }
            report.error = ack.error();
            return UnitOutcome::Fatal;
        }

        progress_.bytesCurrent = size;
        if (*ack == Protocol::AckMatch::Ok) {
            auto persisted = transferState_.markCompleted(unit.name);
            if (!persisted) {
                report.error = persisted.error();
                return UnitOutcome::Fatal;
            }
            ++report.unitsSent;
            logger_.info(unit.name + " accepted on attempt " + std::to_string(attempt), "Sender");
            return UnitOutcome::Accepted;
        }

        if (*ack == Protocol::AckMatch::Bad) {
            logger_.warn(unit.name + " rejected by receiver (BAD)", "Sender");
        } else {
            logger_.warn(unit.name + ": garbled acknowledgement", "Sender");
        }
    }

    Error failure{ErrorCode::SendFailure,
                  unit.name + " failed after " + std::to_string(options_.maxRetries) + " attempt(s)"};
    logger_.error(failure.toString(), "Sender");
    report.failedUnits.push_back(unit.name);
    return UnitOutcome::Failed;
}

Result<Protocol::AckMatch> DeliveryScheduler::sendOnce(TcpConnection& conn, const DeliveryUnit& unit,
                                                       const std::string& path, uint64_t size) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Err<Protocol::AckMatch>(ErrorCode::FileReadError, "Cannot open " + path);
    }

    auto announced = conn.sendString(Protocol::formatAnnouncement(unit.name, size));
    if (!announced) {
        return announced.error();
    }

    std::vector<uint8_t> buffer(options_.bufferSize);
    uint64_t remaining = size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        auto got = static_cast<size_t>(in.gcount());
        if (got == 0) {
            // Announced size can no longer be honoured; framing is lost
            return Err<Protocol::AckMatch>(ErrorCode::ConnectionLost,
                                           path + " shrank while sending, aborting the session");
        }
        auto sent = conn.sendAll(buffer.data(), got);
        if (!sent) {
            return sent.error();
        }
        remaining -= got;
    }

    logger_.debug("Finished sending bytes for " + unit.name + ", awaiting acknowledgement", "Sender");
    return conn.readAck();
}

} // namespace Chunkwise
