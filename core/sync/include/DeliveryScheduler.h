#pragma once

#include "Manifest.h"
#include "Protocol.h"
#include "Result.h"
#include "StatusSink.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Chunkwise {

class Logger;
class TcpConnection;
class TransferState;

enum class SenderState {
    Idle,
    Connecting,
    Connected,
    Sending,
    Completed,
    CompletedWithErrors,
    Error
};

const char* senderStateToString(SenderState state);

struct DeliveryUnit {
    std::string name;
    int priority = Manifest::DEFAULT_PRIORITY;
    bool isManifest = false;
};

struct SendReport {
    SenderState state = SenderState::Idle;
    size_t totalUnits = 0;
    size_t unitsSent = 0;
    size_t unitsSkipped = 0;
    std::vector<std::string> failedUnits;
    std::optional<Error> error;     // set when state is Error
};

struct DeliveryOptions {
    int timeoutSeconds = 30;
    size_t bufferSize = 4096;
    int maxRetries = 3;             // total attempts per unit
    bool priorityEnabled = true;
};

/**
 * @brief Sender side of a transfer
 *
 * Sends the manifest, then every chunk in priority order, over one
 * connection. Units already in the TransferState are skipped; a unit the
 * receiver confirms is added to it and persisted before the next unit.
 *
 * BAD and garbled acks are retried up to maxRetries attempts and then
 * recorded. A lost connection or a timeout once a unit is on the wire ends
 * the run in Error; the unit stays unconfirmed and is resent on the next run.
 */
class DeliveryScheduler {
public:
    DeliveryScheduler(const DeliveryOptions& options, TransferState& state, Logger& logger, StatusSink& status);

    DeliveryScheduler(const DeliveryScheduler&) = delete;
    DeliveryScheduler& operator=(const DeliveryScheduler&) = delete;

    /// Manifest first, then chunks stable-sorted by ascending priority (if enabled)
    static std::vector<DeliveryUnit> planUnits(const Manifest& manifest, bool priorityEnabled);

    /// @p workDir holds manifest.json and the chunk files
    SendReport run(const Manifest& manifest, const std::string& workDir,
                   const std::string& host, uint16_t port);

    /// Safe from any thread; the running transfer ends in Error/Cancelled
    void cancel();

    SenderState state() const { return state_.load(); }

private:
    enum class UnitOutcome {
        Accepted,
        Failed,
        Fatal
    };

    DeliveryOptions options_;
    TransferState& transferState_;
    Logger& logger_;
    StatusSink& status_;

    std::atomic<SenderState> state_{SenderState::Idle};
    std::atomic<bool> cancelled_{false};
    std::mutex connMutex_;
    TcpConnection* activeConn_ = nullptr;
    StatusReport progress_;

    void setState(SenderState state);
    void publish();
    void attach(TcpConnection* conn);
    UnitOutcome deliverUnit(TcpConnection& conn, const DeliveryUnit& unit, const std::string& workDir,
                            SendReport& report);
    Result<Protocol::AckMatch> sendOnce(TcpConnection& conn, const DeliveryUnit& unit,
                                        const std::string& path, uint64_t size);
    SendReport finish(SendReport report, SenderState state, std::optional<Error> error = std::nullopt);
};

} // namespace Chunkwise
