#pragma once

#include "Manifest.h"
#include "Result.h"
#include "StatusSink.h"
#include "TcpConnection.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace Chunkwise {

class Logger;

enum class ReceiverState {
    Waiting,
    Connected,
    ReceivingUnit,
    Completed,
    Error,
    Stopped
};

const char* receiverStateToString(ReceiverState state);

struct ReceiverOptions {
    std::string host = "0.0.0.0";
    uint16_t port = 5001;           // 0 picks an ephemeral port
    int timeoutSeconds = 30;
    size_t bufferSize = 4096;
    std::string storageDir = ".";
    bool acceptUnknownUnits = true;
    int defaultPriority = Manifest::DEFAULT_PRIORITY;
};

struct ReceiveReport {
    ReceiverState state = ReceiverState::Waiting;
    size_t unitsReceived = 0;       // announcements whose payload was read in full
    size_t unitsAccepted = 0;
    size_t unitsRejected = 0;
    uint64_t bytesReceived = 0;
    std::optional<Error> error;     // set when state is Error or Stopped
    std::optional<Manifest> manifest;
};

/**
 * @brief Receiver side of a transfer: one connection, one session
 *
 * bind() opens the listening socket; run() accepts a single peer, closes
 * the listener, and processes units until DONE (Completed), a fatal error
 * (Error) or stop() (Stopped).
 *
 * Each unit is streamed into `<storage>/<name>.part` while being hashed.
 * An accepted unit is renamed to its final name; a rejected or
 * interrupted one is deleted.
 */
class ReceiverSession {
public:
    ReceiverSession(const ReceiverOptions& options, Logger& logger, StatusSink& status);

    ReceiverSession(const ReceiverSession&) = delete;
    ReceiverSession& operator=(const ReceiverSession&) = delete;

    /**
     * @brief Create the storage directory and start listening
     *
     * A valid manifest already present in the storage directory is loaded,
     * so chunks of a resumed transfer are still hash-checked.
     */
    Result<void> bind();

    uint16_t boundPort() const { return listener_.port(); }

    /// Blocks until the session ends. bind() must have succeeded.
    ReceiveReport run();

    /// Safe from any thread
    void stop();

    ReceiverState state() const { return state_.load(); }

private:
    enum class Verdict {
        Accept,
        Reject
    };

    ReceiverOptions options_;
    Logger& logger_;
    StatusSink& status_;

    TcpListener listener_;
    std::optional<Manifest> manifest_;

    std::atomic<ReceiverState> state_{ReceiverState::Waiting};
    std::atomic<bool> stopRequested_{false};
    std::mutex connMutex_;
    TcpConnection* activeConn_ = nullptr;
    StatusReport progress_;

    void setState(ReceiverState state);
    void publish();
    void attach(TcpConnection* conn);

    /// Receive one announced unit and answer it. Errors are session-fatal.
    Result<void> receiveUnit(TcpConnection& conn, const Protocol::Announcement& unit, ReceiveReport& report);

    /// Consume @p size payload bytes, writing them to @p partPath when not empty
    Result<std::string> consumePayload(TcpConnection& conn, uint64_t size, const std::string& partPath,
                                       bool& writeFailed);

    Verdict judgeChunk(const std::string& name, const std::string& actualHash);
    Result<Verdict> judgeManifest(const std::string& partPath);

    ReceiveReport finish(ReceiveReport report, ReceiverState state, std::optional<Error> error = std::nullopt);
};

} // namespace Chunkwise
