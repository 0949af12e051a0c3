#pragma once

#include <cstdint>
#include <string>

namespace Chunkwise {

    class Logger;

    /// Counters shown by an external dashboard while a transfer runs
    struct StatusReport {
        std::string currentUnit;
        size_t currentIndex = 0;
        size_t totalUnits = 0;
        size_t unitsDone = 0;
        uint64_t bytesCurrent = 0;
        uint64_t currentSize = 0;
        std::string errorMessage;
    };

    /**
     * @brief Live status publisher
     *
     * publish() is fire-and-forget: implementations never fail the caller.
     */
    class StatusSink {
    public:
        virtual ~StatusSink() = default;
        virtual void publish(const std::string& role, const std::string& state, const StatusReport& report) = 0;
    };

    class NullStatusSink : public StatusSink {
    public:
        void publish(const std::string&, const std::string&, const StatusReport&) override {}
    };

    /**
     * @brief Rewrites a JSON snapshot file on every publish
     *
     * Write failures are logged at WARN and otherwise ignored.
     */
    class JsonFileStatusSink : public StatusSink {
    public:
        JsonFileStatusSink(std::string path, Logger& logger);

        void publish(const std::string& role, const std::string& state, const StatusReport& report) override;

        const std::string& path() const { return path_; }

    private:
        std::string path_;
        Logger& logger_;
    };

}
