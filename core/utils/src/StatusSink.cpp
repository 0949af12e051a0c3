#include "StatusSink.h"
#include "FileUtils.h"
#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace Chunkwise {

namespace {

std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

} // namespace

JsonFileStatusSink::JsonFileStatusSink(std::string path, Logger& logger)
    : path_(std::move(path)), logger_(logger) {}

void JsonFileStatusSink::publish(const std::string& role, const std::string& state, const StatusReport& report) {
    Json::Value root(Json::objectValue);
    root["role"] = role;
    root["state"] = state;
    root["current_unit"] = report.currentUnit;
    root["current_index"] = static_cast<Json::UInt64>(report.currentIndex);
    root["total_units"] = static_cast<Json::UInt64>(report.totalUnits);
    root["units_done"] = static_cast<Json::UInt64>(report.unitsDone);
    root["bytes_current"] = static_cast<Json::UInt64>(report.bytesCurrent);
    root["current_size"] = static_cast<Json::UInt64>(report.currentSize);
    root["error_message"] = report.errorMessage;
    root["last_update"] = isoTimestamp();

    auto written = FileUtils::writeJsonAtomic(path_, root);
    if (!written) {
        logger_.warn("Status update failed: " + written.error().message, "Status");
    }
}

} // namespace Chunkwise
