#include "ConsoleProgressSink.h"

#include <iostream>
#include <sstream>

namespace Chunkwise {

void ConsoleProgressSink::publish(const std::string& role, const std::string& state, const StatusReport& report) {
    inner_.publish(role, state, report);

    std::ostringstream line;
    line << "[" << role << "] " << state;
    if (report.totalUnits > 0) {
        line << "  " << report.unitsDone << "/" << report.totalUnits << " units";
    }
    if (!report.currentUnit.empty()) {
        line << "  " << report.currentUnit;
        if (report.currentSize > 0) {
            line << " (" << (report.bytesCurrent * 100 / report.currentSize) << "%)";
        }
    }
    if (!report.errorMessage.empty()) {
        line << "  " << report.errorMessage;
    }

    // Status is republished on every state change; skip repeats
    if (line.str() == lastLine_) {
        return;
    }
    lastLine_ = line.str();
    std::cout << lastLine_ << std::endl;
}

} // namespace Chunkwise
