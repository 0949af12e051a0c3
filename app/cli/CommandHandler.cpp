#include "CommandHandler.h"
#include "Logger.h"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace Chunkwise {

std::string CommandHandler::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unitIndex = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024.0 && unitIndex < 4) {
        size /= 1024.0;
        unitIndex++;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(unitIndex == 0 ? 0 : 2) << size << " " << units[unitIndex];
    return ss.str();
}

int CommandHandler::fail(const std::string& message, int code) {
    ctx_.logger.error(message, "CLI");
    std::cerr << "Error: " << message << std::endl;
    return code;
}

} // namespace Chunkwise
