#pragma once

#include "StatusSink.h"

#include <string>

namespace Chunkwise {

/**
 * @brief Forwards to another sink and prints a progress line per update
 */
class ConsoleProgressSink : public StatusSink {
public:
    explicit ConsoleProgressSink(StatusSink& inner) : inner_(inner) {}

    void publish(const std::string& role, const std::string& state, const StatusReport& report) override;

private:
    StatusSink& inner_;
    std::string lastLine_;
};

} // namespace Chunkwise
