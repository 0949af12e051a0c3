#include "Interrupt.h"

#include <chrono>
#include <csignal>
#include <utility>

namespace Chunkwise {

namespace {
    // std::atomic is not guaranteed async-signal-safe in C++17
    volatile sig_atomic_t signalReceived = 0;

    void signalHandler(int) {
        signalReceived = 1;
    }
}

void installInterruptHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

bool interruptRequested() {
    return signalReceived != 0;
}

InterruptWatcher::InterruptWatcher(std::function<void()> onInterrupt)
    : onInterrupt_(std::move(onInterrupt)) {
    thread_ = std::thread([this]() {
        while (!done_) {
            if (interruptRequested()) {
                onInterrupt_();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

InterruptWatcher::~InterruptWatcher() {
    done_ = true;
    if (thread_.joinable()) {
        thread_.join();
    }
}

} // namespace Chunkwise
