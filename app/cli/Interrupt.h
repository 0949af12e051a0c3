#pragma once

#include <atomic>
#include <functional>
#include <thread>

namespace Chunkwise {

/// Route SIGINT and SIGTERM to an async-signal-safe flag
void installInterruptHandlers();

bool interruptRequested();

/**
 * @brief Runs @p onInterrupt on a helper thread once a signal arrives
 *
 * The callback runs at most once, outside signal context, while the
 * watcher is alive.
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::function<void()> onInterrupt);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    std::function<void()> onInterrupt_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace Chunkwise
