#pragma once

#include "Result.h"

#include <set>
#include <string>

namespace Chunkwise {

class Logger;

/**
 * @brief Sender-side record of units the receiver has confirmed
 *
 * Loaded once at startup, kept in memory, and rewritten in full after
 * every confirmed unit. Persisted as `{"completed_files": [...]}`.
 * With an empty path the record lives only in memory.
 */
class TransferState {
public:
    TransferState(std::string path, Logger& logger);

    /**
     * @brief Read the record from disk
     *
     * A missing file is an empty record. An unreadable or corrupted file
     * is logged and also treated as empty.
     */
    void load();

    bool isCompleted(const std::string& unit) const;

    /// Add @p unit and persist immediately
    Result<void> markCompleted(const std::string& unit);

    Result<void> save() const;

    const std::set<std::string>& completed() const { return completed_; }
    size_t size() const { return completed_.size(); }
    const std::string& path() const { return path_; }
    bool persistent() const { return !path_.empty(); }

private:
    std::string path_;
    Logger& logger_;
    std::set<std::string> completed_;
};

} // namespace Chunkwise
