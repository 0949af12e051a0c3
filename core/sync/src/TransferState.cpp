#include "TransferState.h"
#include "FileUtils.h"
#include "Logger.h"

#include <filesystem>
#include <utility>

namespace Chunkwise {

TransferState::TransferState(std::string path, Logger& logger)
    : path_(std::move(path)), logger_(logger) {}

void TransferState::load() {
    completed_.clear();
    if (path_.empty()) {
        return;
    }

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        logger_.debug("No transfer state at " + path_ + ", starting fresh", "TransferState");
        return;
    }

    auto root = FileUtils::readJson(path_);
    if (!root) {
        logger_.warn("Ignoring unreadable transfer state " + path_ + ": " + root.error().message, "TransferState");
        return;
    }

    if (!root->isObject() || !(*root)["completed_files"].isArray()) {
        logger_.warn("Ignoring transfer state " + path_ + ": no completed_files list", "TransferState");
        return;
    }

    for (const auto& entry : (*root)["completed_files"]) {
        if (entry.isString()) {
            completed_.insert(entry.asString());
        }
    }
    logger_.info("Loaded transfer state: " + std::to_string(completed_.size()) + " unit(s) already confirmed",
                 "TransferState");
}

bool TransferState::isCompleted(const std::string& unit) const {
    return completed_.count(unit) > 0;
}

Result<void> TransferState::markCompleted(const std::string& unit) {
    completed_.insert(unit);
    return save();
}

Result<void> TransferState::save() const {
    if (path_.empty()) {
        return Ok();
    }

    Json::Value root(Json::objectValue);
    Json::Value list(Json::arrayValue);
    for (const auto& unit : completed_) {
        list.append(unit);
    }
    root["completed_files"] = list;

    auto parent = std::filesystem::path(path_).parent_path();
    auto dirReady = FileUtils::ensureDirectory(parent);
    if (!dirReady) {
        return dirReady;
    }
    return FileUtils::writeJsonAtomic(path_, root);
}

} // namespace Chunkwise
