#pragma once

#include "Result.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <json/json.h>

namespace Chunkwise {

/**
 * @brief Small file helpers shared by the transfer components
 *
 * Every write* function goes through a sibling ".tmp" file that is
 * renamed over the target, so readers never observe a half-written file.
 */
class FileUtils {
public:
    static Result<void> ensureDirectory(const std::filesystem::path& dir);

    static Result<std::vector<uint8_t>> readFile(const std::filesystem::path& path);

    static Result<void> writeFileAtomic(const std::filesystem::path& path,
                                        const std::vector<uint8_t>& data);

    static Result<Json::Value> readJson(const std::filesystem::path& path);
    static Result<Json::Value> parseJson(const std::string& text);

    /// Two-space indented JSON, written atomically
    static Result<void> writeJsonAtomic(const std::filesystem::path& path, const Json::Value& value);

    static std::string toJsonString(const Json::Value& value);

    /// Best-effort unlink; a missing file is not an error
    static void removeQuietly(const std::filesystem::path& path);
};

} // namespace Chunkwise
