#pragma once

#include "Result.h"

#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>

namespace Chunkwise {

/**
 * @brief One stored chunk of a transfer
 *
 * `hash` is the SHA-256 of the stored form (after compression and
 * encryption), i.e. exactly the bytes that travel and land on disk.
 */
struct ChunkDescriptor {
    uint64_t index = 0;
    std::string name;
    uint64_t size = 0;
    std::string hash;
    int priority = 3;

    Json::Value extra{Json::objectValue}; // unrecognised keys, written back as-is
};

/**
 * @brief Description of one transfer: source identity plus chunk list
 *
 * Serialized as JSON. Keys this class does not know about are kept in
 * `extra` and written back unchanged.
 */
class Manifest {
public:
    static constexpr const char* UNIT_NAME = "manifest.json";
    static constexpr const char* HASH_ALGORITHM = "sha256";
    static constexpr int DEFAULT_PRIORITY = 3;

    std::string originalFilename;
    uint64_t originalSize = 0;
    std::string originalHash;
    uint64_t chunkSize = 0;
    std::string hashAlgorithm = HASH_ALGORITHM;
    int priority = DEFAULT_PRIORITY;
    std::string priorityName = "NORMAL";
    bool compressionEnabled = true;
    bool encryptionEnabled = true;
    std::vector<ChunkDescriptor> chunks;

    Json::Value extra{Json::objectValue};

    Json::Value toJson() const;
    std::string serialize() const;

    /**
     * @brief Parse a manifest
     *
     * Required keys: original_filename, original_size, original_hash,
     * chunk_size, chunks. Optional keys default as follows: priority and
     * per-chunk priority to @p defaultPriority / the manifest priority,
     * priority_name to the label of the priority, the two flags to true,
     * hash_algorithm to sha256. Fails with MalformedManifest, also when an
     * optional key is present with the wrong type.
     */
    static Result<Manifest> fromJson(const Json::Value& root, int defaultPriority = DEFAULT_PRIORITY);
    static Result<Manifest> deserialize(const std::string& text, int defaultPriority = DEFAULT_PRIORITY);
    static Result<Manifest> loadFromFile(const std::string& path, int defaultPriority = DEFAULT_PRIORITY);

    Result<void> saveToFile(const std::string& path) const;

    /**
     * @brief Check structural invariants, normalizing priorities
     *
     * Fails with MalformedManifest on non-contiguous indices, duplicate or
     * illegal chunk names, malformed hashes, chunk_size 0 or an unsupported
     * hash algorithm. Priorities outside 1..4 are replaced by
     * @p defaultPriority instead of failing.
     */
    Result<void> validate(int defaultPriority = DEFAULT_PRIORITY);

    /// nullptr if no chunk has this name
    const ChunkDescriptor* findChunk(const std::string& name) const;

    /// Descriptors ordered by index
    std::vector<ChunkDescriptor> chunksByIndex() const;

    static std::string chunkName(uint64_t index);

    /// Legal as a unit and file name: non-empty, no separators, not "." or "..", not the manifest name
    static bool isValidChunkName(const std::string& name);

    static bool isValidPriority(int priority) { return priority >= 1 && priority <= 4; }
    static std::string defaultPriorityName(int priority);
};

} // namespace Chunkwise
