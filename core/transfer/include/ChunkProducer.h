#pragma once

#include "Manifest.h"
#include "Result.h"

#include <string>

namespace Chunkwise {

class Logger;
class KeyProvider;

struct ProduceOptions {
    size_t chunkSizeBytes = 1024 * 1024;
    int priority = Manifest::DEFAULT_PRIORITY;
    int defaultPriority = Manifest::DEFAULT_PRIORITY;   // used when priority is out of range
    std::string priorityName;                           // empty: standard label for the priority
    int compressionLevel = 6;
    bool compressionEnabled = true;
    bool encryptionEnabled = true;
};

/**
 * @brief Splits a source file into stored chunks plus a manifest
 *
 * Each raw chunk is compressed, then sealed, then written to
 * `<outputDir>/echunk_<i>.bin`; the manifest goes to
 * `<outputDir>/manifest.json` only after every chunk was written.
 * A failed run removes the chunk files it created.
 */
class ChunkProducer {
public:
    /// @p keys may be null when encryption is disabled
    ChunkProducer(Logger& logger, const KeyProvider* keys);

    Result<Manifest> produce(const std::string& sourcePath,
                             const std::string& outputDir,
                             const ProduceOptions& options);

private:
    Logger& logger_;
    const KeyProvider* keys_;
};

} // namespace Chunkwise
