#pragma once

#include "Manifest.h"
#include "Result.h"

#include <string>
#include <vector>

namespace Chunkwise {

class Logger;
class KeyProvider;

enum class ChunkStatus {
    Ok,
    Missing,
    Bad
};

const char* chunkStatusToString(ChunkStatus status);

struct ChunkCheck {
    uint64_t index = 0;
    std::string name;
    ChunkStatus status = ChunkStatus::Missing;
    std::string expectedHash;
    std::string actualHash;   // empty when missing
};

struct VerifyReport {
    std::vector<ChunkCheck> chunks;
    size_t okCount = 0;
    size_t missingCount = 0;
    size_t badCount = 0;

    bool allOk() const { return missingCount == 0 && badCount == 0; }
};

enum class IntegrityOutcome {
    VerifiedIdentical,
    IntegrityMismatch
};

struct ReassemblyReport {
    IntegrityOutcome outcome = IntegrityOutcome::IntegrityMismatch;
    std::string outputPath;
    std::string expectedHash;
    std::string actualHash;
    uint64_t expectedSize = 0;
    uint64_t actualSize = 0;
};

/**
 * @brief Offline consumer of a received chunk set
 *
 * verify() checks every stored chunk against its descriptor hash.
 * reassemble() opens/decompresses the chunks in index order into the
 * output file and compares the result with the manifest's original hash.
 * A mismatch is reported in the returned report, the output is kept.
 */
class Reassembler {
public:
    /// @p keys may be null for manifests without encryption
    Reassembler(Logger& logger, const KeyProvider* keys);

    VerifyReport verify(const Manifest& manifest, const std::string& chunkDir) const;

    /**
     * @brief Rebuild the original file
     *
     * Refuses (ChunkMissing / HashMismatch) unless verify() reports every
     * chunk ok. Fails with FileWriteError if @p outputPath exists and
     * @p overwrite is false. Decrypt or decompress failures remove the
     * partial output.
     */
    Result<ReassemblyReport> reassemble(const Manifest& manifest,
                                        const std::string& chunkDir,
                                        const std::string& outputPath,
                                        bool overwrite = false) const;

private:
    Logger& logger_;
    const KeyProvider* keys_;
};

} // namespace Chunkwise
