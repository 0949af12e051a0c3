#include "ChunkProducer.h"
#include "Compression.h"
#include "Crypto.h"
#include "FileUtils.h"
#include "KeyProvider.h"
#include "Logger.h"
#include "SHA256.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <openssl/crypto.h>

namespace Chunkwise {

namespace {

/// Removes the chunk files of a failed run unless committed
class ChunkCleanup {
public:
    ~ChunkCleanup() {
        if (committed_) return;
        for (const auto& path : written_) {
            FileUtils::removeQuietly(path);
        }
    }

    void add(const std::filesystem::path& path) { written_.push_back(path); }
    void commit() { committed_ = true; }

private:
    std::vector<std::filesystem::path> written_;
    bool committed_ = false;
};

/// Zeroes key material on scope exit
struct KeyWipe {
    std::vector<uint8_t>& key;
    ~KeyWipe() {
        if (!key.empty()) OPENSSL_cleanse(key.data(), key.size());
    }
};

} // namespace

ChunkProducer::ChunkProducer(Logger& logger, const KeyProvider* keys)
    : logger_(logger), keys_(keys) {}

Result<Manifest> ChunkProducer::produce(const std::string& sourcePath,
                                        const std::string& outputDir,
                                        const ProduceOptions& options) {
    if (options.chunkSizeBytes == 0) {
        return Err<Manifest>(ErrorCode::InvalidArgument, "Chunk size must be positive");
    }
    if (options.compressionEnabled && (options.compressionLevel < 0 || options.compressionLevel > 9)) {
        return Err<Manifest>(ErrorCode::InvalidArgument,
                             "Compression level must be 0-9, got " + std::to_string(options.compressionLevel));
    }

    std::ifstream source(sourcePath, std::ios::binary);
    if (!source.is_open() || std::filesystem::is_directory(sourcePath)) {
        return Err<Manifest>(ErrorCode::SourceUnreadable, "Cannot open source file " + sourcePath);
    }

    std::vector<uint8_t> key;
    KeyWipe wipe{key};
    if (options.encryptionEnabled) {
        if (!keys_) {
            return Err<Manifest>(ErrorCode::KeyUnavailable, "Encryption enabled but no key provider configured");
        }
        auto loaded = keys_->load();
        if (!loaded) {
            return Err<Manifest>(ErrorCode::KeyUnavailable, loaded.error().message);
        }
        key = std::move(*loaded);
    }

    auto dirReady = FileUtils::ensureDirectory(outputDir);
    if (!dirReady) {
        return dirReady.error();
    }

    const std::filesystem::path outDir(outputDir);
    const std::filesystem::path manifestPath = outDir / Manifest::UNIT_NAME;
    // A manifest from an earlier run must not outlive a failed run
    FileUtils::removeQuietly(manifestPath);

    int priority = options.priority;
    if (!Manifest::isValidPriority(priority)) {
        logger_.warn("Invalid priority " + std::to_string(priority) + ", using default " +
                     std::to_string(options.defaultPriority), "Producer");
        priority = options.defaultPriority;
    }

    Manifest manifest;
    manifest.originalFilename = std::filesystem::path(sourcePath).filename().string();
    manifest.chunkSize = options.chunkSizeBytes;
    manifest.priority = priority;
    manifest.priorityName = options.priorityName.empty() ? Manifest::defaultPriorityName(priority)
                                                         : options.priorityName;
    manifest.compressionEnabled = options.compressionEnabled;
    manifest.encryptionEnabled = options.encryptionEnabled;

    logger_.info("Chunking " + sourcePath + " (chunk size " + std::to_string(options.chunkSizeBytes) +
                 " bytes, compression " + (options.compressionEnabled ? "on" : "off") +
                 ", encryption " + (options.encryptionEnabled ? "on" : "off") + ")", "Producer");

    ChunkCleanup cleanup;
    SHA256 originalHasher;
    uint64_t totalRaw = 0;
    uint64_t totalStored = 0;
    std::vector<uint8_t> raw(options.chunkSizeBytes);

    for (uint64_t index = 0;; ++index) {
        source.read(reinterpret_cast<char*>(raw.data()), static_cast<std::streamsize>(raw.size()));
        auto got = static_cast<size_t>(source.gcount());
        if (source.bad()) {
            return Err<Manifest>(ErrorCode::SourceUnreadable, "Read error on " + sourcePath);
        }
        if (got == 0) {
            break;
        }

        std::vector<uint8_t> stored(raw.begin(), raw.begin() + static_cast<std::ptrdiff_t>(got));
        originalHasher.update(stored);
        totalRaw += got;

        if (options.compressionEnabled) {
            auto compressed = Compression::compress(stored, options.compressionLevel);
            if (!compressed) {
                return compressed.error();
            }
            stored = std::move(*compressed);
        }
        size_t compressedSize = stored.size();

        if (options.encryptionEnabled) {
            auto sealed = Crypto::seal(stored, key);
            if (!sealed) {
                return sealed.error();
            }
            stored = std::move(*sealed);
        }

        ChunkDescriptor chunk;
        chunk.index = index;
        chunk.name = Manifest::chunkName(index);
        chunk.size = stored.size();
        chunk.hash = SHA256::hashBytes(stored);
        chunk.priority = priority;

        auto chunkPath = outDir / chunk.name;
        cleanup.add(chunkPath);
        auto written = FileUtils::writeFileAtomic(chunkPath, stored);
        if (!written) {
            return written.error();
        }

        if (logger_.isDebugEnabled()) {
            std::ostringstream msg;
            msg << chunk.name << ": raw=" << got << " compressed=" << compressedSize
                << " stored=" << chunk.size << " sha256=" << chunk.hash.substr(0, 8);
            logger_.debug(msg.str(), "Producer");
        }

        totalStored += chunk.size;
        manifest.chunks.push_back(std::move(chunk));

        if (got < raw.size()) {
            break;
        }
    }

    manifest.originalSize = totalRaw;
    manifest.originalHash = originalHasher.finalHex();
    if (manifest.originalHash.empty()) {
        return Err<Manifest>(ErrorCode::InternalError, "SHA-256 digest of source failed");
    }

    auto saved = manifest.saveToFile(manifestPath.string());
    if (!saved) {
        return saved.error();
    }
    cleanup.commit();

    std::ostringstream summary;
    summary << "Produced " << manifest.chunks.size() << " chunk(s) from " << totalRaw
            << " bytes, " << totalStored << " bytes stored";
    if (options.compressionEnabled && totalRaw > 0) {
        summary << " (" << std::fixed << std::setprecision(1)
                << (1.0 - Compression::compressionRatio(totalRaw, totalStored)) * 100.0 << "% reduction)";
    }
    logger_.info(summary.str(), "Producer");
    return manifest;
}

} // namespace Chunkwise
