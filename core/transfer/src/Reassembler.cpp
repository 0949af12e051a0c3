#include "Reassembler.h"
#include "Compression.h"
#include "Crypto.h"
#include "FileUtils.h"
#include "KeyProvider.h"
#include "Logger.h"
#include "SHA256.h"

#include <filesystem>
#include <fstream>
#include <openssl/crypto.h>

namespace Chunkwise {

const char* chunkStatusToString(ChunkStatus status) {
    switch (status) {
        case ChunkStatus::Ok: return "ok";
        case ChunkStatus::Missing: return "missing";
        case ChunkStatus::Bad: return "bad";
        default: return "unknown";
    }
}

Reassembler::Reassembler(Logger& logger, const KeyProvider* keys)
    : logger_(logger), keys_(keys) {}

VerifyReport Reassembler::verify(const Manifest& manifest, const std::string& chunkDir) const {
    VerifyReport report;
    const std::filesystem::path dir(chunkDir);

    for (const auto& chunk : manifest.chunksByIndex()) {
        ChunkCheck check;
        check.index = chunk.index;
        check.name = chunk.name;
        check.expectedHash = chunk.hash;

        auto path = dir / chunk.name;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            check.status = ChunkStatus::Missing;
            ++report.missingCount;
            logger_.error("Chunk missing: " + chunk.name, "Reassembler");
            report.chunks.push_back(std::move(check));
            continue;
        }

        auto digest = SHA256::hashFile(path.string());
        if (!digest) {
            check.status = ChunkStatus::Missing;
            ++report.missingCount;
            logger_.error("Chunk unreadable: " + digest.error().message, "Reassembler");
        } else if (*digest == chunk.hash) {
            check.status = ChunkStatus::Ok;
            check.actualHash = *digest;
            ++report.okCount;
            logger_.debug("Chunk OK: " + chunk.name, "Reassembler");
        } else {
            check.status = ChunkStatus::Bad;
            check.actualHash = *digest;
            ++report.badCount;
            logger_.warn("Chunk corrupted: " + chunk.name + " (expected " + chunk.hash.substr(0, 8) +
                         ", got " + digest->substr(0, 8) + ")", "Reassembler");
        }
        report.chunks.push_back(std::move(check));
    }

    logger_.info("Verified " + std::to_string(report.chunks.size()) + " chunk(s): " +
                 std::to_string(report.okCount) + " ok, " + std::to_string(report.missingCount) +
                 " missing, " + std::to_string(report.badCount) + " bad", "Reassembler");
    return report;
}

Result<ReassemblyReport> Reassembler::reassemble(const Manifest& manifest,
                                                 const std::string& chunkDir,
                                                 const std::string& outputPath,
                                                 bool overwrite) const {
    using Report = ReassemblyReport;

    VerifyReport verified = verify(manifest, chunkDir);
    if (verified.missingCount > 0) {
        return Err<Report>(ErrorCode::ChunkMissing,
                           std::to_string(verified.missingCount) + " chunk(s) missing, refusing to reassemble");
    }
    if (verified.badCount > 0) {
        return Err<Report>(ErrorCode::HashMismatch,
                           std::to_string(verified.badCount) + " chunk(s) corrupted, refusing to reassemble");
    }

    std::error_code ec;
    if (!overwrite && std::filesystem::exists(outputPath, ec)) {
        return Err<Report>(ErrorCode::FileWriteError, "Output file already exists: " + outputPath);
    }

    std::vector<uint8_t> key;
    if (manifest.encryptionEnabled) {
        if (!keys_) {
            return Err<Report>(ErrorCode::KeyUnavailable, "Manifest is encrypted but no key provider configured");
        }
        auto loaded = keys_->load();
        if (!loaded) {
            return Err<Report>(ErrorCode::KeyUnavailable, loaded.error().message);
        }
        key = std::move(*loaded);
    }

    auto parent = std::filesystem::path(outputPath).parent_path();
    auto dirReady = FileUtils::ensureDirectory(parent);
    if (!dirReady) {
        return dirReady.error();
    }

    const std::string partPath = outputPath + ".part";
    std::ofstream out(partPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Err<Report>(ErrorCode::FileWriteError, "Cannot create " + partPath);
    }

    auto fail = [&](Error error) -> Result<Report> {
        out.close();
        FileUtils::removeQuietly(partPath);
        if (!key.empty()) OPENSSL_cleanse(key.data(), key.size());
        logger_.error("Reassembly failed: " + error.toString(), "Reassembler");
        return error;
    };

    const std::filesystem::path dir(chunkDir);
    uint64_t written = 0;
    const auto ordered = manifest.chunksByIndex();

    for (size_t i = 0; i < ordered.size(); ++i) {
        const auto& chunk = ordered[i];
        auto data = FileUtils::readFile(dir / chunk.name);
        if (!data) {
            return fail(data.error());
        }
        std::vector<uint8_t> bytes = std::move(*data);

        if (manifest.encryptionEnabled) {
            auto opened = Crypto::open(bytes, key);
            if (!opened) {
                return fail(Error{ErrorCode::DecryptionFailed, chunk.name + ": " + opened.error().message});
            }
            bytes = std::move(*opened);
        }
        if (manifest.compressionEnabled) {
            auto inflated = Compression::decompress(bytes);
            if (!inflated) {
                return fail(Error{ErrorCode::DecompressionFailed, chunk.name + ": " + inflated.error().message});
            }
            bytes = std::move(*inflated);
        }

        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!out.good()) {
            return fail(Error{ErrorCode::FileWriteError, "Write failed on " + partPath});
        }
        written += bytes.size();
        logger_.debug("[" + std::to_string(i + 1) + "/" + std::to_string(ordered.size()) + "] " +
                      chunk.name + ": " + std::to_string(bytes.size()) + " bytes", "Reassembler");
    }

    if (!key.empty()) OPENSSL_cleanse(key.data(), key.size());
    out.flush();
    if (!out.good()) {
        return fail(Error{ErrorCode::FileWriteError, "Flush failed on " + partPath});
    }
    out.close();

    std::filesystem::rename(partPath, outputPath, ec);
    if (ec) {
        FileUtils::removeQuietly(partPath);
        return Err<Report>(ErrorCode::FileWriteError, "Cannot rename " + partPath + ": " + ec.message());
    }

    // Hash what actually landed on disk
    auto digest = SHA256::hashFile(outputPath);
    if (!digest) {
        return digest.error();
    }

    Report report;
    report.outputPath = outputPath;
    report.expectedHash = manifest.originalHash;
    report.expectedSize = manifest.originalSize;
    report.actualHash = *digest;
    report.actualSize = std::filesystem::file_size(outputPath, ec);
    if (ec) {
        report.actualSize = written;
    }

    if (report.actualHash == report.expectedHash && report.actualSize == report.expectedSize) {
        report.outcome = IntegrityOutcome::VerifiedIdentical;
        logger_.info("Reassembled " + outputPath + " (" + std::to_string(written) +
                     " bytes), integrity verified", "Reassembler");
    } else {
        report.outcome = IntegrityOutcome::IntegrityMismatch;
        logger_.error("Integrity mismatch for " + outputPath + ": expected " + report.expectedHash +
                      " (" + std::to_string(report.expectedSize) + " bytes), got " + report.actualHash +
                      " (" + std::to_string(report.actualSize) + " bytes)", "Reassembler");
    }
    return report;
}

} // namespace Chunkwise
