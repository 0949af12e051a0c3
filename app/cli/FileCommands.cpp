#include "FileCommands.h"
#include "FileUtils.h"
#include "KeyProvider.h"
#include "Logger.h"
#include "Manifest.h"
#include "Reassembler.h"
#include "Settings.h"

#include <filesystem>
#include <iostream>

namespace Chunkwise {

namespace {

Result<Manifest> loadManifest(const std::string& dir, int defaultPriority) {
    const auto path = (std::filesystem::path(dir) / Manifest::UNIT_NAME).string();
    auto manifest = Manifest::loadFromFile(path, defaultPriority);
    if (!manifest) {
        return Error{manifest.error().code, path + ": " + manifest.error().message};
    }
    auto valid = manifest->validate(defaultPriority);
    if (!valid) {
        return Error{valid.error().code, path + ": " + valid.error().message};
    }
    return manifest;
}

void printVerifyReport(const VerifyReport& report) {
    for (const auto& check : report.chunks) {
        std::cout << "  " << check.name << ": " << chunkStatusToString(check.status) << std::endl;
    }
    std::cout << report.okCount << " ok, " << report.missingCount << " missing, " << report.badCount << " bad"
              << std::endl;
}

/// original_filename comes from the peer; keep only its last component
std::string defaultOutputName(const Manifest& manifest) {
    std::string name = std::filesystem::path(manifest.originalFilename).filename().string();
    if (name.empty() || name == "." || name == "..") {
        return "rebuilt_file.bin";
    }
    return name;
}

} // namespace

int FileCommands::handleVerify() {
    const std::string dir = ctx_.args.valueOr("--dir", ctx_.settings.storageDir);
    auto manifest = loadManifest(dir, ctx_.settings.defaultPriority);
    if (!manifest) {
        return fail("Cannot verify: " + manifest.error().message);
    }

    Reassembler reassembler(ctx_.logger, nullptr);
    auto report = reassembler.verify(*manifest, dir);
    printVerifyReport(report);

    if (!report.allOk()) {
        std::cerr << "Verification failed: re-transfer the missing or bad chunks" << std::endl;
        return ExitStatus::Integrity;
    }
    std::cout << "All chunks verified" << std::endl;
    return ExitStatus::Ok;
}

int FileCommands::handleReassemble() {
    const std::string dir = ctx_.args.valueOr("--dir", ctx_.settings.storageDir);
    auto manifest = loadManifest(dir, ctx_.settings.defaultPriority);
    if (!manifest) {
        return fail("Cannot reassemble: " + manifest.error().message);
    }

    FileKeyProvider keys(ctx_.settings.keyFile);
    Reassembler reassembler(ctx_.logger, manifest->encryptionEnabled ? &keys : nullptr);

    auto verified = reassembler.verify(*manifest, dir);
    if (!verified.allOk()) {
        printVerifyReport(verified);
        std::cerr << "Cannot reassemble: some chunks are missing or corrupted" << std::endl;
        return ExitStatus::Integrity;
    }

    const std::string output = ctx_.args.valueOr("--output", defaultOutputName(*manifest));
    auto result = reassembler.reassemble(*manifest, dir, output, ctx_.args.flag("--force"));
    if (!result) {
        return fail("Reassembly failed: " + result.error().toString());
    }

    std::cout << "Output file: " << result->outputPath << " (" << formatBytes(result->actualSize) << ")"
              << std::endl;
    if (result->outcome != IntegrityOutcome::VerifiedIdentical) {
        std::cerr << "INTEGRITY MISMATCH" << std::endl;
        std::cerr << "  expected " << result->expectedHash << " (" << result->expectedSize << " bytes)" << std::endl;
        std::cerr << "  got      " << result->actualHash << " (" << result->actualSize << " bytes)" << std::endl;
        return ExitStatus::Integrity;
    }
    std::cout << "Verified identical to the original (SHA-256 " << result->actualHash << ")" << std::endl;
    return ExitStatus::Ok;
}

int FileCommands::handleKeygen() {
    const std::string path = ctx_.args.valueOr("--key-file", ctx_.settings.keyFile);
    auto generated = FileKeyProvider::generate(path);
    if (!generated) {
        return fail("Key generation failed: " + generated.error().message);
    }
    std::cout << "Wrote a new 256-bit key to " << path << std::endl;
    std::cout << "Copy it to the receiving machine over a trusted channel." << std::endl;
    return ExitStatus::Ok;
}

int FileCommands::handleStatus() {
    const std::string role = ctx_.args.valueOr("--role", "sender");
    std::string path;
    if (role == "sender") {
        path = ctx_.settings.senderStatusFile;
    } else if (role == "receiver") {
        path = ctx_.settings.receiverStatusFile;
    } else {
        return fail("--role must be 'sender' or 'receiver'", ExitStatus::Usage);
    }
    if (path.empty()) {
        return fail("No status file configured for the " + role);
    }

    auto snapshot = FileUtils::readJson(path);
    if (!snapshot) {
        return fail("No status available: " + snapshot.error().message);
    }
    std::cout << FileUtils::toJsonString(*snapshot) << std::endl;
    return ExitStatus::Ok;
}

} // namespace Chunkwise
