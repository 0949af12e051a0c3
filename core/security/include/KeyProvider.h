#pragma once

#include "Result.h"

#include <string>
#include <vector>
#include <cstdint>
#include <utility>

namespace Chunkwise {

/**
 * @brief Source of the symmetric key used to seal chunk payloads
 */
class KeyProvider {
public:
    virtual ~KeyProvider() = default;

    /// Returns a Crypto::KEY_SIZE key or KeyUnavailable
    virtual Result<std::vector<uint8_t>> load() const = 0;
};

/**
 * @brief Key read from a file on every load()
 *
 * The file holds either 64 hex characters (surrounding whitespace is
 * ignored) or exactly 32 raw bytes.
 */
class FileKeyProvider : public KeyProvider {
public:
    explicit FileKeyProvider(std::string path);
    ~FileKeyProvider() override = default;

    Result<std::vector<uint8_t>> load() const override;

    const std::string& path() const { return path_; }

    /// Write a fresh random key as hex with mode 0600. Never overwrites.
    static Result<void> generate(const std::string& path);

private:
    std::string path_;
};

/// Fixed in-memory key
class StaticKeyProvider : public KeyProvider {
public:
    explicit StaticKeyProvider(std::vector<uint8_t> key) : key_(std::move(key)) {}

    Result<std::vector<uint8_t>> load() const override;

private:
    std::vector<uint8_t> key_;
};

} // namespace Chunkwise
