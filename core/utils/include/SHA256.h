#pragma once

#include "Result.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <openssl/evp.h>

namespace Chunkwise {

/**
 * @brief SHA-256 hashing, one-shot or incremental
 *
 * Digests are returned as 64 lowercase hex characters.
 */
class SHA256 {
public:
    static constexpr size_t HEX_LENGTH = 64;

    SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    void update(const uint8_t* data, size_t size);
    void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }

    /// Finish the digest. The hasher is reset and can be reused.
    std::string finalHex();

    static std::string hash(const std::string& input);
    static std::string hashBytes(const std::vector<uint8_t>& data);

    /// Hash a file's contents in bounded reads
    static Result<std::string> hashFile(const std::string& path);

    /// True for exactly 64 lowercase hex characters
    static bool isHexDigest(const std::string& value);

private:
    struct CtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
    bool failed_ = false;

    void reset();
};

} // namespace Chunkwise
