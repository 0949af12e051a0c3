#pragma once

#include "Result.h"

#include <string>
#include <vector>
#include <cstdint>

namespace Chunkwise {

/**
 * @brief AES-256-GCM sealing of chunk payloads
 *
 * Sealed form: [Nonce (12)] [Ciphertext] [Tag (16)]. A fresh random nonce
 * is drawn for every seal, so sealing the same bytes twice gives
 * different output.
 */
class Crypto {
public:
    static constexpr size_t KEY_SIZE = 32;      // 256 bits
    static constexpr size_t GCM_IV_SIZE = 12;   // 96 bits for GCM (recommended)
    static constexpr size_t GCM_TAG_SIZE = 16;  // 128 bits auth tag
    static constexpr size_t SEAL_OVERHEAD = GCM_IV_SIZE + GCM_TAG_SIZE;

    /**
     * @brief Generate a random encryption key
     * @return 32-byte key suitable for AES-256
     */
    static Result<std::vector<uint8_t>> generateKey();

    static Result<std::vector<uint8_t>> generateGcmNonce();

    /**
     * @brief Encrypt with a fresh nonce and return nonce|ciphertext|tag
     */
    static Result<std::vector<uint8_t>> seal(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key
    );

    /**
     * @brief Reverse seal()
     *
     * Fails with DecryptionFailed on truncated input, a wrong key or any
     * modification of the sealed bytes.
     */
    static Result<std::vector<uint8_t>> open(
        const std::vector<uint8_t>& sealed,
        const std::vector<uint8_t>& key
    );

    /**
     * @brief Encrypt using AES-256-GCM (AEAD)
     *
     * @param plaintext Data to encrypt
     * @param key 32-byte encryption key
     * @param nonce 12-byte nonce (must be unique per message)
     * @return Ciphertext with appended 16-byte auth tag
     */
    static Result<std::vector<uint8_t>> encryptGcm(
        const std::vector<uint8_t>& plaintext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce
    );

    /**
     * @brief Decrypt using AES-256-GCM (AEAD)
     *
     * Verifies the tag before returning plaintext.
     */
    static Result<std::vector<uint8_t>> decryptGcm(
        const std::vector<uint8_t>& ciphertext,
        const std::vector<uint8_t>& key,
        const std::vector<uint8_t>& nonce
    );

    static std::string toHex(const std::vector<uint8_t>& data);

    /// Accepts upper or lower case; fails with InvalidArgument on odd length or non-hex characters
    static Result<std::vector<uint8_t>> fromHex(const std::string& hex);
};

} // namespace Chunkwise
