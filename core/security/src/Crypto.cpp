#include "Crypto.h"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>
#include <sstream>
#include <iomanip>

namespace Chunkwise {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Result<std::vector<uint8_t>> Crypto::generateKey() {
    std::vector<uint8_t> key(KEY_SIZE);
    if (RAND_bytes(key.data(), KEY_SIZE) != 1) {
        return Err<std::vector<uint8_t>>(ErrorCode::EncryptionFailed, "Failed to generate random key");
    }
    return key;
}

Result<std::vector<uint8_t>> Crypto::generateGcmNonce() {
    std::vector<uint8_t> nonce(GCM_IV_SIZE);
    if (RAND_bytes(nonce.data(), GCM_IV_SIZE) != 1) {
        return Err<std::vector<uint8_t>>(ErrorCode::EncryptionFailed, "Failed to generate GCM nonce");
    }
    return nonce;
}

Result<std::vector<uint8_t>> Crypto::seal(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key
) {
    auto nonce = generateGcmNonce();
    if (!nonce) {
        return nonce.error();
    }

    auto ciphertext = encryptGcm(plaintext, key, *nonce);
    if (!ciphertext) {
        return ciphertext.error();
    }

    std::vector<uint8_t> sealed;
    sealed.reserve(GCM_IV_SIZE + ciphertext->size());
    sealed.insert(sealed.end(), nonce->begin(), nonce->end());
    sealed.insert(sealed.end(), ciphertext->begin(), ciphertext->end());
    return sealed;
}

Result<std::vector<uint8_t>> Crypto::open(
    const std::vector<uint8_t>& sealed,
    const std::vector<uint8_t>& key
) {
    if (sealed.size() < SEAL_OVERHEAD) {
        return Err<std::vector<uint8_t>>(ErrorCode::DecryptionFailed,
                                         "Sealed block too short (" + std::to_string(sealed.size()) + " bytes)");
    }

    std::vector<uint8_t> nonce(sealed.begin(), sealed.begin() + GCM_IV_SIZE);
    std::vector<uint8_t> ciphertext(sealed.begin() + GCM_IV_SIZE, sealed.end());
    return decryptGcm(ciphertext, key, nonce);
}

Result<std::vector<uint8_t>> Crypto::encryptGcm(
    const std::vector<uint8_t>& plaintext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce
) {
    using Bytes = std::vector<uint8_t>;

    if (key.size() != KEY_SIZE) {
        return Err<Bytes>(ErrorCode::EncryptionFailed, "Invalid key size for GCM encryption");
    }
    if (nonce.size() != GCM_IV_SIZE) {
        return Err<Bytes>(ErrorCode::EncryptionFailed, "Invalid nonce size (must be 12 bytes)");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Err<Bytes>(ErrorCode::EncryptionFailed, "Failed to create cipher context");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return Err<Bytes>(ErrorCode::EncryptionFailed, "Failed to initialize GCM");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, GCM_IV_SIZE, nullptr) != 1) {
        return Err<Bytes>(ErrorCode::EncryptionFailed, "Failed to set GCM IV length");
    }
    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return Err<Bytes>(ErrorCode::EncryptionFailed, "Failed to set GCM key/nonce");
    }

    Bytes ciphertext(plaintext.size() + GCM_TAG_SIZE);
    int len = 0;
    int ciphertextLen = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return Err<Bytes>(ErrorCode::EncryptionFailed, "GCM encryption failed");
        }
        ciphertextLen = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertextLen, &len) != 1) {
        return Err<Bytes>(ErrorCode::EncryptionFailed, "GCM finalization failed");
    }
    ciphertextLen += len;

    // Append the authentication tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, GCM_TAG_SIZE,
                            ciphertext.data() + ciphertextLen) != 1) {
        return Err<Bytes>(ErrorCode::EncryptionFailed, "Failed to get GCM tag");
    }
    ciphertextLen += GCM_TAG_SIZE;

    ciphertext.resize(static_cast<size_t>(ciphertextLen));
    return ciphertext;
}

Result<std::vector<uint8_t>> Crypto::decryptGcm(
    const std::vector<uint8_t>& ciphertext,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce
) {
    using Bytes = std::vector<uint8_t>;

    if (key.size() != KEY_SIZE) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "Invalid key size for GCM decryption");
    }
    if (nonce.size() != GCM_IV_SIZE) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "Invalid nonce size");
    }
    if (ciphertext.size() < GCM_TAG_SIZE) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "Ciphertext too short for GCM");
    }

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "Failed to create cipher context");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "Failed to initialize GCM decryption");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, GCM_IV_SIZE, nullptr) != 1) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "Failed to set GCM IV length");
    }
    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "Failed to set GCM key/nonce");
    }

    size_t actualCiphertextLen = ciphertext.size() - GCM_TAG_SIZE;
    // One spare byte keeps data() valid for an empty payload
    Bytes plaintext(actualCiphertextLen + 1);
    int len = 0;
    int plaintextLen = 0;

    if (actualCiphertextLen > 0) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              ciphertext.data(), static_cast<int>(actualCiphertextLen)) != 1) {
            return Err<Bytes>(ErrorCode::DecryptionFailed, "GCM decryption failed");
        }
        plaintextLen = len;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, GCM_TAG_SIZE,
                            const_cast<uint8_t*>(ciphertext.data() + actualCiphertextLen)) != 1) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "Failed to set GCM tag");
    }

    // Tag check happens here
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintextLen, &len) <= 0) {
        return Err<Bytes>(ErrorCode::DecryptionFailed, "GCM authentication failed");
    }
    plaintextLen += len;

    plaintext.resize(static_cast<size_t>(plaintextLen));
    return plaintext;
}

std::string Crypto::toHex(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

Result<std::vector<uint8_t>> Crypto::fromHex(const std::string& hex) {
    if (hex.length() % 2 != 0) {
        return Err<std::vector<uint8_t>>(ErrorCode::InvalidArgument, "Invalid hex string length");
    }

    std::vector<uint8_t> data;
    data.reserve(hex.length() / 2);

    for (size_t i = 0; i < hex.length(); i += 2) {
        int high = hexValue(hex[i]);
        int low = hexValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Err<std::vector<uint8_t>>(ErrorCode::InvalidArgument, "Invalid hex character");
        }
        data.push_back(static_cast<uint8_t>((high << 4) | low));
    }

    return data;
}

} // namespace Chunkwise
