#include "SHA256.h"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>

namespace Chunkwise {

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        throw std::runtime_error("Failed to allocate digest context");
    }
    reset();
}

void SHA256::reset() {
    failed_ = EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1;
}

void SHA256::update(const uint8_t* data, size_t size) {
    if (failed_ || size == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        failed_ = true;
    }
}

std::string SHA256::finalHex() {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    unsigned int digestLen = 0;
    bool ok = !failed_ && EVP_DigestFinal_ex(ctx_.get(), digest, &digestLen) == 1;
    reset();
    if (!ok) {
        return "";
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < digestLen; ++i) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string SHA256::hash(const std::string& input) {
    SHA256 hasher;
    hasher.update(reinterpret_cast<const uint8_t*>(input.data()), input.size());
    return hasher.finalHex();
}

std::string SHA256::hashBytes(const std::vector<uint8_t>& data) {
    SHA256 hasher;
    hasher.update(data);
    return hasher.finalHex();
}

Result<std::string> SHA256::hashFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Err<std::string>(ErrorCode::FileReadError, "Cannot open " + path);
    }

    SHA256 hasher;
    std::vector<uint8_t> buffer(64 * 1024);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto got = file.gcount();
        if (got > 0) {
            hasher.update(buffer.data(), static_cast<size_t>(got));
        }
    }
    if (file.bad()) {
        return Err<std::string>(ErrorCode::FileReadError, "Read error on " + path);
    }

    std::string digest = hasher.finalHex();
    if (digest.empty()) {
        return Err<std::string>(ErrorCode::InternalError, "SHA-256 digest failed for " + path);
    }
    return digest;
}

bool SHA256::isHexDigest(const std::string& value) {
    if (value.size() != HEX_LENGTH) return false;
    for (char c : value) {
        bool digit = c >= '0' && c <= '9';
        bool lowerHex = c >= 'a' && c <= 'f';
        if (!digit && !lowerHex) return false;
    }
    return true;
}

} // namespace Chunkwise
