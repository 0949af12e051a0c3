/**
 * @file KeyProvider.cpp
 * @brief File-based key material for chunk sealing
 */

#include "KeyProvider.h"
#include "Crypto.h"
#include <openssl/crypto.h>
#include <fstream>
#include <iterator>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Chunkwise {

namespace {

std::string trimWhitespace(const std::string& value) {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

} // namespace

FileKeyProvider::FileKeyProvider(std::string path)
    : path_(std::move(path))
{
}

Result<std::vector<uint8_t>> FileKeyProvider::load() const {
    using Bytes = std::vector<uint8_t>;

    std::ifstream in(path_, std::ios::binary);
    if (!in.is_open()) {
        return Err<Bytes>(ErrorCode::KeyUnavailable, "Cannot open key file " + path_);
    }
    std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Err<Bytes>(ErrorCode::KeyUnavailable, "Cannot read key file " + path_);
    }

    std::string trimmed = trimWhitespace(contents);
    if (trimmed.size() == Crypto::KEY_SIZE * 2) {
        auto decoded = Crypto::fromHex(trimmed);
        if (decoded) {
            return decoded;
        }
    }

    if (contents.size() == Crypto::KEY_SIZE) {
        Bytes key(contents.begin(), contents.end());
        OPENSSL_cleanse(&contents[0], contents.size());
        return key;
    }

    return Err<Bytes>(ErrorCode::KeyUnavailable,
                      "Key file " + path_ + " holds neither 64 hex characters nor 32 raw bytes");
}

Result<void> FileKeyProvider::generate(const std::string& path) {
    auto key = Crypto::generateKey();
    if (!key) {
        return Err(ErrorCode::KeyUnavailable, key.error().message);
    }
    std::string hex = Crypto::toHex(*key) + "\n";
    OPENSSL_cleanse(key->data(), key->size());

    // O_EXCL: an existing key is never replaced
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL, S_IRUSR | S_IWUSR);
    if (fd < 0) {
        if (errno == EEXIST) {
            return Err(ErrorCode::FileWriteError, "Key file already exists: " + path);
        }
        return Err(ErrorCode::FileWriteError,
                   "Cannot create key file " + path + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < hex.size()) {
        ssize_t n = ::write(fd, hex.data() + written, hex.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int saved = errno;
            ::close(fd);
            ::unlink(path.c_str());
            return Err(ErrorCode::FileWriteError,
                       "Cannot write key file " + path + ": " + std::strerror(saved));
        }
        written += static_cast<size_t>(n);
    }
    OPENSSL_cleanse(&hex[0], hex.size());

    if (::close(fd) != 0) {
        return Err(ErrorCode::FileWriteError, "Cannot close key file " + path);
    }
    return Ok();
}

Result<std::vector<uint8_t>> StaticKeyProvider::load() const {
    if (key_.size() != Crypto::KEY_SIZE) {
        return Err<std::vector<uint8_t>>(ErrorCode::KeyUnavailable, "Key must be 32 bytes");
    }
    return key_;
}

} // namespace Chunkwise
