#pragma once

/**
 * @file Compression.h
 * @brief zlib compression of chunk payloads
 *
 * Compressed blocks carry an 8-byte header: 4-byte magic ("ZLIB") and the
 * 4-byte little-endian original length, so decompression can size its
 * output buffer up front.
 */

#include "Result.h"

#include <vector>
#include <cstdint>

namespace Chunkwise {

class Compression {
public:
    /**
     * @brief Compress data using zlib deflate
     * @param data Input data (may be empty)
     * @param level zlib level, 0-9
     */
    static Result<std::vector<uint8_t>> compress(const std::vector<uint8_t>& data, int level);

    /**
     * @brief Reverse compress()
     *
     * Fails with DecompressionFailed on a bad header, a corrupt stream or
     * a length that does not match the header.
     */
    static Result<std::vector<uint8_t>> decompress(const std::vector<uint8_t>& data);

    /// Compressed size as a fraction of the original (0.5 = half)
    static double compressionRatio(size_t originalSize, size_t compressedSize);

    static constexpr uint32_t COMPRESS_MAGIC = 0x5A4C4942; // "ZLIB"
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr uint32_t MAX_BLOCK_SIZE = 0xFFFFFFFFu;
};

} // namespace Chunkwise
