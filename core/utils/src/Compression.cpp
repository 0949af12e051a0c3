#include "Compression.h"
#include <zlib.h>
#include <string>

namespace Chunkwise {

namespace {

void writeLE32(uint8_t* out, uint32_t value) {
    out[0] = static_cast<uint8_t>(value & 0xFF);
    out[1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    out[2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    out[3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

uint32_t readLE32(const uint8_t* in) {
    return static_cast<uint32_t>(in[0]) |
           (static_cast<uint32_t>(in[1]) << 8) |
           (static_cast<uint32_t>(in[2]) << 16) |
           (static_cast<uint32_t>(in[3]) << 24);
}

} // namespace

Result<std::vector<uint8_t>> Compression::compress(const std::vector<uint8_t>& data, int level) {
    if (level < 0 || level > 9) {
        return Err<std::vector<uint8_t>>(ErrorCode::CompressionFailed,
                                         "Invalid compression level " + std::to_string(level));
    }
    if (data.size() > MAX_BLOCK_SIZE) {
        return Err<std::vector<uint8_t>>(ErrorCode::CompressionFailed, "Block too large to compress");
    }

    // Worst case is slightly larger than input
    uLongf compressedSize = compressBound(static_cast<uLong>(data.size()));
    std::vector<uint8_t> compressed(HEADER_SIZE + compressedSize);

    writeLE32(compressed.data(), COMPRESS_MAGIC);
    writeLE32(compressed.data() + 4, static_cast<uint32_t>(data.size()));

    int result = compress2(
        compressed.data() + HEADER_SIZE,
        &compressedSize,
        data.data(),
        static_cast<uLong>(data.size()),
        level
    );

    if (result != Z_OK) {
        return Err<std::vector<uint8_t>>(ErrorCode::CompressionFailed,
                                         "zlib compress2 returned " + std::to_string(result));
    }

    compressed.resize(HEADER_SIZE + compressedSize);
    return compressed;
}

Result<std::vector<uint8_t>> Compression::decompress(const std::vector<uint8_t>& data) {
    if (data.size() < HEADER_SIZE) {
        return Err<std::vector<uint8_t>>(ErrorCode::DecompressionFailed, "Block shorter than header");
    }

    if (readLE32(data.data()) != COMPRESS_MAGIC) {
        return Err<std::vector<uint8_t>>(ErrorCode::DecompressionFailed, "Bad compression magic");
    }
    uint32_t originalSize = readLE32(data.data() + 4);

    // Sanity check on size (max 1GB)
    if (originalSize > 1024u * 1024u * 1024u) {
        return Err<std::vector<uint8_t>>(ErrorCode::DecompressionFailed,
                                         "Implausible original size " + std::to_string(originalSize));
    }

    std::vector<uint8_t> decompressed(originalSize);
    uLongf destLen = originalSize;
    // uncompress() rejects a null destination even for zero-length output
    uint8_t scratch = 0;

    int result = uncompress(
        originalSize > 0 ? decompressed.data() : &scratch,
        &destLen,
        data.data() + HEADER_SIZE,
        static_cast<uLong>(data.size() - HEADER_SIZE)
    );

    if (result != Z_OK || destLen != originalSize) {
        return Err<std::vector<uint8_t>>(ErrorCode::DecompressionFailed,
                                         "zlib uncompress returned " + std::to_string(result));
    }

    return decompressed;
}

double Compression::compressionRatio(size_t originalSize, size_t compressedSize) {
    if (originalSize == 0) return 1.0;
    return static_cast<double>(compressedSize) / static_cast<double>(originalSize);
}

} // namespace Chunkwise
