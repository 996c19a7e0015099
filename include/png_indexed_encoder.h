#pragma once

#include "retro_palette_types.h"
#include <array>

// Minimal 8-bit indexed PNG writer. Pixel data goes into stored (uncompressed)
// deflate blocks, so output size is predictable and the encoder has no dependencies.
class RETROPALETTE_API PngIndexedEncoder {
private:
    static const std::array<uint32_t, 256>& CrcTable();

    static void WriteU32BE(std::vector<uint8_t>& out, uint32_t v);
    static void WriteChunk(std::vector<uint8_t>& out, const char type[4], const std::vector<uint8_t>& data);

    // Palette index per pixel: exact RGBA match first, nearest RGB otherwise.
    static std::vector<uint8_t> IndexPixels(const uint8_t* rgba, uint32_t width, uint32_t height, const Palette& palette);

    // zlib stream of stored deflate blocks (<= 65535 bytes each).
    static std::vector<uint8_t> ZlibStore(const std::vector<uint8_t>& raw);

public:
    static constexpr uint32_t MAX_STORED_BLOCK = 65535;

    // Throws std::invalid_argument for zero dimensions, a short buffer, or a palette
    // that is empty or larger than 256 entries.
    static std::vector<uint8_t> EncodePNG8(const uint8_t* rgba, uint32_t width, uint32_t height, const Palette& palette);
    static std::vector<uint8_t> EncodePNG8(const PixelBuffer& pixels, const Palette& palette);

    // CRC-32 (reflected polynomial 0xEDB88320) as used by PNG chunks.
    static uint32_t Crc32(const uint8_t* data, size_t size, uint32_t crc = 0);

    static uint32_t Adler32(const uint8_t* data, size_t size);
};
