#include "png_indexed_encoder.h"
#include <unordered_map>
#include <stdexcept>
#include <limits>

namespace {
    const uint8_t PNG_SIGNATURE[8] = { 137, 80, 78, 71, 13, 10, 26, 10 };
    constexpr uint8_t PNG_COLOR_TYPE_INDEXED = 3;
    constexpr uint32_t ADLER_MOD = 65521;
}

// =================================================================================================
// Checksums
// =================================================================================================

const std::array<uint32_t, 256>& PngIndexedEncoder::CrcTable() {
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t n = 0; n < 256; ++n) {
            uint32_t c = n;
            for (int k = 0; k < 8; ++k) c = (c & 1) ? 0xEDB88320u ^ (c >> 1) : c >> 1;
            t[n] = c;
        }
        return t;
    }();
    return table;
}

uint32_t PngIndexedEncoder::Crc32(const uint8_t* data, size_t size, uint32_t crc) {
    const auto& table = CrcTable();
    uint32_t c = crc ^ 0xFFFFFFFFu;
    for (size_t i = 0; i < size; ++i) c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
    return c ^ 0xFFFFFFFFu;
}

uint32_t PngIndexedEncoder::Adler32(const uint8_t* data, size_t size) {
    uint32_t a = 1, b = 0;
    for (size_t i = 0; i < size; ++i) {
        a = (a + data[i]) % ADLER_MOD;
        b = (b + a) % ADLER_MOD;
    }
    return (b << 16) | a;
}

// =================================================================================================
// Byte stream helpers
// =================================================================================================

void PngIndexedEncoder::WriteU32BE(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

void PngIndexedEncoder::WriteChunk(std::vector<uint8_t>& out, const char type[4], const std::vector<uint8_t>& data) {
    WriteU32BE(out, static_cast<uint32_t>(data.size()));
    const size_t typeStart = out.size();
    out.insert(out.end(), type, type + 4);
    out.insert(out.end(), data.begin(), data.end());
    // CRC covers type + data
    WriteU32BE(out, Crc32(out.data() + typeStart, 4 + data.size()));
}

std::vector<uint8_t> PngIndexedEncoder::ZlibStore(const std::vector<uint8_t>& raw) {
    std::vector<uint8_t> out;
    const size_t blocks = raw.empty() ? 1 : (raw.size() + MAX_STORED_BLOCK - 1) / MAX_STORED_BLOCK;
    out.reserve(2 + raw.size() + blocks * 5 + 4);

    // CMF 0x78 (deflate, 32K window), FLG 0x01 (no dict, fastest; check bits valid)
    out.push_back(0x78);
    out.push_back(0x01);

    size_t offset = 0;
    do {
        const size_t len = std::min<size_t>(MAX_STORED_BLOCK, raw.size() - offset);
        const bool final = offset + len >= raw.size();
        out.push_back(final ? 1 : 0); // BFINAL, BTYPE=00
        const uint16_t nlen = static_cast<uint16_t>(~len);
        out.push_back(static_cast<uint8_t>(len & 0xFF));
        out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
        out.push_back(static_cast<uint8_t>(nlen & 0xFF));
        out.push_back(static_cast<uint8_t>((nlen >> 8) & 0xFF));
        out.insert(out.end(), raw.begin() + offset, raw.begin() + offset + len);
        offset += len;
    } while (offset < raw.size());

    WriteU32BE(out, Adler32(raw.data(), raw.size()));
    return out;
}

std::vector<uint8_t> PngIndexedEncoder::IndexPixels(const uint8_t* rgba, uint32_t width, uint32_t height, const Palette& palette) {
    std::unordered_map<uint32_t, uint8_t> exact;
    int transparentIndex = -1;
    for (size_t i = 0; i < palette.size(); ++i) {
        const Color& c = palette[i];
        const uint32_t key = (uint32_t(c.r) << 24) | (uint32_t(c.g) << 16) | (uint32_t(c.b) << 8) | c.a;
        exact.emplace(key, static_cast<uint8_t>(i)); // first occurrence wins
        if (c.a == 0 && transparentIndex < 0) transparentIndex = static_cast<int>(i);
    }

    bool hasOpaque = false;
    for (const auto& c : palette) hasOpaque = hasOpaque || c.a != 0;

    // Visible pixels only fall back to visible entries when the palette has any.
    std::unordered_map<uint32_t, uint8_t> nearestCache;
    auto nearestRgb = [&](uint8_t r, uint8_t g, uint8_t b, bool visible) {
        const bool skipTransparent = visible && hasOpaque;
        const uint32_t key = (uint32_t(skipTransparent) << 24) | (uint32_t(r) << 16) | (uint32_t(g) << 8) | b;
        auto it = nearestCache.find(key);
        if (it != nearestCache.end()) return it->second;
        int best = std::numeric_limits<int>::max();
        uint8_t bestIdx = 0;
        for (size_t i = 0; i < palette.size(); ++i) {
            if (skipTransparent && palette[i].a == 0) continue;
            const int dr = int(r) - palette[i].r;
            const int dg = int(g) - palette[i].g;
            const int db = int(b) - palette[i].b;
            const int d = dr * dr + dg * dg + db * db;
            if (d < best) { best = d; bestIdx = static_cast<uint8_t>(i); }
        }
        nearestCache.emplace(key, bestIdx);
        return bestIdx;
    };

    // One filter byte (0 = None) per row, then one index per pixel.
    std::vector<uint8_t> raw;
    raw.reserve(size_t(height) * (size_t(width) + 1));
    for (uint32_t y = 0; y < height; ++y) {
        raw.push_back(0);
        const uint8_t* row = rgba + size_t(y) * width * 4;
        for (uint32_t x = 0; x < width; ++x) {
            const uint8_t* px = row + size_t(x) * 4;
            const uint32_t key = (uint32_t(px[0]) << 24) | (uint32_t(px[1]) << 16) | (uint32_t(px[2]) << 8) | px[3];
            auto it = exact.find(key);
            if (it != exact.end()) raw.push_back(it->second);
            else if (px[3] == 0 && transparentIndex >= 0) raw.push_back(static_cast<uint8_t>(transparentIndex));
            else raw.push_back(nearestRgb(px[0], px[1], px[2], px[3] != 0));
        }
    }
    return raw;
}

// =================================================================================================
// Public API
// =================================================================================================

std::vector<uint8_t> PngIndexedEncoder::EncodePNG8(const uint8_t* rgba, uint32_t width, uint32_t height, const Palette& palette) {
    if (width == 0 || height == 0) throw std::invalid_argument("PNG dimensions must be non-zero");
    if (!rgba) throw std::invalid_argument("PNG pixel data is null");
    if (palette.empty()) throw std::invalid_argument("Indexed PNG needs at least one palette entry");
    if (palette.size() > 256) {
        throw std::invalid_argument("Indexed PNG palette has " + std::to_string(palette.size()) + " entries (max 256)");
    }

    std::vector<uint8_t> png(PNG_SIGNATURE, PNG_SIGNATURE + 8);

    // --- IHDR ---
    std::vector<uint8_t> ihdr;
    WriteU32BE(ihdr, width);
    WriteU32BE(ihdr, height);
    ihdr.push_back(8);                      // bit depth
    ihdr.push_back(PNG_COLOR_TYPE_INDEXED); // color type
    ihdr.push_back(0);                      // compression
    ihdr.push_back(0);                      // filter
    ihdr.push_back(0);                      // interlace
    WriteChunk(png, "IHDR", ihdr);

    // --- PLTE / tRNS ---
    std::vector<uint8_t> plte;
    plte.reserve(palette.size() * 3);
    bool hasAlpha = false;
    for (const auto& c : palette) {
        plte.push_back(c.r);
        plte.push_back(c.g);
        plte.push_back(c.b);
        if (c.a < 255) hasAlpha = true;
    }
    WriteChunk(png, "PLTE", plte);
    if (hasAlpha) {
        std::vector<uint8_t> trns;
        trns.reserve(palette.size());
        for (const auto& c : palette) trns.push_back(c.a);
        WriteChunk(png, "tRNS", trns);
    }

    // --- IDAT / IEND ---
    WriteChunk(png, "IDAT", ZlibStore(IndexPixels(rgba, width, height, palette)));
    WriteChunk(png, "IEND", {});
    return png;
}

std::vector<uint8_t> PngIndexedEncoder::EncodePNG8(const PixelBuffer& pixels, const Palette& palette) {
    if (!pixels.IsValid()) throw std::invalid_argument("Pixel buffer size does not match its dimensions");
    return EncodePNG8(pixels.data.data(), pixels.width, pixels.height, palette);
}
