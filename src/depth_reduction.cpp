#include "depth_reduction.h"
#include <array>
#include <algorithm>
#include <cmath>

DepthBits GetDepthBits(ColorDepthMode mode)
{
    switch (mode) {
    case ColorDepthMode::RGB222: return { 2, 2, 2 };
    case ColorDepthMode::RGB333: return { 3, 3, 3 };
    case ColorDepthMode::RGB444: return { 4, 4, 4 };
    case ColorDepthMode::RGB555: return { 5, 5, 5 };
    case ColorDepthMode::RGB324: return { 3, 2, 4 };
    default: return { 8, 8, 8 }; // Should not happen
    }
}

uint32_t ColorSpaceSize(ColorDepthMode mode)
{
    DepthBits bits = GetDepthBits(mode);
    return 1u << (bits.r + bits.g + bits.b);
}

const char* DepthModeName(ColorDepthMode mode)
{
    switch (mode) {
    case ColorDepthMode::RGB222: return "RGB222";
    case ColorDepthMode::RGB333: return "RGB333";
    case ColorDepthMode::RGB444: return "RGB444";
    case ColorDepthMode::RGB555: return "RGB555";
    case ColorDepthMode::RGB324: return "RGB324";
    default: return "Unknown";
    }
}

uint8_t QuantizeChannelToBits(uint8_t value, uint8_t bits)
{
    if (bits >= 8) return value;
    if (bits == 0) return 0;
    const double levels = static_cast<double>((1u << bits) - 1u);
    const double q = std::round(value / 255.0 * levels);
    return static_cast<uint8_t>(std::round(q / levels * 255.0));
}

namespace {
    // One 256-entry table per bit width; every reduction goes through these.
    const std::array<uint8_t, 256>& ChannelTable(uint8_t bits)
    {
        static const std::array<std::array<uint8_t, 256>, 9> tables = [] {
            std::array<std::array<uint8_t, 256>, 9> t{};
            for (uint8_t b = 0; b <= 8; ++b) {
                for (int v = 0; v < 256; ++v) t[b][v] = QuantizeChannelToBits(static_cast<uint8_t>(v), b);
            }
            return t;
        }();
        return tables[std::min<uint8_t>(bits, 8)];
    }
}

Color ReduceColor(const Color& color, ColorDepthMode mode)
{
    DepthBits bits = GetDepthBits(mode);
    Color out = color;
    out.r = ChannelTable(bits.r)[color.r];
    out.g = ChannelTable(bits.g)[color.g];
    out.b = ChannelTable(bits.b)[color.b];
    return out;
}

Palette ReducePalette(const Palette& palette, ColorDepthMode mode)
{
    Palette out;
    out.reserve(palette.size());
    for (const auto& c : palette) out.push_back(ReduceColor(c, mode));
    return out;
}

Palette EnumerateReducedColorSpace(ColorDepthMode mode)
{
    DepthBits bits = GetDepthBits(mode);
    const uint32_t rLevels = 1u << bits.r;
    const uint32_t gLevels = 1u << bits.g;
    const uint32_t bLevels = 1u << bits.b;

    auto expand = [](uint32_t level, uint32_t levels) {
        return static_cast<uint8_t>(std::round(static_cast<double>(level) / (levels - 1) * 255.0));
    };

    Palette out;
    out.reserve(size_t(rLevels) * gLevels * bLevels);
    for (uint32_t r = 0; r < rLevels; ++r) {
        for (uint32_t g = 0; g < gLevels; ++g) {
            for (uint32_t b = 0; b < bLevels; ++b) {
                out.emplace_back(expand(r, rLevels), expand(g, gLevels), expand(b, bLevels));
            }
        }
    }
    return out;
}

void ReducePixelBuffer(PixelBuffer& pixels, ColorDepthMode mode)
{
    DepthBits bits = GetDepthBits(mode);
    const auto& tr = ChannelTable(bits.r);
    const auto& tg = ChannelTable(bits.g);
    const auto& tb = ChannelTable(bits.b);
    const size_t n = pixels.PixelCount();
    uint8_t* p = pixels.data.data();
    for (size_t i = 0; i < n; ++i) {
        p[i * 4 + 0] = tr[p[i * 4 + 0]];
        p[i * 4 + 1] = tg[p[i * 4 + 1]];
        p[i * 4 + 2] = tb[p[i * 4 + 2]];
    }
}
