#include "color_histogram.h"
#include "seeded_random.h"
#include <unordered_map>
#include <algorithm>
#include <cstdint>
#include <iostream>

namespace {
    // Builds an insertion-ordered histogram from packed 0xRRGGBB keys.
    template <typename KeyRange>
    Palette BuildHistogram(const KeyRange& keys, size_t expected)
    {
        Palette out;
        std::unordered_map<uint32_t, size_t> slot;
        slot.reserve(expected);
        for (uint32_t key : keys) {
            auto it = slot.find(key);
            if (it == slot.end()) {
                slot.emplace(key, out.size());
                out.emplace_back(static_cast<uint8_t>(key >> 16), static_cast<uint8_t>(key >> 8), static_cast<uint8_t>(key), 255, 1);
            }
            else {
                out[it->second].count++;
            }
        }
        return out;
    }
}

void SortByCountDescending(Palette& colors)
{
    std::stable_sort(colors.begin(), colors.end(), [](const Color& a, const Color& b) { return a.count > b.count; });
}

uint64_t TotalCount(const Palette& colors)
{
    uint64_t total = 0;
    for (const auto& c : colors) total += c.count;
    return total;
}

Palette EnumerateUniqueColors(const PixelBuffer& pixels)
{
    std::vector<uint32_t> keys;
    keys.reserve(pixels.PixelCount());
    const uint8_t* p = pixels.data.data();
    for (size_t i = 0; i < pixels.PixelCount(); ++i) {
        const uint8_t* px = p + i * 4;
        if (px[3] == 0) continue;
        keys.push_back((uint32_t(px[0]) << 16) | (uint32_t(px[1]) << 8) | px[2]);
    }
    return BuildHistogram(keys, 4096);
}

Palette ExtractColorsSampled(const PixelBuffer& pixels, const QuantizationConfig& config)
{
    const size_t totalPixels = pixels.PixelCount();
    const size_t targetSamples = std::min<size_t>(totalPixels, std::max<size_t>(1000, config.reservoirCap));

    // Seed from the dimensions and the red channel of the first ten pixels.
    int32_t seed = HashStep31(static_cast<int32_t>(pixels.width), 0);
    seed = static_cast<int32_t>(static_cast<uint32_t>(seed) + pixels.height);
    for (size_t i = 0; i < std::min<size_t>(40, pixels.data.size()); i += 4) {
        seed = HashStep31(seed, pixels.data[i]);
    }
    SeededRandom rng(seed);

    std::vector<uint32_t> reservoir;
    reservoir.reserve(targetSamples);
    uint64_t seen = 0;
    const uint8_t* p = pixels.data.data();
    for (size_t i = 0; i < totalPixels; ++i) {
        const uint8_t* px = p + i * 4;
        if (px[3] == 0) continue;
        const uint32_t key = (uint32_t(px[0]) << 16) | (uint32_t(px[1]) << 8) | px[2];
        if (reservoir.size() < targetSamples) {
            reservoir.push_back(key);
        }
        else {
            const uint64_t j = rng.NextInt(static_cast<uint32_t>(std::min<uint64_t>(seen + 1, UINT32_MAX)));
            if (j < targetSamples) reservoir[j] = key;
        }
        seen++;
    }

    Palette colors = BuildHistogram(reservoir, 4096);
    if (config.verbose) {
        std::cout << "Color extraction: " << totalPixels << " pixels, reservoir " << reservoir.size()
            << " -> " << colors.size() << " unique colors" << std::endl;
    }

    if (colors.size() > config.maxExtractedColors) {
        SortByCountDescending(colors);
        colors.resize(config.maxExtractedColors);
    }
    return colors;
}
