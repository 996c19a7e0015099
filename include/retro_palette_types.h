#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <functional>
#include <algorithm>

#if defined(_WIN32) || defined(_WIN64)
#if defined(RETROPALETTE_EXPORT)
#define RETROPALETTE_API __declspec(dllexport)
#else
#define RETROPALETTE_API __declspec(dllimport)
#endif
#else
// GCC/Clang: default visibility for shared libs; empty for static.
#if __GNUC__ >= 4
#define RETROPALETTE_API __attribute__((visibility("default")))
#else
#define RETROPALETTE_API
#endif
#endif

// A palette entry or a histogram bucket. `count` is the pixel-frequency weight and
// takes no part in equality.
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;
    uint32_t count = 0;

    Color() = default;
    Color(uint8_t red, uint8_t green, uint8_t blue, uint8_t alpha = 255, uint32_t weight = 0)
        : r(red), g(green), b(blue), a(alpha), count(weight) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    // Packs RGB into 24 bits, used as a hash key for exact lookups.
    uint32_t Key() const { return (uint32_t(r) << 16) | (uint32_t(g) << 8) | uint32_t(b); }
    // Packs RGBA into 32 bits; transparent and opaque entries of the same RGB stay distinct.
    uint32_t RgbaKey() const { return (Key() << 8) | uint32_t(a); }
};

using Palette = std::vector<Color>;

enum class ColorDepthMode {
    RGB222,
    RGB333,
    RGB444,
    RGB555,
    RGB324
};

struct PixelBuffer {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> data; // RGBA, row-major

    PixelBuffer() = default;
    PixelBuffer(uint32_t w, uint32_t h) : width(w), height(h), data(size_t(w) * h * 4, 0) {}

    size_t PixelCount() const { return size_t(width) * height; }
    bool IsValid() const { return data.size() == PixelCount() * 4; }
};

// Progress is reported as a non-decreasing percentage 0..100.
using ProgressCallback = std::function<void(int)>;

struct QuantizationConfig {
public:
    // --- Clustering ---
    uint32_t kmeansStarts = 8;
    uint32_t kmeansMaxIterations = 40;
    uint32_t kmeansSampleLimit = 10000;
    float kmeansMoveEpsilon = 0.25f;

    // --- Sampling ---
    uint32_t reservoirCap = 50000;
    uint32_t maxExtractedColors = 10000;

    // --- Post-processing ---
    float nearBlackL = 10.0f;
    uint32_t maxNearBlack = 1;
    float duplicateThreshold = 5.0f;

    // --- Diversity selection ---
    double rareColorMinFraction = 0.0004;
    float minSpacing222 = 14.0f;
    float minSpacing333 = 10.0f;
    float minSpacing444 = 8.0f;
    float tieBreakLambda222 = 0.55f;
    float tieBreakLambda333 = 0.40f;
    float tieBreakLambda444 = 0.35f;

    // --- Runtime ---
    int numThreads = 4;
    bool verbose = false;

    // Clamps every field into a usable range.
    void Sanitize();

    float MinSpacingFor(ColorDepthMode mode) const;
    float TieBreakLambdaFor(ColorDepthMode mode) const;
};

inline void QuantizationConfig::Sanitize() {
    kmeansStarts = std::clamp<uint32_t>(kmeansStarts, 1u, 64u);
    kmeansMaxIterations = std::clamp<uint32_t>(kmeansMaxIterations, 1u, 1000u);
    kmeansSampleLimit = std::max<uint32_t>(kmeansSampleLimit, 1u);
    kmeansMoveEpsilon = std::max(kmeansMoveEpsilon, 0.0f);
    reservoirCap = std::max<uint32_t>(reservoirCap, 1000u);
    maxExtractedColors = std::max<uint32_t>(maxExtractedColors, 1u);
    nearBlackL = std::clamp(nearBlackL, 0.0f, 100.0f);
    duplicateThreshold = std::max(duplicateThreshold, 0.0f);
    rareColorMinFraction = std::clamp(rareColorMinFraction, 0.0, 1.0);
    minSpacing222 = std::max(minSpacing222, 0.0f);
    minSpacing333 = std::max(minSpacing333, 0.0f);
    minSpacing444 = std::max(minSpacing444, 0.0f);
    tieBreakLambda222 = std::max(tieBreakLambda222, 0.0f);
    tieBreakLambda333 = std::max(tieBreakLambda333, 0.0f);
    tieBreakLambda444 = std::max(tieBreakLambda444, 0.0f);
    numThreads = std::max(numThreads, 1);
}

inline float QuantizationConfig::MinSpacingFor(ColorDepthMode mode) const {
    switch (mode) {
    case ColorDepthMode::RGB222: return minSpacing222;
    case ColorDepthMode::RGB444: return minSpacing444;
    default: return minSpacing333;
    }
}

inline float QuantizationConfig::TieBreakLambdaFor(ColorDepthMode mode) const {
    switch (mode) {
    case ColorDepthMode::RGB222: return tieBreakLambda222;
    case ColorDepthMode::RGB444: return tieBreakLambda444;
    default: return tieBreakLambda333;
    }
}
