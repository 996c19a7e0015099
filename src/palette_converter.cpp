#include "palette_converter.h"
#include "depth_reduction.h"
#include "color_histogram.h"
#include "kmeans_clusterer.h"
#include "diversity_selector.h"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <stdexcept>
#include <iostream>
#include <limits>
#include <cmath>

namespace {
    constexpr size_t kRemapChunks = 50;
    constexpr uint32_t kFrequencySeedCount = 8;

    // Forwards only strictly increasing percentages, so callers always see a
    // non-decreasing sequence that ends at 100.
    class ProgressReporter {
    private:
        ProgressCallback callback;
        int last = -1;

    public:
        explicit ProgressReporter(ProgressCallback cb) : callback(std::move(cb)) {}

        void Report(int percent) {
            percent = std::clamp(percent, 0, 100);
            if (percent <= last) return;
            last = percent;
            if (callback) callback(percent);
        }
    };

    Palette GrayRamp(ColorDepthMode mode) {
        Palette grays;
        for (int level = 0; level < 8; ++level) {
            const uint8_t v = static_cast<uint8_t>(std::lround(level / 7.0 * 255.0));
            grays.push_back(ReduceColor(Color(v, v, v, 255, 0), mode));
        }
        return grays;
    }

    // Hands out replacement colors in priority order, never one already in use.
    class ReplacementSource {
    private:
        const Palette& imageColors;
        ColorDepthMode mode;
        size_t imageCursor = 0;
        Palette colorSpace;
        bool colorSpaceBuilt = false;

    public:
        ReplacementSource(const Palette& colors, ColorDepthMode depthMode) : imageColors(colors), mode(depthMode) {}

        std::optional<Color> Next(const Palette& current, const std::unordered_set<uint32_t>& inUse) {
            // --- 1. The image's own reduced colors, most frequent first ---
            while (imageCursor < imageColors.size()) {
                Color c = ReduceColor(imageColors[imageCursor++], mode);
                c.a = 255;
                if (!inUse.count(c.RgbaKey())) return c;
            }

            // --- 2. The reduced color space entry farthest from the palette ---
            if (!colorSpaceBuilt) {
                colorSpace = EnumerateReducedColorSpace(mode);
                colorSpaceBuilt = true;
            }
            std::vector<LabColor> currentLab;
            currentLab.reserve(current.size());
            for (const auto& c : current) currentLab.push_back(Cielab::RgbToLab(c.r, c.g, c.b));
            double bestDist = -1.0;
            const Color* best = nullptr;
            for (const auto& c : colorSpace) {
                if (inUse.count(c.RgbaKey())) continue;
                const LabColor lab = Cielab::RgbToLab(c.r, c.g, c.b);
                double minD = std::numeric_limits<double>::max();
                for (const auto& p : currentLab) minD = std::min(minD, Cielab::DeltaE76(lab, p));
                if (minD > bestDist) { bestDist = minD; best = &c; }
            }
            if (best) return *best;

            // --- 3. Reduced grays, then black ---
            for (const auto& gray : GrayRamp(mode)) {
                if (!inUse.count(gray.RgbaKey())) return gray;
            }
            const Color black(0, 0, 0, 255, 0);
            if (!inUse.count(black.RgbaKey())) return black;
            return std::nullopt;
        }
    };
}

// =================================================================================================
// Collision repair
// =================================================================================================

RepairedPalette RepairCollisions(const Palette& reduced, const Palette& imageColors,
    ColorDepthMode mode, size_t desiredCount)
{
    RepairedPalette out;
    out.slotOf.reserve(reduced.size());

    // Every key the input will place is off limits to replacements.
    std::unordered_set<uint32_t> inUse;
    for (const auto& c : reduced) inUse.insert(c.RgbaKey());
    std::unordered_map<uint32_t, size_t> slotByKey;
    ReplacementSource replacements(imageColors, mode);

    auto addReplacement = [&]() {
        std::optional<Color> next = replacements.Next(out.palette, inUse);
        if (!next) return false;
        inUse.insert(next->RgbaKey());
        out.added.push_back(out.palette.size());
        out.palette.push_back(*next);
        return true;
    };

    for (const auto& c : reduced) {
        auto it = slotByKey.find(c.RgbaKey());
        if (it == slotByKey.end()) {
            slotByKey.emplace(c.RgbaKey(), out.palette.size());
            out.slotOf.push_back(out.palette.size());
            out.palette.push_back(c);
            continue;
        }
        // A duplicate keeps drawing with the slot it collided with; its place in the
        // order goes to a replacement if one is left.
        out.slotOf.push_back(it->second);
        if (out.palette.size() < desiredCount) addReplacement();
    }

    while (out.palette.size() < desiredCount) {
        if (!addReplacement()) break;
    }
    return out;
}

// =================================================================================================
// RetroPaletteConverter
// =================================================================================================

RetroPaletteConverter::RetroPaletteConverter(const QuantizationConfig& cfg)
    : config(cfg) {
    config.Sanitize();
}

void RetroPaletteConverter::SetConfig(const QuantizationConfig& cfg) {
    config = cfg;
    config.Sanitize();
}

ProcessResult RetroPaletteConverter::Process(const ConversionRequest& request) const {
    if (!request.pixels.IsValid()) {
        throw std::invalid_argument("Pixel buffer size does not match " + std::to_string(request.pixels.width) +
            "x" + std::to_string(request.pixels.height) + " RGBA");
    }
    const PaletteProfile* profile = FindProfile(request.profile);
    if (!profile) {
        throw std::invalid_argument("Unknown palette profile: " + request.profile);
    }

    if (config.verbose) {
        std::cout << "Converting " << request.pixels.width << "x" << request.pixels.height
            << " image with profile '" << profile->name << "'" << std::endl;
    }

    switch (profile->kind) {
    case ProfileKind::Derived: return ProcessDerived(request, *profile);
    case ProfileKind::FixedNearest:
    case ProfileKind::FixedLuminance: return ProcessFixed(request, *profile);
    case ProfileKind::Passthrough: return ProcessPassthrough(request);
    default:
        throw std::runtime_error("Unhandled profile kind for '" + profile->name + "'");
    }
}

Palette RetroPaletteConverter::DeriveWorkingPalette(const Palette& reducedColors, const PaletteProfile& profile) const {
    const uint32_t target = profile.targetColors;
    if (reducedColors.size() <= target) return reducedColors;

    if (profile.strategy == DerivationStrategy::KMeansDiversity) {
        // Over-cluster, since reduction collapses neighbouring centroids.
        const uint32_t margin = static_cast<uint32_t>(std::min<size_t>(size_t(target) * 2, reducedColors.size()));
        LabKMeans kmeans(config);
        Palette candidates = kmeans.Quantize(reducedColors, margin);

        Palette unique;
        std::unordered_set<uint32_t> seen;
        for (const auto& c : candidates) {
            Color reduced = ReduceColor(c, profile.depthMode);
            if (seen.insert(reduced.Key()).second) unique.push_back(reduced);
        }
        if (config.verbose) {
            std::cout << "K-Means produced " << unique.size() << " unique colors from " << margin << " requested" << std::endl;
        }
        if (unique.size() < target) return unique;

        // Pure diversity from here on: populations of centroids are not comparable.
        for (auto& c : unique) c.count = 0;
        return SelectMostDiverseColors(unique, target, profile.depthMode, config);
    }

    // FrequencyDiversity: the most common colors are kept, the rest chosen for spread.
    Palette sorted = reducedColors;
    SortByCountDescending(sorted);
    const size_t topCount = std::min<size_t>(kFrequencySeedCount, target);
    Palette working(sorted.begin(), sorted.begin() + topCount);
    Palette rest(sorted.begin() + topCount, sorted.end());
    const size_t needed = target - topCount;
    if (!rest.empty() && needed > 0) {
        Palette diverse = SelectMostDiverseColors(rest, static_cast<uint32_t>(std::min(needed, rest.size())), profile.depthMode, config);
        working.insert(working.end(), diverse.begin(), diverse.end());
    }
    return working;
}

ProcessResult RetroPaletteConverter::ProcessDerived(const ConversionRequest& request, const PaletteProfile& profile) const {
    ProgressReporter progress(request.progress);
    progress.Report(0);
    const uint32_t target = profile.targetColors;
    const ColorDepthMode mode = profile.depthMode;

    // --- 1. Histogram of the image in the reduced color space ---
    PixelBuffer reducedImage = request.pixels;
    ReducePixelBuffer(reducedImage, mode);
    const Palette imageColors = ExtractColorsSampled(reducedImage, config);
    Palette byFrequency = imageColors;
    SortByCountDescending(byFrequency);
    progress.Report(10);

    // --- 2. Working palette: preserved source, or derived ---
    std::vector<WorkingEntry> working;
    RepairedPalette repaired;
    const bool preserve = !request.sourcePalette.empty() && request.sourcePalette.size() <= target;
    if (preserve) {
        const Palette reduced = ReducePalette(request.sourcePalette, mode);
        repaired = RepairCollisions(reduced, byFrequency, mode, reduced.size());
        // Transparent source entries keep their slot but never draw a visible pixel,
        // unless the source has nothing else to draw with.
        const bool anyVisible = std::any_of(request.sourcePalette.begin(), request.sourcePalette.end(),
            [](const Color& c) { return c.a != 0; });
        for (size_t i = 0; i < request.sourcePalette.size(); ++i) {
            if (anyVisible && request.sourcePalette[i].a == 0) continue;
            working.push_back({ request.sourcePalette[i], repaired.slotOf[i] });
        }
    }
    else {
        const Palette derived = ReducePalette(DeriveWorkingPalette(imageColors, profile), mode);
        progress.Report(40);
        const size_t achievable = std::min<size_t>(target, imageColors.size());
        repaired = RepairCollisions(derived, byFrequency, mode, achievable);
        for (size_t i = 0; i < derived.size(); ++i) {
            working.push_back({ derived[i], repaired.slotOf[i] });
        }
    }
    for (size_t slot : repaired.added) working.push_back({ repaired.palette[slot], slot });
    progress.Report(50);

    Palette palette = repaired.palette;
    if (request.layout == PaletteLayout::FixedLength && palette.size() < target) {
        if (preserve) {
            palette.resize(target, Color(0, 0, 0, 255, 0));
        }
        else {
            std::unordered_set<uint32_t> present;
            for (const auto& c : palette) present.insert(c.Key());
            for (const auto& gray : GrayRamp(mode)) {
                if (palette.size() >= target) break;
                if (present.insert(gray.Key()).second) palette.push_back(gray);
            }
            palette.resize(target, Color(0, 0, 0, 255, 0));
        }
    }

    if (config.verbose) {
        std::cout << "Palette for '" << profile.name << "' (" << DepthModeName(mode) << "): " << palette.size()
            << " colors" << (preserve ? " (preserved source order)" : "") << std::endl;
    }

    // --- 3. Remap ---
    ProcessResult result;
    result.pixels = request.pixels;
    RemapPixels(result.pixels, working, palette, [&](int p) { progress.Report(p); }, 50, 100);
    result.palette = std::move(palette);
    progress.Report(100);
    return result;
}

void RetroPaletteConverter::RemapPixels(PixelBuffer& pixels, const std::vector<WorkingEntry>& working, const Palette& palette,
    const std::function<void(int)>& progress, int progressFrom, int progressTo) const {
    const size_t n = pixels.PixelCount();
    if (working.empty() || n == 0) {
        progress(progressTo);
        return;
    }

    std::vector<LabColor> labs;
    labs.reserve(working.size());
    for (const auto& w : working) labs.push_back(Cielab::RgbToLab(w.color.r, w.color.g, w.color.b));
    const Cielab::LabPaletteSoA soa(labs);

    // Resolve each distinct color once.
    const Palette unique = EnumerateUniqueColors(pixels);
    const int64_t uniqueCount = static_cast<int64_t>(unique.size());
    std::vector<size_t> slotForUnique(unique.size());
#pragma omp parallel for schedule(static) num_threads(config.numThreads)
    for (int64_t i = 0; i < uniqueCount; ++i) {
        const LabColor lab = Cielab::RgbToLab(unique[i].r, unique[i].g, unique[i].b);
        slotForUnique[i] = working[Cielab::NearestIndex(soa, lab)].slot;
    }
    std::unordered_map<uint32_t, size_t> slotByKey;
    slotByKey.reserve(unique.size());
    for (size_t i = 0; i < unique.size(); ++i) slotByKey.emplace(unique[i].Key(), slotForUnique[i]);

    const size_t chunkSize = std::max<size_t>(1, (n + kRemapChunks - 1) / kRemapChunks);
    uint8_t* p = pixels.data.data();
    for (size_t start = 0; start < n; start += chunkSize) {
        const size_t end = std::min(n, start + chunkSize);
        for (size_t i = start; i < end; ++i) {
            uint8_t* px = p + i * 4;
            if (px[3] == 0) continue; // fully transparent pixels are never rewritten
            const uint32_t key = (uint32_t(px[0]) << 16) | (uint32_t(px[1]) << 8) | px[2];
            const Color& c = palette[slotByKey.at(key)];
            px[0] = c.r;
            px[1] = c.g;
            px[2] = c.b;
        }
        progress(progressFrom + static_cast<int>((progressTo - progressFrom) * end / n));
    }
}

// =================================================================================================
// Fixed palettes
// =================================================================================================

ProcessResult RetroPaletteConverter::ProcessFixed(const ConversionRequest& request, const PaletteProfile& profile) const {
    Palette colors = profile.fixedColors;
    if (!request.customColors.empty() && request.customColors.size() == colors.size()) {
        colors = request.customColors;
    }

    ProgressReporter progress(request.progress);
    progress.Report(0);
    ProcessResult result;
    if (profile.kind == ProfileKind::FixedLuminance) {
        result.pixels = ApplyLuminanceBands(request.pixels, colors);
    }
    else {
        result.pixels = ApplyFixedPalette(request.pixels, colors, [&](int p) { progress.Report(p); });
    }
    result.palette = std::move(colors);
    result.usedFixedPalette = true;
    progress.Report(100);
    return result;
}

PixelBuffer RetroPaletteConverter::ApplyFixedPalette(const PixelBuffer& pixels, const Palette& palette,
    const ProgressCallback& progress) const {
    PixelBuffer out = pixels;
    if (palette.empty()) return out;

    std::vector<LabColor> paletteLab;
    paletteLab.reserve(palette.size());
    for (const auto& c : palette) paletteLab.push_back(Cielab::RgbToLab(c.r, c.g, c.b));

    // Per-color cache: CIEDE2000 runs once per distinct input color.
    const Palette unique = EnumerateUniqueColors(pixels);
    const int64_t uniqueCount = static_cast<int64_t>(unique.size());
    std::vector<size_t> nearest(unique.size(), 0);
#pragma omp parallel for schedule(dynamic, 64) num_threads(config.numThreads)
    for (int64_t i = 0; i < uniqueCount; ++i) {
        const LabColor lab = Cielab::RgbToLab(unique[i].r, unique[i].g, unique[i].b);
        double best = std::numeric_limits<double>::max();
        for (size_t j = 0; j < paletteLab.size(); ++j) {
            const double d = Cielab::DeltaE2000(lab, paletteLab[j]);
            if (d < best) { best = d; nearest[i] = j; }
        }
    }
    std::unordered_map<uint32_t, size_t> cache;
    cache.reserve(unique.size());
    for (size_t i = 0; i < unique.size(); ++i) cache.emplace(unique[i].Key(), nearest[i]);

    const size_t n = out.PixelCount();
    const size_t chunkSize = std::max<size_t>(1, (n + kRemapChunks - 1) / kRemapChunks);
    uint8_t* p = out.data.data();
    for (size_t start = 0; start < n; start += chunkSize) {
        const size_t end = std::min(n, start + chunkSize);
        for (size_t i = start; i < end; ++i) {
            uint8_t* px = p + i * 4;
            if (px[3] == 0) continue;
            const Color& c = palette[cache.at((uint32_t(px[0]) << 16) | (uint32_t(px[1]) << 8) | px[2])];
            px[0] = c.r;
            px[1] = c.g;
            px[2] = c.b;
        }
        if (progress) progress(static_cast<int>(100 * end / n));
    }
    return out;
}

PixelBuffer RetroPaletteConverter::ApplyLuminanceBands(const PixelBuffer& pixels, const Palette& shades) {
    if (shades.size() != 4) {
        throw std::invalid_argument("Luminance mapping needs exactly 4 shades, got " + std::to_string(shades.size()));
    }
    PixelBuffer out = pixels;
    uint8_t* p = out.data.data();
    for (size_t i = 0; i < out.PixelCount(); ++i) {
        uint8_t* px = p + i * 4;
        if (px[3] == 0) continue;
        const double brightness = (0.299 * px[0] + 0.587 * px[1] + 0.114 * px[2]) / 255.0 * 100.0;
        const size_t band = brightness <= 24 ? 0 : brightness <= 49 ? 1 : brightness <= 74 ? 2 : 3;
        px[0] = shades[band].r;
        px[1] = shades[band].g;
        px[2] = shades[band].b;
    }
    return out;
}

// =================================================================================================
// Passthrough
// =================================================================================================

ProcessResult RetroPaletteConverter::ProcessPassthrough(const ConversionRequest& request) const {
    ProgressReporter progress(request.progress);
    progress.Report(0);
    ProcessResult result;
    result.pixels = request.pixels;
    if (!request.sourcePalette.empty()) {
        result.palette = request.sourcePalette;
    }
    else {
        result.palette = EnumerateUniqueColors(request.pixels);
        if (result.palette.size() > 256) {
            SortByCountDescending(result.palette);
            result.palette.resize(256);
        }
    }
    progress.Report(100);
    return result;
}
