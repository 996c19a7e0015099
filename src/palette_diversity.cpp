#include "palette_diversity.h"
#include "cielab_math.hpp"
#include <numeric>
#include <algorithm>
#include <limits>
#include <cmath>
#include <unordered_set>

namespace {
    // Levels 1..2047 step through every 8-bit gray.
    constexpr int kMaxGrayLevels = 2048;

    struct Entry {
        Color color;
        LabColor lab;
    };

    double MinDistanceTo(const LabColor& lab, const std::vector<Entry>& keep) {
        double minD = std::numeric_limits<double>::max();
        for (const auto& k : keep) minD = std::min(minD, Cielab::DeltaE76(lab, k.lab));
        return minD;
    }

    // Greedily appends up to `wanted` candidates, each the best of
    // distance * sqrt(count) against the palette as it grows. Only candidates farther
    // than `threshold` from every kept entry qualify.
    uint32_t AppendDistinctCandidates(std::vector<Entry>& keep, const std::vector<Entry>& pool,
        uint32_t wanted, double threshold, float nearBlackL, bool excludeNearBlack) {
        std::vector<double> minDist(pool.size());
        for (size_t i = 0; i < pool.size(); ++i) minDist[i] = MinDistanceTo(pool[i].lab, keep);

        uint32_t added = 0;
        while (added < wanted) {
            double bestScore = -1.0;
            size_t bestIdx = pool.size();
            for (size_t i = 0; i < pool.size(); ++i) {
                if (minDist[i] <= threshold) continue;
                if (excludeNearBlack && pool[i].lab.L < nearBlackL) continue;
                const double score = minDist[i] * std::sqrt(static_cast<double>(std::max<uint32_t>(pool[i].color.count, 1)));
                if (score > bestScore) { bestScore = score; bestIdx = i; }
            }
            if (bestIdx == pool.size()) break;

            keep.push_back(pool[bestIdx]);
            ++added;
            for (size_t i = 0; i < pool.size(); ++i) {
                minDist[i] = std::min(minDist[i], Cielab::DeltaE76(pool[i].lab, pool[bestIdx].lab));
            }
        }
        return added;
    }
}

Palette EnforcePaletteDiversity(const Palette& palette, const Palette& originalColors,
    uint32_t targetCount, const QuantizationConfig& config)
{
    if (palette.size() <= 1) return palette;

    const double threshold = config.duplicateThreshold;
    auto isNearBlack = [&](const LabColor& lab) { return lab.L < config.nearBlackL; };

    // --- 1. Collapse near-duplicates ---
    // Visit entries most-populous first; an entry survives only if it is far from
    // everything that already survived. Survivors are emitted in their original order.
    std::vector<Entry> all(palette.size());
    for (size_t i = 0; i < palette.size(); ++i) {
        all[i] = { palette[i], Cielab::RgbToLab(palette[i].r, palette[i].g, palette[i].b) };
    }
    std::vector<size_t> byCount(all.size());
    std::iota(byCount.begin(), byCount.end(), 0);
    std::stable_sort(byCount.begin(), byCount.end(), [&](size_t a, size_t b) { return all[a].color.count > all[b].color.count; });

    std::vector<bool> survives(all.size(), false);
    std::vector<Entry> accepted;
    for (size_t idx : byCount) {
        if (accepted.empty() || MinDistanceTo(all[idx].lab, accepted) >= threshold) {
            survives[idx] = true;
            accepted.push_back(all[idx]);
        }
    }
    std::vector<Entry> keep;
    for (size_t i = 0; i < all.size(); ++i) {
        if (survives[i]) keep.push_back(all[i]);
    }

    std::vector<Entry> pool(originalColors.size());
    for (size_t i = 0; i < originalColors.size(); ++i) {
        pool[i] = { originalColors[i], Cielab::RgbToLab(originalColors[i].r, originalColors[i].g, originalColors[i].b) };
    }

    // --- 2. Cap near-black entries ---
    std::vector<size_t> nearBlack;
    for (size_t i = 0; i < keep.size(); ++i) {
        if (isNearBlack(keep[i].lab)) nearBlack.push_back(i);
    }
    if (nearBlack.size() > config.maxNearBlack) {
        std::stable_sort(nearBlack.begin(), nearBlack.end(), [&](size_t a, size_t b) { return keep[a].color.count > keep[b].color.count; });
        std::vector<size_t> toRemove(nearBlack.begin() + config.maxNearBlack, nearBlack.end());
        std::sort(toRemove.rbegin(), toRemove.rend()); // erase from the back so indices stay valid
        for (size_t idx : toRemove) keep.erase(keep.begin() + idx);
        AppendDistinctCandidates(keep, pool, static_cast<uint32_t>(toRemove.size()), threshold, config.nearBlackL, true);
    }

    // --- 3. Top up ---
    if (keep.size() < targetCount) {
        AppendDistinctCandidates(keep, pool, targetCount - static_cast<uint32_t>(keep.size()), threshold, config.nearBlackL, false);
    }

    // --- 4. Gray padding (never pure black, never a color already kept) ---
    std::unordered_set<uint32_t> present;
    for (const auto& k : keep) present.insert(k.color.RgbaKey());
    for (int level = 1; keep.size() < targetCount && level < kMaxGrayLevels; ++level) {
        const uint8_t v = static_cast<uint8_t>(static_cast<int>(std::lround(level / 8.0 * 255.0)) % 256);
        Color gray(v, v, v, 255, 0);
        if (v == 0 || !present.insert(gray.RgbaKey()).second) continue;
        keep.push_back({ gray, Cielab::RgbToLab(v, v, v) });
    }

    Palette out;
    out.reserve(keep.size());
    for (const auto& k : keep) out.push_back(k.color);
    return out;
}
