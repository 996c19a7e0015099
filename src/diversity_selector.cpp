#include "diversity_selector.h"
#include "depth_reduction.h"
#include "cielab_math.hpp"
#include <iostream>
#include <iomanip>

namespace {
    constexpr uint32_t kMaxSpacingRelaxations = 20;
    constexpr double kSpacingRelaxFactor = 0.9;
}

Palette SelectMostDiverseColors(const Palette& colors, uint32_t target,
    ColorDepthMode depthMode, const QuantizationConfig& config)
{
    if (colors.empty() || target == 0) return {};
    if (colors.size() <= target) return colors;

    // --- 1. Rare color filtering ---
    uint64_t total = 0;
    for (const auto& c : colors) total += std::max<uint32_t>(c.count, 1);
    const uint64_t rareThreshold = std::max<uint64_t>(1, static_cast<uint64_t>(std::floor(total * config.rareColorMinFraction)));

    Palette pool;
    pool.reserve(colors.size());
    for (const auto& c : colors) {
        if (std::max<uint32_t>(c.count, 1) >= rareThreshold) pool.push_back(c);
    }
    if (pool.size() < size_t(target) * 2) {
        if (config.verbose) {
            std::cout << "Diversity selection: rare filter kept " << pool.size() << " of " << colors.size()
                << " (threshold " << rareThreshold << "), reverting" << std::endl;
        }
        pool = colors;
    }

    std::vector<LabColor> labs(pool.size());
    for (size_t i = 0; i < pool.size(); ++i) labs[i] = Cielab::RgbToLab(pool[i].r, pool[i].g, pool[i].b);

    const double lambda = config.TieBreakLambdaFor(depthMode);
    double minSpacing = config.MinSpacingFor(depthMode);

    // --- 2. Seed with the most distant pair ---
    double maxDist = -1.0;
    size_t seed1 = 0, seed2 = 1;
    for (size_t i = 0; i < labs.size(); ++i) {
        for (size_t j = i + 1; j < labs.size(); ++j) {
            const double d = Cielab::DeltaE76(labs[i], labs[j]);
            if (d > maxDist) { maxDist = d; seed1 = i; seed2 = j; }
        }
    }

    Palette selected;
    selected.reserve(target);
    std::vector<bool> taken(pool.size(), false);
    std::vector<double> minDist(pool.size(), std::numeric_limits<double>::max());
    size_t remaining = pool.size();

    auto take = [&](size_t idx) {
        selected.push_back(pool[idx]);
        taken[idx] = true;
        --remaining;
        for (size_t i = 0; i < pool.size(); ++i) {
            if (!taken[i]) minDist[i] = std::min(minDist[i], Cielab::DeltaE76(labs[i], labs[idx]));
        }
    };
    take(seed1);
    if (target > 1) take(seed2);

    // --- 3. Greedy diversity with a relaxing spacing floor ---
    uint32_t relaxations = 0;
    while (selected.size() < target && remaining > 0) {
        size_t bestIdx = pool.size();
        double bestScore = -std::numeric_limits<double>::max();
        double bestMinDist = 0.0;
        for (size_t i = 0; i < pool.size(); ++i) {
            if (taken[i]) continue;
            const double freq = pool[i].count > 0 ? std::log(static_cast<double>(pool[i].count) + 1.0) : 0.0;
            const double score = minDist[i] + lambda * freq;
            if (score > bestScore) { bestScore = score; bestIdx = i; bestMinDist = minDist[i]; }
        }

        // Below the floor with spare candidates left: relax the floor and retry, but
        // only a bounded number of times before accepting the best anyway.
        const size_t needed = target - selected.size();
        while (bestMinDist < minSpacing && remaining > needed && relaxations <= kMaxSpacingRelaxations) {
            minSpacing *= kSpacingRelaxFactor;
            ++relaxations;
        }
        take(bestIdx);
    }

    if (config.verbose) {
        std::cout << "Diversity selection (" << DepthModeName(depthMode) << "): " << selected.size()
            << " colors, final spacing " << std::fixed << std::setprecision(2) << minSpacing << std::endl;
    }
    return selected;
}
