#pragma once

#include "retro_palette_types.h"
#include "cielab_math.hpp"
#include "seeded_random.h"

// Multi-start k-means in CIE Lab over a weighted color population.
//
// Every run is seeded from the input itself, so the same population and config
// always give the same palette, whatever the thread count.
class RETROPALETTE_API LabKMeans {
private:
    QuantizationConfig config;

    struct WeightedSamples {
        std::vector<LabColor> lab;
        std::vector<uint32_t> weight; // samples represented by each unique color
        uint64_t totalWeight = 0;
        uint32_t sampleRate = 1;
    };

    struct RunResult {
        Palette palette;
        double score = 0.0;
    };

    WeightedSamples BuildSamples(const Palette& colors) const;

    // Index of the sample that a weighted walk of `r` over `distances` stops at.
    static size_t WeightedPick(const std::vector<double>& distances, const std::vector<uint32_t>& weight, double r);

    std::vector<LabColor> SeedCentroids(const WeightedSamples& samples, uint32_t k, SeededRandom& rng) const;
    RunResult RunOnce(const WeightedSamples& samples, uint32_t k, SeededRandom& rng) const;

public:
    LabKMeans(const QuantizationConfig& cfg = QuantizationConfig());

    // Seed derived from the population length and its first ten entries.
    static int32_t DeriveSeed(const Palette& colors);

    // Best of `kmeansStarts` runs, sorted by population, without post-processing.
    // Populations of `targetCount` or fewer entries come back unchanged.
    Palette Cluster(const Palette& colors, uint32_t targetCount) const;

    // Cluster() followed by the duplicate / near-black post-processor.
    Palette Quantize(const Palette& colors, uint32_t targetCount) const;
};
