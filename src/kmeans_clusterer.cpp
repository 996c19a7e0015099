#include "kmeans_clusterer.h"
#include "palette_diversity.h"
#include "color_histogram.h"
#include <iostream>
#include <iomanip>

// =================================================================================================
// Setup
// =================================================================================================

LabKMeans::LabKMeans(const QuantizationConfig& cfg)
    : config(cfg) {
    config.Sanitize();
}

int32_t LabKMeans::DeriveSeed(const Palette& colors) {
    int32_t seed = static_cast<int32_t>(colors.size());
    for (size_t i = 0; i < std::min<size_t>(10, colors.size()); ++i) {
        seed = HashStep31(seed, int64_t(colors[i].r) + colors[i].g + colors[i].b);
    }
    return seed;
}

// Each unique color stands for ceil(count / sampleRate) samples, which bounds the
// population at roughly kmeansSampleLimit without expanding it in memory.
LabKMeans::WeightedSamples LabKMeans::BuildSamples(const Palette& colors) const {
    WeightedSamples samples;
    uint64_t total = 0;
    for (const auto& c : colors) total += std::max<uint32_t>(c.count, 1);
    samples.sampleRate = total > config.kmeansSampleLimit
        ? static_cast<uint32_t>((total + config.kmeansSampleLimit - 1) / config.kmeansSampleLimit)
        : 1;

    samples.lab.reserve(colors.size());
    samples.weight.reserve(colors.size());
    for (const auto& c : colors) {
        const uint32_t count = std::max<uint32_t>(c.count, 1);
        const uint32_t w = (count + samples.sampleRate - 1) / samples.sampleRate;
        samples.lab.push_back(Cielab::RgbToLab(c.r, c.g, c.b));
        samples.weight.push_back(w);
        samples.totalWeight += w;
    }
    return samples;
}

size_t LabKMeans::WeightedPick(const std::vector<double>& distances, const std::vector<uint32_t>& weight, double r) {
    for (size_t j = 0; j < distances.size(); ++j) {
        r -= distances[j] * weight[j];
        if (r <= 0) return j;
    }
    return 0;
}

// =================================================================================================
// Single run
// =================================================================================================

// k-means++ with linear (not squared) distance weighting.
std::vector<LabColor> LabKMeans::SeedCentroids(const WeightedSamples& samples, uint32_t k, SeededRandom& rng) const {
    const size_t n = samples.lab.size();
    std::vector<LabColor> centroids;
    centroids.reserve(k);

    // Uniform over samples, i.e. over unique colors weighted by their sample count.
    uint64_t firstSample = rng.NextInt(static_cast<uint32_t>(samples.totalWeight));
    size_t first = 0;
    for (uint64_t acc = 0; first < n; ++first) {
        acc += samples.weight[first];
        if (acc > firstSample) break;
    }
    centroids.push_back(samples.lab[std::min(first, n - 1)]);

    std::vector<double> minDist(n, std::numeric_limits<double>::max());
    for (uint32_t i = 1; i < k; ++i) {
        const LabColor& last = centroids.back();
        double total = 0.0;
        for (size_t j = 0; j < n; ++j) {
            minDist[j] = std::min(minDist[j], Cielab::DeltaE76(samples.lab[j], last));
            total += minDist[j] * samples.weight[j];
        }
        const double r = rng.Next() * total;
        centroids.push_back(samples.lab[WeightedPick(minDist, samples.weight, r)]);
    }
    return centroids;
}

LabKMeans::RunResult LabKMeans::RunOnce(const WeightedSamples& samples, uint32_t k, SeededRandom& rng) const {
    const int64_t n = static_cast<int64_t>(samples.lab.size());
    std::vector<LabColor> centroids = SeedCentroids(samples, k, rng);
    std::vector<uint32_t> assignments(n, 0);
    Cielab::LabPaletteSoA soa;

    double score = 0.0;
    for (uint32_t iter = 0; iter < config.kmeansMaxIterations; ++iter) {
        // --- Assign ---
        soa.Assign(centroids);
#pragma omp parallel for schedule(static) num_threads(config.numThreads)
        for (int64_t i = 0; i < n; ++i) {
            assignments[i] = static_cast<uint32_t>(Cielab::NearestIndex(soa, samples.lab[i]));
        }

        // --- Update (sequential so the sums are order-stable) ---
        std::vector<double> sumL(k, 0.0), sumA(k, 0.0), sumB(k, 0.0), weight(k, 0.0);
        for (int64_t i = 0; i < n; ++i) {
            const uint32_t c = assignments[i];
            const double w = samples.weight[i];
            sumL[c] += samples.lab[i].L * w;
            sumA[c] += samples.lab[i].a * w;
            sumB[c] += samples.lab[i].b * w;
            weight[c] += w;
        }

        double maxMove = 0.0;
        score = 0.0;
        for (uint32_t c = 0; c < k; ++c) {
            if (weight[c] == 0.0) {
                // Empty cluster: re-seed from the samples farthest from every current centroid.
                std::vector<double> distances(n);
                double totalDist = 0.0;
                for (int64_t s = 0; s < n; ++s) {
                    double minD = std::numeric_limits<double>::max();
                    for (const auto& cc : centroids) minD = std::min(minD, Cielab::DeltaE76(samples.lab[s], cc));
                    distances[s] = minD;
                    totalDist += minD * samples.weight[s];
                }
                if (totalDist > 0) {
                    centroids[c] = samples.lab[WeightedPick(distances, samples.weight, rng.Next() * totalDist)];
                }
                continue;
            }

            LabColor next{ sumL[c] / weight[c], sumA[c] / weight[c], sumB[c] / weight[c] };
            maxMove = std::max(maxMove, Cielab::DeltaE76(next, centroids[c]));
            centroids[c] = next;
            for (int64_t i = 0; i < n; ++i) {
                if (assignments[i] == c) score += Cielab::DeltaE76(samples.lab[i], next) * samples.weight[i];
            }
        }
        if (maxMove < config.kmeansMoveEpsilon) break;
    }

    // --- Populations from a final nearest assignment ---
    soa.Assign(centroids);
    std::vector<uint64_t> populations(k, 0);
    for (int64_t i = 0; i < n; ++i) {
        populations[Cielab::NearestIndex(soa, samples.lab[i])] += samples.weight[i];
    }

    RunResult result;
    result.score = score;
    result.palette.reserve(k);
    for (uint32_t c = 0; c < k; ++c) {
        uint8_t rgb[3];
        Cielab::LabToRgb(centroids[c], rgb);
        const uint64_t count = populations[c] * samples.sampleRate;
        result.palette.emplace_back(rgb[0], rgb[1], rgb[2], 255, static_cast<uint32_t>(std::min<uint64_t>(count, UINT32_MAX)));
    }
    SortByCountDescending(result.palette);
    return result;
}

// =================================================================================================
// Public API
// =================================================================================================

Palette LabKMeans::Cluster(const Palette& colors, uint32_t targetCount) const {
    if (colors.empty()) return {};
    if (colors.size() <= targetCount) return colors;

    const uint32_t k = std::clamp<uint32_t>(targetCount, 1, 256);
    const WeightedSamples samples = BuildSamples(colors);
    const int32_t seed = DeriveSeed(colors);

    SeededRandom firstRng(seed);
    RunResult best = RunOnce(samples, k, firstRng);
    for (uint32_t s = 1; s < config.kmeansStarts; ++s) {
        SeededRandom rng(static_cast<int32_t>(static_cast<uint32_t>(seed) + s + 1));
        RunResult candidate = RunOnce(samples, k, rng);
        if (candidate.score < best.score) best = std::move(candidate);
    }

    if (config.verbose) {
        std::cout << "K-Means: " << colors.size() << " colors -> " << k << " clusters, sample rate "
            << samples.sampleRate << ", best score " << std::fixed << std::setprecision(1) << best.score << std::endl;
    }
    return best.palette;
}

Palette LabKMeans::Quantize(const Palette& colors, uint32_t targetCount) const {
    if (colors.empty()) return {};
    if (colors.size() <= targetCount) return colors;
    const uint32_t k = std::clamp<uint32_t>(targetCount, 1, 256);
    return EnforcePaletteDiversity(Cluster(colors, targetCount), colors, k, config);
}
