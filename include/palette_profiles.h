#pragma once

#include "retro_palette_types.h"

// Bumped whenever an entry of the table changes.
constexpr uint32_t kProfileTableVersion = 3;

enum class ProfileKind {
    Derived,        // palette derived from the image in a reduced color space
    FixedNearest,   // literal palette, CIEDE2000 nearest match
    FixedLuminance, // literal 4-shade palette, luminance bands
    Passthrough     // pixels untouched
};

enum class DerivationStrategy {
    KMeansDiversity,   // k-means over-clustering, then diversity selection
    FrequencyDiversity // most frequent colors first, diversity for the rest
};

struct PaletteProfile {
    std::string name;
    ProfileKind kind = ProfileKind::Derived;
    uint32_t targetColors = 16;
    ColorDepthMode depthMode = ColorDepthMode::RGB333;
    DerivationStrategy strategy = DerivationStrategy::KMeansDiversity;
    Palette fixedColors; // only for Fixed* kinds
};

RETROPALETTE_API const std::vector<PaletteProfile>& ProfileTable();

// nullptr if no profile has that name.
RETROPALETTE_API const PaletteProfile* FindProfile(const std::string& name);

RETROPALETTE_API std::vector<std::string> ProfileNames();
