#pragma once

#include "retro_palette_types.h"

// Greedy farthest-point selection in Lab.
//
// Starts from the most distant pair, then repeatedly adds the candidate maximising
// minDistanceToSelected + lambda * log(count + 1). Ultra-rare colors are filtered out
// first unless that would leave fewer than 2 * target candidates. Spacing and lambda
// come from the config entry for `depthMode`.
RETROPALETTE_API Palette SelectMostDiverseColors(const Palette& colors, uint32_t target,
    ColorDepthMode depthMode, const QuantizationConfig& config);
