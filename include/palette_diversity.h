#pragma once

#include "retro_palette_types.h"

// Post-processes a derived palette:
//  1. collapses entries closer than `duplicateThreshold` (Lab), keeping the most populous;
//  2. caps near-black entries (L* < nearBlackL) at maxNearBlack, replacing the excess
//     with distinct non-near-black colors from `originalColors`;
//  3. tops up to `targetCount` from `originalColors` by distance * sqrt(count);
//  4. pads with non-black grays as a last resort.
// Surviving entries keep their relative order; replacements are appended.
RETROPALETTE_API Palette EnforcePaletteDiversity(const Palette& palette, const Palette& originalColors,
    uint32_t targetCount, const QuantizationConfig& config);
