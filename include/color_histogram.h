#pragma once

#include "retro_palette_types.h"

// Exact histogram of every opaque (alpha > 0) pixel, in first-seen order.
RETROPALETTE_API Palette EnumerateUniqueColors(const PixelBuffer& pixels);

// Deterministic reservoir-sampled histogram. At most `reservoirCap` opaque pixels are
// kept (never fewer than 1000 unless the image is smaller); the result is capped at
// `maxExtractedColors` entries by sampled frequency. Identical buffers give identical
// results.
RETROPALETTE_API Palette ExtractColorsSampled(const PixelBuffer& pixels, const QuantizationConfig& config);

// Stable sort by count, most frequent first.
RETROPALETTE_API void SortByCountDescending(Palette& colors);

RETROPALETTE_API uint64_t TotalCount(const Palette& colors);
