#pragma once

#include "retro_palette_types.h"

struct DepthBits {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

RETROPALETTE_API DepthBits GetDepthBits(ColorDepthMode mode);

// Number of distinct colors addressable in the reduced space (64, 512, 4096, ...).
RETROPALETTE_API uint32_t ColorSpaceSize(ColorDepthMode mode);

RETROPALETTE_API const char* DepthModeName(ColorDepthMode mode);

// Snaps an 8-bit channel to the nearest of 2^bits evenly spaced levels and back to 0..255.
RETROPALETTE_API uint8_t QuantizeChannelToBits(uint8_t value, uint8_t bits);

// Idempotent per-channel reduction. Alpha and count are carried through unchanged.
RETROPALETTE_API Color ReduceColor(const Color& color, ColorDepthMode mode);

RETROPALETTE_API Palette ReducePalette(const Palette& palette, ColorDepthMode mode);

// Every color of the reduced space in r, g, b loop order.
RETROPALETTE_API Palette EnumerateReducedColorSpace(ColorDepthMode mode);

// In-place reduction of an RGBA buffer; alpha is untouched.
RETROPALETTE_API void ReducePixelBuffer(PixelBuffer& pixels, ColorDepthMode mode);
