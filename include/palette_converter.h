#pragma once

#include "retro_palette_types.h"
#include "palette_profiles.h"
#include "cielab_math.hpp"
#include <optional>

enum class PaletteLayout {
    Compact,    // the palette holds only the colors actually achievable
    FixedLength // legacy: always padded to the profile's target count
};

struct ConversionRequest {
    PixelBuffer pixels;
    std::string profile = "megadrive";
    Palette sourcePalette;  // ordered palette of an indexed source, if any
    Palette customColors;   // replaces a fixed palette of the same length
    PaletteLayout layout = PaletteLayout::Compact;
    ProgressCallback progress;
};

struct ProcessResult {
    PixelBuffer pixels;
    Palette palette;
    bool usedFixedPalette = false;
};

// Output of collision repair. Entry i of the input palette is drawn with
// palette[slotOf[i]]; `added` lists slots filled with replacement colors.
struct RepairedPalette {
    Palette palette;
    std::vector<size_t> slotOf;
    std::vector<size_t> added;
};

// Replaces exact duplicates of a reduced palette in place and tops it up to
// `desiredCount`. Replacements come from `imageColors` (reduced, most frequent first),
// then the reduced color space entry farthest from the palette, then reduced grays,
// then black. A duplicate with nothing left to replace it is dropped.
RETROPALETTE_API RepairedPalette RepairCollisions(const Palette& reduced, const Palette& imageColors,
    ColorDepthMode mode, size_t desiredCount);

// Central policy: preserve an indexed source palette when it fits, otherwise derive
// one in the profile's reduced color space, repair collisions, and remap every pixel.
class RETROPALETTE_API RetroPaletteConverter {
private:
    QuantizationConfig config;

    struct WorkingEntry {
        Color color;  // color used for matching
        size_t slot;  // palette slot written to the pixel
    };

    // Working palette derived from the histogram of the reduced image.
    Palette DeriveWorkingPalette(const Palette& reducedColors, const PaletteProfile& profile) const;

    ProcessResult ProcessDerived(const ConversionRequest& request, const PaletteProfile& profile) const;
    ProcessResult ProcessFixed(const ConversionRequest& request, const PaletteProfile& profile) const;
    ProcessResult ProcessPassthrough(const ConversionRequest& request) const;

    // Writes palette[slot of nearest working entry] into every opaque pixel.
    void RemapPixels(PixelBuffer& pixels, const std::vector<WorkingEntry>& working, const Palette& palette,
        const std::function<void(int)>& progress, int progressFrom, int progressTo) const;

public:
    RetroPaletteConverter(const QuantizationConfig& cfg = QuantizationConfig());

    const QuantizationConfig& GetConfig() const { return config; }
    void SetConfig(const QuantizationConfig& cfg);

    // Throws std::invalid_argument for an unknown profile or a malformed buffer.
    ProcessResult Process(const ConversionRequest& request) const;

    // Nearest match by CIEDE2000, with a per-color cache. Alpha 0 pixels are untouched.
    PixelBuffer ApplyFixedPalette(const PixelBuffer& pixels, const Palette& palette,
        const ProgressCallback& progress = nullptr) const;

    // Four-shade mapping by luminance band (<=24%, <=49%, <=74%, above).
    static PixelBuffer ApplyLuminanceBands(const PixelBuffer& pixels, const Palette& shades);
};
