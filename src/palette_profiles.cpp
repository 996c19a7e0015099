#include "palette_profiles.h"

namespace {
    PaletteProfile Derived(const char* name, uint32_t target, ColorDepthMode mode, DerivationStrategy strategy) {
        PaletteProfile p;
        p.name = name;
        p.kind = ProfileKind::Derived;
        p.targetColors = target;
        p.depthMode = mode;
        p.strategy = strategy;
        return p;
    }

    PaletteProfile Fixed(const char* name, ProfileKind kind, Palette colors) {
        PaletteProfile p;
        p.name = name;
        p.kind = kind;
        p.targetColors = static_cast<uint32_t>(colors.size());
        p.depthMode = ColorDepthMode::RGB555;
        p.fixedColors = std::move(colors);
        return p;
    }

    // Firmware order: index = 9 * green + 3 * red + blue over the levels 0, 128, 255.
    Palette AmstradCpcColors() {
        static const uint8_t levels[3] = { 0, 128, 255 };
        Palette colors;
        for (int g = 0; g < 3; ++g)
            for (int r = 0; r < 3; ++r)
                for (int b = 0; b < 3; ++b)
                    colors.emplace_back(levels[r], levels[g], levels[b]);
        return colors;
    }

    // Normal intensity at 215, bright at 255; bright black is dropped.
    Palette ZxSpectrumColors() {
        Palette colors;
        for (uint8_t level : { uint8_t(215), uint8_t(255) }) {
            for (int i = 0; i < 8; ++i) {
                if (level == 255 && i == 0) continue;
                const uint8_t b = (i & 1) ? level : 0;
                const uint8_t r = (i & 2) ? level : 0;
                const uint8_t g = (i & 4) ? level : 0;
                colors.emplace_back(r, g, b);
            }
        }
        return colors;
    }

    std::vector<PaletteProfile> BuildTable() {
        std::vector<PaletteProfile> table;

        // --- Derived console palettes ---
        table.push_back(Derived("megadrive", 16, ColorDepthMode::RGB333, DerivationStrategy::KMeansDiversity));
        table.push_back(Derived("megadrive61", 61, ColorDepthMode::RGB333, DerivationStrategy::KMeansDiversity));
        table.push_back(Derived("gameGear", 32, ColorDepthMode::RGB444, DerivationStrategy::KMeansDiversity));
        table.push_back(Derived("masterSystem", 16, ColorDepthMode::RGB222, DerivationStrategy::FrequencyDiversity));

        // --- Handhelds, mapped by luminance ---
        table.push_back(Fixed("gameboy", ProfileKind::FixedLuminance,
            { {7, 24, 33}, {134, 192, 108}, {224, 248, 207}, {101, 255, 0} }));
        table.push_back(Fixed("gameboyBg", ProfileKind::FixedLuminance,
            { {7, 24, 33}, {48, 104, 80}, {134, 192, 108}, {224, 248, 207} }));
        table.push_back(Fixed("gameboyRealistic", ProfileKind::FixedLuminance,
            { {56, 72, 40}, {96, 112, 40}, {160, 168, 48}, {208, 224, 64} }));

        // --- Literal palettes ---
        table.push_back(Fixed("megadriveDefault", ProfileKind::FixedNearest, {
            {0, 0, 0}, {0, 0, 146}, {0, 146, 0}, {0, 146, 146},
            {146, 0, 0}, {146, 0, 146}, {146, 73, 0}, {182, 182, 182},
            {73, 73, 73}, {73, 73, 255}, {73, 255, 73}, {73, 255, 255},
            {255, 73, 73}, {255, 73, 255}, {255, 255, 73}, {255, 255, 255} }));
        table.push_back(Fixed("cga0", ProfileKind::FixedNearest,
            { {0, 0, 0}, {0, 170, 0}, {170, 0, 0}, {170, 85, 0} }));
        table.push_back(Fixed("cga1", ProfileKind::FixedNearest,
            { {0, 0, 0}, {0, 170, 170}, {170, 0, 170}, {170, 170, 170} }));
        table.push_back(Fixed("cga2", ProfileKind::FixedNearest,
            { {0, 0, 0}, {0, 170, 170}, {170, 0, 0}, {170, 170, 170} }));
        table.push_back(Fixed("commodore64", ProfileKind::FixedNearest, {
            {0, 0, 0}, {255, 255, 255}, {136, 0, 0}, {170, 255, 238},
            {204, 68, 204}, {0, 204, 85}, {0, 0, 170}, {238, 238, 119},
            {221, 136, 85}, {102, 68, 0}, {255, 119, 119}, {51, 51, 51},
            {119, 119, 119}, {170, 255, 102}, {0, 136, 255}, {187, 187, 187} }));
        table.push_back(Fixed("zxSpectrum", ProfileKind::FixedNearest, ZxSpectrumColors()));
        table.push_back(Fixed("amstradCpc", ProfileKind::FixedNearest, AmstradCpcColors()));

        PaletteProfile original;
        original.name = "original";
        original.kind = ProfileKind::Passthrough;
        original.targetColors = 256;
        original.depthMode = ColorDepthMode::RGB555;
        table.push_back(original);
        return table;
    }
}

const std::vector<PaletteProfile>& ProfileTable() {
    static const std::vector<PaletteProfile> table = BuildTable();
    return table;
}

const PaletteProfile* FindProfile(const std::string& name) {
    for (const auto& p : ProfileTable()) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

std::vector<std::string> ProfileNames() {
    std::vector<std::string> names;
    for (const auto& p : ProfileTable()) names.push_back(p.name);
    return names;
}
