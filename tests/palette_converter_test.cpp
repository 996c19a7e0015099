#include "palette_converter.h"
#include "depth_reduction.h"
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>

namespace {
    PixelBuffer FromColors(const std::vector<Color>& colors) {
        PixelBuffer pixels(static_cast<uint32_t>(colors.size()), 1);
        for (size_t i = 0; i < colors.size(); ++i) {
            pixels.data[i * 4 + 0] = colors[i].r;
            pixels.data[i * 4 + 1] = colors[i].g;
            pixels.data[i * 4 + 2] = colors[i].b;
            pixels.data[i * 4 + 3] = colors[i].a;
        }
        return pixels;
    }

    Color PixelAt(const PixelBuffer& pixels, size_t i) {
        return Color(pixels.data[i * 4], pixels.data[i * 4 + 1], pixels.data[i * 4 + 2], pixels.data[i * 4 + 3]);
    }

    PixelBuffer Gradient(uint32_t w, uint32_t h) {
        PixelBuffer pixels(w, h);
        for (uint32_t y = 0; y < h; ++y) {
            for (uint32_t x = 0; x < w; ++x) {
                uint8_t* px = &pixels.data[(size_t(y) * w + x) * 4];
                px[0] = uint8_t(x * 4);
                px[1] = uint8_t(y * 4);
                px[2] = uint8_t(255 - x * 2 - y);
                px[3] = 255;
            }
        }
        return pixels;
    }

    bool Contains(const Palette& palette, const Color& c) {
        for (const auto& p : palette) {
            if (p.r == c.r && p.g == c.g && p.b == c.b) return true;
        }
        return false;
    }

    ConversionRequest Request(const PixelBuffer& pixels, const std::string& profile) {
        ConversionRequest request;
        request.pixels = pixels;
        request.profile = profile;
        return request;
    }
}

// =================================================================================================
// Derived palettes
// =================================================================================================

TEST(PaletteConverter, FewColorsGiveACompactPalette) {
    const PixelBuffer pixels = FromColors({ Color(255, 0, 0), Color(0, 255, 0), Color(0, 0, 255), Color(255, 0, 0) });
    RetroPaletteConverter converter;
    const ProcessResult result = converter.Process(Request(pixels, "megadrive"));

    ASSERT_EQ(result.palette.size(), 3u);
    EXPECT_FALSE(result.usedFixedPalette);
    EXPECT_TRUE(Contains(result.palette, Color(255, 0, 0)));
    EXPECT_TRUE(Contains(result.palette, Color(0, 255, 0)));
    EXPECT_TRUE(Contains(result.palette, Color(0, 0, 255)));
    EXPECT_EQ(result.pixels.data, pixels.data);
}

TEST(PaletteConverter, WeightedThreeColorImageIsNotPadded) {
    std::vector<Color> colors;
    colors.insert(colors.end(), 100, Color(0, 0, 0));
    colors.insert(colors.end(), 50, Color(255, 0, 0));
    colors.insert(colors.end(), 25, Color(0, 255, 0));
    const ProcessResult result = RetroPaletteConverter().Process(Request(FromColors(colors), "megadrive"));

    ASSERT_EQ(result.palette.size(), 3u);
    EXPECT_EQ(result.palette[0], ReduceColor(Color(0, 0, 0), ColorDepthMode::RGB333));
    EXPECT_EQ(result.palette[1], ReduceColor(Color(255, 0, 0), ColorDepthMode::RGB333));
    EXPECT_EQ(result.palette[2], ReduceColor(Color(0, 255, 0), ColorDepthMode::RGB333));
}

TEST(PaletteConverter, FixedLengthLayoutPadsToTarget) {
    const PixelBuffer pixels = FromColors({ Color(255, 0, 0), Color(0, 255, 0), Color(0, 0, 255) });
    ConversionRequest request = Request(pixels, "megadrive");
    request.layout = PaletteLayout::FixedLength;
    const ProcessResult result = RetroPaletteConverter().Process(request);

    ASSERT_EQ(result.palette.size(), 16u);
    EXPECT_EQ(result.palette[3], Color(0, 0, 0));
    EXPECT_EQ(result.pixels.data, pixels.data);
}

TEST(PaletteConverter, PreservesSourcePaletteOrder) {
    const Palette source = { Color(250, 10, 10), Color(10, 250, 10), Color(10, 10, 250), Color(128, 128, 128) };
    ConversionRequest request = Request(FromColors(source), "masterSystem");
    request.sourcePalette = source;
    const ProcessResult result = RetroPaletteConverter().Process(request);

    ASSERT_EQ(result.palette.size(), source.size());
    for (size_t i = 0; i < source.size(); ++i) {
        EXPECT_EQ(result.palette[i], ReduceColor(source[i], ColorDepthMode::RGB222)) << "slot " << i;
        EXPECT_EQ(PixelAt(result.pixels, i), result.palette[i]) << "pixel " << i;
    }
    EXPECT_EQ(result.palette[3], Color(170, 170, 170));
}

TEST(PaletteConverter, PreservedPaletteCollisionsGetReplacements) {
    const Palette source = { Color(250, 0, 0), Color(240, 0, 0) };
    ConversionRequest request = Request(FromColors({ Color(250, 0, 0), Color(240, 0, 0), Color(0, 250, 0) }), "masterSystem");
    request.sourcePalette = source;
    const ProcessResult result = RetroPaletteConverter().Process(request);

    ASSERT_EQ(result.palette.size(), 2u);
    EXPECT_EQ(result.palette[0], Color(255, 0, 0));
    EXPECT_EQ(result.palette[1], Color(0, 255, 0));
    EXPECT_EQ(PixelAt(result.pixels, 0), Color(255, 0, 0));
    EXPECT_EQ(PixelAt(result.pixels, 1), Color(255, 0, 0));
    EXPECT_EQ(PixelAt(result.pixels, 2), Color(0, 255, 0));
}

TEST(PaletteConverter, TransparentSourceEntryNeverDrawsOpaquePixels) {
    const Palette source = { Color(0, 0, 0, 0), Color(255, 255, 255) };
    ConversionRequest request = Request(FromColors({ Color(10, 10, 10), Color(250, 250, 250) }), "megadrive");
    request.sourcePalette = source;
    const ProcessResult result = RetroPaletteConverter().Process(request);

    ASSERT_EQ(result.palette.size(), 2u);
    EXPECT_EQ(result.palette[0], Color(0, 0, 0, 0));
    EXPECT_EQ(result.palette[1], Color(255, 255, 255));
    EXPECT_EQ(PixelAt(result.pixels, 0), Color(255, 255, 255));
    EXPECT_EQ(PixelAt(result.pixels, 1), Color(255, 255, 255));
}

TEST(PaletteConverter, PreservedPaletteFixedLengthPadsWithBlack) {
    const Palette source = { Color(255, 255, 255), Color(85, 0, 170) };
    ConversionRequest request = Request(FromColors(source), "masterSystem");
    request.sourcePalette = source;
    request.layout = PaletteLayout::FixedLength;
    const ProcessResult result = RetroPaletteConverter().Process(request);

    ASSERT_EQ(result.palette.size(), 16u);
    EXPECT_EQ(result.palette[0], Color(255, 255, 255));
    EXPECT_EQ(result.palette[1], Color(85, 0, 170));
    for (size_t i = 2; i < 16; ++i) EXPECT_EQ(result.palette[i], Color(0, 0, 0));
}

TEST(PaletteConverter, OversizedSourcePaletteIsIgnored) {
    Palette source;
    for (int i = 0; i < 20; ++i) source.emplace_back(uint8_t(i * 12), uint8_t(255 - i * 12), uint8_t(i * 5));
    ConversionRequest request = Request(Gradient(32, 32), "megadrive");
    request.sourcePalette = source;
    const ProcessResult result = RetroPaletteConverter().Process(request);
    EXPECT_LE(result.palette.size(), 16u);
    EXPECT_FALSE(result.palette.empty());
}

TEST(PaletteConverter, DerivedPaletteIsValidForTheHardware) {
    const PixelBuffer pixels = Gradient(64, 64);
    RetroPaletteConverter converter;
    const ProcessResult result = converter.Process(Request(pixels, "megadrive"));

    ASSERT_EQ(result.palette.size(), 16u);
    std::set<uint32_t> keys;
    for (const auto& c : result.palette) {
        keys.insert(c.Key());
        EXPECT_EQ(ReduceColor(c, ColorDepthMode::RGB333), c);
    }
    EXPECT_EQ(keys.size(), result.palette.size());
    for (size_t i = 0; i < result.pixels.PixelCount(); ++i) {
        ASSERT_TRUE(Contains(result.palette, PixelAt(result.pixels, i))) << "pixel " << i;
    }
}

TEST(PaletteConverter, ResultsAreDeterministic) {
    const PixelBuffer pixels = Gradient(48, 40);
    QuantizationConfig one;
    one.numThreads = 1;
    const ProcessResult a = RetroPaletteConverter(one).Process(Request(pixels, "gameGear"));
    const ProcessResult b = RetroPaletteConverter().Process(Request(pixels, "gameGear"));
    ASSERT_EQ(a.palette.size(), b.palette.size());
    for (size_t i = 0; i < a.palette.size(); ++i) EXPECT_EQ(a.palette[i], b.palette[i]);
    EXPECT_EQ(a.pixels.data, b.pixels.data);
}

TEST(PaletteConverter, FrequencyStrategyKeepsDominantColors) {
    PixelBuffer pixels = Gradient(40, 40);
    // Paint the top rows a single dominant color.
    for (size_t i = 0; i < 400; ++i) {
        pixels.data[i * 4 + 0] = 170;
        pixels.data[i * 4 + 1] = 85;
        pixels.data[i * 4 + 2] = 0;
    }
    const ProcessResult result = RetroPaletteConverter().Process(Request(pixels, "masterSystem"));
    EXPECT_LE(result.palette.size(), 16u);
    EXPECT_TRUE(Contains(result.palette, Color(170, 85, 0)));
    EXPECT_EQ(PixelAt(result.pixels, 0), Color(170, 85, 0));
}

TEST(PaletteConverter, TransparentPixelsAreNeverRewritten) {
    const Color hidden(12, 34, 56, 0);
    const PixelBuffer pixels = FromColors({ Color(200, 30, 30), hidden, Color(30, 30, 200), Color(90, 200, 90) });
    RetroPaletteConverter converter;
    for (const char* profile : { "megadrive", "masterSystem", "cga1", "gameboy" }) {
        const ProcessResult result = converter.Process(Request(pixels, profile));
        EXPECT_EQ(PixelAt(result.pixels, 1), hidden) << profile;
    }
}

TEST(PaletteConverter, FullyTransparentImage) {
    const PixelBuffer pixels(4, 4);
    const ProcessResult result = RetroPaletteConverter().Process(Request(pixels, "megadrive"));
    EXPECT_TRUE(result.palette.empty());
    EXPECT_EQ(result.pixels.data, pixels.data);
}

TEST(PaletteConverter, ProgressIsMonotonicAndEndsAtHundred) {
    for (const char* profile : { "megadrive", "cga1", "original" }) {
        std::vector<int> seen;
        ConversionRequest request = Request(Gradient(40, 30), profile);
        request.progress = [&seen](int p) { seen.push_back(p); };
        RetroPaletteConverter().Process(request);

        ASSERT_FALSE(seen.empty()) << profile;
        EXPECT_EQ(seen.front(), 0) << profile;
        EXPECT_EQ(seen.back(), 100) << profile;
        for (size_t i = 1; i < seen.size(); ++i) EXPECT_GT(seen[i], seen[i - 1]) << profile;
    }
}

TEST(PaletteConverter, RejectsBadInput) {
    RetroPaletteConverter converter;
    PixelBuffer broken(4, 4);
    broken.data.resize(10);
    EXPECT_THROW(converter.Process(Request(broken, "megadrive")), std::invalid_argument);
    EXPECT_THROW(converter.Process(Request(PixelBuffer(2, 2), "snes")), std::invalid_argument);
}

// =================================================================================================
// Fixed palettes
// =================================================================================================

TEST(PaletteConverter, LuminanceBandsForHandhelds) {
    const PixelBuffer pixels = FromColors({ Color(0, 0, 0), Color(255, 255, 255), Color(100, 100, 100), Color(160, 160, 160) });
    const ProcessResult result = RetroPaletteConverter().Process(Request(pixels, "gameboy"));
    const Palette& shades = FindProfile("gameboy")->fixedColors;

    EXPECT_TRUE(result.usedFixedPalette);
    ASSERT_EQ(result.palette.size(), 4u);
    EXPECT_EQ(PixelAt(result.pixels, 0), shades[0]);
    EXPECT_EQ(PixelAt(result.pixels, 1), shades[3]);
    EXPECT_EQ(PixelAt(result.pixels, 2), shades[1]); // 39%
    EXPECT_EQ(PixelAt(result.pixels, 3), shades[2]); // 63%
}

TEST(PaletteConverter, LuminanceBandsNeedFourShades) {
    EXPECT_THROW(RetroPaletteConverter::ApplyLuminanceBands(PixelBuffer(1, 1), { Color(), Color(), Color() }),
        std::invalid_argument);
}

TEST(PaletteConverter, CustomColorsReplaceAFixedPalette) {
    const Palette custom = { Color(10, 0, 0), Color(20, 0, 0), Color(30, 0, 0), Color(40, 0, 0) };
    ConversionRequest request = Request(FromColors({ Color(255, 255, 255) }), "gameboy");
    request.customColors = custom;
    const ProcessResult result = RetroPaletteConverter().Process(request);
    ASSERT_EQ(result.palette.size(), 4u);
    EXPECT_EQ(result.palette[0], custom[0]);
    EXPECT_EQ(PixelAt(result.pixels, 0), custom[3]);

    // A custom palette of the wrong length is ignored.
    request.customColors = { Color(1, 2, 3) };
    EXPECT_EQ(RetroPaletteConverter().Process(request).palette, FindProfile("gameboy")->fixedColors);
}

TEST(PaletteConverter, NearestFixedColorByCiede2000) {
    const PixelBuffer pixels = FromColors({ Color(170, 0, 170), Color(255, 255, 255), Color(5, 5, 5) });
    const ProcessResult result = RetroPaletteConverter().Process(Request(pixels, "cga1"));
    EXPECT_TRUE(result.usedFixedPalette);
    EXPECT_EQ(PixelAt(result.pixels, 0), Color(170, 0, 170));
    EXPECT_EQ(PixelAt(result.pixels, 1), Color(170, 170, 170));
    EXPECT_EQ(PixelAt(result.pixels, 2), Color(0, 0, 0));
}

TEST(PaletteConverter, PassthroughKeepsPixels) {
    const PixelBuffer pixels = FromColors({ Color(1, 2, 3), Color(4, 5, 6), Color(1, 2, 3) });
    const ProcessResult result = RetroPaletteConverter().Process(Request(pixels, "original"));
    EXPECT_EQ(result.pixels.data, pixels.data);
    ASSERT_EQ(result.palette.size(), 2u);
    EXPECT_EQ(result.palette[0], Color(1, 2, 3));

    ConversionRequest withSource = Request(pixels, "original");
    withSource.sourcePalette = { Color(4, 5, 6), Color(1, 2, 3), Color(9, 9, 9) };
    EXPECT_EQ(RetroPaletteConverter().Process(withSource).palette, withSource.sourcePalette);
}

// =================================================================================================
// Collision repair
// =================================================================================================

TEST(RepairCollisions, DuplicateSlotIsReplacedInPlace) {
    const Color a(255, 0, 0), b(0, 0, 255), c(0, 255, 0, 255, 9);
    const RepairedPalette repaired = RepairCollisions({ a, a, b }, { c }, ColorDepthMode::RGB222, 3);

    ASSERT_EQ(repaired.palette.size(), 3u);
    EXPECT_EQ(repaired.palette[0], a);
    EXPECT_EQ(repaired.palette[1], Color(0, 255, 0));
    EXPECT_EQ(repaired.palette[2], b);
    EXPECT_EQ(repaired.slotOf, (std::vector<size_t>{ 0, 0, 2 }));
    EXPECT_EQ(repaired.added, (std::vector<size_t>{ 1 }));
}

TEST(RepairCollisions, TopsUpFromTheColorSpace) {
    const RepairedPalette repaired = RepairCollisions({ Color(0, 0, 0) }, { Color(0, 0, 0), Color(255, 255, 255) },
        ColorDepthMode::RGB222, 4);
    ASSERT_EQ(repaired.palette.size(), 4u);
    EXPECT_EQ(repaired.palette[1], Color(255, 255, 255));
    std::set<uint32_t> keys;
    for (const auto& c : repaired.palette) {
        keys.insert(c.Key());
        EXPECT_EQ(ReduceColor(c, ColorDepthMode::RGB222), c);
    }
    EXPECT_EQ(keys.size(), 4u);
    EXPECT_EQ(repaired.added, (std::vector<size_t>{ 1, 2, 3 }));
}

TEST(RepairCollisions, TransparentAndOpaqueOfTheSameRgbDoNotCollide) {
    const RepairedPalette repaired = RepairCollisions({ Color(0, 0, 0, 0), Color(0, 0, 0) }, {},
        ColorDepthMode::RGB333, 2);
    ASSERT_EQ(repaired.palette.size(), 2u);
    EXPECT_EQ(repaired.palette[0], Color(0, 0, 0, 0));
    EXPECT_EQ(repaired.palette[1], Color(0, 0, 0));
    EXPECT_EQ(repaired.slotOf, (std::vector<size_t>{ 0, 1 }));
    EXPECT_TRUE(repaired.added.empty());
}

TEST(RepairCollisions, DropsDuplicatesBeyondTheDesiredCount) {
    const Color a(85, 85, 85);
    const RepairedPalette repaired = RepairCollisions({ a, a }, {}, ColorDepthMode::RGB222, 1);
    ASSERT_EQ(repaired.palette.size(), 1u);
    EXPECT_EQ(repaired.slotOf, (std::vector<size_t>{ 0, 0 }));
    EXPECT_TRUE(repaired.added.empty());
}
