#include "palette_converter.h"
#include "png_indexed_encoder.h"
#include "request_coordinator.h"
#include "palette_profiles.h"
#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <filesystem>
#include <string>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

// --- Image loaded as 8-bit RGBA ---
class Image {
public:
    int width = 0;
    int height = 0;
    int channels = 0; // channel count of the file, the buffer is always RGBA
    PixelBuffer pixels;

    bool Load(const std::string& filename) {
        // Force 4 channels so every source lands in the engine's RGBA layout.
        uint8_t* data = stbi_load(filename.c_str(), &width, &height, &channels, 4);
        if (!data) {
            std::cerr << "Failed to load image: " << stbi_failure_reason() << std::endl;
            return false;
        }
        pixels = PixelBuffer(static_cast<uint32_t>(width), static_cast<uint32_t>(height));
        std::copy(data, data + pixels.data.size(), pixels.data.begin());
        stbi_image_free(data);

        std::cout << "Loaded " << filename << " (" << width << "x" << height
            << ", " << channels << " channels)" << std::endl;
        return true;
    }
};

bool SavePNG8(const std::string& filename, const ProcessResult& result) {
    if (result.palette.empty()) {
        std::cerr << "Nothing to save for " << filename << ": empty palette" << std::endl;
        return false;
    }
    std::vector<uint8_t> png = PngIndexedEncoder::EncodePNG8(result.pixels, result.palette);
    std::ofstream out(filename, std::ios::binary);
    if (!out) {
        std::cerr << "Failed to open " << filename << " for writing" << std::endl;
        return false;
    }
    out.write(reinterpret_cast<const char*>(png.data()), png.size());
    std::cout << "Saved " << filename << " (" << result.palette.size() << " colors, " << png.size() << " bytes)" << std::endl;
    return true;
}

// --- Convert one image with every profile directly ---
void ProcessImage(const fs::path& filePath, const RetroPaletteConverter& converter) {
    std::cout << "\n--- Processing: " << filePath.filename().string() << " ---\n";
    Image image;
    if (!image.Load(filePath.string())) return;

    static const char* profiles[] = { "megadrive", "megadrive61", "gameGear", "masterSystem",
        "gameboy", "cga1", "commodore64", "zxSpectrum", "amstradCpc" };

    for (const char* profile : profiles) {
        try {
            ConversionRequest request;
            request.pixels = image.pixels;
            request.profile = profile;

            auto start = std::chrono::high_resolution_clock::now();
            ProcessResult result = converter.Process(request);
            auto end = std::chrono::high_resolution_clock::now();
            std::cout << "Profile " << profile << " finished in " << std::fixed << std::setprecision(2)
                << std::chrono::duration<double>(end - start).count() << "s.\n";

            SavePNG8("output/" + filePath.stem().string() + "_" + profile + ".png", result);
        }
        catch (const std::exception& e) {
            std::cerr << "An error occurred during processing: " << e.what() << std::endl;
        }
    }
}

// --- Same conversion through the background coordinator, switching profiles quickly ---
void ProcessImageScheduled(const fs::path& filePath, RequestCoordinator& coordinator) {
    Image image;
    if (!image.Load(filePath.string())) return;

    const std::string stem = filePath.stem().string();
    coordinator.SetProgressHandler([](const ProgressEvent& e) {
        if (e.percent % 25 == 0) std::cout << "  job " << e.jobId << ": " << e.percent << "%" << std::endl;
    });
    coordinator.SetCompletionHandler([stem](const CompletedEvent& e) {
        SavePNG8("output/" + stem + "_scheduled_" + std::to_string(e.jobId) + ".png", e.result);
    });
    coordinator.SetFailureHandler([](const FailureEvent& e) {
        std::cerr << "Job " << e.jobId << " failed: " << e.message << std::endl;
    });

    // Only the first and the last of these actually run.
    for (const char* profile : { "masterSystem", "gameGear", "megadrive" }) {
        CoordinatorRequest request;
        request.conversion.pixels = image.pixels;
        request.conversion.profile = profile;
        request.sourceId = filePath.string();
        coordinator.Schedule(request);
    }
    if (!coordinator.WaitUntilIdle(std::chrono::minutes(5))) {
        std::cerr << "Timed out waiting for scheduled conversions" << std::endl;
    }
}

int main(int argc, char** argv) {
    try {
        QuantizationConfig config;
        config.verbose = argc > 1 && std::string(argv[1]) == "--verbose";
        RetroPaletteConverter converter(config);
        RequestCoordinator coordinator(config);
        std::cout << "Profile table v" << kProfileTableVersion << ": " << ProfileTable().size() << " profiles" << std::endl;

        fs::create_directory("output");
        std::string test_dir = "test_assets";
        if (!fs::exists(test_dir)) {
            std::cerr << "Error: Test directory '" << test_dir << "' not found." << std::endl; return 1;
        }
        for (const auto& file : fs::directory_iterator(test_dir)) {
            std::string ext = file.path().extension().string();
            std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
            if (ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".bmp" || ext == ".tga" || ext == ".gif") {
                ProcessImage(file.path(), converter);
                ProcessImageScheduled(file.path(), coordinator);
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << "A critical error occurred: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
