/**
 * @file test_palette_extractor.cpp
 * @brief Unit tests for k-means palette extraction
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <lucent/palette.h>
#include <lucent/io/image_loader.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace lucent;
using Catch::Matchers::WithinAbs;
namespace fs = std::filesystem;

namespace {

io::ImageData makeImage(int width, int height, const std::function<Color(int, int)>& fill) {
    io::ImageData image;
    image.width = width;
    image.height = height;
    image.channels = 4;
    image.pixels.resize(static_cast<size_t>(width) * height * 4);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            Color c = fill(x, y);
            uint8_t* px = &image.pixels[(static_cast<size_t>(y) * width + x) * 4];
            px[0] = Color::toByte(c.r);
            px[1] = Color::toByte(c.g);
            px[2] = Color::toByte(c.b);
            px[3] = 255;
        }
    }
    return image;
}

void putLE(std::vector<uint8_t>& out, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

// Uncompressed 24-bit BMP, which stb_image decodes
std::vector<uint8_t> encodeBmp(const io::ImageData& image) {
    const uint32_t rowSize = (static_cast<uint32_t>(image.width) * 3 + 3) & ~3u;
    const uint32_t dataSize = rowSize * static_cast<uint32_t>(image.height);

    std::vector<uint8_t> out;
    out.push_back('B');
    out.push_back('M');
    putLE(out, 54 + dataSize, 4);
    putLE(out, 0, 4);
    putLE(out, 54, 4);
    putLE(out, 40, 4);
    putLE(out, static_cast<uint32_t>(image.width), 4);
    putLE(out, static_cast<uint32_t>(image.height), 4);
    putLE(out, 1, 2);
    putLE(out, 24, 2);
    putLE(out, 0, 4);
    putLE(out, dataSize, 4);
    putLE(out, 2835, 4);
    putLE(out, 2835, 4);
    putLE(out, 0, 4);
    putLE(out, 0, 4);

    // Rows are stored bottom-up in BGR order
    for (int y = image.height - 1; y >= 0; --y) {
        uint32_t written = 0;
        for (int x = 0; x < image.width; ++x) {
            const uint8_t* px = &image.pixels[(static_cast<size_t>(y) * image.width + x) * 4];
            out.push_back(px[2]);
            out.push_back(px[1]);
            out.push_back(px[0]);
            written += 3;
        }
        for (; written < rowSize; ++written) {
            out.push_back(0);
        }
    }
    return out;
}

fs::path writeTempBmp(const std::string& name, const io::ImageData& image) {
    fs::path path = fs::temp_directory_path() / name;
    std::vector<uint8_t> bytes = encodeBmp(image);
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return path;
}

Color splitRedBlue(int x, int width) {
    return x < width / 2 ? Color::fromHex(0xff0000) : Color::fromHex(0x0000ff);
}

} // namespace

TEST_CASE("PaletteExtractor returns exactly k colours", "[palette][extractor]") {
    auto gradient = [](int x, int y) {
        return Color(x / 40.0f, y / 40.0f, 0.5f);
    };

    SECTION("default k on a 16x16 image") {
        PaletteExtractor extractor;
        REQUIRE(extractor.quantize(makeImage(16, 16, gradient)).size() == 8);
    }

    SECTION("non-square image") {
        PaletteExtractor extractor;
        REQUIRE(extractor.quantize(makeImage(17, 40, gradient)).size() == 8);
    }

    SECTION("custom k") {
        PaletteExtractor extractor(3);
        REQUIRE(extractor.quantize(makeImage(40, 17, gradient)).size() == 3);
    }

    SECTION("solid image collapses to one colour") {
        PaletteExtractor extractor;
        auto colors = extractor.quantize(makeImage(32, 32, [](int, int) { return Color::fromHex(0x336699); }));
        REQUIRE(colors.size() == 8);
        for (const auto& c : colors) {
            REQUIRE(c.toHex() == "#336699");
        }
    }
}

TEST_CASE("PaletteExtractor quantization is deterministic", "[palette][extractor]") {
    auto image = makeImage(48, 32, [](int x, int y) {
        return Color((x * 7 % 48) / 48.0f, (y * 5 % 32) / 32.0f, ((x + y) % 16) / 16.0f);
    });

    PaletteExtractor extractor;
    auto first = extractor.quantize(image);
    auto second = extractor.quantize(image);
    REQUIRE(first == second);
}

TEST_CASE("PaletteExtractor dominant follows cluster order", "[palette][extractor]") {
    auto image = makeImage(64, 64, [](int x, int) { return splitRedBlue(x, 64); });

    PaletteExtractor extractor;
    Palette palette = extractor.extract(image);

    // Sample 0 is the top-left pixel, so the first centroid stays red
    REQUIRE(palette.colors.size() == 8);
    REQUIRE(palette.dominant == palette.colors[0]);
    REQUIRE(palette.dominant.r > 0.9f);
    REQUIRE(palette.dominant.b < 0.1f);
}

TEST_CASE("PaletteExtractor rejects bad input", "[palette][extractor]") {
    REQUIRE_THROWS_AS(PaletteExtractor(0), std::invalid_argument);

    PaletteExtractor extractor;
    REQUIRE_THROWS_AS(extractor.quantize(io::ImageData{}), std::invalid_argument);
    REQUIRE_THROWS_AS(extractor.fromSource("/definitely/not/here.png"), std::runtime_error);
    REQUIRE_THROWS_AS(extractor.fromSource(""), std::runtime_error);
}

TEST_CASE("PaletteExtractor loads local files", "[palette][extractor][io]") {
    auto image = makeImage(16, 16, [](int x, int) { return splitRedBlue(x, 16); });
    fs::path path = writeTempBmp("lucent_palette_test.bmp", image);

    PaletteExtractor extractor;

    SECTION("plain path") {
        Palette palette = extractor.fromSource(path.string());
        REQUIRE(palette.colors.size() == 8);
        REQUIRE(palette.dominant.r > 0.9f);
    }

    SECTION("file:// URL") {
        Palette palette = extractor.fromSource("file://" + path.string());
        REQUIRE(palette.colors.size() == 8);
    }

    SECTION("async variant") {
        auto future = extractor.fromSourceAsync(path.string());
        Palette palette = future.get();
        REQUIRE(palette == extractor.fromSource(path.string()));
    }

    fs::remove(path);
}

TEST_CASE("Palette secondary is the median by luminance", "[palette]") {
    Color black = Color::fromHex(0x000000);
    Color white = Color::fromHex(0xffffff);
    Color red = Color::fromHex(0xff0000);
    Color blue = Color::fromHex(0x0000ff);

    Palette palette = Palette::fromColors({black, white, red, blue});

    // Sorted by luminance: white, red, blue, black
    REQUIRE(palette.dominant == black);
    REQUIRE(palette.secondary == blue);
    REQUIRE(palette.colors.size() == 4);

    SECTION("at() falls back to the last colour") {
        REQUIRE(palette.at(1) == white);
        REQUIRE(palette.at(10) == blue);
    }

    SECTION("empty input is rejected") {
        REQUIRE_THROWS_AS(Palette::fromColors({}), std::invalid_argument);
    }
}

TEST_CASE("Palette defaults", "[palette]") {
    Palette palette = Palette::defaults();
    REQUIRE(palette.dominant.toHex() == "#22cc88");
    REQUIRE(palette.secondary.toHex() == "#cc2288");
    REQUIRE(palette.colors.size() == 4);
}

TEST_CASE("resizeBilinear", "[io]") {
    auto image = makeImage(2, 2, [](int x, int y) {
        return (x + y) % 2 == 0 ? Color(1.0f, 1.0f, 1.0f) : Color(0.0f, 0.0f, 0.0f);
    });

    SECTION("output has the requested size") {
        io::ImageData out = io::resizeBilinear(image, 8, 6);
        REQUIRE(out.valid());
        REQUIRE(out.width == 8);
        REQUIRE(out.height == 6);
    }

    SECTION("corner pixels keep their source value") {
        io::ImageData out = io::resizeBilinear(image, 8, 8);
        REQUIRE(out.pixels[0] == 255);
        REQUIRE(out.pixels[(7 * 8 + 7) * 4] == 255);
        REQUIRE(out.pixels[7 * 4] == 0);
    }

    SECTION("invalid arguments throw") {
        REQUIRE_THROWS_AS(io::resizeBilinear(image, 0, 4), std::invalid_argument);
        REQUIRE_THROWS_AS(io::resizeBilinear(io::ImageData{}, 4, 4), std::invalid_argument);
    }
}
