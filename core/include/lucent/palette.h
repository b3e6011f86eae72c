#pragma once

/**
 * @file palette.h
 * @brief Colour palettes and k-means palette extraction from album art
 */

#include <lucent/color.h>
#include <lucent/io/image_loader.h>
#include <future>
#include <string>
#include <vector>

namespace lucent {

/**
 * @brief Dominant, secondary and ordered representative colours
 *
 * Palettes are replaced wholesale; scenes copy what they need in setPalette().
 */
struct Palette {
    Color dominant;
    Color secondary;
    std::vector<Color> colors;

    /// @brief #22cc88 / #cc2288 with four representative colours
    static Palette defaults();

    /**
     * @brief Build a palette from quantized colours
     *
     * Dominant is colors[0]. Secondary is the middle element of a copy
     * stably sorted by descending relative luminance.
     *
     * @throws std::invalid_argument if @p colors is empty
     */
    static Palette fromColors(std::vector<Color> colors);

    /// @brief colors[index], falling back to the last colour (or dominant) when short
    Color at(size_t index) const;

    bool operator==(const Palette& other) const;
    bool operator!=(const Palette& other) const { return !(*this == other); }
};

/**
 * @brief Deterministic k-means quantizer
 *
 * The image is resampled to a width of 256 keeping its aspect ratio, every
 * 16th pixel is taken as a sample and k centroids are refined for a fixed
 * number of iterations. Centroid i starts at sample (i * 131) % sampleCount,
 * so identical pixels always give identical output order.
 */
class PaletteExtractor {
public:
    static constexpr int DEFAULT_K = 8;
    static constexpr int SAMPLE_WIDTH = 256;
    static constexpr int SAMPLE_STRIDE = 16;
    static constexpr int ITERATIONS = 10;
    static constexpr int SEED_STRIDE = 131;

    explicit PaletteExtractor(int k = DEFAULT_K);

    int k() const { return m_k; }

    /**
     * @brief Quantize decoded pixels to k colours (centroid order)
     * @throws std::invalid_argument if @p image is invalid
     */
    std::vector<Color> quantize(const io::ImageData& image) const;

    /**
     * @brief Quantize and pick dominant/secondary
     * @throws std::invalid_argument if @p image is invalid
     */
    Palette extract(const io::ImageData& image) const;

    /**
     * @brief Load an image from a path or URL and extract its palette
     * @throws std::runtime_error on load, network or decode failure
     */
    Palette fromSource(const std::string& source) const;

    /// @brief fromSource() on a background task
    std::future<Palette> fromSourceAsync(const std::string& source) const;

private:
    int m_k;
};

} // namespace lucent
