#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace lucent::io {

/// Result of loading an LDR image (8-bit per channel)
struct ImageData {
    std::vector<uint8_t> pixels;  ///< RGBA pixel data
    int width = 0;
    int height = 0;
    int channels = 0;             ///< Original channels before forced RGBA

    bool valid() const {
        return width > 0 && height > 0 &&
               pixels.size() == static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    }
};

/// Load an LDR image (PNG, JPG, BMP, TGA, etc.)
/// @param path Path to the image file
/// @return ImageData with RGBA pixels, or empty ImageData on failure
ImageData loadImage(const std::string& path);

/// Load an LDR image from a memory buffer (downloaded album art)
/// @param data Pointer to encoded image file data in memory (PNG, JPG, etc.)
/// @param size Size of the data in bytes
/// @return ImageData with RGBA pixels, or empty on failure
ImageData loadImageFromMemory(const uint8_t* data, size_t size);

/// Load an image from a local path, a file:// URL or an http(s):// URL
/// @throws std::runtime_error on network, HTTP status or decode failure
ImageData fetchImage(const std::string& source);

/// Bilinear resample to the given size
/// @throws std::invalid_argument if @p image is invalid or the size is not positive
ImageData resizeBilinear(const ImageData& image, int width, int height);

/// True for http:// and https:// sources
bool isRemoteSource(const std::string& source);

/// Check if a file exists
bool fileExists(const std::string& path);

} // namespace lucent::io
