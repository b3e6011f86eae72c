// Lucent I/O - Image Loader Implementation

#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#include <lucent/io/image_loader.h>
#include <ixwebsocket/IXHttpClient.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace lucent::io {

ImageData loadImage(const std::string& path) {
    ImageData result;

    if (!fileExists(path)) {
        std::cerr << "[lucent-io] Image not found: " << path << std::endl;
        return result;
    }

    // Load with stb_image, forcing RGBA output
    int width, height, channels;
    unsigned char* data = stbi_load(path.c_str(), &width, &height, &channels, 4);

    if (!data) {
        std::cerr << "[lucent-io] Failed to load image: " << path
                  << " - " << stbi_failure_reason() << std::endl;
        return result;
    }

    result.width = width;
    result.height = height;
    result.channels = channels;
    result.pixels.assign(data, data + (static_cast<size_t>(width) * height * 4));

    stbi_image_free(data);
    return result;
}

ImageData loadImageFromMemory(const uint8_t* data, size_t size) {
    ImageData result;

    if (!data || size == 0) {
        std::cerr << "[lucent-io] Invalid memory buffer for image loading" << std::endl;
        return result;
    }

    int width, height, channels;
    unsigned char* pixels = stbi_load_from_memory(data, static_cast<int>(size), &width, &height, &channels, 4);

    if (!pixels) {
        std::cerr << "[lucent-io] Failed to decode image from memory - "
                  << stbi_failure_reason() << std::endl;
        return result;
    }

    result.width = width;
    result.height = height;
    result.channels = channels;
    result.pixels.assign(pixels, pixels + (static_cast<size_t>(width) * height * 4));

    stbi_image_free(pixels);
    return result;
}

bool isRemoteSource(const std::string& source) {
    return source.rfind("http://", 0) == 0 || source.rfind("https://", 0) == 0;
}

static ImageData fetchRemote(const std::string& url) {
    ix::HttpClient client;
    ix::HttpRequestArgsPtr args = client.createRequest();
    args->connectTimeout = 10;
    args->transferTimeout = 30;
    args->followRedirects = true;

    ix::HttpResponsePtr response = client.get(url, args);
    if (!response || response->errorCode != ix::HttpErrorCode::Ok) {
        std::string reason = response ? response->errorMsg : "no response";
        throw std::runtime_error("fetch failed for " + url + ": " + reason);
    }
    if (response->statusCode < 200 || response->statusCode >= 300) {
        throw std::runtime_error("fetch failed for " + url + ": HTTP " +
                                 std::to_string(response->statusCode));
    }

    const std::string& body = response->body;
    ImageData image = loadImageFromMemory(reinterpret_cast<const uint8_t*>(body.data()), body.size());
    if (!image.valid()) {
        throw std::runtime_error("could not decode image from " + url);
    }
    return image;
}

ImageData fetchImage(const std::string& source) {
    if (source.empty()) {
        throw std::runtime_error("empty image source");
    }
    if (isRemoteSource(source)) {
        return fetchRemote(source);
    }

    std::string path = source;
    if (path.rfind("file://", 0) == 0) {
        path = path.substr(7);
    }

    ImageData image = loadImage(path);
    if (!image.valid()) {
        throw std::runtime_error("could not load image " + path);
    }
    return image;
}

ImageData resizeBilinear(const ImageData& image, int width, int height) {
    if (!image.valid()) {
        throw std::invalid_argument("resizeBilinear: invalid source image");
    }
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("resizeBilinear: target size must be positive");
    }

    ImageData out;
    out.width = width;
    out.height = height;
    out.channels = image.channels;
    out.pixels.resize(static_cast<size_t>(width) * height * 4);

    float sx = static_cast<float>(image.width) / width;
    float sy = static_cast<float>(image.height) / height;

    for (int y = 0; y < height; ++y) {
        // Sample at pixel centres
        float fy = std::clamp((y + 0.5f) * sy - 0.5f, 0.0f, static_cast<float>(image.height - 1));
        int y0 = static_cast<int>(fy);
        int y1 = std::min(y0 + 1, image.height - 1);
        float ty = fy - y0;

        for (int x = 0; x < width; ++x) {
            float fx = std::clamp((x + 0.5f) * sx - 0.5f, 0.0f, static_cast<float>(image.width - 1));
            int x0 = static_cast<int>(fx);
            int x1 = std::min(x0 + 1, image.width - 1);
            float tx = fx - x0;

            const uint8_t* p00 = &image.pixels[(static_cast<size_t>(y0) * image.width + x0) * 4];
            const uint8_t* p10 = &image.pixels[(static_cast<size_t>(y0) * image.width + x1) * 4];
            const uint8_t* p01 = &image.pixels[(static_cast<size_t>(y1) * image.width + x0) * 4];
            const uint8_t* p11 = &image.pixels[(static_cast<size_t>(y1) * image.width + x1) * 4];
            uint8_t* dst = &out.pixels[(static_cast<size_t>(y) * width + x) * 4];

            for (int c = 0; c < 4; ++c) {
                float top = p00[c] + (p10[c] - p00[c]) * tx;
                float bottom = p01[c] + (p11[c] - p01[c]) * tx;
                float v = top + (bottom - top) * ty;
                dst[c] = static_cast<uint8_t>(std::lround(std::clamp(v, 0.0f, 255.0f)));
            }
        }
    }

    return out;
}

bool fileExists(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

} // namespace lucent::io
