// Lucent - Palette Extraction

#include <lucent/palette.h>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace lucent {

// =============================================================================
// Palette
// =============================================================================

Palette Palette::defaults() {
    Palette p;
    p.dominant = Color::fromHex(0x22cc88);
    p.secondary = Color::fromHex(0xcc2288);
    p.colors = {
        Color::fromHex(0x22cc88),
        Color::fromHex(0xcc2288),
        Color::fromHex(0x2266cc),
        Color::fromHex(0xffaa00),
    };
    return p;
}

Palette Palette::fromColors(std::vector<Color> colors) {
    if (colors.empty()) {
        throw std::invalid_argument("Palette::fromColors: no colours");
    }

    std::vector<Color> sorted = colors;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Color& a, const Color& b) {
        return a.relativeLuminance() > b.relativeLuminance();
    });

    Palette p;
    p.dominant = colors[0];
    p.secondary = sorted[sorted.size() / 2];
    p.colors = std::move(colors);
    return p;
}

Color Palette::at(size_t index) const {
    if (index < colors.size()) {
        return colors[index];
    }
    return colors.empty() ? dominant : colors.back();
}

bool Palette::operator==(const Palette& other) const {
    return dominant == other.dominant && secondary == other.secondary && colors == other.colors;
}

// =============================================================================
// PaletteExtractor
// =============================================================================

namespace {

struct Sample {
    float r, g, b;
};

float dist2(const Sample& a, const Sample& b) {
    float dx = a.r - b.r, dy = a.g - b.g, dz = a.b - b.b;
    return dx * dx + dy * dy + dz * dz;
}

} // namespace

PaletteExtractor::PaletteExtractor(int k)
    : m_k(k) {
    if (k <= 0) {
        throw std::invalid_argument("PaletteExtractor: k must be positive");
    }
}

std::vector<Color> PaletteExtractor::quantize(const io::ImageData& image) const {
    if (!image.valid()) {
        throw std::invalid_argument("PaletteExtractor: invalid image");
    }

    int height = static_cast<int>(std::lround(static_cast<double>(SAMPLE_WIDTH) * image.height / image.width));
    io::ImageData scaled = io::resizeBilinear(image, SAMPLE_WIDTH, std::max(1, height));

    std::vector<Sample> samples;
    const size_t pixelCount = static_cast<size_t>(scaled.width) * scaled.height;
    samples.reserve(pixelCount / SAMPLE_STRIDE + 1);
    for (size_t i = 0; i < pixelCount; i += SAMPLE_STRIDE) {
        const uint8_t* px = &scaled.pixels[i * 4];
        samples.push_back({float(px[0]), float(px[1]), float(px[2])});
    }

    std::vector<Sample> means(m_k);
    for (int i = 0; i < m_k; ++i) {
        means[i] = samples[(static_cast<size_t>(i) * SEED_STRIDE) % samples.size()];
    }

    std::vector<Sample> sums(m_k);
    std::vector<size_t> counts(m_k);
    for (int iter = 0; iter < ITERATIONS; ++iter) {
        std::fill(sums.begin(), sums.end(), Sample{0, 0, 0});
        std::fill(counts.begin(), counts.end(), 0);

        for (const auto& s : samples) {
            int best = 0;
            float bestDist = 1e9f;
            for (int i = 0; i < m_k; ++i) {
                float d = dist2(s, means[i]);
                if (d < bestDist) {
                    bestDist = d;
                    best = i;
                }
            }
            sums[best].r += s.r;
            sums[best].g += s.g;
            sums[best].b += s.b;
            counts[best]++;
        }

        for (int i = 0; i < m_k; ++i) {
            // Empty clusters keep their previous centroid
            if (counts[i] == 0) continue;
            float n = static_cast<float>(counts[i]);
            means[i] = {sums[i].r / n, sums[i].g / n, sums[i].b / n};
        }
    }

    std::vector<Color> colors;
    colors.reserve(m_k);
    for (const auto& m : means) {
        colors.push_back(Color::fromBytes(
            static_cast<uint8_t>(std::lround(std::clamp(m.r, 0.0f, 255.0f))),
            static_cast<uint8_t>(std::lround(std::clamp(m.g, 0.0f, 255.0f))),
            static_cast<uint8_t>(std::lround(std::clamp(m.b, 0.0f, 255.0f)))));
    }
    return colors;
}

Palette PaletteExtractor::extract(const io::ImageData& image) const {
    return Palette::fromColors(quantize(image));
}

Palette PaletteExtractor::fromSource(const std::string& source) const {
    return extract(io::fetchImage(source));
}

std::future<Palette> PaletteExtractor::fromSourceAsync(const std::string& source) const {
    PaletteExtractor extractor = *this;
    return std::async(std::launch::async, [extractor, source]() {
        return extractor.fromSource(source);
    });
}

} // namespace lucent
