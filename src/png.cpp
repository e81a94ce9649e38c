#include <ici_image/png.hpp>
#include <lodepng.h>

#include <span>

namespace ici_image {

namespace {

constexpr std::size_t RGBA_CHANNELS = 4;

std::vector<std::uint8_t> encode_indexed(std::span<const std::uint8_t> indices,
                                         std::span<const color> palette,
                                         unsigned width, unsigned height) {
    std::vector<std::uint8_t> rgba_pixels(indices.size() * RGBA_CHANNELS);
    auto* dst = rgba_pixels.data();

    for (std::size_t i = 0; i < indices.size(); ++i) {
        const std::size_t idx = indices[i];
        // Missing palette entry - leave transparent black
        if (idx < palette.size()) {
            const color& c = palette[idx];
            dst[i * 4 + 0] = c.r;
            dst[i * 4 + 1] = c.g;
            dst[i * 4 + 2] = c.b;
            dst[i * 4 + 3] = c.a;
        }
    }

    std::vector<std::uint8_t> png_data;
    unsigned error = lodepng::encode(png_data, rgba_pixels, width, height);
    if (error) {
        return {};
    }

    return png_data;
}

} // namespace

std::vector<std::uint8_t> encode_png(const static_image& image) {
    return encode_indexed(image.pixels(), image.colors(), image.width(), image.height());
}

std::vector<std::uint8_t> encode_png(const animated_image& image, std::size_t frame) {
    std::span<const std::uint8_t> indices;
    if (!image.get_frame(frame, indices)) {
        return {};
    }
    return encode_indexed(indices, image.colors(), image.width(), image.height());
}

} // namespace ici_image
