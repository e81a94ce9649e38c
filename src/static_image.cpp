#include <ici_image/static_image.hpp>
#include "decode_helpers.hpp"
#include "palette_block.hpp"

#include <algorithm>
#include <utility>

namespace ici_image {

static_image::static_image()
    : pixels_(1, 0) {}

static_image::static_image(std::uint8_t width, std::uint8_t height, image_palette palette,
                           std::vector<std::uint8_t> pixels)
    : width_(width),
      height_(height),
      palette_(std::move(palette)),
      pixels_(std::move(pixels)) {}

status static_image::create(std::uint8_t width, std::uint8_t height,
                            file_palette palette,
                            std::vector<std::uint8_t> pixels,
                            static_image& out) {
    auto result = validate_dimensions(width, height);
    if (!result) {
        return result;
    }

    const std::size_t expected = frame_size(width, height);
    if (pixels.size() != expected) {
        return status::failure(error_code::dimension_mismatch,
            "Expected " + std::to_string(expected) + " pixels for " +
            std::to_string(width) + "x" + std::to_string(height) + ", got " +
            std::to_string(pixels.size()));
    }

    result = validate_palette(palette);
    if (!result) {
        return result;
    }

    out = create_unchecked(width, height, std::move(palette), std::move(pixels));
    return status::success();
}

static_image static_image::create_unchecked(std::uint8_t width, std::uint8_t height,
                                            file_palette palette,
                                            std::vector<std::uint8_t> pixels) {
    image_palette full(std::move(palette), pixels);
    return static_image(width, height, std::move(full), std::move(pixels));
}

static_image static_image::create_unchecked(std::uint8_t width, std::uint8_t height,
                                            image_palette palette,
                                            std::vector<std::uint8_t> pixels) {
    return static_image(width, height, std::move(palette), std::move(pixels));
}

// ============================================================================
// Codec
// ============================================================================

status static_image::decode(std::span<const std::uint8_t> data,
                            static_image& out,
                            const decode_options& options) {
    if (data.size() < DIMENSIONS_SIZE) {
        return status::failure(error_code::unexpected_eof,
            "Image data too small: expected width and height");
    }

    const std::uint8_t width = data[0];
    const std::uint8_t height = data[1];
    auto result = validate_dimensions(width, height);
    if (!result) {
        return result;
    }

    std::size_t offset = DIMENSIONS_SIZE;
    file_palette palette;
    result = read_palette_block(data, offset, palette);
    if (!result) {
        return result;
    }

    const std::size_t expected = frame_size(width, height);
    const std::size_t available = data.size() - offset;
    if (available < expected) {
        return status::failure(error_code::unexpected_eof,
            "Incomplete pixel data, found " + std::to_string(available) +
            " bytes but expected " + std::to_string(expected));
    }
    if (available > expected && !options.allow_trailing_data) {
        return status::failure(error_code::dimension_mismatch,
            "Pixel data has " + std::to_string(available - expected) +
            " bytes past " + std::to_string(width) + "x" + std::to_string(height));
    }

    const auto pixel_bytes = data.subspan(offset, expected);
    out = create_unchecked(width, height, std::move(palette),
                           std::vector<std::uint8_t>(pixel_bytes.begin(), pixel_bytes.end()));
    return status::success();
}

std::vector<std::uint8_t> static_image::encode() const {
    std::vector<std::uint8_t> out;
    encode(out);
    return out;
}

void static_image::encode(std::vector<std::uint8_t>& out) const {
    out.reserve(out.size() + DIMENSIONS_SIZE + pixels_.size() + 2);
    out.push_back(width_);
    out.push_back(height_);
    write_palette_block(palette_.declared(), out);
    out.insert(out.end(), pixels_.begin(), pixels_.end());
}

// ============================================================================
// Accessors
// ============================================================================

std::size_t static_image::min_palette_size() const noexcept {
    return ici_image::min_palette_size(pixels_);
}

status static_image::get_pixel_index(int x, int y, std::size_t& out) const {
    return pixel_index(x, y, width_, height_, out);
}

status static_image::get_pixel(std::size_t index, std::uint8_t& out) const {
    if (index >= pixels_.size()) {
        return status::failure(error_code::index_out_of_range,
            "Pixel " + std::to_string(index) + " outside image of " +
            std::to_string(pixels_.size()) + " pixels");
    }
    out = pixels_[index];
    return status::success();
}

status static_image::set_pixel(std::size_t index, std::uint8_t value) {
    if (index >= pixels_.size()) {
        return status::failure(error_code::index_out_of_range,
            "Pixel " + std::to_string(index) + " outside image of " +
            std::to_string(pixels_.size()) + " pixels");
    }
    if (value >= palette_.size()) {
        return status::failure(error_code::index_out_of_range,
            "Palette index " + std::to_string(value) + " outside palette of " +
            std::to_string(palette_.size()) + " colors");
    }
    pixels_[index] = value;
    return status::success();
}

// ============================================================================
// Palette replacement
// ============================================================================

status static_image::set_palette(file_palette palette) {
    return palette_.set_declared(std::move(palette), pixels_);
}

status static_image::set_colors(std::vector<color> colors) {
    return palette_.set_colors(std::move(colors), min_palette_size());
}

status static_image::set_colors_replace_id(std::vector<color> colors, std::uint8_t id) {
    if (id >= colors.size()) {
        return status::failure(error_code::index_out_of_range,
            "Replacement index " + std::to_string(id) + " outside new palette of " +
            std::to_string(colors.size()) + " colors");
    }

    std::vector<std::uint8_t> replaced = pixels_;
    const std::size_t limit = colors.size();
    for (auto& p : replaced) {
        if (p >= limit) {
            p = id;
        }
    }

    auto result = palette_.set_colors(std::move(colors), ici_image::min_palette_size(replaced));
    if (!result) {
        return result;
    }
    pixels_ = std::move(replaced);
    return status::success();
}

status static_image::set_colors_replace_color(std::vector<color> colors, const color& fill) {
    const std::size_t needed = min_palette_size();
    if (colors.size() < needed) {
        colors.resize(needed, fill);
    }
    return palette_.set_colors(std::move(colors), needed);
}

// ============================================================================
// Transforms
// ============================================================================

void static_image::flip(flip_axis axis) noexcept {
    flip_pixels(pixels_, width_, height_, axis);
}

status static_image::rotate(rotation rot) {
    auto result = check_rotation(width_, height_, rot);
    if (!result) {
        return result;
    }

    const auto size = rotate_size(width_, height_, rot);
    std::vector<std::uint8_t> rotated(pixels_.size());
    rotate_pixels(pixels_, rotated, width_, height_, rot);

    width_ = static_cast<std::uint8_t>(size.width);
    height_ = static_cast<std::uint8_t>(size.height);
    pixels_ = std::move(rotated);
    return status::success();
}

status static_image::remap_index(std::uint8_t from, std::uint8_t to) {
    if (to >= palette_.size()) {
        return status::failure(error_code::index_out_of_range,
            "Palette index " + std::to_string(to) + " outside palette of " +
            std::to_string(palette_.size()) + " colors");
    }
    replace_index(pixels_, from, to);
    return status::success();
}

} // namespace ici_image
