#include <ici_image/animated_image.hpp>
#include "byte_io.hpp"
#include "decode_helpers.hpp"
#include "palette_block.hpp"

#include <cmath>
#include <utility>

namespace ici_image {

namespace {

constexpr float DEFAULT_FRAME_DURATION = 0.1f;

status validate_frame_duration(float seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0f) {
        return status::failure(error_code::invalid_value,
            "Frame duration must be a positive number of seconds, got " +
            std::to_string(seconds));
    }
    return status::success();
}

status validate_frame_count(std::size_t frame_count) {
    if (frame_count < 1 || frame_count > static_cast<std::size_t>(MAX_FRAME_COUNT)) {
        return status::count_out_of_range("Frame count", 1, MAX_FRAME_COUNT, frame_count);
    }
    return status::success();
}

} // namespace

animated_image::animated_image()
    : pixels_(1, 0) {}

animated_image::animated_image(std::uint8_t width, std::uint8_t height, float frame_duration,
                               std::uint8_t frame_count, image_palette palette,
                               std::vector<std::uint8_t> pixels)
    : width_(width),
      height_(height),
      frame_count_(frame_count),
      frame_duration_(frame_duration),
      palette_(std::move(palette)),
      pixels_(std::move(pixels)),
      next_frame_time_(frame_duration) {}

status animated_image::create(std::uint8_t width, std::uint8_t height,
                              float frame_duration, std::size_t frame_count,
                              file_palette palette,
                              std::vector<std::uint8_t> pixels,
                              animated_image& out) {
    auto result = validate_dimensions(width, height);
    if (!result) {
        return result;
    }
    result = validate_frame_count(frame_count);
    if (!result) {
        return result;
    }
    result = validate_frame_duration(frame_duration);
    if (!result) {
        return result;
    }

    const std::size_t expected = frame_count * ici_image::frame_size(width, height);
    if (pixels.size() != expected) {
        return status::failure(error_code::frame_size_mismatch,
            "Expected " + std::to_string(expected) + " pixels for " +
            std::to_string(frame_count) + " frames of " + std::to_string(width) + "x" +
            std::to_string(height) + ", got " + std::to_string(pixels.size()));
    }

    result = validate_palette(palette);
    if (!result) {
        return result;
    }

    out = create_unchecked(width, height, frame_duration,
                           static_cast<std::uint8_t>(frame_count),
                           std::move(palette), std::move(pixels));
    return status::success();
}

status animated_image::create(std::uint8_t width, std::uint8_t height,
                              float frame_duration,
                              file_palette palette,
                              const std::vector<std::vector<std::uint8_t>>& frames,
                              animated_image& out) {
    auto result = validate_frame_count(frames.size());
    if (!result) {
        return result;
    }

    const std::size_t size = ici_image::frame_size(width, height);
    std::vector<std::uint8_t> pixels;
    pixels.reserve(size * frames.size());
    for (std::size_t i = 0; i < frames.size(); ++i) {
        if (frames[i].size() != size) {
            return status::failure(error_code::frame_size_mismatch,
                "Frame " + std::to_string(i) + " has " + std::to_string(frames[i].size()) +
                " pixels, expected " + std::to_string(size));
        }
        pixels.insert(pixels.end(), frames[i].begin(), frames[i].end());
    }

    return create(width, height, frame_duration, frames.size(), std::move(palette),
                  std::move(pixels), out);
}

animated_image animated_image::create_unchecked(std::uint8_t width, std::uint8_t height,
                                                float frame_duration,
                                                std::uint8_t frame_count,
                                                file_palette palette,
                                                std::vector<std::uint8_t> pixels) {
    image_palette full(std::move(palette), pixels);
    return animated_image(width, height, frame_duration, frame_count, std::move(full),
                          std::move(pixels));
}

// ============================================================================
// Codec
// ============================================================================

status animated_image::decode(std::span<const std::uint8_t> data,
                              animated_image& out,
                              const decode_options& options) {
    constexpr std::size_t header_size = DIMENSIONS_SIZE + FRAME_COUNT_SIZE + FRAME_DURATION_SIZE;
    if (data.size() < header_size) {
        return status::failure(error_code::unexpected_eof,
            "Animated image data too small: expected width, height, frame count and duration");
    }

    const std::uint8_t width = data[0];
    const std::uint8_t height = data[1];
    auto result = validate_dimensions(width, height);
    if (!result) {
        return result;
    }

    const std::uint8_t frame_count = data[2];
    result = validate_frame_count(frame_count);
    if (!result) {
        return result;
    }

    const float frame_duration = read_le_f32(data.data() + DIMENSIONS_SIZE + FRAME_COUNT_SIZE);
    result = validate_frame_duration(frame_duration);
    if (!result) {
        return result;
    }

    std::size_t offset = header_size;
    file_palette palette;
    result = read_palette_block(data, offset, palette);
    if (!result) {
        return result;
    }

    const std::size_t expected = static_cast<std::size_t>(frame_count) *
                                 ici_image::frame_size(width, height);
    const std::size_t available = data.size() - offset;
    if (available < expected) {
        return status::failure(error_code::unexpected_eof,
            "Incomplete frame data, found " + std::to_string(available) +
            " bytes but expected " + std::to_string(expected));
    }
    if (available > expected && !options.allow_trailing_data) {
        return status::failure(error_code::frame_size_mismatch,
            "Frame data has " + std::to_string(available - expected) + " bytes past " +
            std::to_string(frame_count) + " frames of " + std::to_string(width) + "x" +
            std::to_string(height));
    }

    const auto pixel_bytes = data.subspan(offset, expected);
    out = create_unchecked(width, height, frame_duration, frame_count, std::move(palette),
                           std::vector<std::uint8_t>(pixel_bytes.begin(), pixel_bytes.end()));
    return status::success();
}

std::vector<std::uint8_t> animated_image::encode() const {
    std::vector<std::uint8_t> out;
    encode(out);
    return out;
}

void animated_image::encode(std::vector<std::uint8_t>& out) const {
    out.reserve(out.size() + DIMENSIONS_SIZE + FRAME_COUNT_SIZE + FRAME_DURATION_SIZE +
                pixels_.size() + 2);
    out.push_back(width_);
    out.push_back(height_);
    out.push_back(frame_count_);
    write_le_f32(out, frame_duration_);
    write_palette_block(palette_.declared(), out);
    out.insert(out.end(), pixels_.begin(), pixels_.end());
}

// ============================================================================
// Accessors
// ============================================================================

std::size_t animated_image::frame_size() const noexcept {
    return ici_image::frame_size(width_, height_);
}

std::size_t animated_image::min_palette_size() const noexcept {
    return ici_image::min_palette_size(pixels_);
}

status animated_image::set_frame_duration(float seconds) {
    auto result = validate_frame_duration(seconds);
    if (!result) {
        return result;
    }
    frame_duration_ = seconds;
    return status::success();
}

status animated_image::check_frame(std::size_t index) const {
    if (index >= frame_count_) {
        return status::failure(error_code::index_out_of_range,
            "Frame " + std::to_string(index) + " outside animation of " +
            std::to_string(frame_count_) + " frames");
    }
    return status::success();
}

status animated_image::get_frame(std::size_t index, std::span<const std::uint8_t>& out) const {
    auto result = check_frame(index);
    if (!result) {
        return result;
    }
    out = std::span<const std::uint8_t>(pixels_).subspan(index * frame_size(), frame_size());
    return status::success();
}

status animated_image::get_frame_image(std::size_t index, static_image& out) const {
    std::span<const std::uint8_t> frame;
    auto result = get_frame(index, frame);
    if (!result) {
        return result;
    }
    out = static_image::create_unchecked(width_, height_, palette_,
                                         std::vector<std::uint8_t>(frame.begin(), frame.end()));
    return status::success();
}

std::vector<static_image> animated_image::as_images() const {
    std::vector<static_image> images;
    images.reserve(frame_count_);
    const std::size_t size = frame_size();
    for (std::size_t i = 0; i < frame_count_; ++i) {
        const auto first = pixels_.begin() + static_cast<std::ptrdiff_t>(i * size);
        images.push_back(static_image::create_unchecked(
            width_, height_, palette_,
            std::vector<std::uint8_t>(first, first + static_cast<std::ptrdiff_t>(size))));
    }
    return images;
}

status animated_image::get_pixel_index(int x, int y, std::size_t& out) const {
    return pixel_index(x, y, width_, height_, out);
}

status animated_image::get_pixel(std::size_t frame, std::size_t index, std::uint8_t& out) const {
    auto result = check_frame(frame);
    if (!result) {
        return result;
    }
    if (index >= frame_size()) {
        return status::failure(error_code::index_out_of_range,
            "Pixel " + std::to_string(index) + " outside frame of " +
            std::to_string(frame_size()) + " pixels");
    }
    out = pixels_[frame * frame_size() + index];
    return status::success();
}

status animated_image::set_pixel(std::size_t frame, std::size_t index, std::uint8_t value) {
    auto result = check_frame(frame);
    if (!result) {
        return result;
    }
    if (index >= frame_size()) {
        return status::failure(error_code::index_out_of_range,
            "Pixel " + std::to_string(index) + " outside frame of " +
            std::to_string(frame_size()) + " pixels");
    }
    if (value >= palette_.size()) {
        return status::failure(error_code::index_out_of_range,
            "Palette index " + std::to_string(value) + " outside palette of " +
            std::to_string(palette_.size()) + " colors");
    }
    pixels_[frame * frame_size() + index] = value;
    return status::success();
}

// ============================================================================
// Palette replacement
// ============================================================================

status animated_image::set_palette(file_palette palette) {
    return palette_.set_declared(std::move(palette), pixels_);
}

status animated_image::set_colors(std::vector<color> colors) {
    return palette_.set_colors(std::move(colors), min_palette_size());
}

status animated_image::set_colors_replace_id(std::vector<color> colors, std::uint8_t id) {
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

status animated_image::set_colors_replace_color(std::vector<color> colors, const color& fill) {
    const std::size_t needed = min_palette_size();
    if (colors.size() < needed) {
        colors.resize(needed, fill);
    }
    return palette_.set_colors(std::move(colors), needed);
}

// ============================================================================
// Transforms
// ============================================================================

void animated_image::flip(flip_axis axis) noexcept {
    const std::size_t size = frame_size();
    std::span<std::uint8_t> all(pixels_);
    for (std::size_t i = 0; i < frame_count_; ++i) {
        flip_pixels(all.subspan(i * size, size), width_, height_, axis);
    }
}

status animated_image::rotate(rotation rot) {
    auto result = check_rotation(width_, height_, rot);
    if (!result) {
        return result;
    }

    const std::size_t size = frame_size();
    const auto dst_size = rotate_size(width_, height_, rot);
    std::vector<std::uint8_t> rotated(pixels_.size());
    std::span<const std::uint8_t> src(pixels_);
    std::span<std::uint8_t> dst(rotated);
    for (std::size_t i = 0; i < frame_count_; ++i) {
        rotate_pixels(src.subspan(i * size, size), dst.subspan(i * size, size),
                      width_, height_, rot);
    }

    width_ = static_cast<std::uint8_t>(dst_size.width);
    height_ = static_cast<std::uint8_t>(dst_size.height);
    pixels_ = std::move(rotated);
    return status::success();
}

status animated_image::remap_index(std::uint8_t from, std::uint8_t to) {
    if (to >= palette_.size()) {
        return status::failure(error_code::index_out_of_range,
            "Palette index " + std::to_string(to) + " outside palette of " +
            std::to_string(palette_.size()) + " colors");
    }
    replace_index(pixels_, from, to);
    return status::success();
}

// ============================================================================
// Playback
// ============================================================================

std::span<const std::uint8_t> animated_image::current_frame_pixels() const noexcept {
    return std::span<const std::uint8_t>(pixels_).subspan(current_frame_ * frame_size(),
                                                          frame_size());
}

void animated_image::reset() noexcept {
    const std::size_t last = static_cast<std::size_t>(frame_count_) - 1;
    switch (play_type_) {
        case play_type::once:
            current_frame_ = 0;
            animate_ = false;
            break;
        case play_type::once_reversed:
            current_frame_ = last;
            animate_ = false;
            break;
        case play_type::loops:
        case play_type::loops_both:
            current_frame_ = 0;
            animate_ = true;
            break;
        case play_type::loops_reversed:
            current_frame_ = last;
            animate_ = true;
            break;
    }
    loop_increasing_ = true;
    next_frame_time_ = frame_duration_;
}

void animated_image::set_play_type(play_type type) noexcept {
    play_type_ = type;
    reset();
}

void animated_image::reverse() noexcept {
    switch (play_type_) {
        case play_type::once:           play_type_ = play_type::once_reversed; break;
        case play_type::once_reversed:  play_type_ = play_type::once; break;
        case play_type::loops:          play_type_ = play_type::loops_reversed; break;
        case play_type::loops_reversed: play_type_ = play_type::loops; break;
        case play_type::loops_both:     loop_increasing_ = !loop_increasing_; break;
    }
}

void animated_image::update(double delta) noexcept {
    if (!animate_) {
        return;
    }

    if (next_frame_time_ < 0.0) {
        next_frame_time_ = frame_duration_;
        const std::size_t count = frame_count_;

        switch (play_type_) {
            case play_type::once:
                if (current_frame_ + 1 >= count) {
                    reset();
                } else {
                    ++current_frame_;
                }
                break;
            case play_type::once_reversed:
                if (current_frame_ > 0) {
                    --current_frame_;
                } else {
                    reset();
                }
                break;
            case play_type::loops:
                current_frame_ = (current_frame_ + 1) % count;
                break;
            case play_type::loops_reversed:
                current_frame_ = current_frame_ > 0 ? current_frame_ - 1 : count - 1;
                break;
            case play_type::loops_both:
                if (loop_increasing_) {
                    if (current_frame_ + 1 >= count) {
                        loop_increasing_ = false;
                        if (current_frame_ > 0) {
                            --current_frame_;
                        }
                    } else {
                        ++current_frame_;
                    }
                } else if (current_frame_ > 0) {
                    --current_frame_;
                } else {
                    loop_increasing_ = true;
                    if (count > 1) {
                        ++current_frame_;
                    }
                }
                break;
        }
    }

    next_frame_time_ -= delta;
}

bool operator==(const animated_image& lhs, const animated_image& rhs) {
    return lhs.width_ == rhs.width_ &&
           lhs.height_ == rhs.height_ &&
           lhs.frame_count_ == rhs.frame_count_ &&
           lhs.frame_duration_ == rhs.frame_duration_ &&
           lhs.palette_ == rhs.palette_ &&
           lhs.pixels_ == rhs.pixels_;
}

} // namespace ici_image
