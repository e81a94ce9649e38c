#include <ici_image/image_wrapper.hpp>
#include <ici_image/overloaded.hpp>

#include <string>
#include <utility>

namespace ici_image {

std::uint8_t image_wrapper::width() const noexcept {
    return std::visit([](const auto& image) { return image.width(); }, image_);
}

std::uint8_t image_wrapper::height() const noexcept {
    return std::visit([](const auto& image) { return image.height(); }, image_);
}

const file_palette& image_wrapper::palette() const noexcept {
    return std::visit([](const auto& image) -> const file_palette& { return image.palette(); },
                      image_);
}

std::span<const color> image_wrapper::colors() const noexcept {
    return std::visit([](const auto& image) { return image.colors(); }, image_);
}

std::uint8_t image_wrapper::frame_count() const noexcept {
    return std::visit(overloaded{
        [](const static_image&) -> std::uint8_t { return 1; },
        [](const animated_image& image) { return image.frame_count(); },
    }, image_);
}

status image_wrapper::get_frame(std::size_t index, std::span<const std::uint8_t>& out) const {
    return std::visit(overloaded{
        [&](const static_image& image) {
            if (index != 0) {
                return status::failure(error_code::index_out_of_range,
                    "Frame " + std::to_string(index) + " outside static image");
            }
            out = image.pixels();
            return status::success();
        },
        [&](const animated_image& image) { return image.get_frame(index, out); },
    }, image_);
}

std::span<const std::uint8_t> image_wrapper::pixels() const noexcept {
    return std::visit([](const auto& image) { return image.pixels(); }, image_);
}

std::size_t image_wrapper::min_palette_size() const noexcept {
    return std::visit([](const auto& image) { return image.min_palette_size(); }, image_);
}

status image_wrapper::get_pixel_index(int x, int y, std::size_t& out) const {
    return std::visit([&](const auto& image) { return image.get_pixel_index(x, y, out); },
                      image_);
}

status image_wrapper::get_color(std::size_t index, color& out) const {
    return std::visit([&](const auto& image) { return image.get_color(index, out); }, image_);
}

status image_wrapper::set_color(std::size_t index, const color& c) {
    return std::visit([&](auto& image) { return image.set_color(index, c); }, image_);
}

// ============================================================================
// Palette replacement
// ============================================================================

status image_wrapper::set_palette(file_palette palette) {
    return std::visit([&](auto& image) { return image.set_palette(std::move(palette)); },
                      image_);
}

status image_wrapper::set_colors(std::vector<color> colors) {
    return std::visit([&](auto& image) { return image.set_colors(std::move(colors)); }, image_);
}

status image_wrapper::set_colors_replace_id(std::vector<color> colors, std::uint8_t id) {
    return std::visit([&](auto& image) {
        return image.set_colors_replace_id(std::move(colors), id);
    }, image_);
}

status image_wrapper::set_colors_replace_color(std::vector<color> colors, const color& fill) {
    return std::visit([&](auto& image) {
        return image.set_colors_replace_color(std::move(colors), fill);
    }, image_);
}

void image_wrapper::tint_add(int dr, int dg, int db, int da) {
    std::visit([=](auto& image) { image.tint_add(dr, dg, db, da); }, image_);
}

void image_wrapper::tint_mul(float mr, float mg, float mb, float ma) {
    std::visit([=](auto& image) { image.tint_mul(mr, mg, mb, ma); }, image_);
}

status image_wrapper::tint_palette_add(std::span<const std::array<int, 4>> offsets) {
    return std::visit([offsets](auto& image) { return image.tint_palette_add(offsets); },
                      image_);
}

status image_wrapper::tint_palette_mul(std::span<const std::array<float, 4>> factors) {
    return std::visit([factors](auto& image) { return image.tint_palette_mul(factors); },
                      image_);
}

std::vector<std::uint8_t> image_wrapper::encode() const {
    return std::visit([](const auto& image) { return image.encode(); }, image_);
}

// ============================================================================
// Transforms
// ============================================================================

void image_wrapper::flip(flip_axis axis) noexcept {
    std::visit([axis](auto& image) { image.flip(axis); }, image_);
}

status image_wrapper::rotate(rotation rot) {
    return std::visit([rot](auto& image) { return image.rotate(rot); }, image_);
}

status image_wrapper::remap_index(std::uint8_t from, std::uint8_t to) {
    return std::visit([=](auto& image) { return image.remap_index(from, to); }, image_);
}

image_wrapper image_wrapper::flipped(flip_axis axis) const {
    image_wrapper copy = *this;
    copy.flip(axis);
    return copy;
}

status image_wrapper::rotated(rotation rot, image_wrapper& out) const {
    image_wrapper copy = *this;
    auto result = copy.rotate(rot);
    if (!result) {
        return result;
    }
    out = std::move(copy);
    return status::success();
}

// ============================================================================
// Playback
// ============================================================================

void image_wrapper::update(double delta) noexcept {
    if (auto* image = as_animated()) {
        image->update(delta);
    }
}

void image_wrapper::reset() noexcept {
    if (auto* image = as_animated()) {
        image->reset();
    }
}

void image_wrapper::set_animate(bool animate) noexcept {
    if (auto* image = as_animated()) {
        image->set_animate(animate);
    }
}

bool image_wrapper::animating() const noexcept {
    const auto* image = as_animated();
    return image != nullptr && image->animating();
}

} // namespace ici_image
