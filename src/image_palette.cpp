#include <ici_image/image_palette.hpp>

#include <utility>

namespace ici_image {

image_palette::image_palette(file_palette declared, std::span<const std::uint8_t> pixels)
    : declared_(std::move(declared)),
      colors_(effective_colors(declared_, pixels)) {}

status image_palette::get_color(std::size_t index, color& out) const {
    if (index >= colors_.size()) {
        return status::failure(error_code::index_out_of_range,
            "Palette index " + std::to_string(index) + " outside palette of " +
            std::to_string(colors_.size()) + " colors");
    }
    out = colors_[index];
    return status::success();
}

status image_palette::set_color(std::size_t index, const color& c) {
    if (index >= colors_.size()) {
        return status::failure(error_code::index_out_of_range,
            "Palette index " + std::to_string(index) + " outside palette of " +
            std::to_string(colors_.size()) + " colors");
    }
    colors_[index] = c;
    sync_declared();
    return status::success();
}

status image_palette::set_declared(file_palette declared,
                                   std::span<const std::uint8_t> pixels) {
    auto result = validate_palette(declared);
    if (!result) {
        return result;
    }
    if (const auto* explicit_colors = std::get_if<palette_colors>(&declared)) {
        const std::size_t needed = min_palette_size(pixels);
        if (explicit_colors->colors.size() < needed) {
            return status::count_out_of_range("Palette color count", needed,
                MAX_PALETTE_COLORS, explicit_colors->colors.size());
        }
    }
    colors_ = effective_colors(declared, pixels);
    declared_ = std::move(declared);
    return status::success();
}

status image_palette::set_colors(std::vector<color> colors, std::size_t min_size) {
    const std::size_t max_size = has_colors(declared_)
        ? static_cast<std::size_t>(MAX_PALETTE_COLORS)
        : static_cast<std::size_t>(MAX_EFFECTIVE_COLORS);
    const std::size_t min_allowed = min_size > 0 ? min_size : 1;

    if (colors.size() < min_allowed || colors.size() > max_size) {
        return status::count_out_of_range("Palette color count", min_allowed, max_size,
            colors.size());
    }
    colors_ = std::move(colors);
    sync_declared();
    return status::success();
}

void image_palette::tint_add(int dr, int dg, int db, int da) {
    for (auto& c : colors_) {
        c.tint_add(dr, dg, db, da);
    }
    sync_declared();
}

void image_palette::tint_mul(float mr, float mg, float mb, float ma) {
    for (auto& c : colors_) {
        c.tint_mul(mr, mg, mb, ma);
    }
    sync_declared();
}

status image_palette::tint_palette_add(std::span<const std::array<int, 4>> offsets) {
    if (offsets.size() != colors_.size()) {
        return status::count_out_of_range("Tint entry count", colors_.size(), colors_.size(),
                                          offsets.size());
    }
    for (std::size_t i = 0; i < colors_.size(); ++i) {
        const auto& d = offsets[i];
        colors_[i].tint_add(d[0], d[1], d[2], d[3]);
    }
    sync_declared();
    return status::success();
}

status image_palette::tint_palette_mul(std::span<const std::array<float, 4>> factors) {
    if (factors.size() != colors_.size()) {
        return status::count_out_of_range("Tint entry count", colors_.size(), colors_.size(),
                                          factors.size());
    }
    for (std::size_t i = 0; i < colors_.size(); ++i) {
        const auto& f = factors[i];
        colors_[i].tint_mul(f[0], f[1], f[2], f[3]);
    }
    sync_declared();
    return status::success();
}

void image_palette::sync_declared() {
    if (auto* explicit_colors = std::get_if<palette_colors>(&declared_)) {
        explicit_colors->colors = colors_;
    }
}

} // namespace ici_image
