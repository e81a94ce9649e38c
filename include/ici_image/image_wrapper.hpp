#ifndef ICI_IMAGE_IMAGE_WRAPPER_HPP_
#define ICI_IMAGE_IMAGE_WRAPPER_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>
#include <ici_image/palette.hpp>
#include <ici_image/static_image.hpp>
#include <ici_image/animated_image.hpp>
#include <ici_image/transform.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <variant>
#include <vector>

namespace ici_image {

// ============================================================================
// Image Wrapper
// ============================================================================
//
// Either a static or an animated image. Every call dispatches on the held
// kind; nothing here converts one kind into the other.

class ICI_IMAGE_EXPORT image_wrapper {
public:
    using value_type = std::variant<static_image, animated_image>;

    image_wrapper() = default;
    image_wrapper(static_image image) : image_(std::move(image)) {}
    image_wrapper(animated_image image) : image_(std::move(image)) {}

    [[nodiscard]] bool is_animated() const noexcept {
        return std::holds_alternative<animated_image>(image_);
    }

    [[nodiscard]] const value_type& value() const noexcept { return image_; }
    [[nodiscard]] value_type& value() noexcept { return image_; }

    // nullptr when the other kind is held
    [[nodiscard]] const static_image* as_static() const noexcept {
        return std::get_if<static_image>(&image_);
    }
    [[nodiscard]] static_image* as_static() noexcept {
        return std::get_if<static_image>(&image_);
    }
    [[nodiscard]] const animated_image* as_animated() const noexcept {
        return std::get_if<animated_image>(&image_);
    }
    [[nodiscard]] animated_image* as_animated() noexcept {
        return std::get_if<animated_image>(&image_);
    }

    [[nodiscard]] std::uint8_t width() const noexcept;
    [[nodiscard]] std::uint8_t height() const noexcept;
    [[nodiscard]] const file_palette& palette() const noexcept;
    [[nodiscard]] std::span<const color> colors() const noexcept;

    // 1 for a static image
    [[nodiscard]] std::uint8_t frame_count() const noexcept;

    /**
     * Indices of one frame. A static image has a single frame 0.
     * @return index_out_of_range if index >= frame_count()
     */
    [[nodiscard]] status get_frame(std::size_t index, std::span<const std::uint8_t>& out) const;

    // Indices of every frame, back to back
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept;

    // Highest index in use across all frames + 1
    [[nodiscard]] std::size_t min_palette_size() const noexcept;

    [[nodiscard]] status get_pixel_index(int x, int y, std::size_t& out) const;

    [[nodiscard]] status get_color(std::size_t index, color& out) const;
    [[nodiscard]] status set_color(std::size_t index, const color& c);

    // ------------------------------------------------------------------------
    // Palette replacement (same rules as the held image)
    // ------------------------------------------------------------------------

    [[nodiscard]] status set_palette(file_palette palette);
    [[nodiscard]] status set_colors(std::vector<color> colors);
    [[nodiscard]] status set_colors_replace_id(std::vector<color> colors, std::uint8_t id);
    [[nodiscard]] status set_colors_replace_color(std::vector<color> colors, const color& fill);

    void tint_add(int dr, int dg, int db, int da);
    void tint_mul(float mr, float mg, float mb, float ma);
    [[nodiscard]] status tint_palette_add(std::span<const std::array<int, 4>> offsets);
    [[nodiscard]] status tint_palette_mul(std::span<const std::array<float, 4>> factors);

    [[nodiscard]] std::vector<std::uint8_t> encode() const;

    // ------------------------------------------------------------------------
    // Transforms
    // ------------------------------------------------------------------------

    void flip(flip_axis axis) noexcept;
    [[nodiscard]] status rotate(rotation rot);
    [[nodiscard]] status remap_index(std::uint8_t from, std::uint8_t to);

    // Flipped copy holding the same kind of image
    [[nodiscard]] image_wrapper flipped(flip_axis axis) const;

    // Rotated copy holding the same kind of image; out is assigned on success
    [[nodiscard]] status rotated(rotation rot, image_wrapper& out) const;

    // ------------------------------------------------------------------------
    // Playback (no-ops for a static image)
    // ------------------------------------------------------------------------

    void update(double delta) noexcept;
    void reset() noexcept;
    void set_animate(bool animate) noexcept;
    [[nodiscard]] bool animating() const noexcept;

    friend bool operator==(const image_wrapper&, const image_wrapper&) = default;

private:
    value_type image_;
};

} // namespace ici_image

#endif // ICI_IMAGE_IMAGE_WRAPPER_HPP_
