#ifndef ICI_IMAGE_STATIC_IMAGE_HPP_
#define ICI_IMAGE_STATIC_IMAGE_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>
#include <ici_image/color.hpp>
#include <ici_image/palette.hpp>
#include <ici_image/image_palette.hpp>
#include <ici_image/transform.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ici_image {

// ============================================================================
// Static Image
// ============================================================================
//
// Body layout (little-endian):
//   width:u8  height:u8  palette_block  pixels:[u8; width * height]

class ICI_IMAGE_EXPORT static_image {
public:
    // 1x1 image holding index 0 with no palette data
    static_image();

    /**
     * Validated construction.
     * @param width 1-255
     * @param height 1-255
     * @param palette Declared palette (must pass validate_palette)
     * @param pixels Exactly width * height indices
     * @param out Assigned only on success
     * @return count_out_of_range for a zero dimension, dimension_mismatch for
     *         a wrong pixel count, or the palette validation failure
     */
    [[nodiscard]] static status create(std::uint8_t width, std::uint8_t height,
                                       file_palette palette,
                                       std::vector<std::uint8_t> pixels,
                                       static_image& out);

    /**
     * Trusted construction, no checks.
     *
     * The caller guarantees width and height are non-zero, pixels holds
     * exactly width * height indices and the palette is valid. Breaking that
     * contract is undefined behavior for every later transform or encode.
     */
    [[nodiscard]] static static_image create_unchecked(std::uint8_t width, std::uint8_t height,
                                                       file_palette palette,
                                                       std::vector<std::uint8_t> pixels);

    [[nodiscard]] static static_image create_unchecked(std::uint8_t width, std::uint8_t height,
                                                       image_palette palette,
                                                       std::vector<std::uint8_t> pixels);

    // ------------------------------------------------------------------------
    // Codec
    // ------------------------------------------------------------------------

    /**
     * Decode a static image body.
     * @param data Body bytes, starting at the width byte
     * @param out Assigned only on success
     * @param options Decode options
     * @return unexpected_eof, count_out_of_range, dimension_mismatch or a
     *         palette block failure
     */
    [[nodiscard]] static status decode(std::span<const std::uint8_t> data,
                                       static_image& out,
                                       const decode_options& options = {});

    [[nodiscard]] std::vector<std::uint8_t> encode() const;

    // Append the body to out
    void encode(std::vector<std::uint8_t>& out) const;

    // ------------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------------

    [[nodiscard]] std::uint8_t width() const noexcept { return width_; }
    [[nodiscard]] std::uint8_t height() const noexcept { return height_; }
    [[nodiscard]] std::size_t pixel_count() const noexcept { return pixels_.size(); }
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }

    [[nodiscard]] const file_palette& palette() const noexcept { return palette_.declared(); }
    [[nodiscard]] std::span<const color> colors() const noexcept { return palette_.colors(); }
    [[nodiscard]] const image_palette& full_palette() const noexcept { return palette_; }

    // Highest index in use + 1
    [[nodiscard]] std::size_t min_palette_size() const noexcept;

    [[nodiscard]] status get_pixel_index(int x, int y, std::size_t& out) const;
    [[nodiscard]] status get_pixel(std::size_t index, std::uint8_t& out) const;

    // Requires value to be inside the effective palette
    [[nodiscard]] status set_pixel(std::size_t index, std::uint8_t value);

    [[nodiscard]] status get_color(std::size_t index, color& out) const {
        return palette_.get_color(index, out);
    }

    // Recolor a palette slot; pixel indices are untouched
    [[nodiscard]] status set_color(std::size_t index, const color& c) {
        return palette_.set_color(index, c);
    }

    // ------------------------------------------------------------------------
    // Palette replacement
    // ------------------------------------------------------------------------

    [[nodiscard]] status set_palette(file_palette palette);

    // New colors must cover every index in use
    [[nodiscard]] status set_colors(std::vector<color> colors);

    // Pixels indexing past the new colors are rewritten to `id`
    [[nodiscard]] status set_colors_replace_id(std::vector<color> colors, std::uint8_t id);

    // The new colors are padded with `fill` until they cover every index in use
    [[nodiscard]] status set_colors_replace_color(std::vector<color> colors, const color& fill);

    void tint_add(int dr, int dg, int db, int da) { palette_.tint_add(dr, dg, db, da); }
    void tint_mul(float mr, float mg, float mb, float ma) { palette_.tint_mul(mr, mg, mb, ma); }

    // One {r, g, b, a} entry per effective color
    [[nodiscard]] status tint_palette_add(std::span<const std::array<int, 4>> offsets) {
        return palette_.tint_palette_add(offsets);
    }
    [[nodiscard]] status tint_palette_mul(std::span<const std::array<float, 4>> factors) {
        return palette_.tint_palette_mul(factors);
    }

    // ------------------------------------------------------------------------
    // Transforms
    // ------------------------------------------------------------------------

    void flip(flip_axis axis) noexcept;

    [[nodiscard]] status rotate(rotation rot);
    [[nodiscard]] status rotate_cw() { return rotate(rotation::deg_270); }
    [[nodiscard]] status rotate_ccw() { return rotate(rotation::deg_90); }

    /**
     * Rewrite index `from` to `to` across the pixel buffer; the palette is
     * untouched.
     * @return index_out_of_range if `to` is outside the effective palette
     */
    [[nodiscard]] status remap_index(std::uint8_t from, std::uint8_t to);

    friend bool operator==(const static_image&, const static_image&) = default;

private:
    static_image(std::uint8_t width, std::uint8_t height, image_palette palette,
                 std::vector<std::uint8_t> pixels);

    std::uint8_t width_ = 1;
    std::uint8_t height_ = 1;
    image_palette palette_;
    std::vector<std::uint8_t> pixels_;
};

} // namespace ici_image

#endif // ICI_IMAGE_STATIC_IMAGE_HPP_
