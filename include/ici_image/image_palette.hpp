#ifndef ICI_IMAGE_IMAGE_PALETTE_HPP_
#define ICI_IMAGE_IMAGE_PALETTE_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>
#include <ici_image/color.hpp>
#include <ici_image/palette.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ici_image {

// ============================================================================
// Image Palette
// ============================================================================

/**
 * Palette owned by an image: the declared file_palette that is persisted,
 * plus the effective colors that pixel indices resolve against.
 *
 * Effective colors are the explicit list for palette_colors, otherwise a
 * synthesized transparent list sized to the highest index in use. While the
 * declared palette is palette_colors it mirrors every edit to the effective
 * colors, so it never exceeds MAX_PALETTE_COLORS entries.
 */
class ICI_IMAGE_EXPORT image_palette {
public:
    // no_palette with a single transparent entry
    image_palette() = default;

    /**
     * Build from a declared palette.
     * Precondition: validate_palette(declared) succeeded.
     */
    image_palette(file_palette declared, std::span<const std::uint8_t> pixels);

    [[nodiscard]] const file_palette& declared() const noexcept { return declared_; }
    [[nodiscard]] std::span<const color> colors() const noexcept { return colors_; }
    [[nodiscard]] std::size_t size() const noexcept { return colors_.size(); }

    [[nodiscard]] status get_color(std::size_t index, color& out) const;
    [[nodiscard]] status set_color(std::size_t index, const color& c);

    /**
     * Replace the declared palette and recompute the effective colors.
     * Explicit colors must cover every index in pixels.
     * @return validate_palette() failure or count_out_of_range, palette left
     *         unchanged
     */
    [[nodiscard]] status set_declared(file_palette declared,
                                      std::span<const std::uint8_t> pixels);

    /**
     * Replace the effective colors.
     * @param colors New colors, 1-256 entries (1-255 while declared is palette_colors)
     * @param min_size Smallest acceptable size, normally min_palette_size(pixels)
     */
    [[nodiscard]] status set_colors(std::vector<color> colors, std::size_t min_size);

    void tint_add(int dr, int dg, int db, int da);
    void tint_mul(float mr, float mg, float mb, float ma);

    /**
     * Tint each entry by its own offsets, in r, g, b, a order.
     * @param offsets One entry per effective color
     * @return count_out_of_range if offsets.size() != size(), palette unchanged
     */
    [[nodiscard]] status tint_palette_add(std::span<const std::array<int, 4>> offsets);

    // Per-entry factors; same size rule as tint_palette_add
    [[nodiscard]] status tint_palette_mul(std::span<const std::array<float, 4>> factors);

    friend bool operator==(const image_palette&, const image_palette&) = default;

private:
    void sync_declared();

    file_palette declared_ = no_palette{};
    std::vector<color> colors_ = {colors::transparent};
};

} // namespace ici_image

#endif // ICI_IMAGE_IMAGE_PALETTE_HPP_
