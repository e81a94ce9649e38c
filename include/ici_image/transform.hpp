#ifndef ICI_IMAGE_TRANSFORM_HPP_
#define ICI_IMAGE_TRANSFORM_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace ici_image {

// ============================================================================
// Geometric Transforms over Index Buffers
// ============================================================================
//
// Buffers are row-major, one palette index per pixel, width * height bytes.
// Rotations are counter-clockwise: a 90 degree turn moves the pixel at (x, y)
// to (y, width - 1 - x) in a height x width result.

enum class flip_axis {
    horizontal,   // mirror columns (left <-> right)
    vertical      // mirror rows (top <-> bottom)
};

enum class rotation {
    deg_90,
    deg_180,
    deg_270
};

// Width and height after rotating
struct rotated_size {
    int width = 0;
    int height = 0;
};

[[nodiscard]] constexpr rotated_size rotate_size(int width, int height, rotation rot) noexcept {
    if (rot == rotation::deg_180) {
        return {width, height};
    }
    return {height, width};
}

/**
 * Destination offset of source pixel (x, y) after rotation.
 * Every rotation goes through this one mapping.
 */
[[nodiscard]] constexpr std::size_t rotated_offset(int x, int y, int width, int height,
                                                   rotation rot) noexcept {
    const auto dst = rotate_size(width, height, rot);
    int nx = 0;
    int ny = 0;
    switch (rot) {
        case rotation::deg_90:
            nx = y;
            ny = width - 1 - x;
            break;
        case rotation::deg_180:
            nx = width - 1 - x;
            ny = height - 1 - y;
            break;
        case rotation::deg_270:
            nx = height - 1 - y;
            ny = x;
            break;
    }
    return static_cast<std::size_t>(ny) * static_cast<std::size_t>(dst.width) +
           static_cast<std::size_t>(nx);
}

/**
 * Check that a rotation keeps both dimensions within MAX_DIMENSION.
 * @return count_out_of_range when a swapped dimension would not fit
 */
[[nodiscard]] ICI_IMAGE_EXPORT status check_rotation(int width, int height, rotation rot);

/**
 * Mirror a buffer in place.
 * @param pixels width * height indices
 */
ICI_IMAGE_EXPORT void flip_pixels(std::span<std::uint8_t> pixels, int width, int height,
                                  flip_axis axis) noexcept;

/**
 * Rotate src into dst.
 * @param src width * height indices
 * @param dst Same size as src, laid out with rotate_size() dimensions
 */
ICI_IMAGE_EXPORT void rotate_pixels(std::span<const std::uint8_t> src,
                                    std::span<std::uint8_t> dst,
                                    int width, int height, rotation rot) noexcept;

// Rewrite every occurrence of index `from` to `to`; returns how many pixels changed
ICI_IMAGE_EXPORT std::size_t replace_index(std::span<std::uint8_t> pixels,
                                           std::uint8_t from, std::uint8_t to) noexcept;

} // namespace ici_image

#endif // ICI_IMAGE_TRANSFORM_HPP_
