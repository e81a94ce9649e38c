#ifndef ICI_IMAGE_PALETTE_HPP_
#define ICI_IMAGE_PALETTE_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>
#include <ici_image/color.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace ici_image {

// ============================================================================
// File Palette
// ============================================================================
//
// How palette data is stored in an ICI body. Exactly one of:
//   no_palette      - nothing stored
//   palette_id      - 16-bit reference to a palette the reader knows about
//   palette_name    - 1-255 UTF-8 bytes naming a palette the reader knows about
//   palette_colors  - 1-255 explicit RGBA colors
//
// Block layout: tag:u8 followed by
//   id     -> u16 little-endian
//   name   -> len:u8, len UTF-8 bytes
//   colors -> count:u8, count * (R, G, B, A)

struct no_palette {
    friend bool operator==(const no_palette&, const no_palette&) noexcept = default;
};

struct palette_id {
    std::uint16_t id = 0;
    friend bool operator==(const palette_id&, const palette_id&) noexcept = default;
};

struct palette_name {
    std::string name;
    friend bool operator==(const palette_name&, const palette_name&) = default;
};

struct palette_colors {
    std::vector<color> colors;
    friend bool operator==(const palette_colors&, const palette_colors&) = default;
};

using file_palette = std::variant<no_palette, palette_id, palette_name, palette_colors>;

enum class palette_tag : std::uint8_t {
    no_data = 0,
    id = 1,
    name = 2,
    colors = 3
};

[[nodiscard]] ICI_IMAGE_EXPORT palette_tag tag_of(const file_palette& palette) noexcept;

// True when the palette carries concrete colors
[[nodiscard]] inline bool has_colors(const file_palette& palette) noexcept {
    return std::holds_alternative<palette_colors>(palette);
}

// ============================================================================
// Palette Codec
// ============================================================================

/**
 * Check the payload bounds of a palette.
 * @return count_out_of_range for an empty or over-long name/color list,
 *         invalid_utf8 for a name that is not valid UTF-8
 */
[[nodiscard]] ICI_IMAGE_EXPORT status validate_palette(const file_palette& palette);

/**
 * Append a palette block.
 * @param palette Palette to encode
 * @param out Destination; left untouched on failure
 * @return validate_palette() result
 */
[[nodiscard]] ICI_IMAGE_EXPORT status encode_palette(const file_palette& palette,
                                                     std::vector<std::uint8_t>& out);

/**
 * Decode a palette block from the start of data.
 * @param data Bytes starting at the tag byte
 * @param out Decoded palette, assigned only on success
 * @param consumed Number of bytes the block occupies
 * @return invalid_tag, invalid_utf8, count_out_of_range or unexpected_eof on failure
 */
[[nodiscard]] ICI_IMAGE_EXPORT status decode_palette(std::span<const std::uint8_t> data,
                                                     file_palette& out,
                                                     std::size_t& consumed);

[[nodiscard]] ICI_IMAGE_EXPORT bool is_valid_utf8(std::span<const std::uint8_t> bytes) noexcept;

// ============================================================================
// Effective Palette
// ============================================================================

// Fully transparent palette covering the highest index in pixels (at least 1 entry)
[[nodiscard]] ICI_IMAGE_EXPORT std::vector<color> synthesize_colors(
    std::span<const std::uint8_t> pixels);

// Explicit colors when the palette has them, synthesize_colors() otherwise
[[nodiscard]] ICI_IMAGE_EXPORT std::vector<color> effective_colors(
    const file_palette& palette, std::span<const std::uint8_t> pixels);

// Highest index used + 1, or 1 for an empty buffer
[[nodiscard]] ICI_IMAGE_EXPORT std::size_t min_palette_size(
    std::span<const std::uint8_t> pixels) noexcept;

// ============================================================================
// Palette Simplification
// ============================================================================

/**
 * Merge colors that lie within `threshold` of each other (color::diff) into
 * their midpoint. Entries are merged in place, so indices stay valid and the
 * result may contain duplicates.
 * @param colors Source palette
 * @param threshold Merge distance, 2 is a sensible start, 1020 merges everything
 */
[[nodiscard]] ICI_IMAGE_EXPORT std::vector<color> simplify_palette(
    std::span<const color> colors, int threshold);

// Repeatedly simplify with a growing threshold until fewer than max distinct colors remain
[[nodiscard]] ICI_IMAGE_EXPORT std::vector<color> simplify_palette_to_fit(
    std::span<const color> colors, std::size_t max);

} // namespace ici_image

#endif // ICI_IMAGE_PALETTE_HPP_
