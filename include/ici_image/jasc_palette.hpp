#ifndef ICI_IMAGE_JASC_PALETTE_HPP_
#define ICI_IMAGE_JASC_PALETTE_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>
#include <ici_image/color.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ici_image {

// ============================================================================
// JASC Palette
// ============================================================================
//
// Plain-text palette written by Paint Shop Pro and most pixel art editors:
//
//   JASC-PAL
//   0100
//   <count>
//   <r> <g> <b>      (count lines)
//
// Alpha is not stored. Decoded colors are opaque.

struct ICI_IMAGE_EXPORT jasc_palette {
    static constexpr std::string_view name = "jasc";
    static constexpr std::string_view extensions[] = {".pal"};

    static constexpr std::string_view HEADER = "JASC-PAL";
    static constexpr std::string_view VERSION = "0100";
    static constexpr int MAX_COLORS = 256;

    std::vector<color> colors;

    /**
     * Parse JASC text. Accepts LF or CRLF line endings and ignores trailing
     * empty lines. Header and version lines must match exactly.
     * @param text Whole file contents
     * @param out Assigned only on success
     * @return invalid_header, version_mismatch, count_out_of_range or
     *         invalid_value
     */
    [[nodiscard]] static status decode(std::string_view text, jasc_palette& out);

    /**
     * Write JASC text. Alpha is dropped; lines end in LF.
     * @param out Assigned only on success
     * @return count_out_of_range for more than MAX_COLORS colors
     */
    [[nodiscard]] status encode(std::string& out) const;

    friend bool operator==(const jasc_palette&, const jasc_palette&) = default;
};

} // namespace ici_image

#endif // ICI_IMAGE_JASC_PALETTE_HPP_
