#ifndef ICI_IMAGE_COLOR_HPP_
#define ICI_IMAGE_COLOR_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

namespace ici_image {

// ============================================================================
// Color
// ============================================================================
//
// Four independent 8-bit channels. Every conversion names its channel order:
//   RGBA packed: 0xRRGGBBAA
//   ARGB packed: 0xAARRGGBB
//   RGB  packed: 0x00RRGGBB (alpha dropped on encode, forced to 255 on decode)
// Float conversions map 0..255 to 0.0..1.0; decoding rounds to the nearest
// step and clamps (NaN becomes 0), so to_*_float followed by from_*_float is
// lossless.

struct color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    constexpr color() noexcept = default;
    constexpr color(std::uint8_t red, std::uint8_t green, std::uint8_t blue,
                    std::uint8_t alpha = 255) noexcept
        : r(red), g(green), b(blue), a(alpha) {}

    [[nodiscard]] static constexpr color gray(std::uint8_t value) noexcept {
        return {value, value, value, 255};
    }

    [[nodiscard]] constexpr bool is_transparent() const noexcept { return a == 0; }

    // ------------------------------------------------------------------------
    // Channel replacement
    // ------------------------------------------------------------------------

    [[nodiscard]] constexpr color with_red(std::uint8_t value) const noexcept {
        return {value, g, b, a};
    }
    [[nodiscard]] constexpr color with_green(std::uint8_t value) const noexcept {
        return {r, value, b, a};
    }
    [[nodiscard]] constexpr color with_blue(std::uint8_t value) const noexcept {
        return {r, g, value, a};
    }
    [[nodiscard]] constexpr color with_alpha(std::uint8_t value) const noexcept {
        return {r, g, b, value};
    }

    // ------------------------------------------------------------------------
    // Packed 32-bit
    // ------------------------------------------------------------------------

    [[nodiscard]] static constexpr color from_rgba(std::uint32_t value) noexcept {
        return {static_cast<std::uint8_t>(value >> 24),
                static_cast<std::uint8_t>(value >> 16),
                static_cast<std::uint8_t>(value >> 8),
                static_cast<std::uint8_t>(value)};
    }

    [[nodiscard]] static constexpr color from_argb(std::uint32_t value) noexcept {
        return {static_cast<std::uint8_t>(value >> 16),
                static_cast<std::uint8_t>(value >> 8),
                static_cast<std::uint8_t>(value),
                static_cast<std::uint8_t>(value >> 24)};
    }

    [[nodiscard]] static constexpr color from_rgb(std::uint32_t value) noexcept {
        return {static_cast<std::uint8_t>(value >> 16),
                static_cast<std::uint8_t>(value >> 8),
                static_cast<std::uint8_t>(value),
                255};
    }

    [[nodiscard]] constexpr std::uint32_t to_rgba() const noexcept {
        return (static_cast<std::uint32_t>(r) << 24) |
               (static_cast<std::uint32_t>(g) << 16) |
               (static_cast<std::uint32_t>(b) << 8) |
               static_cast<std::uint32_t>(a);
    }

    [[nodiscard]] constexpr std::uint32_t to_argb() const noexcept {
        return (static_cast<std::uint32_t>(a) << 24) |
               (static_cast<std::uint32_t>(r) << 16) |
               (static_cast<std::uint32_t>(g) << 8) |
               static_cast<std::uint32_t>(b);
    }

    [[nodiscard]] constexpr std::uint32_t to_rgb() const noexcept {
        return (static_cast<std::uint32_t>(r) << 16) |
               (static_cast<std::uint32_t>(g) << 8) |
               static_cast<std::uint32_t>(b);
    }

    // ------------------------------------------------------------------------
    // Byte arrays and tuples
    // ------------------------------------------------------------------------

    [[nodiscard]] static constexpr color from_rgba(const std::array<std::uint8_t, 4>& v) noexcept {
        return {v[0], v[1], v[2], v[3]};
    }
    [[nodiscard]] static constexpr color from_argb(const std::array<std::uint8_t, 4>& v) noexcept {
        return {v[1], v[2], v[3], v[0]};
    }
    [[nodiscard]] static constexpr color from_rgb(const std::array<std::uint8_t, 3>& v) noexcept {
        return {v[0], v[1], v[2], 255};
    }

    [[nodiscard]] constexpr std::array<std::uint8_t, 4> to_rgba_array() const noexcept {
        return {{r, g, b, a}};
    }
    [[nodiscard]] constexpr std::array<std::uint8_t, 4> to_argb_array() const noexcept {
        return {{a, r, g, b}};
    }
    [[nodiscard]] constexpr std::array<std::uint8_t, 3> to_rgb_array() const noexcept {
        return {{r, g, b}};
    }

    using rgba_tuple = std::tuple<std::uint8_t, std::uint8_t, std::uint8_t, std::uint8_t>;
    using rgb_tuple = std::tuple<std::uint8_t, std::uint8_t, std::uint8_t>;

    [[nodiscard]] static constexpr color from_rgba(const rgba_tuple& v) noexcept {
        return {std::get<0>(v), std::get<1>(v), std::get<2>(v), std::get<3>(v)};
    }
    [[nodiscard]] static constexpr color from_argb(const rgba_tuple& v) noexcept {
        return {std::get<1>(v), std::get<2>(v), std::get<3>(v), std::get<0>(v)};
    }
    [[nodiscard]] static constexpr color from_rgb(const rgb_tuple& v) noexcept {
        return {std::get<0>(v), std::get<1>(v), std::get<2>(v), 255};
    }

    [[nodiscard]] constexpr rgba_tuple to_rgba_tuple() const noexcept { return {r, g, b, a}; }
    [[nodiscard]] constexpr rgba_tuple to_argb_tuple() const noexcept { return {a, r, g, b}; }
    [[nodiscard]] constexpr rgb_tuple to_rgb_tuple() const noexcept { return {r, g, b}; }

    // ------------------------------------------------------------------------
    // Normalized floats
    // ------------------------------------------------------------------------

    [[nodiscard]] ICI_IMAGE_EXPORT static color from_rgba(const std::array<float, 4>& v) noexcept;
    [[nodiscard]] ICI_IMAGE_EXPORT static color from_argb(const std::array<float, 4>& v) noexcept;
    [[nodiscard]] ICI_IMAGE_EXPORT static color from_rgb(const std::array<float, 3>& v) noexcept;

    [[nodiscard]] ICI_IMAGE_EXPORT std::array<float, 4> to_rgba_float() const noexcept;
    [[nodiscard]] ICI_IMAGE_EXPORT std::array<float, 4> to_argb_float() const noexcept;
    [[nodiscard]] ICI_IMAGE_EXPORT std::array<float, 3> to_rgb_float() const noexcept;

    // ------------------------------------------------------------------------
    // Hex strings
    // ------------------------------------------------------------------------

    /**
     * Parse "#RRGGBB" or "#RRGGBBAA" (leading '#' optional).
     * @param text Hex string
     * @param out Parsed color, assigned only on success
     * @return invalid_value on wrong length or non-hex digits
     */
    [[nodiscard]] ICI_IMAGE_EXPORT static status from_hex(std::string_view text, color& out);

    // "#RRGGBBAA", uppercase
    [[nodiscard]] ICI_IMAGE_EXPORT std::string to_hex() const;

    // ------------------------------------------------------------------------
    // Mixing
    // ------------------------------------------------------------------------

    // Alpha-composite `over` on top of this color
    [[nodiscard]] ICI_IMAGE_EXPORT color blend(const color& over) const noexcept;

    // Rec. 709 luma in 0.0-1.0, alpha ignored
    [[nodiscard]] ICI_IMAGE_EXPORT float brightness() const noexcept;

    [[nodiscard]] bool is_dark() const noexcept { return brightness() < 0.5f; }

    /**
     * Scale red, green and blue by amount, clamped to 0-255. Alpha is kept.
     * @param amount 1.0 leaves the color unchanged
     */
    [[nodiscard]] ICI_IMAGE_EXPORT color with_brightness(float amount) const noexcept;

    [[nodiscard]] color darken() const noexcept { return with_brightness(0.9f); }
    [[nodiscard]] color lighten() const noexcept { return with_brightness(1.1f); }

    /**
     * Move red, green and blue towards the luma by amount.
     * @param amount 1.0 is fully gray; negative values increase saturation
     */
    [[nodiscard]] ICI_IMAGE_EXPORT color with_saturate(float amount) const noexcept;

    [[nodiscard]] color desaturate() const noexcept { return with_saturate(0.1f); }
    [[nodiscard]] color saturate() const noexcept { return with_saturate(-0.1f); }

    // Per-channel midpoint
    [[nodiscard]] ICI_IMAGE_EXPORT color mid(const color& other) const noexcept;

    // Sum of absolute channel differences (0-1020)
    [[nodiscard]] ICI_IMAGE_EXPORT int diff(const color& other) const noexcept;

    // Add to each channel, clamped to 0-255
    ICI_IMAGE_EXPORT void tint_add(int dr, int dg, int db, int da) noexcept;

    // Multiply each channel, rounded and clamped to 0-255 (NaN gives 0)
    ICI_IMAGE_EXPORT void tint_mul(float mr, float mg, float mb, float ma) noexcept;

    friend constexpr bool operator==(const color&, const color&) noexcept = default;
};

// ============================================================================
// Named Colors
// ============================================================================

namespace colors {

inline constexpr color transparent{0, 0, 0, 0};
inline constexpr color black = color::gray(0);
inline constexpr color white = color::gray(255);
inline constexpr color dark_gray = color::gray(75);
inline constexpr color mid_gray = color::gray(110);
inline constexpr color light_gray = color::gray(180);
inline constexpr color red{255, 0, 0};
inline constexpr color green{0, 255, 0};
inline constexpr color blue{0, 0, 255};
inline constexpr color cyan{0, 255, 255};
inline constexpr color magenta{255, 0, 255};
inline constexpr color yellow{255, 255, 0};
inline constexpr color orange{255, 165, 0};

// Game Boy DMG-01, darkest to lightest
inline constexpr color gb_3{15, 56, 15};
inline constexpr color gb_2{48, 98, 48};
inline constexpr color gb_1{120, 145, 15};
inline constexpr color gb_0{155, 188, 15};

} // namespace colors

} // namespace ici_image

#endif // ICI_IMAGE_COLOR_HPP_
