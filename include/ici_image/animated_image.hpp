#ifndef ICI_IMAGE_ANIMATED_IMAGE_HPP_
#define ICI_IMAGE_ANIMATED_IMAGE_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>
#include <ici_image/color.hpp>
#include <ici_image/palette.hpp>
#include <ici_image/image_palette.hpp>
#include <ici_image/static_image.hpp>
#include <ici_image/transform.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace ici_image {

// ============================================================================
// Playback
// ============================================================================

enum class play_type {
    once,             // first to last, then stop and reset
    once_reversed,    // last to first, then stop and reset
    loops,            // first to last, repeat
    loops_reversed,   // last to first, repeat
    loops_both        // first to last to first, repeat
};

// ============================================================================
// Animated Image
// ============================================================================
//
// Body layout (little-endian):
//   width:u8  height:u8  frame_count:u8  frame_duration:f32  palette_block
//   frames:[[u8; width * height]; frame_count]
//
// All frames share the dimensions, the palette and the frame duration.
// Playback state lives in memory only and is not part of equality.

class ICI_IMAGE_EXPORT animated_image {
public:
    // Single 1x1 frame, 0.1 s per frame, no palette data
    animated_image();

    /**
     * Validated construction from a flat buffer of consecutive frames.
     * @param width 1-255
     * @param height 1-255
     * @param frame_duration Seconds per frame, finite and > 0
     * @param frame_count 1-255
     * @param palette Declared palette (must pass validate_palette)
     * @param pixels Exactly frame_count * width * height indices
     * @param out Assigned only on success
     * @return count_out_of_range, invalid_value, frame_size_mismatch or the
     *         palette validation failure
     */
    [[nodiscard]] static status create(std::uint8_t width, std::uint8_t height,
                                       float frame_duration, std::size_t frame_count,
                                       file_palette palette,
                                       std::vector<std::uint8_t> pixels,
                                       animated_image& out);

    // Validated construction from one buffer per frame
    [[nodiscard]] static status create(std::uint8_t width, std::uint8_t height,
                                       float frame_duration,
                                       file_palette palette,
                                       const std::vector<std::vector<std::uint8_t>>& frames,
                                       animated_image& out);

    /**
     * Trusted construction, no checks.
     *
     * The caller guarantees non-zero dimensions, frame_count in 1-255,
     * pixels.size() == frame_count * width * height, a positive duration and
     * a valid palette. Breaking that contract is undefined behavior for every
     * later transform or encode.
     */
    [[nodiscard]] static animated_image create_unchecked(std::uint8_t width, std::uint8_t height,
                                                         float frame_duration,
                                                         std::uint8_t frame_count,
                                                         file_palette palette,
                                                         std::vector<std::uint8_t> pixels);

    // ------------------------------------------------------------------------
    // Codec
    // ------------------------------------------------------------------------

    /**
     * Decode an animated image body.
     * @param data Body bytes, starting at the width byte
     * @param out Assigned only on success
     * @param options Decode options
     * @return unexpected_eof, count_out_of_range, invalid_value,
     *         frame_size_mismatch or a palette block failure
     */
    [[nodiscard]] static status decode(std::span<const std::uint8_t> data,
                                       animated_image& out,
                                       const decode_options& options = {});

    [[nodiscard]] std::vector<std::uint8_t> encode() const;

    // Append the body to out
    void encode(std::vector<std::uint8_t>& out) const;

    // ------------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------------

    [[nodiscard]] std::uint8_t width() const noexcept { return width_; }
    [[nodiscard]] std::uint8_t height() const noexcept { return height_; }
    [[nodiscard]] std::uint8_t frame_count() const noexcept { return frame_count_; }
    [[nodiscard]] float frame_duration() const noexcept { return frame_duration_; }
    [[nodiscard]] std::size_t frame_size() const noexcept;

    // Every frame, back to back
    [[nodiscard]] std::span<const std::uint8_t> pixels() const noexcept { return pixels_; }

    [[nodiscard]] const file_palette& palette() const noexcept { return palette_.declared(); }
    [[nodiscard]] std::span<const color> colors() const noexcept { return palette_.colors(); }
    [[nodiscard]] const image_palette& full_palette() const noexcept { return palette_; }

    // Highest index in use across all frames + 1
    [[nodiscard]] std::size_t min_palette_size() const noexcept;

    // Seconds per frame, finite and > 0
    [[nodiscard]] status set_frame_duration(float seconds);

    /**
     * Indices of one frame.
     * @return index_out_of_range if index >= frame_count()
     */
    [[nodiscard]] status get_frame(std::size_t index, std::span<const std::uint8_t>& out) const;

    // One frame as an independent static image with a copy of the palette
    [[nodiscard]] status get_frame_image(std::size_t index, static_image& out) const;

    // Every frame as an independent static image, in order
    [[nodiscard]] std::vector<static_image> as_images() const;

    [[nodiscard]] status get_pixel_index(int x, int y, std::size_t& out) const;
    [[nodiscard]] status get_pixel(std::size_t frame, std::size_t index, std::uint8_t& out) const;

    // Requires value to be inside the effective palette
    [[nodiscard]] status set_pixel(std::size_t frame, std::size_t index, std::uint8_t value);

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
    [[nodiscard]] status set_colors(std::vector<color> colors);
    [[nodiscard]] status set_colors_replace_id(std::vector<color> colors, std::uint8_t id);
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
    // Transforms (applied to every frame)
    // ------------------------------------------------------------------------

    void flip(flip_axis axis) noexcept;

    [[nodiscard]] status rotate(rotation rot);
    [[nodiscard]] status rotate_cw() { return rotate(rotation::deg_270); }
    [[nodiscard]] status rotate_ccw() { return rotate(rotation::deg_90); }

    [[nodiscard]] status remap_index(std::uint8_t from, std::uint8_t to);

    // ------------------------------------------------------------------------
    // Playback
    // ------------------------------------------------------------------------

    /**
     * Advance the frame timer.
     * @param delta Seconds since the previous update
     */
    void update(double delta) noexcept;

    /**
     * Restart the frame timer and, depending on the play type:
     *   once           - frame 0, stopped
     *   once_reversed  - last frame, stopped
     *   loops*         - frame 0 (last for loops_reversed), playing
     */
    void reset() noexcept;

    void set_animate(bool animate) noexcept { animate_ = animate; }
    [[nodiscard]] bool animating() const noexcept { return animate_; }

    [[nodiscard]] std::uint8_t current_frame() const noexcept {
        return static_cast<std::uint8_t>(current_frame_);
    }

    [[nodiscard]] std::span<const std::uint8_t> current_frame_pixels() const noexcept;

    // Move on at the next update() regardless of the timer
    void skip_to_next_frame() noexcept { next_frame_time_ = -0.1; }

    // One-off extra delay before the next frame
    void delay_next_frame(double seconds) noexcept { next_frame_time_ += seconds; }

    [[nodiscard]] play_type get_play_type() const noexcept { return play_type_; }

    // Change the play type and reset()
    void set_play_type(play_type type) noexcept;

    // once <-> once_reversed, loops <-> loops_reversed, loops_both turns around
    void reverse() noexcept;

    friend bool operator==(const animated_image& lhs, const animated_image& rhs);

private:
    animated_image(std::uint8_t width, std::uint8_t height, float frame_duration,
                   std::uint8_t frame_count, image_palette palette,
                   std::vector<std::uint8_t> pixels);

    [[nodiscard]] status check_frame(std::size_t index) const;

    std::uint8_t width_ = 1;
    std::uint8_t height_ = 1;
    std::uint8_t frame_count_ = 1;
    float frame_duration_ = 0.1f;
    image_palette palette_;
    std::vector<std::uint8_t> pixels_;

    std::size_t current_frame_ = 0;
    double next_frame_time_ = 0.1;
    bool animate_ = true;
    play_type play_type_ = play_type::loops;
    bool loop_increasing_ = true;
};

} // namespace ici_image

#endif // ICI_IMAGE_ANIMATED_IMAGE_HPP_
