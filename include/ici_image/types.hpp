#ifndef ICI_IMAGE_TYPES_HPP_
#define ICI_IMAGE_TYPES_HPP_

#include <ici_image/ici_image_export.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace ici_image {

// ============================================================================
// Format Limits
// ============================================================================

constexpr int MAX_DIMENSION = 255;
constexpr int MAX_FRAME_COUNT = 255;
constexpr int MAX_PALETTE_COLORS = 255;     // persisted Colors / Name payloads
constexpr int MAX_EFFECTIVE_COLORS = 256;   // in-memory palette (indices 0-255)

// ============================================================================
// Errors
// ============================================================================

enum class error_code {
    none,
    unexpected_eof,
    invalid_tag,
    invalid_utf8,
    count_out_of_range,
    dimension_mismatch,
    frame_size_mismatch,
    index_out_of_range,
    invalid_header,
    version_mismatch,
    invalid_value,
    file_type_mismatch
};

[[nodiscard]] ICI_IMAGE_EXPORT const char* to_string(error_code err) noexcept;

// ============================================================================
// Status
// ============================================================================

struct status {
    bool ok = false;
    error_code error = error_code::none;
    std::string message;

    [[nodiscard]] static status success() {
        return {true, error_code::none, {}};
    }

    [[nodiscard]] static status failure(error_code err, std::string msg = {}) {
        return {false, err, std::move(msg)};
    }

    // Bound violation; message reads "<what> <actual> out of range [min, max]"
    [[nodiscard]] ICI_IMAGE_EXPORT static status count_out_of_range(const char* what,
                                                                    std::size_t min,
                                                                    std::size_t max,
                                                                    std::size_t actual);

    explicit operator bool() const noexcept { return ok; }
};

// ============================================================================
// Decode Options
// ============================================================================

struct decode_options {
    // Ignore bytes after the last pixel instead of failing
    bool allow_trailing_data = false;
};

} // namespace ici_image

#endif // ICI_IMAGE_TYPES_HPP_
