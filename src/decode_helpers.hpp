#pragma once

#include <ici_image/types.hpp>
#include <ici_image/palette.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace ici_image {

constexpr std::size_t DIMENSIONS_SIZE = 2;      // width, height
constexpr std::size_t FRAME_COUNT_SIZE = 1;
constexpr std::size_t FRAME_DURATION_SIZE = 4;  // binary32

// Reject zero width or height; 255 is the largest representable value
inline status validate_dimensions(int width, int height) {
    if (width < 1 || width > MAX_DIMENSION) {
        return status::count_out_of_range("Image width", 1, MAX_DIMENSION,
            static_cast<std::size_t>(width < 0 ? 0 : width));
    }
    if (height < 1 || height > MAX_DIMENSION) {
        return status::count_out_of_range("Image height", 1, MAX_DIMENSION,
            static_cast<std::size_t>(height < 0 ? 0 : height));
    }
    return status::success();
}

inline std::size_t frame_size(int width, int height) noexcept {
    return static_cast<std::size_t>(width) * static_cast<std::size_t>(height);
}

// Linear pixel offset for (x, y), bounds-checked against the dimensions
inline status pixel_index(int x, int y, int width, int height, std::size_t& out) {
    if (x < 0 || x >= width) {
        return status::failure(error_code::index_out_of_range,
            "X " + std::to_string(x) + " outside width " + std::to_string(width));
    }
    if (y < 0 || y >= height) {
        return status::failure(error_code::index_out_of_range,
            "Y " + std::to_string(y) + " outside height " + std::to_string(height));
    }
    out = static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
          static_cast<std::size_t>(x);
    return status::success();
}

// Read the palette block at data[offset], advancing offset past it
inline status read_palette_block(std::span<const std::uint8_t> data, std::size_t& offset,
                                 file_palette& out) {
    std::size_t consumed = 0;
    auto result = decode_palette(data.subspan(offset), out, consumed);
    if (!result) {
        return result;
    }
    offset += consumed;
    return status::success();
}

} // namespace ici_image
