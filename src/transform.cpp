#include <ici_image/transform.hpp>

#include <algorithm>

namespace ici_image {

status check_rotation(int width, int height, rotation rot) {
    const auto dst = rotate_size(width, height, rot);
    if (dst.width < 1 || dst.width > MAX_DIMENSION) {
        return status::count_out_of_range("Rotated width", 1, MAX_DIMENSION,
            static_cast<std::size_t>(std::max(dst.width, 0)));
    }
    if (dst.height < 1 || dst.height > MAX_DIMENSION) {
        return status::count_out_of_range("Rotated height", 1, MAX_DIMENSION,
            static_cast<std::size_t>(std::max(dst.height, 0)));
    }
    return status::success();
}

void flip_pixels(std::span<std::uint8_t> pixels, int width, int height,
                 flip_axis axis) noexcept {
    const auto w = static_cast<std::size_t>(width);
    const auto h = static_cast<std::size_t>(height);

    switch (axis) {
        case flip_axis::horizontal:
            for (std::size_t y = 0; y < h; ++y) {
                auto row = pixels.subspan(y * w, w);
                std::reverse(row.begin(), row.end());
            }
            break;
        case flip_axis::vertical:
            for (std::size_t y = 0; y < h / 2; ++y) {
                auto top = pixels.subspan(y * w, w);
                auto bottom = pixels.subspan((h - 1 - y) * w, w);
                std::swap_ranges(top.begin(), top.end(), bottom.begin());
            }
            break;
    }
}

void rotate_pixels(std::span<const std::uint8_t> src,
                   std::span<std::uint8_t> dst,
                   int width, int height, rotation rot) noexcept {
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            const std::size_t from = static_cast<std::size_t>(y) * static_cast<std::size_t>(width) +
                                     static_cast<std::size_t>(x);
            dst[rotated_offset(x, y, width, height, rot)] = src[from];
        }
    }
}

std::size_t replace_index(std::span<std::uint8_t> pixels,
                          std::uint8_t from, std::uint8_t to) noexcept {
    std::size_t changed = 0;
    for (auto& p : pixels) {
        if (p == from) {
            p = to;
            ++changed;
        }
    }
    return from == to ? 0 : changed;
}

} // namespace ici_image
