#include <ici_image/color.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace ici_image {

namespace {

// NaN maps to 0
std::uint8_t saturate_channel(float value) noexcept {
    if (!(value >= 0.0f)) {
        return 0;
    }
    return static_cast<std::uint8_t>(std::min(value, 255.0f));
}

std::uint8_t float_to_channel(float value) noexcept {
    return saturate_channel(std::round(value * 255.0f));
}

float channel_to_float(std::uint8_t value) noexcept {
    return static_cast<float>(value) / 255.0f;
}

std::uint8_t clamp_channel(int value) noexcept {
    return static_cast<std::uint8_t>(std::clamp(value, 0, 255));
}

// Any delta outside this range already saturates a channel
int clamp_delta(int delta) noexcept {
    return std::clamp(delta, -255, 255);
}

int hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

color color::from_rgba(const std::array<float, 4>& v) noexcept {
    return {float_to_channel(v[0]), float_to_channel(v[1]),
            float_to_channel(v[2]), float_to_channel(v[3])};
}

color color::from_argb(const std::array<float, 4>& v) noexcept {
    return {float_to_channel(v[1]), float_to_channel(v[2]),
            float_to_channel(v[3]), float_to_channel(v[0])};
}

color color::from_rgb(const std::array<float, 3>& v) noexcept {
    return {float_to_channel(v[0]), float_to_channel(v[1]), float_to_channel(v[2]), 255};
}

std::array<float, 4> color::to_rgba_float() const noexcept {
    return {{channel_to_float(r), channel_to_float(g), channel_to_float(b), channel_to_float(a)}};
}

std::array<float, 4> color::to_argb_float() const noexcept {
    return {{channel_to_float(a), channel_to_float(r), channel_to_float(g), channel_to_float(b)}};
}

std::array<float, 3> color::to_rgb_float() const noexcept {
    return {{channel_to_float(r), channel_to_float(g), channel_to_float(b)}};
}

status color::from_hex(std::string_view text, color& out) {
    if (!text.empty() && text.front() == '#') {
        text.remove_prefix(1);
    }
    if (text.size() != 6 && text.size() != 8) {
        return status::failure(error_code::invalid_value,
            "Hex color must have 6 or 8 digits");
    }

    std::uint8_t channels[4] = {0, 0, 0, 255};
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int hi = hex_digit(text[i]);
        const int lo = hex_digit(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return status::failure(error_code::invalid_value,
                "Hex color contains non-hex digits");
        }
        channels[i / 2] = static_cast<std::uint8_t>((hi << 4) | lo);
    }

    out = {channels[0], channels[1], channels[2], channels[3]};
    return status::success();
}

std::string color::to_hex() const {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X", r, g, b, a);
    return buf;
}

color color::blend(const color& over) const noexcept {
    const auto base = to_rgba_float();
    const auto top = over.to_rgba_float();

    const float alpha = 1.0f - (1.0f - top[3]) * (1.0f - base[3]);
    if (alpha <= 0.0f) {
        return colors::transparent;
    }

    std::array<float, 4> mix{};
    for (std::size_t i = 0; i < 3; ++i) {
        mix[i] = (top[i] * top[3] / alpha) + (base[i] * base[3] * (1.0f - top[3]) / alpha);
    }
    mix[3] = alpha;
    return from_rgba(mix);
}

float color::brightness() const noexcept {
    const auto c = to_rgb_float();
    return 0.2126f * c[0] + 0.7152f * c[1] + 0.0722f * c[2];
}

color color::mid(const color& other) const noexcept {
    auto midpoint = [](std::uint8_t lhs, std::uint8_t rhs) {
        const int half = std::abs(static_cast<int>(lhs) - static_cast<int>(rhs)) / 2;
        return static_cast<std::uint8_t>(std::min(lhs, rhs) + half);
    };
    return {midpoint(r, other.r), midpoint(g, other.g),
            midpoint(b, other.b), midpoint(a, other.a)};
}

color color::with_brightness(float amount) const noexcept {
    auto c = to_rgba_float();
    for (std::size_t i = 0; i < 3; ++i) {
        c[i] *= amount;
    }
    return from_rgba(c);
}

color color::with_saturate(float amount) const noexcept {
    auto c = to_rgba_float();
    // Rec. 601 luma
    const float lum = 0.2989f * c[0] + 0.5870f * c[1] + 0.1140f * c[2];
    for (std::size_t i = 0; i < 3; ++i) {
        c[i] += amount * (lum - c[i]);
    }
    return from_rgba(c);
}

int color::diff(const color& other) const noexcept {
    return std::abs(static_cast<int>(r) - other.r) +
           std::abs(static_cast<int>(g) - other.g) +
           std::abs(static_cast<int>(b) - other.b) +
           std::abs(static_cast<int>(a) - other.a);
}

void color::tint_add(int dr, int dg, int db, int da) noexcept {
    r = clamp_channel(r + clamp_delta(dr));
    g = clamp_channel(g + clamp_delta(dg));
    b = clamp_channel(b + clamp_delta(db));
    a = clamp_channel(a + clamp_delta(da));
}

void color::tint_mul(float mr, float mg, float mb, float ma) noexcept {
    auto mul = [](std::uint8_t value, float factor) {
        return saturate_channel(std::round(static_cast<float>(value) * factor));
    };
    r = mul(r, mr);
    g = mul(g, mg);
    b = mul(b, mb);
    a = mul(a, ma);
}

} // namespace ici_image
