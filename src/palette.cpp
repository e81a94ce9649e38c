#include <ici_image/palette.hpp>
#include "byte_io.hpp"
#include <ici_image/overloaded.hpp>
#include "palette_block.hpp"

#include <algorithm>
#include <set>

namespace ici_image {

namespace {

constexpr std::size_t PALETTE_TAG_SIZE = 1;
constexpr std::size_t PALETTE_ID_SIZE = 2;
constexpr std::size_t PALETTE_LENGTH_SIZE = 1;
constexpr std::size_t COLOR_SIZE = 4;

std::size_t distinct_count(std::span<const color> colors) {
    std::set<std::uint32_t> seen;
    for (const auto& c : colors) {
        seen.insert(c.to_rgba());
    }
    return seen.size();
}

} // namespace

palette_tag tag_of(const file_palette& palette) noexcept {
    return std::visit(overloaded{
        [](const no_palette&) { return palette_tag::no_data; },
        [](const palette_id&) { return palette_tag::id; },
        [](const palette_name&) { return palette_tag::name; },
        [](const palette_colors&) { return palette_tag::colors; }
    }, palette);
}

bool is_valid_utf8(std::span<const std::uint8_t> bytes) noexcept {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::uint8_t lead = bytes[i];
        std::size_t extra = 0;
        std::uint32_t cp = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }

        if (i + extra >= bytes.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const std::uint8_t cont = bytes[i + k];
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Reject overlong forms, surrogates and values past U+10FFFF
        constexpr std::uint32_t min_for_length[4] = {0, 0x80, 0x800, 0x10000};
        if (cp < min_for_length[extra] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

status validate_palette(const file_palette& palette) {
    return std::visit(overloaded{
        [](const no_palette&) { return status::success(); },
        [](const palette_id&) { return status::success(); },
        [](const palette_name& p) {
            if (p.name.empty() || p.name.size() > static_cast<std::size_t>(MAX_PALETTE_COLORS)) {
                return status::count_out_of_range("Palette name length", 1,
                    MAX_PALETTE_COLORS, p.name.size());
            }
            const auto* bytes = reinterpret_cast<const std::uint8_t*>(p.name.data());
            if (!is_valid_utf8({bytes, p.name.size()})) {
                return status::failure(error_code::invalid_utf8,
                    "Palette name is not valid UTF-8");
            }
            return status::success();
        },
        [](const palette_colors& p) {
            if (p.colors.empty() || p.colors.size() > static_cast<std::size_t>(MAX_PALETTE_COLORS)) {
                return status::count_out_of_range("Palette color count", 1,
                    MAX_PALETTE_COLORS, p.colors.size());
            }
            return status::success();
        }
    }, palette);
}

void write_palette_block(const file_palette& palette, std::vector<std::uint8_t>& out) {
    out.push_back(static_cast<std::uint8_t>(tag_of(palette)));
    std::visit(overloaded{
        [](const no_palette&) {},
        [&out](const palette_id& p) { write_le16(out, p.id); },
        [&out](const palette_name& p) {
            out.push_back(static_cast<std::uint8_t>(p.name.size()));
            out.insert(out.end(), p.name.begin(), p.name.end());
        },
        [&out](const palette_colors& p) {
            out.push_back(static_cast<std::uint8_t>(p.colors.size()));
            for (const auto& c : p.colors) {
                out.push_back(c.r);
                out.push_back(c.g);
                out.push_back(c.b);
                out.push_back(c.a);
            }
        }
    }, palette);
}

status encode_palette(const file_palette& palette, std::vector<std::uint8_t>& out) {
    auto result = validate_palette(palette);
    if (!result) {
        return result;
    }
    write_palette_block(palette, out);
    return status::success();
}

status decode_palette(std::span<const std::uint8_t> data,
                      file_palette& out,
                      std::size_t& consumed) {
    if (data.size() < PALETTE_TAG_SIZE) {
        return status::failure(error_code::unexpected_eof,
            "Missing palette block, expected palette tag");
    }

    const std::uint8_t tag = data[0];
    const auto payload = data.subspan(PALETTE_TAG_SIZE);

    switch (tag) {
        case static_cast<std::uint8_t>(palette_tag::no_data):
            out = no_palette{};
            consumed = PALETTE_TAG_SIZE;
            return status::success();

        case static_cast<std::uint8_t>(palette_tag::id):
            if (payload.size() < PALETTE_ID_SIZE) {
                return status::failure(error_code::unexpected_eof,
                    "Palette block truncated, expected 2 byte palette ID");
            }
            out = palette_id{read_le16(payload.data())};
            consumed = PALETTE_TAG_SIZE + PALETTE_ID_SIZE;
            return status::success();

        case static_cast<std::uint8_t>(palette_tag::name): {
            if (payload.size() < PALETTE_LENGTH_SIZE) {
                return status::failure(error_code::unexpected_eof,
                    "Palette block truncated, expected name length");
            }
            const std::size_t len = payload[0];
            if (len == 0) {
                return status::count_out_of_range("Palette name length", 1,
                    MAX_PALETTE_COLORS, len);
            }
            if (payload.size() < PALETTE_LENGTH_SIZE + len) {
                return status::failure(error_code::unexpected_eof,
                    "Palette block truncated, expected " + std::to_string(len) +
                    " name bytes");
            }
            const auto name_bytes = payload.subspan(PALETTE_LENGTH_SIZE, len);
            if (!is_valid_utf8(name_bytes)) {
                return status::failure(error_code::invalid_utf8,
                    "Palette name is not valid UTF-8");
            }
            out = palette_name{std::string(name_bytes.begin(), name_bytes.end())};
            consumed = PALETTE_TAG_SIZE + PALETTE_LENGTH_SIZE + len;
            return status::success();
        }

        case static_cast<std::uint8_t>(palette_tag::colors): {
            if (payload.size() < PALETTE_LENGTH_SIZE) {
                return status::failure(error_code::unexpected_eof,
                    "Palette block truncated, expected color count");
            }
            const std::size_t count = payload[0];
            if (count == 0) {
                return status::count_out_of_range("Palette color count", 1,
                    MAX_PALETTE_COLORS, count);
            }
            if (payload.size() < PALETTE_LENGTH_SIZE + count * COLOR_SIZE) {
                return status::failure(error_code::unexpected_eof,
                    "Palette block truncated, expected " + std::to_string(count) +
                    " colors");
            }
            palette_colors p;
            p.colors.reserve(count);
            const auto* src = payload.data() + PALETTE_LENGTH_SIZE;
            for (std::size_t i = 0; i < count; ++i, src += COLOR_SIZE) {
                p.colors.emplace_back(src[0], src[1], src[2], src[3]);
            }
            out = std::move(p);
            consumed = PALETTE_TAG_SIZE + PALETTE_LENGTH_SIZE + count * COLOR_SIZE;
            return status::success();
        }

        default:
            return status::failure(error_code::invalid_tag,
                "Unsupported palette tag " + std::to_string(tag));
    }
}

std::size_t min_palette_size(std::span<const std::uint8_t> pixels) noexcept {
    if (pixels.empty()) {
        return 1;
    }
    return static_cast<std::size_t>(*std::max_element(pixels.begin(), pixels.end())) + 1;
}

std::vector<color> synthesize_colors(std::span<const std::uint8_t> pixels) {
    return std::vector<color>(min_palette_size(pixels), colors::transparent);
}

std::vector<color> effective_colors(const file_palette& palette,
                                    std::span<const std::uint8_t> pixels) {
    if (const auto* explicit_colors = std::get_if<palette_colors>(&palette)) {
        return explicit_colors->colors;
    }
    return synthesize_colors(pixels);
}

std::vector<color> simplify_palette(std::span<const color> colors, int threshold) {
    std::vector<color> output(colors.begin(), colors.end());
    std::size_t idx = 0;

    while (idx < output.size()) {
        const color current = output[idx];
        bool merged = false;
        for (std::size_t i = 0; i < output.size(); ++i) {
            const int distance = current.diff(output[i]);
            if (i != idx && distance > 0 && distance < threshold) {
                const color m = current.mid(output[i]);
                output[idx] = m;
                output[i] = m;
                merged = true;
                break;
            }
        }
        if (!merged) {
            ++idx;
        }
    }

    return output;
}

std::vector<color> simplify_palette_to_fit(std::span<const color> colors, std::size_t max) {
    std::vector<color> output(colors.begin(), colors.end());
    const std::size_t target = std::max<std::size_t>(max, 2);
    int threshold = 2;
    while (distinct_count(output) >= target) {
        output = simplify_palette(output, threshold);
        threshold += 10;
    }
    return output;
}

} // namespace ici_image
