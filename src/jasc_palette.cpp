#include <ici_image/jasc_palette.hpp>

#include <cctype>
#include <charconv>
#include <utility>

namespace ici_image {

namespace {

constexpr int COLORS_PER_LINE = 3;

// Splits on '\n' and strips one trailing '\r' from every line
std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }

    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Whole string must be a decimal integer
bool parse_int(std::string_view s, int& value) {
    if (s.empty()) {
        return false;
    }
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    auto result = std::from_chars(begin, end, value);
    return result.ec == std::errc{} && result.ptr == end;
}

bool parse_color_line(std::string_view line, color& out) {
    int values[COLORS_PER_LINE] = {};
    int found = 0;
    const char* ptr = line.data();
    const char* end = line.data() + line.size();

    while (true) {
        while (ptr < end && std::isspace(static_cast<unsigned char>(*ptr))) {
            ptr++;
        }
        if (ptr >= end) {
            break;
        }
        if (found == COLORS_PER_LINE) {
            return false;
        }

        int value = 0;
        auto result = std::from_chars(ptr, end, value);
        if (result.ec != std::errc{} || value < 0 || value > 255) {
            return false;
        }
        if (result.ptr < end && !std::isspace(static_cast<unsigned char>(*result.ptr))) {
            return false;
        }
        values[found++] = value;
        ptr = result.ptr;
    }

    if (found != COLORS_PER_LINE) {
        return false;
    }
    out = color(static_cast<std::uint8_t>(values[0]),
                static_cast<std::uint8_t>(values[1]),
                static_cast<std::uint8_t>(values[2]));
    return true;
}

} // namespace

status jasc_palette::decode(std::string_view text, jasc_palette& out) {
    const auto lines = split_lines(text);

    if (lines.empty() || lines[0] != HEADER) {
        return status::failure(error_code::invalid_header, "Missing JASC-PAL header");
    }
    if (lines.size() < 2 || lines[1] != VERSION) {
        return status::failure(error_code::version_mismatch,
            "Unsupported JASC version, expected 0100");
    }
    if (lines.size() < 3) {
        return status::failure(error_code::invalid_value, "Missing color count");
    }

    int count = 0;
    if (!parse_int(trim(lines[2]), count)) {
        return status::failure(error_code::invalid_value,
            "Color count is not a number: '" + std::string(lines[2]) + "'");
    }
    if (count < 0 || count > MAX_COLORS) {
        return status::failure(error_code::count_out_of_range,
            "Color count out of range [0, " + std::to_string(MAX_COLORS) + "], got " +
            std::to_string(count));
    }

    const std::size_t color_lines = lines.size() - 3;
    if (color_lines != static_cast<std::size_t>(count)) {
        return status::count_out_of_range("Color line count", static_cast<std::size_t>(count),
                                          static_cast<std::size_t>(count), color_lines);
    }

    std::vector<color> colors;
    colors.reserve(color_lines);
    for (std::size_t i = 0; i < color_lines; ++i) {
        color c;
        if (!parse_color_line(lines[3 + i], c)) {
            return status::failure(error_code::invalid_value,
                "Color line " + std::to_string(i + 1) + " is not three values 0-255: '" +
                std::string(lines[3 + i]) + "'");
        }
        colors.push_back(c);
    }

    out.colors = std::move(colors);
    return status::success();
}

status jasc_palette::encode(std::string& out) const {
    if (colors.size() > static_cast<std::size_t>(MAX_COLORS)) {
        return status::count_out_of_range("JASC color count", 0,
                                          static_cast<std::size_t>(MAX_COLORS), colors.size());
    }

    std::string output;
    output.reserve(16 + colors.size() * 12);
    output.append(HEADER).append("\n");
    output.append(VERSION).append("\n");
    output.append(std::to_string(colors.size())).append("\n");
    for (const auto& c : colors) {
        output.append(std::to_string(c.r)).append(" ");
        output.append(std::to_string(c.g)).append(" ");
        output.append(std::to_string(c.b)).append("\n");
    }

    out = std::move(output);
    return status::success();
}

} // namespace ici_image
