#include <doctest/doctest.h>
#include <ici_image/palette.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

using ici_image::color;
using ici_image::error_code;

namespace {

ici_image::file_palette decode_ok(const std::vector<std::uint8_t>& data, std::size_t& consumed) {
    ici_image::file_palette palette;
    auto result = ici_image::decode_palette(data, palette, consumed);
    REQUIRE_MESSAGE(result.ok, result.message);
    return palette;
}

error_code decode_error(const std::vector<std::uint8_t>& data) {
    ici_image::file_palette palette;
    std::size_t consumed = 0;
    return ici_image::decode_palette(data, palette, consumed).error;
}

std::vector<std::uint8_t> encode_ok(const ici_image::file_palette& palette) {
    std::vector<std::uint8_t> out;
    auto result = ici_image::encode_palette(palette, out);
    REQUIRE_MESSAGE(result.ok, result.message);
    return out;
}

} // namespace

TEST_CASE("Palette: encode layout") {
    SUBCASE("No palette is a lone tag") {
        CHECK(encode_ok(ici_image::no_palette{}) == std::vector<std::uint8_t>{0});
    }

    SUBCASE("Id is little-endian") {
        CHECK(encode_ok(ici_image::palette_id{0x1234}) ==
              std::vector<std::uint8_t>{1, 0x34, 0x12});
    }

    SUBCASE("Name carries its byte length") {
        CHECK(encode_ok(ici_image::palette_name{"gb"}) ==
              std::vector<std::uint8_t>{2, 2, 'g', 'b'});
    }

    SUBCASE("Colors are RGBA quads") {
        ici_image::palette_colors p{{color(1, 2, 3, 4), color(5, 6, 7, 8)}};
        CHECK(encode_ok(p) == std::vector<std::uint8_t>{3, 2, 1, 2, 3, 4, 5, 6, 7, 8});
    }

    SUBCASE("Encode appends") {
        std::vector<std::uint8_t> out = {0xAA};
        REQUIRE(ici_image::encode_palette(ici_image::no_palette{}, out));
        CHECK(out == std::vector<std::uint8_t>{0xAA, 0});
    }
}

TEST_CASE("Palette: decode") {
    std::size_t consumed = 0;

    SUBCASE("No palette") {
        auto p = decode_ok({0, 99}, consumed);
        CHECK(std::holds_alternative<ici_image::no_palette>(p));
        CHECK(consumed == 1);
    }

    SUBCASE("Id") {
        auto p = decode_ok({1, 0x34, 0x12}, consumed);
        REQUIRE(std::holds_alternative<ici_image::palette_id>(p));
        CHECK(std::get<ici_image::palette_id>(p).id == 0x1234);
        CHECK(consumed == 3);
    }

    SUBCASE("Name") {
        auto p = decode_ok({2, 3, 'a', 'b', 'c', 0xFF}, consumed);
        REQUIRE(std::holds_alternative<ici_image::palette_name>(p));
        CHECK(std::get<ici_image::palette_name>(p).name == "abc");
        CHECK(consumed == 5);
    }

    SUBCASE("Colors") {
        auto p = decode_ok({3, 1, 10, 20, 30, 40}, consumed);
        REQUIRE(std::holds_alternative<ici_image::palette_colors>(p));
        CHECK(std::get<ici_image::palette_colors>(p).colors ==
              std::vector<color>{color(10, 20, 30, 40)});
        CHECK(consumed == 6);
    }
}

TEST_CASE("Palette: decode errors") {
    SUBCASE("Unknown tag") {
        CHECK(decode_error({4}) == error_code::invalid_tag);
        CHECK(decode_error({0xFF}) == error_code::invalid_tag);
    }

    SUBCASE("Truncated blocks") {
        CHECK(decode_error({}) == error_code::unexpected_eof);
        CHECK(decode_error({1, 0x34}) == error_code::unexpected_eof);
        CHECK(decode_error({2}) == error_code::unexpected_eof);
        CHECK(decode_error({2, 3, 'a'}) == error_code::unexpected_eof);
        CHECK(decode_error({3, 2, 1, 2, 3, 4, 5}) == error_code::unexpected_eof);
    }

    SUBCASE("Empty name or color list") {
        CHECK(decode_error({2, 0}) == error_code::count_out_of_range);
        CHECK(decode_error({3, 0}) == error_code::count_out_of_range);
    }

    SUBCASE("Name that is not UTF-8") {
        CHECK(decode_error({2, 2, 0xC3, 0x28}) == error_code::invalid_utf8);
        CHECK(decode_error({2, 1, 0x80}) == error_code::invalid_utf8);
    }

    SUBCASE("Failure leaves the output untouched") {
        ici_image::file_palette palette = ici_image::palette_id{7};
        std::size_t consumed = 42;
        auto result = ici_image::decode_palette(std::vector<std::uint8_t>{3, 0}, palette, consumed);
        CHECK_FALSE(result);
        CHECK(palette == ici_image::file_palette{ici_image::palette_id{7}});
        CHECK(consumed == 42);
    }
}

TEST_CASE("Palette: length bounds") {
    SUBCASE("Colors: 0 rejected, 1 and 255 accepted, 256 rejected") {
        CHECK(ici_image::validate_palette(ici_image::palette_colors{}).error ==
              error_code::count_out_of_range);
        CHECK(ici_image::validate_palette(ici_image::palette_colors{std::vector<color>(1)}));
        CHECK(ici_image::validate_palette(ici_image::palette_colors{std::vector<color>(255)}));
        CHECK(ici_image::validate_palette(ici_image::palette_colors{std::vector<color>(256)}).error ==
              error_code::count_out_of_range);
    }

    SUBCASE("Name: 0 rejected, 1 and 255 accepted, 256 rejected") {
        CHECK(ici_image::validate_palette(ici_image::palette_name{""}).error ==
              error_code::count_out_of_range);
        CHECK(ici_image::validate_palette(ici_image::palette_name{"x"}));
        CHECK(ici_image::validate_palette(ici_image::palette_name{std::string(255, 'x')}));
        CHECK(ici_image::validate_palette(ici_image::palette_name{std::string(256, 'x')}).error ==
              error_code::count_out_of_range);
    }

    SUBCASE("Invalid palettes are not encoded") {
        std::vector<std::uint8_t> out;
        CHECK_FALSE(ici_image::encode_palette(ici_image::palette_colors{}, out));
        CHECK(out.empty());
    }
}

TEST_CASE("Palette: round trip") {
    const std::vector<ici_image::file_palette> palettes = {
        ici_image::no_palette{},
        ici_image::palette_id{0},
        ici_image::palette_id{0xFFFF},
        ici_image::palette_name{"Game Boy \xC3\xA9\xE2\x82\xAC"},
        ici_image::palette_name{std::string(255, 'n')},
        ici_image::palette_colors{std::vector<color>(255, color(9, 8, 7, 6))},
    };

    for (const auto& palette : palettes) {
        const auto bytes = encode_ok(palette);
        std::size_t consumed = 0;
        CHECK(decode_ok(bytes, consumed) == palette);
        CHECK(consumed == bytes.size());
    }
}

TEST_CASE("Palette: UTF-8 validation") {
    auto valid = [](std::vector<std::uint8_t> bytes) { return ici_image::is_valid_utf8(bytes); };

    CHECK(valid({'a', 'b'}));
    CHECK(valid({0xC3, 0xA9}));                 // e acute
    CHECK(valid({0xF0, 0x9F, 0x98, 0x80}));     // emoji
    CHECK_FALSE(valid({0xC3}));                 // truncated
    CHECK_FALSE(valid({0xC0, 0x80}));           // overlong NUL
    CHECK_FALSE(valid({0xED, 0xA0, 0x80}));     // surrogate
    CHECK_FALSE(valid({0xF4, 0x90, 0x80, 0x80})); // past U+10FFFF
    CHECK_FALSE(valid({0xFF}));
}

TEST_CASE("Palette: effective colors") {
    SUBCASE("Synthesized palette covers the highest index, all transparent") {
        const std::vector<std::uint8_t> pixels = {0, 1, 1, 2};
        const auto synthesized = ici_image::synthesize_colors(pixels);
        REQUIRE(synthesized.size() == 3);
        for (const auto& c : synthesized) {
            CHECK(c.is_transparent());
        }
    }

    SUBCASE("Empty buffer still gets one entry") {
        CHECK(ici_image::synthesize_colors({}).size() == 1);
        CHECK(ici_image::min_palette_size({}) == 1);
    }

    SUBCASE("Explicit colors win") {
        const std::vector<std::uint8_t> pixels = {0, 5};
        ici_image::palette_colors p{{ici_image::colors::red}};
        CHECK(ici_image::effective_colors(p, pixels) == std::vector<color>{ici_image::colors::red});
    }

    SUBCASE("Id and name palettes synthesize") {
        const std::vector<std::uint8_t> pixels = {4};
        CHECK(ici_image::effective_colors(ici_image::palette_id{1}, pixels).size() == 5);
        CHECK(ici_image::effective_colors(ici_image::palette_name{"x"}, pixels).size() == 5);
    }
}

TEST_CASE("Palette: simplification") {
    SUBCASE("Near colors merge to their midpoint") {
        const std::vector<color> input = {color(100, 100, 100), color(102, 100, 100),
                                          color(0, 0, 0)};
        const auto output = ici_image::simplify_palette(input, 5);
        REQUIRE(output.size() == 3);
        CHECK(output[0] == color(101, 100, 100));
        CHECK(output[1] == color(101, 100, 100));
        CHECK(output[2] == color(0, 0, 0));
    }

    SUBCASE("Distant colors are kept") {
        const std::vector<color> input = {ici_image::colors::black, ici_image::colors::white};
        CHECK(ici_image::simplify_palette(input, 5) == input);
    }

    SUBCASE("Fit reduces the distinct count below the limit") {
        std::vector<color> input;
        for (int i = 0; i < 16; ++i) {
            input.push_back(color::gray(static_cast<std::uint8_t>(i * 4)));
        }
        const auto output = ici_image::simplify_palette_to_fit(input, 8);
        CHECK(output.size() == input.size());

        std::vector<color> distinct;
        for (const auto& c : output) {
            if (std::find(distinct.begin(), distinct.end(), c) == distinct.end()) {
                distinct.push_back(c);
            }
        }
        CHECK(distinct.size() < 8);
    }
}
