#include <doctest/doctest.h>
#include <ici_image/jasc_palette.hpp>

#include <string>
#include <vector>

using ici_image::color;
using ici_image::error_code;
using ici_image::jasc_palette;

namespace {

error_code decode_error(std::string_view text) {
    jasc_palette palette;
    return jasc_palette::decode(text, palette).error;
}

} // namespace

TEST_CASE("JASC palette: decode") {
    SUBCASE("Two colors") {
        jasc_palette palette;
        REQUIRE(jasc_palette::decode("JASC-PAL\n0100\n2\n255 0 0\n0 255 0\n", palette));
        CHECK(palette.colors == std::vector<color>{color(255, 0, 0, 255), color(0, 255, 0, 255)});
    }

    SUBCASE("CRLF and trailing blank lines") {
        jasc_palette palette;
        REQUIRE(jasc_palette::decode("JASC-PAL\r\n0100\r\n1\r\n1 2 3\r\n\r\n\r\n", palette));
        CHECK(palette.colors == std::vector<color>{color(1, 2, 3)});
    }

    SUBCASE("No trailing newline, extra spacing") {
        jasc_palette palette;
        REQUIRE(jasc_palette::decode("JASC-PAL\n0100\n1\n  10\t20   30 ", palette));
        CHECK(palette.colors == std::vector<color>{color(10, 20, 30)});
    }

    SUBCASE("Empty palette") {
        jasc_palette palette{{ici_image::colors::red}};
        REQUIRE(jasc_palette::decode("JASC-PAL\n0100\n0\n", palette));
        CHECK(palette.colors.empty());
    }
}

TEST_CASE("JASC palette: decode errors") {
    SUBCASE("Header") {
        CHECK(decode_error("JASC-PAI\n0100\n0\n") == error_code::invalid_header);
        CHECK(decode_error("") == error_code::invalid_header);
        CHECK(decode_error("  JASC-PAL  \n0100\n0\n") == error_code::invalid_header);
        CHECK(decode_error("jasc-pal\n0100\n0\n") == error_code::invalid_header);
    }

    SUBCASE("Version") {
        CHECK(decode_error("JASC-PAL\n0200\n0\n") == error_code::version_mismatch);
        CHECK(decode_error("JASC-PAL\n") == error_code::version_mismatch);
        CHECK(decode_error("JASC-PAL\n 0100\n0\n") == error_code::version_mismatch);
        CHECK(decode_error("JASC-PAL\n0100 \n0\n") == error_code::version_mismatch);
    }

    SUBCASE("Count") {
        CHECK(decode_error("JASC-PAL\n0100\n") == error_code::invalid_value);
        CHECK(decode_error("JASC-PAL\n0100\ntwo\n") == error_code::invalid_value);
        CHECK(decode_error("JASC-PAL\n0100\n-1\n") == error_code::count_out_of_range);
        CHECK(decode_error("JASC-PAL\n0100\n257\n") == error_code::count_out_of_range);
    }

    SUBCASE("Count does not match the color lines") {
        CHECK(decode_error("JASC-PAL\n0100\n2\n1 2 3\n") == error_code::count_out_of_range);
        CHECK(decode_error("JASC-PAL\n0100\n1\n1 2 3\n4 5 6\n") == error_code::count_out_of_range);
    }

    SUBCASE("Malformed color lines") {
        CHECK(decode_error("JASC-PAL\n0100\n1\n1 2\n") == error_code::invalid_value);
        CHECK(decode_error("JASC-PAL\n0100\n1\n1 2 3 4\n") == error_code::invalid_value);
        CHECK(decode_error("JASC-PAL\n0100\n1\n1 2 256\n") == error_code::invalid_value);
        CHECK(decode_error("JASC-PAL\n0100\n1\n1 2 x\n") == error_code::invalid_value);
        CHECK(decode_error("JASC-PAL\n0100\n1\n1 2 3x\n") == error_code::invalid_value);
    }

    SUBCASE("Failure leaves the output untouched") {
        jasc_palette palette{{ici_image::colors::red}};
        CHECK_FALSE(jasc_palette::decode("JASC-PAL\n0100\n1\nbad\n", palette));
        CHECK(palette.colors == std::vector<color>{ici_image::colors::red});
    }
}

TEST_CASE("JASC palette: encode") {
    SUBCASE("Layout, alpha dropped") {
        jasc_palette palette{{color(255, 0, 0, 10), color(1, 2, 3)}};
        std::string text;
        REQUIRE(palette.encode(text));
        CHECK(text == "JASC-PAL\n0100\n2\n255 0 0\n1 2 3\n");
    }

    SUBCASE("Round trip of opaque colors") {
        jasc_palette palette{{ici_image::colors::gb_0, ici_image::colors::gb_1,
                              ici_image::colors::gb_2, ici_image::colors::gb_3}};
        std::string text;
        REQUIRE(palette.encode(text));
        jasc_palette decoded;
        REQUIRE(jasc_palette::decode(text, decoded));
        CHECK(decoded == palette);
    }

    SUBCASE("Color count limit matches decode") {
        jasc_palette full{std::vector<color>(256, ici_image::colors::red)};
        std::string text;
        REQUIRE(full.encode(text));
        jasc_palette decoded;
        CHECK(jasc_palette::decode(text, decoded));

        jasc_palette oversized{std::vector<color>(300, ici_image::colors::red)};
        std::string untouched = "keep";
        CHECK(oversized.encode(untouched).error == error_code::count_out_of_range);
        CHECK(untouched == "keep");
    }
}
