#include <doctest/doctest.h>
#include <ici_image/animated_image.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <span>
#include <utility>
#include <vector>

using ici_image::animated_image;
using ici_image::color;
using ici_image::error_code;

namespace {

animated_image make_animation(std::uint8_t width, std::uint8_t height, float duration,
                              ici_image::file_palette palette,
                              const std::vector<std::vector<std::uint8_t>>& frames) {
    animated_image image;
    auto result = animated_image::create(width, height, duration, std::move(palette), frames, image);
    REQUIRE_MESSAGE(result.ok, result.message);
    return image;
}

error_code decode_error(const std::vector<std::uint8_t>& data) {
    animated_image image;
    return animated_image::decode(data, image).error;
}

std::vector<std::uint8_t> to_vector(std::span<const std::uint8_t> span) {
    return {span.begin(), span.end()};
}

} // namespace

TEST_CASE("Animated image: construction") {
    SUBCASE("Default is one 1x1 frame") {
        animated_image image;
        CHECK(image.width() == 1);
        CHECK(image.height() == 1);
        CHECK(image.frame_count() == 1);
        CHECK(image.frame_duration() == doctest::Approx(0.1f));
    }

    SUBCASE("Flat buffer") {
        animated_image image;
        REQUIRE(animated_image::create(2, 1, 0.25f, 2, ici_image::no_palette{}, {0, 1, 2, 3}, image));
        CHECK(image.frame_count() == 2);
        CHECK(image.frame_size() == 2);
        CHECK(image.colors().size() == 4);
    }

    SUBCASE("Frame buffers of the wrong size") {
        animated_image image;
        CHECK(animated_image::create(2, 1, 0.25f, ici_image::no_palette{}, {{0, 1}, {2}}, image).error ==
              error_code::frame_size_mismatch);
        CHECK(animated_image::create(2, 1, 0.25f, 3, ici_image::no_palette{}, {0, 1, 2, 3}, image).error ==
              error_code::frame_size_mismatch);
    }

    SUBCASE("Frame count bounds") {
        animated_image image;
        CHECK(animated_image::create(1, 1, 0.1f, ici_image::no_palette{}, {}, image).error ==
              error_code::count_out_of_range);
        CHECK(animated_image::create(1, 1, 0.1f, 0, ici_image::no_palette{}, {}, image).error ==
              error_code::count_out_of_range);
        CHECK(animated_image::create(1, 1, 0.1f, 256, ici_image::no_palette{},
                                     std::vector<std::uint8_t>(256, 0), image).error ==
              error_code::count_out_of_range);
        CHECK(animated_image::create(1, 1, 0.1f, 255, ici_image::no_palette{},
                                     std::vector<std::uint8_t>(255, 0), image));
    }

    SUBCASE("Frame duration must be positive and finite") {
        animated_image image;
        CHECK(animated_image::create(1, 1, 0.0f, 1, ici_image::no_palette{}, {0}, image).error ==
              error_code::invalid_value);
        CHECK(animated_image::create(1, 1, -1.0f, 1, ici_image::no_palette{}, {0}, image).error ==
              error_code::invalid_value);
        CHECK(animated_image::create(1, 1, std::numeric_limits<float>::quiet_NaN(), 1,
                                     ici_image::no_palette{}, {0}, image).error ==
              error_code::invalid_value);
        CHECK(image.set_frame_duration(std::numeric_limits<float>::infinity()).error ==
              error_code::invalid_value);
        REQUIRE(image.set_frame_duration(2.0f));
        CHECK(image.frame_duration() == doctest::Approx(2.0f));
    }

    SUBCASE("Zero dimensions") {
        animated_image image;
        CHECK(animated_image::create(0, 1, 0.1f, 1, ici_image::no_palette{}, {}, image).error ==
              error_code::count_out_of_range);
    }
}

TEST_CASE("Animated image: frames") {
    auto image = make_animation(1, 1, 0.5f,
                                ici_image::palette_colors{{ici_image::colors::red,
                                                           ici_image::colors::blue}},
                                {{0}, {1}, {0}});

    SUBCASE("Frames as static images share the palette") {
        const auto frames = image.as_images();
        REQUIRE(frames.size() == 3);

        const color expected[] = {ici_image::colors::red, ici_image::colors::blue,
                                  ici_image::colors::red};
        for (std::size_t i = 0; i < frames.size(); ++i) {
            CHECK(frames[i].width() == 1);
            CHECK(frames[i].height() == 1);
            color c;
            REQUIRE(frames[i].get_color(frames[i].pixels()[0], c));
            CHECK(c == expected[i]);
        }
    }

    SUBCASE("Each call produces independent copies") {
        auto frames = image.as_images();
        REQUIRE(frames[0].set_color(0, ici_image::colors::white));
        color c;
        REQUIRE(image.get_color(0, c));
        CHECK(c == ici_image::colors::red);
        CHECK(image.as_images()[0].colors()[0] == ici_image::colors::red);
    }

    SUBCASE("Frame access is bounds-checked") {
        std::span<const std::uint8_t> frame;
        REQUIRE(image.get_frame(1, frame));
        CHECK(to_vector(frame) == std::vector<std::uint8_t>{1});
        CHECK(image.get_frame(3, frame).error == error_code::index_out_of_range);

        ici_image::static_image still;
        REQUIRE(image.get_frame_image(2, still));
        CHECK(still.pixels()[0] == 0);
        CHECK(image.get_frame_image(3, still).error == error_code::index_out_of_range);
    }

    SUBCASE("Pixels by frame") {
        std::uint8_t value = 0;
        REQUIRE(image.get_pixel(1, 0, value));
        CHECK(value == 1);
        REQUIRE(image.set_pixel(2, 0, 1));
        REQUIRE(image.get_pixel(2, 0, value));
        CHECK(value == 1);
        CHECK(image.get_pixel(3, 0, value).error == error_code::index_out_of_range);
        CHECK(image.get_pixel(0, 1, value).error == error_code::index_out_of_range);
        CHECK(image.set_pixel(0, 0, 2).error == error_code::index_out_of_range);
    }
}

TEST_CASE("Animated image: codec") {
    SUBCASE("Layout") {
        auto image = make_animation(1, 1, 0.5f, ici_image::palette_id{1}, {{0}, {1}});
        // 0.5f is 0x3F000000
        CHECK(image.encode() == std::vector<std::uint8_t>{1, 1, 2, 0x00, 0x00, 0x00, 0x3F,
                                                          1, 0x01, 0x00, 0, 1});
    }

    SUBCASE("Round trip") {
        auto image = make_animation(2, 2, 0.125f, ici_image::palette_name{"anim"},
                                    {{0, 1, 2, 3}, {3, 2, 1, 0}, {1, 1, 1, 1}});
        animated_image decoded;
        REQUIRE(animated_image::decode(image.encode(), decoded));
        CHECK(decoded == image);
        CHECK(decoded.encode() == image.encode());
    }

    SUBCASE("Equality ignores playback") {
        auto image = make_animation(1, 1, 0.1f, ici_image::no_palette{}, {{0}, {0}});
        auto other = image;
        other.skip_to_next_frame();
        other.update(0.0);
        REQUIRE(other.current_frame() == 1);
        CHECK(other == image);
    }
}

TEST_CASE("Animated image: decode errors") {
    SUBCASE("Truncated header") {
        CHECK(decode_error({1, 1, 1, 0, 0}) == error_code::unexpected_eof);
    }

    SUBCASE("Zero frame count") {
        CHECK(decode_error({1, 1, 0, 0, 0, 0, 0x3F, 0}) == error_code::count_out_of_range);
    }

    SUBCASE("Non-positive duration") {
        CHECK(decode_error({1, 1, 1, 0, 0, 0, 0, 0, 0}) == error_code::invalid_value);
        CHECK(decode_error({1, 1, 1, 0, 0, 0x80, 0xBF, 0, 0}) == error_code::invalid_value);
    }

    SUBCASE("Short and excess frame data") {
        CHECK(decode_error({1, 1, 2, 0, 0, 0, 0x3F, 0, 0}) == error_code::unexpected_eof);
        CHECK(decode_error({1, 1, 1, 0, 0, 0, 0x3F, 0, 0, 0}) == error_code::frame_size_mismatch);

        ici_image::decode_options options;
        options.allow_trailing_data = true;
        animated_image image;
        CHECK(animated_image::decode(std::vector<std::uint8_t>{1, 1, 1, 0, 0, 0, 0x3F, 0, 0, 0},
                                     image, options));
    }
}

TEST_CASE("Animated image: editing and transforms") {
    // Two 2x1 frames: [0 1] and [2 0]
    auto image = make_animation(2, 1, 0.1f, ici_image::no_palette{}, {{0, 1}, {2, 0}});

    SUBCASE("Flip applies to every frame") {
        image.flip(ici_image::flip_axis::horizontal);
        CHECK(to_vector(image.pixels()) == std::vector<std::uint8_t>{1, 0, 0, 2});
    }

    SUBCASE("Rotate applies to every frame") {
        REQUIRE(image.rotate(ici_image::rotation::deg_90));
        CHECK(image.width() == 1);
        CHECK(image.height() == 2);
        CHECK(to_vector(image.pixels()) == std::vector<std::uint8_t>{1, 0, 0, 2});

        REQUIRE(image.rotate_cw());
        CHECK(to_vector(image.pixels()) == std::vector<std::uint8_t>{0, 1, 2, 0});
    }

    SUBCASE("Remap spans all frames") {
        REQUIRE(image.remap_index(0, 1));
        CHECK(to_vector(image.pixels()) == std::vector<std::uint8_t>{1, 1, 2, 1});
    }

    SUBCASE("Palette replacement considers every frame") {
        CHECK(image.set_colors({ici_image::colors::black, ici_image::colors::white}).error ==
              error_code::count_out_of_range);
        REQUIRE(image.set_colors_replace_id({ici_image::colors::black, ici_image::colors::white}, 0));
        CHECK(to_vector(image.pixels()) == std::vector<std::uint8_t>{0, 1, 0, 0});

        REQUIRE(image.set_palette(ici_image::palette_colors{{ici_image::colors::red,
                                                             ici_image::colors::green}}));
        image.tint_mul(0.5f, 0.5f, 0.5f, 1.0f);
        CHECK(image.colors()[0] == color(128, 0, 0));
    }

    SUBCASE("Pad with a color") {
        REQUIRE(image.set_colors_replace_color({ici_image::colors::red}, ici_image::colors::blue));
        REQUIRE(image.colors().size() == 3);
        CHECK(image.colors()[2] == ici_image::colors::blue);
    }
}
