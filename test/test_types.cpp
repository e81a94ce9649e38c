#include <doctest/doctest.h>
#include <ici_image/types.hpp>

#include <string>

TEST_CASE("Types: status") {
    SUBCASE("Success converts to true") {
        auto result = ici_image::status::success();
        CHECK(result.ok);
        CHECK(static_cast<bool>(result));
        CHECK(result.error == ici_image::error_code::none);
        CHECK(result.message.empty());
    }

    SUBCASE("Failure carries code and message") {
        auto result = ici_image::status::failure(ici_image::error_code::invalid_tag, "bad tag");
        CHECK_FALSE(result);
        CHECK(result.error == ici_image::error_code::invalid_tag);
        CHECK(result.message == "bad tag");
    }

    SUBCASE("Count out of range names the bounds") {
        auto result = ici_image::status::count_out_of_range("Frame count", 1, 255, 0);
        CHECK_FALSE(result);
        CHECK(result.error == ici_image::error_code::count_out_of_range);
        CHECK(result.message == "Frame count 0 out of range [1, 255]");
    }
}

TEST_CASE("Types: error code names") {
    CHECK(std::string(ici_image::to_string(ici_image::error_code::none)) == "none");
    CHECK(std::string(ici_image::to_string(ici_image::error_code::unexpected_eof)) == "unexpected_eof");
    CHECK(std::string(ici_image::to_string(ici_image::error_code::invalid_utf8)) == "invalid_utf8");
    CHECK(std::string(ici_image::to_string(ici_image::error_code::frame_size_mismatch)) ==
          "frame_size_mismatch");
    CHECK(std::string(ici_image::to_string(ici_image::error_code::file_type_mismatch)) ==
          "file_type_mismatch");
}
