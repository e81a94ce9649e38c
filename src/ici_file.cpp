#include <ici_image/ici_file.hpp>
#include <ici_image/overloaded.hpp>

#include <iterator>
#include <string>
#include <utility>
#include <variant>

namespace ici_image {

namespace {

constexpr std::size_t MAGIC_SIZE = sizeof(ici_file::MAGIC);
constexpr std::size_t VERSION_OFFSET = 3;
constexpr std::size_t FILE_TYPE_OFFSET = 4;

void write_header(file_type type, std::vector<std::uint8_t>& out) {
    out.insert(out.end(), std::begin(ici_file::MAGIC), std::end(ici_file::MAGIC));
    out.push_back(ici_file::VERSION);
    out.push_back(static_cast<std::uint8_t>(type));
}

status expect_type(std::span<const std::uint8_t> data, file_type expected) {
    file_type actual{};
    auto result = ici_file::detect(data, actual);
    if (!result) {
        return result;
    }
    if (actual != expected) {
        return status::failure(error_code::file_type_mismatch,
            "Expected " + std::string(to_string(expected)) + " file, found " +
            std::string(to_string(actual)));
    }
    return status::success();
}

} // namespace

std::string_view to_string(file_type type) noexcept {
    switch (type) {
        case file_type::static_image:   return "static image";
        case file_type::animated_image: return "animated image";
    }
    return "unknown";
}

std::string_view extension(file_type type) noexcept {
    switch (type) {
        case file_type::static_image:   return ".ici";
        case file_type::animated_image: return ".ica";
    }
    return "";
}

// ============================================================================
// ICI File
// ============================================================================

bool ici_file::sniff(std::span<const std::uint8_t> data) noexcept {
    if (data.size() < HEADER_SIZE) {
        return false;
    }

    for (std::size_t i = 0; i < MAGIC_SIZE; ++i) {
        if (data[i] != MAGIC[i]) {
            return false;
        }
    }

    return data[VERSION_OFFSET] == VERSION;
}

status ici_file::detect(std::span<const std::uint8_t> data, file_type& out) {
    if (data.size() < HEADER_SIZE) {
        return status::failure(error_code::invalid_header,
            "File too small for ICI header: " + std::to_string(data.size()) + " bytes");
    }
    for (std::size_t i = 0; i < MAGIC_SIZE; ++i) {
        if (data[i] != MAGIC[i]) {
            return status::failure(error_code::invalid_header, "Not an ICI file");
        }
    }
    if (data[VERSION_OFFSET] != VERSION) {
        return status::failure(error_code::version_mismatch,
            "Unsupported ICI version " + std::to_string(data[VERSION_OFFSET]));
    }

    const std::uint8_t type = data[FILE_TYPE_OFFSET];
    switch (type) {
        case static_cast<std::uint8_t>(file_type::static_image):
            out = file_type::static_image;
            return status::success();
        case static_cast<std::uint8_t>(file_type::animated_image):
            out = file_type::animated_image;
            return status::success();
        default:
            return status::failure(error_code::invalid_tag,
                "Unknown ICI file type " + std::to_string(type));
    }
}

status ici_file::decode(std::span<const std::uint8_t> data,
                        image_wrapper& out,
                        const decode_options& options) {
    file_type type{};
    auto result = detect(data, type);
    if (!result) {
        return result;
    }

    const auto body = data.subspan(HEADER_SIZE);
    if (type == file_type::static_image) {
        static_image image;
        result = static_image::decode(body, image, options);
        if (!result) {
            return result;
        }
        out = image_wrapper(std::move(image));
    } else {
        animated_image image;
        result = animated_image::decode(body, image, options);
        if (!result) {
            return result;
        }
        out = image_wrapper(std::move(image));
    }
    return status::success();
}

status ici_file::decode(std::span<const std::uint8_t> data,
                        static_image& out,
                        const decode_options& options) {
    auto result = expect_type(data, file_type::static_image);
    if (!result) {
        return result;
    }
    return static_image::decode(data.subspan(HEADER_SIZE), out, options);
}

status ici_file::decode(std::span<const std::uint8_t> data,
                        animated_image& out,
                        const decode_options& options) {
    auto result = expect_type(data, file_type::animated_image);
    if (!result) {
        return result;
    }
    return animated_image::decode(data.subspan(HEADER_SIZE), out, options);
}

std::vector<std::uint8_t> ici_file::encode(const static_image& image) {
    std::vector<std::uint8_t> out;
    write_header(file_type::static_image, out);
    image.encode(out);
    return out;
}

std::vector<std::uint8_t> ici_file::encode(const animated_image& image) {
    std::vector<std::uint8_t> out;
    write_header(file_type::animated_image, out);
    image.encode(out);
    return out;
}

std::vector<std::uint8_t> ici_file::encode(const image_wrapper& image) {
    return std::visit(overloaded{
        [](const static_image& held) { return encode(held); },
        [](const animated_image& held) { return encode(held); },
    }, image.value());
}

} // namespace ici_image
