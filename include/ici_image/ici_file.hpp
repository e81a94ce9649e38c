#ifndef ICI_IMAGE_ICI_FILE_HPP_
#define ICI_IMAGE_ICI_FILE_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>
#include <ici_image/static_image.hpp>
#include <ici_image/animated_image.hpp>
#include <ici_image/image_wrapper.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace ici_image {

enum class file_type : std::uint8_t {
    static_image = 1,
    animated_image = 2
};

[[nodiscard]] ICI_IMAGE_EXPORT std::string_view to_string(file_type type) noexcept;

// ".ici" or ".ica"
[[nodiscard]] ICI_IMAGE_EXPORT std::string_view extension(file_type type) noexcept;

// ============================================================================
// ICI File
// ============================================================================
//
// File layout:
//   'I' 'C' 'I'  version:u8 (1)  file_type:u8  body
//
// The body is a static or animated image body as written by their encode().

class ICI_IMAGE_EXPORT ici_file {
public:
    static constexpr std::string_view name = "ici";
    static constexpr std::string_view extensions[] = {".ici", ".ica"};

    static constexpr std::uint8_t MAGIC[] = {'I', 'C', 'I'};
    static constexpr std::uint8_t VERSION = 1;
    static constexpr std::size_t HEADER_SIZE = 5;

    /**
     * Check if data starts with the ICI magic and a supported version.
     * @param data Raw file data
     * @return true if the header matches
     */
    [[nodiscard]] static bool sniff(std::span<const std::uint8_t> data) noexcept;

    /**
     * Read the file type from the header.
     * @return invalid_header, version_mismatch or invalid_tag
     */
    [[nodiscard]] static status detect(std::span<const std::uint8_t> data, file_type& out);

    /**
     * Decode either kind of image.
     * @param data Raw file data
     * @param out Assigned only on success
     * @param options Decode options
     */
    [[nodiscard]] static status decode(std::span<const std::uint8_t> data,
                                       image_wrapper& out,
                                       const decode_options& options = {});

    // Fails file_type_mismatch for an animated image file
    [[nodiscard]] static status decode(std::span<const std::uint8_t> data,
                                       static_image& out,
                                       const decode_options& options = {});

    // Fails file_type_mismatch for a static image file
    [[nodiscard]] static status decode(std::span<const std::uint8_t> data,
                                       animated_image& out,
                                       const decode_options& options = {});

    [[nodiscard]] static std::vector<std::uint8_t> encode(const static_image& image);
    [[nodiscard]] static std::vector<std::uint8_t> encode(const animated_image& image);
    [[nodiscard]] static std::vector<std::uint8_t> encode(const image_wrapper& image);
};

} // namespace ici_image

#endif // ICI_IMAGE_ICI_FILE_HPP_
