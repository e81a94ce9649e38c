#ifndef ICI_IMAGE_PNG_HPP_
#define ICI_IMAGE_PNG_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/static_image.hpp>
#include <ici_image/animated_image.hpp>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ici_image {

// ============================================================================
// PNG Encoder Functions
// ============================================================================

/**
 * Render an image through its effective palette and encode it as RGBA PNG.
 * Indices outside the palette render fully transparent.
 * @param image Source image
 * @return PNG-encoded data, or empty vector on failure
 */
[[nodiscard]] ICI_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(const static_image& image);

/**
 * Encode one frame of an animation as RGBA PNG.
 * @param image Source animation
 * @param frame Frame index
 * @return PNG-encoded data, or empty vector if the frame does not exist or
 *         encoding fails
 */
[[nodiscard]] ICI_IMAGE_EXPORT std::vector<std::uint8_t> encode_png(const animated_image& image,
                                                                    std::size_t frame);

} // namespace ici_image

#endif // ICI_IMAGE_PNG_HPP_
