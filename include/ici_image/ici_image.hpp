#ifndef ICI_IMAGE_ICI_IMAGE_HPP_
#define ICI_IMAGE_ICI_IMAGE_HPP_

#include <ici_image/ici_image_export.h>
#include <ici_image/types.hpp>
#include <ici_image/color.hpp>
#include <ici_image/palette.hpp>
#include <ici_image/image_palette.hpp>
#include <ici_image/transform.hpp>
#include <ici_image/static_image.hpp>
#include <ici_image/animated_image.hpp>
#include <ici_image/image_wrapper.hpp>
#include <ici_image/ici_file.hpp>
#include <ici_image/jasc_palette.hpp>
#include <ici_image/png.hpp>
#include <ici_image/overloaded.hpp>

namespace ici_image {

// All public API is included via the headers above.
// See:
//   - types.hpp:          error_code, status, decode_options, limits
//   - color.hpp:          color, channel conversions, named colors
//   - palette.hpp:        file_palette variant, palette block codec, helpers
//   - static_image.hpp:   static_image codec and editing
//   - animated_image.hpp: animated_image codec, editing and playback
//   - image_wrapper.hpp:  either image kind behind one interface
//   - ici_file.hpp:       .ici / .ica file container
//   - jasc_palette.hpp:   JASC-PAL text palettes
//   - png.hpp:            PNG export
//   - overloaded.hpp:     lambda-set visitor for the variants above

} // namespace ici_image

#endif // ICI_IMAGE_ICI_IMAGE_HPP_
