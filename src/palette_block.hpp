#pragma once

#include <ici_image/palette.hpp>

#include <cstdint>
#include <vector>

namespace ici_image {

// Append a palette block without validating it. Callers hold a palette that
// already passed validate_palette().
void write_palette_block(const file_palette& palette, std::vector<std::uint8_t>& out);

} // namespace ici_image
