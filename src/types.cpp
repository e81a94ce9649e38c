#include <ici_image/types.hpp>

namespace ici_image {

const char* to_string(error_code err) noexcept {
    switch (err) {
        case error_code::none:                return "none";
        case error_code::unexpected_eof:      return "unexpected_eof";
        case error_code::invalid_tag:         return "invalid_tag";
        case error_code::invalid_utf8:        return "invalid_utf8";
        case error_code::count_out_of_range:  return "count_out_of_range";
        case error_code::dimension_mismatch:  return "dimension_mismatch";
        case error_code::frame_size_mismatch: return "frame_size_mismatch";
        case error_code::index_out_of_range:  return "index_out_of_range";
        case error_code::invalid_header:      return "invalid_header";
        case error_code::version_mismatch:    return "version_mismatch";
        case error_code::invalid_value:       return "invalid_value";
        case error_code::file_type_mismatch:  return "file_type_mismatch";
    }
    return "unknown";
}

status status::count_out_of_range(const char* what, std::size_t min,
                                  std::size_t max, std::size_t actual) {
    return failure(error_code::count_out_of_range,
        std::string(what) + " " + std::to_string(actual) + " out of range [" +
        std::to_string(min) + ", " + std::to_string(max) + "]");
}

} // namespace ici_image
