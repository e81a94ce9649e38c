#include <ici_image/ici_image.hpp>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <variant>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] <image_file> [output.png]\n";
    std::cerr << "Prints ICI image information and converts the first frame to PNG.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -p, --palette <file.pal>  Print a JASC palette\n";
    std::cerr << "  -h, --help                Show this help\n";
}

std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    const auto size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    file.read(reinterpret_cast<char*>(data.data()), size);

    return data;
}

bool write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));

    return file.good();
}

std::string describe(const ici_image::file_palette& palette) {
    return std::visit(ici_image::overloaded{
        [](const ici_image::no_palette&) -> std::string { return "none"; },
        [](const ici_image::palette_id& p) { return "id " + std::to_string(p.id); },
        [](const ici_image::palette_name& p) { return "name '" + p.name + "'"; },
        [](const ici_image::palette_colors& p) {
            return std::to_string(p.colors.size()) + " colors";
        },
    }, palette);
}

int print_jasc(const std::filesystem::path& path) {
    auto data = read_file(path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << path << "\n";
        return 1;
    }

    ici_image::jasc_palette palette;
    const std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
    auto result = ici_image::jasc_palette::decode(text, palette);
    if (!result) {
        std::cerr << "Error: Failed to decode: " << result.message << "\n";
        return 1;
    }

    std::cout << "Colors: " << palette.colors.size() << "\n";
    for (std::size_t i = 0; i < palette.colors.size(); ++i) {
        std::cout << "  " << i << ": " << palette.colors[i].to_hex() << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    // Check for options
    if (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        return 0;
    }

    if (std::strcmp(argv[1], "-p") == 0 || std::strcmp(argv[1], "--palette") == 0) {
        if (argc < 3) {
            print_usage(argv[0]);
            return 1;
        }
        return print_jasc(argv[2]);
    }

    const std::filesystem::path input_path(argv[1]);

    if (!std::filesystem::exists(input_path)) {
        std::cerr << "Error: File not found: " << input_path << "\n";
        return 1;
    }

    // Read input file
    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    if (!ici_image::ici_file::sniff(data)) {
        std::cerr << "Error: Not an ICI file: " << input_path << "\n";
        return 1;
    }

    ici_image::image_wrapper image;
    auto result = ici_image::ici_file::decode(data, image);
    if (!result) {
        std::cerr << "Error: Failed to decode (" << ici_image::to_string(result.error)
                  << "): " << result.message << "\n";
        return 1;
    }

    std::cout << "Type: " << (image.is_animated() ? "animated" : "static") << "\n";
    std::cout << "Size: " << static_cast<int>(image.width()) << "x"
              << static_cast<int>(image.height()) << "\n";
    std::cout << "Palette: " << describe(image.palette()) << " ("
              << image.colors().size() << " effective)\n";
    if (const auto* animation = image.as_animated()) {
        std::cout << "Frames: " << static_cast<int>(animation->frame_count()) << " at "
                  << animation->frame_duration() << " s\n";
    }

    // Use second argument as output path, or same name with .png extension
    std::filesystem::path output_path;
    if (argc >= 3) {
        output_path = argv[2];
    } else {
        output_path = input_path;
        output_path.replace_extension(".png");
    }

    const auto png = image.is_animated()
        ? ici_image::encode_png(*image.as_animated(), 0)
        : ici_image::encode_png(*image.as_static());
    if (png.empty() || !write_file(output_path, png)) {
        std::cerr << "Error: Failed to save: " << output_path << "\n";
        return 1;
    }

    std::cout << "Saved: " << output_path << "\n";

    return 0;
}
