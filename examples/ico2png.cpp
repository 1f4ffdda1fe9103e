#include <icokit/icokit.hpp>

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-o OUTDIR] ICO_FILE\n";
    std::cerr << "Extracts every image of an icon file as PNG.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -o OUTDIR     Output directory (default: .)\n";
    std::cerr << "  -h, --help    Show this help\n";
    std::cerr << "\nExample: " << program << " -o ./out ./sample.ico\n";
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

std::filesystem::path frame_path(const std::filesystem::path& outdir,
                                 const std::filesystem::path& input,
                                 std::size_t index) {
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%02zu.png", index + 1);
    return outdir / (input.stem().string() + suffix);
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path outdir = ".";
    const char* input_arg = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-o") == 0) {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 2;
            }
            outdir = argv[++i];
            continue;
        }
        if (input_arg) {
            print_usage(argv[0]);
            return 2;
        }
        input_arg = argv[i];
    }

    if (!input_arg) {
        print_usage(argv[0]);
        return 2;
    }

    const std::filesystem::path input_path(input_arg);

    std::error_code ec;
    std::filesystem::create_directories(outdir, ec);
    if (ec) {
        std::cerr << "Error: Failed to create " << outdir << ": " << ec.message() << "\n";
        return 1;
    }

    auto data = read_file(input_path);
    if (data.empty()) {
        std::cerr << "Error: Failed to read file: " << input_path << "\n";
        return 1;
    }

    std::vector<icokit::memory_surface> frames;
    auto result = icokit::ico_decoder::decode_frames(data, frames);
    if (!result) {
        std::cerr << "Error: Failed to decode (" << icokit::to_string(result.error)
                  << "): " << result.message << "\n";
        return 1;
    }

    for (std::size_t i = 0; i < frames.size(); ++i) {
        const auto output_path = frame_path(outdir, input_path, i);
        if (!icokit::save_png(frames[i], output_path)) {
            std::cerr << "Error: Failed to save: " << output_path << "\n";
            return 1;
        }
        std::cout << "Saved: " << output_path << " (" << frames[i].width() << "x"
                  << frames[i].height() << ")\n";
    }

    return 0;
}
