/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic pngchunk usage
 *
 * This is a minimal example showing how to parse a PNG file
 * and print information about its chunks.
 */

#include <pngchunk/container.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file.png>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    // Open the file
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    try {
        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };

        auto png = pngchunk::container::parse(raw.data(), raw.size(), options);

        for (const auto& chunk : png.chunks()) {
            std::cout << "Chunk: " << chunk.type().to_string()
                      << " (" << chunk.length() << " bytes)"
                      << (chunk.type().is_critical() ? " critical" : " ancillary")
                      << (chunk.type().is_public() ? " public" : " private")
                      << (chunk.type().is_safe_to_copy() ? " safe-to-copy" : "")
                      << "\n";
        }

        std::cout << "\nParsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
