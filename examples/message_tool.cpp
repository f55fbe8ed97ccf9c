/**
 * @file message_tool.cpp
 * @brief Hide, show and strip text messages in PNG files
 *
 * Usage:
 *   message_tool encode <file> <chunk-type> <message> [<output>]
 *   message_tool decode <file> <chunk-type>
 *   message_tool remove <file> <chunk-type>
 *   message_tool print  <file>
 *
 * The message is stored as a chunk of the given type inserted just
 * before IEND. Use a private ancillary type (e.g. "ruSt") so that
 * other PNG tools ignore it.
 */

#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

    std::vector<std::byte> read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot open file '" + path + "'");
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        auto first = reinterpret_cast<const std::byte*>(raw.data());
        return {first, first + raw.size()};
    }

    void write_file(const std::string& path, const std::vector<std::byte>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Cannot create file '" + path + "'");
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!file) {
            throw std::runtime_error("Failed writing file '" + path + "'");
        }
    }

    int usage(const char* prog) {
        std::cout << "Usage:\n"
                  << "  " << prog << " encode <file> <chunk-type> <message> [<output>]\n"
                  << "  " << prog << " decode <file> <chunk-type>\n"
                  << "  " << prog << " remove <file> <chunk-type>\n"
                  << "  " << prog << " print  <file>\n";
        return 1;
    }

    int encode_message(const std::string& path, const std::string& type, const std::string& message,
               const std::string& out_path) {
        auto png = pngchunk::container::parse(read_file(path));
        png.insert(pngchunk::chunk::from_strings(type, message));
        write_file(out_path, png.to_wire_bytes());
        std::cout << "Wrote message to: " << out_path << "\n";
        return 0;
    }

    int decode_message(const std::string& path, const std::string& type) {
        auto png = pngchunk::container::parse(read_file(path));
        const auto* chunk = png.find_first_by_type(type);
        if (!chunk) {
            std::cerr << "Error: No chunk of type " << type << "\n";
            return 1;
        }
        std::cout << chunk->interpret_data_as_text() << "\n";
        return 0;
    }

    int remove_message(const std::string& path, const std::string& type) {
        auto png = pngchunk::container::parse(read_file(path));
        auto removed = png.remove_first_by_type(type);
        write_file(path, png.to_wire_bytes());
        std::cout << "Removed " << removed.type() << " (" << removed.length() << " bytes) from: " << path << "\n";
        return 0;
    }

    int print_chunks(const std::string& path) {
        std::cout << pngchunk::container::parse(read_file(path));
        return 0;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        return usage(argv[0]);
    }

    const std::string command = argv[1];

    try {
        if (command == "encode" && (argc == 5 || argc == 6)) {
            return encode_message(argv[2], argv[3], argv[4], argc == 6 ? argv[5] : argv[2]);
        }
        if (command == "decode" && argc == 4) {
            return decode_message(argv[2], argv[3]);
        }
        if (command == "remove" && argc == 4) {
            return remove_message(argv[2], argv[3]);
        }
        if (command == "print" && argc == 3) {
            return print_chunks(argv[2]);
        }
    } catch (const pngchunk::png_error& e) {
        std::cerr << "Error (" << pngchunk::to_string(e.code()) << "): " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return usage(argv[0]);
}
