/**
 * @file pngme.cpp
 * @brief Hide, reveal and strip text messages in PNG chunks
 *
 * Messages are stored as extra chunks of a user chosen type. The image
 * data itself is never touched.
 */

#include <pngchunk/png.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/pngchunk_config.h>
#include <iostream>
#include <fstream>
#include <string>
#include <vector>

namespace {

    void usage(const char* prog) {
        std::cout << "pngme (libpngchunk " << PNGCHUNK_VERSION_MAJOR << "." << PNGCHUNK_VERSION_MINOR
                  << "." << PNGCHUNK_VERSION_PATCH << ")\n";
        std::cout << "\n";
        std::cout << "Usage: " << prog << " <command> <args>\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <chunk_type> <message> [output_file]\n";
        std::cout << "    Append a chunk holding the message\n";
        std::cout << "  decode <file> <chunk_type>\n";
        std::cout << "    Print the message of the first chunk of that type\n";
        std::cout << "  remove <file> <chunk_type>\n";
        std::cout << "    Remove every chunk of that type\n";
        std::cout << "  print <file>\n";
        std::cout << "    List all chunks\n";
        std::cout << "\n";
        std::cout << "Chunk types are four ASCII letters, e.g. ruSt.\n";
    }

    pngchunk::parse_options make_options() {
        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "warning: [" << category << "] at offset " << offset << ": " << message << "\n";
        };
        return options;
    }

    pngchunk::png read_png(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary);
        THROW_IO_IF(!file, "Cannot open file '", filename, "'");
        return pngchunk::png::parse(file, make_options());
    }

    void write_png(const pngchunk::png& image, const std::string& filename) {
        std::ofstream file(filename, std::ios::binary | std::ios::trunc);
        THROW_IO_IF(!file, "Cannot create file '", filename, "'");
        image.write(file);
    }

    void encode_message(const std::string& filename, const std::string& type, const std::string& message,
                        const std::string& output) {
        auto id = pngchunk::chunk_type::from_text(type);
        auto image = read_png(filename);
        image.append_chunk(pngchunk::chunk(id, message));
        write_png(image, output);
        std::cout << "Encoded " << message.size() << " bytes into chunk " << id
                  << " of " << output << "\n";
    }

    void decode_message(const std::string& filename, const std::string& type) {
        auto id = pngchunk::chunk_type::from_text(type);
        auto image = read_png(filename);
        const auto* found = image.chunk_by_type(id);
        if (!found) {
            throw pngchunk::png_error("No chunk of type " + id.to_string() + " in " + filename);
        }
        std::cout << "message from \"" << id << "\" is \"" << found->data_as_string() << "\"\n";
    }

    void remove_messages(const std::string& filename, const std::string& type) {
        auto id = pngchunk::chunk_type::from_text(type);
        auto image = read_png(filename);
        auto removed = image.remove_chunks(id);
        write_png(image, filename);
        std::cout << "Removed " << removed << " chunk(s) of type " << id << "\n";
    }

    void print_chunks(const std::string& filename) {
        auto image = read_png(filename);
        std::cout << image;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        usage(argv[0]);
        return 1;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    const std::string& command = args[0];

    try {
        if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
            encode_message(args[1], args[2], args[3], args.size() == 5 ? args[4] : args[1]);
        } else if (command == "decode" && args.size() == 3) {
            decode_message(args[1], args[2]);
        } else if (command == "remove" && args.size() == 3) {
            remove_messages(args[1], args[2]);
        } else if (command == "print" && args.size() == 2) {
            print_chunks(args[1]);
        } else {
            usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
