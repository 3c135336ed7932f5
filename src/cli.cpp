/**
 * @file cli.cpp
 * @brief bitlongvec command line interface.
 *
 * Packs lists of unsigned integers into fixed bit width files and back.
 */

#include <bitlongvec/bitlongvec.hpp>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

using namespace bitlongvec;

static constexpr const char* PACKED_EXTENSION = ".blv";

static void print_version() {
    std::printf("bitlongvec %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nbitlongvec %s - fixed bit width integer packing\n", version());
    std::printf("=============================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <input.txt> <bit_width>\n", prog_name);
    std::printf("  %s -d <input.blv>\n", prog_name);
    std::printf("  %s -i <input.blv>\n", prog_name);
    std::printf("  %s -r <input.blv> <bit_width>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -d             Unpack to text (default is pack)\n");
    std::printf("  -i             Show information about a packed file\n");
    std::printf("  -r             Re-encode a packed file with a new bit width\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Arguments:\n");
    std::printf("  input.txt      Whitespace separated unsigned decimal values\n");
    std::printf("  input.blv      Packed file\n");
    std::printf("  bit_width      Bits per value, 1-64 (0 = smallest that fits)\n\n");
    std::printf("Output:\n");
    std::printf("  Pack:      <input.txt>.blv\n");
    std::printf("  Unpack:    <base>.txt (or <input>.txt if input does not end in .blv)\n");
    std::printf("  Re-encode: <base>.w<bit_width>.blv\n\n");
    std::printf("Examples:\n");
    std::printf("  %s values.txt 10         # pack\n", prog_name);
    std::printf("  %s -d values.txt.blv     # unpack\n\n", prog_name);
}

static std::string strip_packed_extension(const std::string& input) {
    const std::size_t ext_len = std::strlen(PACKED_EXTENSION);
    if (input.size() > ext_len && input.substr(input.size() - ext_len) == PACKED_EXTENSION) {
        return input.substr(0, input.size() - ext_len);
    }
    return input;
}

static bool parse_size(const char* text, std::size_t& value) {
    const char* end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, value);
    return ec == std::errc() && ptr == end;
}

static bool read_file(const std::string& path, std::vector<std::uint8_t>& buffer) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    buffer.resize(static_cast<std::size_t>(size));
    return static_cast<bool>(file.read(reinterpret_cast<char*>(buffer.data()), size));
}

static bool write_file(const std::string& path, const std::uint8_t* data, std::size_t size) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    return file.good();
}

static bool read_values(const std::string& path, std::vector<word_t>& values) {
    std::ifstream file(path);
    if (!file) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", path.c_str());
        return false;
    }

    std::string token;
    while (file >> token) {
        word_t value = 0;
        const char* end = token.data() + token.size();
        auto [ptr, ec] = std::from_chars(token.data(), end, value);
        if (ec != std::errc() || ptr != end) {
            std::fprintf(stderr, "Error: Not an unsigned 64-bit value: '%s'\n", token.c_str());
            return false;
        }
        values.push_back(value);
    }
    return true;
}

static bool load_packed(const std::string& path, BitLongVec& vec) {
    std::vector<std::uint8_t> data;
    if (!read_file(path, data)) {
        std::fprintf(stderr, "Error: Cannot read input file: %s\n", path.c_str());
        return false;
    }

    Error result = deserialize(data.data(), data.size(), vec);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s: %s\n", path.c_str(), error_string(result));
        return false;
    }
    return true;
}

static bool store_packed(const std::string& path, const BitLongVec& vec) {
    std::vector<std::uint8_t> data(serialized_size(vec));
    std::size_t written = 0;

    Error result = serialize(vec, data.data(), data.size(), written);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return false;
    }
    if (!write_file(path, data.data(), written)) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", path.c_str());
        return false;
    }
    return true;
}

static int do_pack(const char* input_path, std::size_t bit_width) {
    std::vector<word_t> values;
    if (!read_values(input_path, values)) {
        return 1;
    }

    if (bit_width == 0) {
        bit_width = min_bit_width(values.data(), values.size());
    }

    BitLongVec vec;
    Error result = pack(values.data(), values.size(), bit_width, vec);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }

    std::string output_path = std::string(input_path) + PACKED_EXTENSION;
    if (!store_packed(output_path, vec)) {
        return 1;
    }

    // Compare against one full word per value
    std::size_t plain_bytes = values.size() * BYTES_PER_WORD;
    std::printf("Input:       %s (%zu values)\n", input_path, values.size());
    std::printf("Output:      %s (%zu bytes)\n", output_path.c_str(), serialized_size(vec));
    std::printf("Bit width:   %zu\n", vec.bit_width());
    std::printf("Storage:     %zu bytes (%zu words) vs %zu bytes as u64\n", vec.size_bytes(),
                vec.num_words(), plain_bytes);
    if (vec.size_bytes() > 0) {
        double ratio = static_cast<double>(plain_bytes) / static_cast<double>(vec.size_bytes());
        std::printf("Ratio:       %.2fx\n", ratio);
    }

    return 0;
}

static int do_unpack(const char* input_path) {
    BitLongVec vec;
    if (!load_packed(input_path, vec)) {
        return 1;
    }

    std::vector<word_t> values(vec.length());
    Error result = unpack(vec, values.data(), values.size());
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s\n", error_string(result));
        return 1;
    }

    std::string output_path = strip_packed_extension(input_path) + ".txt";
    std::ofstream file(output_path);
    if (!file) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }
    for (word_t value : values) {
        file << value << '\n';
    }
    if (!file.good()) {
        std::fprintf(stderr, "Error: Cannot write output file: %s\n", output_path.c_str());
        return 1;
    }

    std::printf("Input:       %s (%zu values, %zu bits each)\n", input_path, vec.length(),
                vec.bit_width());
    std::printf("Output:      %s\n", output_path.c_str());

    return 0;
}

static int do_info(const char* input_path) {
    BitLongVec vec;
    if (!load_packed(input_path, vec)) {
        return 1;
    }

    std::printf("File:        %s\n", input_path);
    std::printf("Length:      %zu\n", vec.length());
    std::printf("Bit width:   %zu\n", vec.bit_width());
    std::printf("Max value:   %llu\n", static_cast<unsigned long long>(vec.max_value()));
    std::printf("Words:       %zu\n", vec.num_words());
    std::printf("Bytes:       %zu\n", vec.size_bytes());

    return 0;
}

static int do_resize(const char* input_path, std::size_t bit_width) {
    BitLongVec vec;
    if (!load_packed(input_path, vec)) {
        return 1;
    }

    if (bit_width == 0) {
        std::vector<word_t> values(vec.length());
        Error unpacked = unpack(vec, values.data(), values.size());
        if (unpacked != Error::Ok) {
            std::fprintf(stderr, "Error: %s\n", error_string(unpacked));
            return 1;
        }
        bit_width = min_bit_width(values.data(), values.size());
    }

    BitLongVec resized;
    Error result = vec.try_resize(bit_width, resized);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: Re-encoding to %zu bits failed: %s\n", bit_width,
                     error_string(result));
        return 1;
    }

    std::string output_path = strip_packed_extension(input_path) + ".w" +
                              std::to_string(bit_width) + PACKED_EXTENSION;
    if (!store_packed(output_path, resized)) {
        return 1;
    }

    std::printf("Input:       %s (%zu bits, %zu bytes)\n", input_path, vec.bit_width(),
                vec.size_bytes());
    std::printf("Output:      %s (%zu bits, %zu bytes)\n", output_path.c_str(),
                resized.bit_width(), resized.size_bytes());

    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    if (std::strcmp(argv[1], "-d") == 0 || std::strcmp(argv[1], "-i") == 0) {
        if (argc != 3) {
            std::fprintf(stderr, "Error: %s requires 1 argument\n", argv[1]);
            std::fprintf(stderr, "Usage: %s %s <input.blv>\n", argv[0], argv[1]);
            return 1;
        }
        return (argv[1][1] == 'd') ? do_unpack(argv[2]) : do_info(argv[2]);
    }

    std::size_t bit_width = 0;

    if (std::strcmp(argv[1], "-r") == 0) {
        // Re-encode mode: -r <input.blv> <bit_width>
        if (argc != 4) {
            std::fprintf(stderr, "Error: -r requires 2 arguments\n");
            std::fprintf(stderr, "Usage: %s -r <input.blv> <bit_width>\n", argv[0]);
            return 1;
        }
        if (!parse_size(argv[3], bit_width) || bit_width > MAX_BIT_WIDTH) {
            std::fprintf(stderr, "Error: bit_width must be 0-64\n");
            return 1;
        }
        return do_resize(argv[2], bit_width);
    }

    // Pack mode: <input.txt> <bit_width>
    if (argc != 3) {
        std::fprintf(stderr, "Error: Pack requires 2 arguments\n");
        std::fprintf(stderr, "Usage: %s <input.txt> <bit_width>\n", argv[0]);
        return 1;
    }
    if (!parse_size(argv[2], bit_width) || bit_width > MAX_BIT_WIDTH) {
        std::fprintf(stderr, "Error: bit_width must be 0-64\n");
        return 1;
    }

    return do_pack(argv[1], bit_width);
}
