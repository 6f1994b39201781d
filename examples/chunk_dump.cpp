/**
 * @file chunk_dump.cpp
 * @brief List the chunks of a PNG file
 *
 * Prints type, offset, length, checksum and property bits of every chunk.
 * With --lenient, checksum mismatches and trailing bytes are reported as
 * warnings and the listing continues.
 */

#include <pngchunk/reader.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <iterator>
#include <span>
#include <vector>
#include <string>
#include <iomanip>
#include <map>

class ChunkDumper {
public:
    bool dump(const std::string& filename, bool lenient, bool show_hex) {
        std::ifstream file(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << filename << "\n";
            return false;
        }

        // The reader works on a buffer it does not own; keep it alive here
        data_.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        show_hex_ = show_hex;

        std::cout << "File: " << filename << " (" << data_.size() << " bytes)\n";
        std::cout << "=========================================\n\n";

        pngchunk::parse_options options;
        options.strict = !lenient;
        options.on_warning = [](uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };

        try {
            pngchunk::reader r(bytes(), options);
            while (r.has_next()) {
                display_chunk(r.next());
            }
        } catch (const pngchunk::checksum_mismatch_error& e) {
            std::cerr << "Checksum error in chunk " << e.index() << " " << e.type()
                      << ": stored 0x" << std::hex << e.stored()
                      << ", computed 0x" << e.computed() << std::dec << "\n";
            print_summary();
            return false;
        } catch (const pngchunk::format_error& e) {
            std::cerr << "Format error: " << e.what() << "\n";
            print_summary();
            return false;
        }

        print_summary();
        return true;
    }

private:
    std::span<const std::byte> bytes() const {
        return {reinterpret_cast<const std::byte*>(data_.data()), data_.size()};
    }

    void display_chunk(const pngchunk::chunk_view& chunk) {
        std::cout << "[" << chunk.index << "] " << chunk.type.to_string() << "\n";
        std::cout << "  Offset: 0x" << std::hex << chunk.offset << std::dec << "\n";
        std::cout << "  Length: " << chunk.length() << " bytes\n";
        std::cout << "  CRC:    0x" << std::hex << std::setw(8) << std::setfill('0')
                  << chunk.stored_crc << std::dec << std::setfill(' ')
                  << (chunk.verify_crc() ? " (ok)" : " (MISMATCH)") << "\n";
        std::cout << "  Flags:  "
                  << (chunk.type.is_critical() ? "critical" : "ancillary")
                  << (chunk.type.is_private() ? ", private" : ", public")
                  << (chunk.type.is_safe_to_copy() ? ", safe-to-copy" : "")
                  << (chunk.type.is_reserved() ? ", RESERVED BIT SET" : "") << "\n";

        if (show_hex_ && !chunk.payload.empty()) {
            display_hex_dump(chunk.payload.first(std::min<size_t>(64, chunk.payload.size())));
        }
        std::cout << "\n";

        auto& stats = by_type_[chunk.type.to_string()];
        stats.first++;
        stats.second += chunk.length();
    }

    void display_hex_dump(std::span<const std::byte> data) {
        const size_t bytes_per_line = 16;

        for (size_t offset = 0; offset < data.size(); offset += bytes_per_line) {
            std::cout << "    " << std::hex << std::setw(4) << std::setfill('0') << offset << "  ";
            for (size_t i = 0; i < bytes_per_line; ++i) {
                if (offset + i < data.size()) {
                    std::cout << std::setw(2) << static_cast<int>(data[offset + i]) << " ";
                } else {
                    std::cout << "   ";
                }
            }
            std::cout << " |";
            for (size_t i = 0; i < bytes_per_line && offset + i < data.size(); ++i) {
                char c = static_cast<char>(data[offset + i]);
                std::cout << ((c >= 32 && c <= 126) ? c : '.');
            }
            std::cout << "|\n";
        }
        std::cout << std::dec << std::setfill(' ');
    }

    void print_summary() {
        std::cout << "Summary:\n";
        std::cout << "--------\n";
        for (const auto& [type, stats] : by_type_) {
            std::cout << "  " << type << ": " << stats.first << " chunk(s), "
                      << stats.second << " payload bytes\n";
        }
    }

    std::vector<char> data_;
    bool show_hex_ = false;
    std::map<std::string, std::pair<size_t, uint64_t>> by_type_;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: " << argv[0] << " <file.png> [options]\n";
        std::cout << "\n";
        std::cout << "List the chunks of a PNG file.\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  --lenient  Report checksum and trailing data problems as warnings\n";
        std::cout << "  --hex      Show the first 64 payload bytes of each chunk\n";
        return 1;
    }

    bool lenient = false;
    bool hex = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--lenient") {
            lenient = true;
        } else if (arg == "--hex") {
            hex = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return 1;
        }
    }

    ChunkDumper dumper;
    return dumper.dump(argv[1], lenient, hex) ? 0 : 2;
}
