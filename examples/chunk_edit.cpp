/**
 * @file chunk_edit.cpp
 * @brief Strip or add chunks and write the rebuilt PNG file
 *
 * Unchanged chunks are copied straight from the input buffer when the
 * output is serialized.
 */

#include <pngchunk/reader.hh>
#include <pngchunk/builder.hh>
#include <pngchunk/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <span>
#include <vector>
#include <string>

namespace {

    struct edit_command {
        enum class kind { strip, add_text };
        kind what;
        std::string argument;
    };

}

class ChunkEditor {
public:
    bool load(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to open file: " << filename << "\n";
            return false;
        }
        data_.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());

        pngchunk::reader r(bytes());
        builder_ = pngchunk::builder::from_reader(r);
        std::cout << "Loaded " << builder_.size() << " chunk(s) from " << filename << "\n";
        return true;
    }

    void strip(const pngchunk::chunk_type& type) {
        size_t removed = 0;
        // Indices shift after each removal, so only advance past kept chunks
        for (size_t i = 0; i < builder_.size();) {
            if (builder_.type_at(i) == type) {
                builder_.remove(i);
                removed++;
            } else {
                ++i;
            }
        }
        std::cout << "Stripped " << removed << " " << type << " chunk(s)\n";
    }

    void add_text(const std::string& key, const std::string& value) {
        // tEXt payload: keyword, NUL separator, text
        std::vector<std::byte> payload = pngchunk::to_payload(key);
        payload.push_back(std::byte{0});
        auto text = pngchunk::to_payload(value);
        payload.insert(payload.end(), text.begin(), text.end());

        builder_.insert_after(0, pngchunk::chunk_type("tEXt"), std::move(payload));
        std::cout << "Added tEXt chunk '" << key << "'\n";
    }

    bool save(const std::string& filename) const {
        auto out = builder_.finalize();
        std::ofstream file(filename, std::ios::binary);
        if (!file) {
            std::cerr << "Failed to create file: " << filename << "\n";
            return false;
        }
        file.write(reinterpret_cast<const char*>(out.data()), static_cast<std::streamsize>(out.size()));
        if (!file) {
            std::cerr << "Failed to write file: " << filename << "\n";
            return false;
        }
        std::cout << "Wrote " << builder_.size() << " chunk(s), " << out.size()
                  << " bytes to " << filename << "\n";
        return true;
    }

private:
    std::span<const std::byte> bytes() const {
        return {reinterpret_cast<const std::byte*>(data_.data()), data_.size()};
    }

    // Borrowed chunks in builder_ point into data_
    std::vector<char> data_;
    pngchunk::builder builder_;
};

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cout << "Usage: " << argv[0] << " <input.png> <output.png> [commands]\n";
        std::cout << "\n";
        std::cout << "Commands (applied in order):\n";
        std::cout << "  --strip TYPE           Remove every chunk of the given type\n";
        std::cout << "  --add-text KEY=VALUE   Insert a tEXt chunk after the header\n";
        std::cout << "\n";
        std::cout << "Example:\n";
        std::cout << "  " << argv[0] << " in.png out.png --strip tIME --add-text Author=me\n";
        return 1;
    }

    std::vector<edit_command> commands;
    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--strip" || arg == "--add-text") && i + 1 < argc) {
            auto what = arg == "--strip" ? edit_command::kind::strip : edit_command::kind::add_text;
            commands.push_back({what, argv[++i]});
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n";
            return 1;
        }
    }

    try {
        ChunkEditor editor;
        if (!editor.load(argv[1])) {
            return 2;
        }

        for (const auto& cmd : commands) {
            if (cmd.what == edit_command::kind::strip) {
                pngchunk::chunk_type type(cmd.argument);
                if (!type.is_valid()) {
                    std::cerr << "Invalid chunk type: " << cmd.argument << "\n";
                    return 1;
                }
                editor.strip(type);
            } else {
                auto eq = cmd.argument.find('=');
                if (eq == std::string::npos || eq == 0) {
                    std::cerr << "Expected KEY=VALUE, got: " << cmd.argument << "\n";
                    return 1;
                }
                editor.add_text(cmd.argument.substr(0, eq), cmd.argument.substr(eq + 1));
            }
        }

        return editor.save(argv[2]) ? 0 : 2;
    } catch (const pngchunk::pngchunk_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
