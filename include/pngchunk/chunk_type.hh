//
// Four byte chunk type tag.
//
#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <algorithm>
#include <ostream>
#include <iomanip>
#include <stdexcept>

namespace pngchunk {
    struct chunk_type {
        std::array<char, 4> b{'\0', '\0', '\0', '\0'};

        constexpr chunk_type() = default;

        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        // A string of any length other than 4 leaves the tag all NUL, which fails is_valid()
        explicit chunk_type(std::string_view sv) {
            if (sv.size() == b.size()) {
                std::copy_n(sv.begin(), b.size(), b.begin());
            }
        }

        chunk_type(const char* str) : chunk_type(std::string_view(str)) {}

        static chunk_type from_bytes(const void* data) {
            chunk_type result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {b.data(), 4};
        }

        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Plain four byte comparison, no case folding: "IHDR" and "iHDR" are unrelated types
        bool operator==(const chunk_type& o) const { return b == o.b; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return b < o.b; }

        static constexpr bool is_letter(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        // Every byte must be an ASCII letter
        [[nodiscard]] constexpr bool is_valid() const {
            return is_letter(b[0]) && is_letter(b[1]) && is_letter(b[2]) && is_letter(b[3]);
        }

        // Property bits: bit 5 (0x20) of each byte.
        // Decoders may skip unknown ancillary chunks.
        [[nodiscard]] constexpr bool is_ancillary() const { return property_bit(0); }
        // Not a registered public chunk type.
        [[nodiscard]] constexpr bool is_private() const { return property_bit(1); }
        // Must be clear in conforming files; kept for inspection only.
        [[nodiscard]] constexpr bool is_reserved() const { return property_bit(2); }
        // Editors may copy the chunk even when they do not understand it.
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return property_bit(3); }

        [[nodiscard]] constexpr bool is_critical() const { return !is_ancillary(); }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << '\'';
            for (char c : t.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                }
            }
            os << '\'';
            os.flags(flags);
            os.fill(fill);
            return os;
        }

    private:
        [[nodiscard]] constexpr bool property_bit(std::size_t i) const {
            return (static_cast<unsigned char>(b[i]) & 0x20u) != 0;
        }
    };

    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, t.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Compile time chunk type; the literal must have exactly 4 characters
    constexpr chunk_type operator""_ct(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("chunk type literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }

    /// Designated first chunk of every file
    inline constexpr chunk_type header_chunk_type{'I', 'H', 'D', 'R'};
    /// Designated last chunk of every file; always carries an empty payload
    inline constexpr chunk_type terminator_chunk_type{'I', 'E', 'N', 'D'};
}

namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
