#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <pngchunk/crc32.hh>
#include <pngchunk/format.hh>

// Hand-assembled PNG byte sequences. They do not go through pngchunk::builder
// so reader tests do not depend on the code they are checking against.

inline std::vector<std::byte> to_bytes(std::string_view s) {
    std::vector<std::byte> out(s.size());
    if (!s.empty()) {
        std::memcpy(out.data(), s.data(), s.size());
    }
    return out;
}

inline void put_be32(std::vector<std::byte>& out, std::uint32_t v) {
    out.push_back(std::byte(v >> 24));
    out.push_back(std::byte(v >> 16));
    out.push_back(std::byte(v >> 8));
    out.push_back(std::byte(v));
}

inline std::vector<std::byte> signature_bytes() {
    return {pngchunk::file_signature.begin(), pngchunk::file_signature.end()};
}

// length + type + payload + crc; crc defaults to the correct one
inline void put_chunk(std::vector<std::byte>& out,
                      std::string_view type,
                      const std::vector<std::byte>& payload,
                      std::optional<std::uint32_t> crc = std::nullopt) {
    put_be32(out, static_cast<std::uint32_t>(payload.size()));
    auto type_bytes = to_bytes(type);
    out.insert(out.end(), type_bytes.begin(), type_bytes.end());
    out.insert(out.end(), payload.begin(), payload.end());

    if (!crc) {
        std::vector<std::byte> crc_data = type_bytes;
        crc_data.insert(crc_data.end(), payload.begin(), payload.end());
        crc = pngchunk::crc32(crc_data);
    }
    put_be32(out, *crc);
}

inline void put_chunk(std::vector<std::byte>& out, std::string_view type, std::string_view payload) {
    put_chunk(out, type, to_bytes(payload));
}

// 1x1 pixel, 8 bit grayscale; stored CRC is 0x3A7E9B55
inline std::vector<std::byte> ihdr_payload() {
    return {std::byte{0}, std::byte{0}, std::byte{0}, std::byte{1},
            std::byte{0}, std::byte{0}, std::byte{0}, std::byte{1},
            std::byte{8}, std::byte{0}, std::byte{0}, std::byte{0}, std::byte{0}};
}

inline std::vector<std::byte> make_png(const std::vector<std::pair<std::string_view, std::string_view>>& middle) {
    auto out = signature_bytes();
    put_chunk(out, "IHDR", ihdr_payload());
    for (const auto& [type, payload] : middle) {
        put_chunk(out, type, payload);
    }
    put_chunk(out, "IEND", std::vector<std::byte>{});
    return out;
}

// IHDR, IEND
inline std::vector<std::byte> minimal_png() {
    return make_png({});
}

// IHDR, IDAT "abcd", IEND
inline std::vector<std::byte> three_chunk_png() {
    return make_png({{"IDAT", "abcd"}});
}

inline std::string_view as_text(std::span<const std::byte> bytes) {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}
