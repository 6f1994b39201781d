//
// Table driven CRC-32, table built at compile time.
//

#include <pngchunk/crc32.hh>
#include <array>

namespace pngchunk {

    namespace {
        constexpr std::array<std::uint32_t, 256> make_crc_table() {
            std::array<std::uint32_t, 256> table{};
            for (std::uint32_t n = 0; n < 256; n++) {
                std::uint32_t c = n;
                for (int k = 0; k < 8; k++) {
                    if (c & 1) {
                        c = 0xEDB88320u ^ (c >> 1);
                    } else {
                        c >>= 1;
                    }
                }
                table[n] = c;
            }
            return table;
        }

        constexpr auto crc_table = make_crc_table();

        static_assert(crc_table[1] == 0x77073096u, "CRC table generation is broken");
    }

    std::uint32_t crc32_update(std::uint32_t state, std::span<const std::byte> bytes) {
        for (std::byte b : bytes) {
            state = crc_table[(state ^ std::to_integer<std::uint32_t>(b)) & 0xFFu] ^ (state >> 8);
        }
        return state;
    }

    std::uint32_t crc32(std::span<const std::byte> bytes) {
        return crc32_finish(crc32_update(crc32_initial, bytes));
    }

    std::uint32_t chunk_crc(const chunk_type& type, std::span<const std::byte> payload) {
        std::array<std::byte, 4> tag;
        type.to_bytes(tag.data());

        std::uint32_t state = crc32_update(crc32_initial, tag);
        state = crc32_update(state, payload);
        return crc32_finish(state);
    }

} // namespace pngchunk
