//
// chunk_view checksum helpers
//

#include <pngchunk/chunk_view.hh>
#include <pngchunk/crc32.hh>

namespace pngchunk {

    std::uint32_t chunk_view::compute_crc() const {
        return chunk_crc(type, payload);
    }

    bool chunk_view::verify_crc() const {
        return compute_crc() == stored_crc;
    }

} // namespace pngchunk
