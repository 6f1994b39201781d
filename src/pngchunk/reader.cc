//
// Chunk scanner over an in-memory source buffer.
//

#include <pngchunk/reader.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/format.hh>

#include <algorithm>
#include <ios>
#include <string>

namespace pngchunk {

    bool has_signature(std::span<const std::byte> source) {
        return source.size() >= signature_size &&
               std::equal(file_signature.begin(), file_signature.end(), source.begin());
    }

    reader::reader(std::span<const std::byte> source)
        : reader(source, parse_options{}) {
    }

    reader::reader(std::span<const std::byte> source, const parse_options& options)
        : m_source(source),
          m_options(options),
          m_position(signature_size) {
        PNGCHUNK_THROW_IF(source.size() < signature_size, signature_error,
                          "Buffer of ", source.size(), " bytes is shorter than the ",
                          signature_size, " byte file signature");
        PNGCHUNK_THROW_UNLESS(has_signature(source), signature_error,
                              "Buffer does not start with the PNG file signature");
    }

    chunk_view reader::next() {
        switch (m_state) {
            case state::ended:
                PNGCHUNK_THROW(pngchunk_error, "next() called after the chunk sequence ended");
            case state::trailing:
                m_state = state::ended;
                PNGCHUNK_THROW(trailing_data_error,
                               m_source.size() - m_position, " byte(s) of trailing data at offset ",
                               m_position, " after the terminator chunk");
            case state::scanning:
                break;
        }

        try {
            return read_chunk();
        } catch (const format_error&) {
            // A malformed chunk leaves no reliable position to continue from
            m_state = state::ended;
            throw;
        }
    }

    chunk_view reader::read_chunk() {
        const std::size_t start = m_position;
        const std::size_t remaining = m_source.size() - start;

        PNGCHUNK_THROW_IF(remaining == 0, missing_terminator_error,
                          "Buffer ends after ", m_index, " chunk(s) without a ",
                          terminator_chunk_type, " chunk");
        PNGCHUNK_THROW_IF(remaining < chunk_header_size, truncated_chunk_error,
                          "Chunk #", m_index, " at offset ", start, " needs ", chunk_header_size,
                          " header bytes, only ", remaining, " remain");

        const std::byte* base = m_source.data() + start;
        const std::uint32_t length = load_be32(base);
        const chunk_type type = chunk_type::from_bytes(base + 4);

        // Checked before the payload is touched, so a bogus length never drives a read
        const std::uint32_t limit = std::min(m_options.max_chunk_size, max_chunk_length);
        PNGCHUNK_THROW_IF(length > limit, chunk_too_large_error,
                          "Chunk #", m_index, " at offset ", start, " declares ", length,
                          " payload bytes, maximum is ", limit);
        PNGCHUNK_THROW_UNLESS(type.is_valid(), invalid_type_tag_error,
                              "Chunk #", m_index, " at offset ", start, " has type ", type,
                              ", type bytes must be ASCII letters");
        PNGCHUNK_THROW_IF(m_index == 0 && type != header_chunk_type, missing_header_error,
                          "First chunk is ", type, ", expected ", header_chunk_type);
        PNGCHUNK_THROW_IF(type == terminator_chunk_type && length != 0, missing_terminator_error,
                          "Terminator chunk at offset ", start, " carries ", length,
                          " payload bytes, it must be empty");

        const std::size_t body = remaining - chunk_header_size;
        PNGCHUNK_THROW_IF(body < std::size_t(length) + chunk_crc_size, truncated_chunk_error,
                          "Chunk #", m_index, " ", type, " at offset ", start, " needs ",
                          std::size_t(length) + chunk_crc_size, " more bytes, only ", body, " remain");

        chunk_view view;
        view.type = type;
        view.payload = m_source.subspan(start + chunk_header_size, length);
        view.stored_crc = load_be32(base + chunk_header_size + length);
        view.offset = start;
        view.index = m_index;

        if (m_options.verify_checksums) {
            const std::uint32_t computed = view.compute_crc();
            if (computed != view.stored_crc) {
                auto msg = build_error_msg("CRC mismatch in chunk #", view.index, " ", type,
                                           " at offset ", start, ": stored 0x", std::hex,
                                           view.stored_crc, ", computed 0x", computed);
                if (m_options.strict) {
                    throw checksum_mismatch_error(msg, type, view.index, start, view.stored_crc, computed);
                }
                warn(start, "checksum", msg);
            }
        }

        m_position = start + view.total_size();
        m_index++;

        if (type == terminator_chunk_type) {
            finish_after_terminator();
        }

        return view;
    }

    void reader::finish_after_terminator() {
        const std::size_t trailing = m_source.size() - m_position;
        if (trailing == 0) {
            m_state = state::ended;
            return;
        }
        if (m_options.strict) {
            m_state = state::trailing;
            return;
        }
        warn(m_position, "trailing_data",
             build_error_msg(trailing, " byte(s) after the terminator chunk ignored"));
        m_state = state::ended;
    }

    void reader::warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
        if (m_options.on_warning) {
            m_options.on_warning(offset, category, message);
        }
    }

    std::vector<chunk_view> reader::collect_all() {
        std::vector<chunk_view> chunks;
        while (has_next()) {
            chunks.push_back(next());
        }
        return chunks;
    }

    std::size_t validate(std::span<const std::byte> source, const parse_options& options) {
        reader r(source, options);
        while (r.has_next()) {
            r.next();
        }
        return r.chunks_read();
    }

    std::optional<chunk_view> find_first(std::span<const std::byte> source,
                                         const chunk_type& type,
                                         const parse_options& options) {
        reader r(source, options);
        while (r.has_next()) {
            auto chunk = r.next();
            if (chunk.type == type) {
                return chunk;
            }
        }
        return std::nullopt;
    }

    std::vector<chunk_view> find_all(std::span<const std::byte> source,
                                     const chunk_type& type,
                                     const parse_options& options) {
        std::vector<chunk_view> found;
        reader r(source, options);
        while (r.has_next()) {
            auto chunk = r.next();
            if (chunk.type == type) {
                found.push_back(chunk);
            }
        }
        return found;
    }

} // namespace pngchunk
