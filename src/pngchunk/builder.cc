//
// Builder: edit log mutations and the single serialization pass.
//

#include <pngchunk/builder.hh>
#include <pngchunk/reader.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/crc32.hh>
#include <pngchunk/format.hh>

#include <algorithm>
#include <cstring>
#include <utility>

namespace pngchunk {

    namespace {
        void check_chunk(const chunk_type& type, std::size_t length) {
            PNGCHUNK_THROW_UNLESS(type.is_valid(), invalid_type_tag_error,
                                  "Chunk type ", type, " is invalid, type bytes must be ASCII letters");
            PNGCHUNK_THROW_IF(length > max_chunk_length, chunk_too_large_error,
                              "Payload of ", length, " bytes for chunk ", type,
                              " exceeds the maximum of ", max_chunk_length);
        }

        std::byte* write_chunk(std::byte* out, const chunk_type& type, std::span<const std::byte> payload) {
            store_be32(out, static_cast<std::uint32_t>(payload.size()));
            type.to_bytes(out + 4);
            out += chunk_header_size;
            if (!payload.empty()) {
                std::memcpy(out, payload.data(), payload.size());
                out += payload.size();
            }
            store_be32(out, chunk_crc(type, payload));
            return out + chunk_crc_size;
        }
    }

    std::vector<std::byte> to_payload(std::string_view text) {
        std::vector<std::byte> bytes(text.size());
        if (!text.empty()) {
            std::memcpy(bytes.data(), text.data(), text.size());
        }
        return bytes;
    }

    std::vector<std::byte> to_payload(std::span<const std::byte> bytes) {
        return {bytes.begin(), bytes.end()};
    }

    builder::builder()
        : builder(builder_options{}) {
    }

    builder::builder(const builder_options& options)
        : m_options(options) {
    }

    builder builder::from_chunks(std::span<const chunk_view> chunks, const builder_options& options) {
        builder b(options);
        for (const auto& chunk : chunks) {
            b.append_chunk(chunk);
        }
        return b;
    }

    builder builder::from_reader(reader& r, const builder_options& options) {
        builder b(options);
        while (r.has_next()) {
            b.append_chunk(r.next());
        }
        return b;
    }

    void builder::check_index(std::size_t index, const char* operation) const {
        PNGCHUNK_THROW_IF(index >= size(), index_out_of_range_error,
                          operation, ": index ", index, " out of range, builder has ", size(), " chunk(s)");
    }

    entry_id builder::insert_before(std::size_t index, const chunk_type& type, std::vector<std::byte> payload) {
        check_index(index, "insert_before");
        check_chunk(type, payload.size());
        return m_log.insert_at(index, owned_chunk{type, std::move(payload)});
    }

    entry_id builder::insert_after(std::size_t index, const chunk_type& type, std::vector<std::byte> payload) {
        check_index(index, "insert_after");
        check_chunk(type, payload.size());
        return m_log.insert_at(index + 1, owned_chunk{type, std::move(payload)});
    }

    entry_id builder::append(const chunk_type& type, std::vector<std::byte> payload) {
        check_chunk(type, payload.size());
        return m_log.push_back(owned_chunk{type, std::move(payload)});
    }

    entry_id builder::append_chunk(const chunk_view& chunk) {
        check_chunk(chunk.type, chunk.payload.size());
        return m_log.push_back(borrowed_chunk{chunk});
    }

    entry_id builder::insert_chunk_before(std::size_t index, const chunk_view& chunk) {
        check_index(index, "insert_chunk_before");
        check_chunk(chunk.type, chunk.payload.size());
        return m_log.insert_at(index, borrowed_chunk{chunk});
    }

    void builder::remove(std::size_t index) {
        check_index(index, "remove");
        m_log.tombstone(index);
    }

    void builder::replace(std::size_t index, const chunk_type& type, std::vector<std::byte> payload) {
        check_index(index, "replace");
        check_chunk(type, payload.size());
        m_log.overwrite(index, owned_chunk{type, std::move(payload)});
    }

    void builder::reorder(const std::vector<std::size_t>& new_order) {
        m_log.permute(new_order);
    }

    chunk_type builder::type_at(std::size_t index) const {
        check_index(index, "type_at");
        return m_log.at(index).type();
    }

    std::span<const std::byte> builder::payload_at(std::size_t index) const {
        check_index(index, "payload_at");
        return m_log.at(index).payload();
    }

    bool builder::is_borrowed(std::size_t index) const {
        check_index(index, "is_borrowed");
        return m_log.at(index).is_borrowed();
    }

    std::optional<std::size_t> builder::index_of(entry_id id) const {
        return m_log.logical_index(id);
    }

    void builder::warn(std::uint64_t index, std::string_view message) const {
        if (m_options.on_warning) {
            m_options.on_warning(index, "structure", message);
        }
    }

    void builder::check_structure() const {
        const std::size_t count = size();
        const chunk_type first = m_log.at(0).type();
        const edit_entry& last = m_log.at(count - 1);

        if (first != header_chunk_type) {
            auto msg = build_error_msg("First chunk is ", first, ", expected ", header_chunk_type);
            if (m_options.validate_structure) {
                throw missing_header_error(msg);
            }
            warn(0, msg);
        }

        if (last.type() != terminator_chunk_type || !last.payload().empty()) {
            auto msg = build_error_msg("Last chunk is ", last.type(), " with ", last.payload().size(),
                                       " payload bytes, expected an empty ", terminator_chunk_type);
            if (m_options.validate_structure) {
                throw missing_terminator_error(msg);
            }
            warn(count - 1, msg);
        }

        std::size_t index = 0;
        std::optional<std::size_t> early_terminator;
        m_log.for_each_live([&](const edit_entry& e) {
            if (!early_terminator && index + 1 < count && e.type() == terminator_chunk_type) {
                early_terminator = index;
            }
            index++;
        });
        if (early_terminator) {
            auto msg = build_error_msg(count - 1 - *early_terminator,
                                       " chunk(s) follow the terminator at index ", *early_terminator);
            if (m_options.validate_structure) {
                throw trailing_data_error(msg);
            }
            warn(*early_terminator, msg);
        }
    }

    std::vector<std::byte> builder::finalize() const {
        PNGCHUNK_THROW_IF(empty(), empty_output_error,
                          "Nothing to serialize, every chunk has been removed");

        check_structure();

        std::size_t total = signature_size;
        m_log.for_each_live([&total](const edit_entry& e) {
            total += chunk_framing_size + e.payload().size();
        });

        std::vector<std::byte> out(total);
        std::byte* cursor = std::copy(file_signature.begin(), file_signature.end(), out.data());

        // Borrowed payloads are copied here, once; the stored CRC is not reused
        m_log.for_each_live([&cursor](const edit_entry& e) {
            cursor = write_chunk(cursor, e.type(), e.payload());
        });

        return out;
    }

} // namespace pngchunk
