/**
 * @file edit_log.hh
 * @brief Ordered record of pending chunk level edits
 *
 * The edit log is the builder's storage. Each entry either borrows a chunk
 * from a source buffer (no copy), owns a caller supplied chunk, or is a
 * tombstone left by a removal. Order of entries is output order.
 *
 * Two numberings exist:
 *  - the logical index counts live (non-removed) entries only. It shifts
 *    immediately when an entry is removed or inserted, so every index based
 *    call sees the numbering left by the previous call;
 *  - the entry id is assigned once when an entry enters the log and never
 *    changes, whatever happens around it. replace() keeps the id of the
 *    slot it overwrites.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/chunk_view.hh>

namespace pngchunk {

    using entry_id = std::uint64_t;

    /// Pass-through of a chunk living in some source buffer
    struct borrowed_chunk {
        chunk_view view;
    };

    /// Chunk whose payload is owned by the log
    struct owned_chunk {
        chunk_type type;
        std::vector<std::byte> payload;
    };

    /// Tombstone: contributes nothing to the output
    struct removed_chunk {
    };

    using entry_content = std::variant<borrowed_chunk, owned_chunk, removed_chunk>;

    struct PNGCHUNK_EXPORT edit_entry {
        entry_id id = 0;
        entry_content content;

        [[nodiscard]] bool is_live() const { return !std::holds_alternative<removed_chunk>(content); }
        [[nodiscard]] bool is_borrowed() const { return std::holds_alternative<borrowed_chunk>(content); }

        // Only meaningful for live entries; a tombstone reports an all NUL type and no payload
        [[nodiscard]] chunk_type type() const;
        [[nodiscard]] std::span<const std::byte> payload() const;
    };

    class PNGCHUNK_EXPORT edit_log {
    public:
        edit_log() = default;

        /// Append after every existing entry
        entry_id push_back(entry_content content);

        /**
         * @brief Insert so the new entry gets logical index @p logical
         * @param logical In [0, live_count()]; live_count() appends
         * @throws index_out_of_range_error
         */
        entry_id insert_at(std::size_t logical, entry_content content);

        /**
         * @brief Turn the live entry at @p logical into a tombstone
         * @throws index_out_of_range_error
         */
        void tombstone(std::size_t logical);

        /**
         * @brief Replace the content of the live entry at @p logical, keeping its id
         * @throws index_out_of_range_error
         */
        void overwrite(std::size_t logical, entry_content content);

        /**
         * @brief Rewrite the order of the live entries
         *
         * order[k] is the current logical index that moves to position k.
         * Tombstones are dropped by the rewrite.
         * @throws invalid_permutation_error unless order is a bijection over [0, live_count())
         */
        void permute(std::span<const std::size_t> order);

        [[nodiscard]] std::size_t live_count() const { return m_live; }

        /// Number of entries including tombstones
        [[nodiscard]] std::size_t entry_count() const { return m_entries.size(); }

        /// Live entry by logical index
        /// @throws index_out_of_range_error
        [[nodiscard]] const edit_entry& at(std::size_t logical) const;

        /// Current logical index of an entry, empty once it was removed
        [[nodiscard]] std::optional<std::size_t> logical_index(entry_id id) const;

        [[nodiscard]] const std::vector<edit_entry>& entries() const { return m_entries; }

        template<typename Func>
        void for_each_live(Func func) const {
            for (const auto& e : m_entries) {
                if (e.is_live()) {
                    func(e);
                }
            }
        }

    private:
        [[nodiscard]] std::size_t physical_index(std::size_t logical) const;

        std::vector<edit_entry> m_entries;
        std::size_t m_live = 0;
        entry_id m_next_id = 0;
    };

} // namespace pngchunk
