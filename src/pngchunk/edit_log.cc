//
// Edit log storage and index bookkeeping.
//

#include <pngchunk/edit_log.hh>
#include <pngchunk/exceptions.hh>

#include <type_traits>
#include <utility>

namespace pngchunk {

    chunk_type edit_entry::type() const {
        return std::visit([](const auto& c) -> chunk_type {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, borrowed_chunk>) {
                return c.view.type;
            } else if constexpr (std::is_same_v<T, owned_chunk>) {
                return c.type;
            } else {
                return chunk_type{};
            }
        }, content);
    }

    std::span<const std::byte> edit_entry::payload() const {
        return std::visit([](const auto& c) -> std::span<const std::byte> {
            using T = std::decay_t<decltype(c)>;
            if constexpr (std::is_same_v<T, borrowed_chunk>) {
                return c.view.payload;
            } else if constexpr (std::is_same_v<T, owned_chunk>) {
                return c.payload;
            } else {
                return {};
            }
        }, content);
    }

    std::size_t edit_log::physical_index(std::size_t logical) const {
        PNGCHUNK_THROW_IF(logical >= m_live, index_out_of_range_error,
                          "Index ", logical, " out of range, edit log has ", m_live, " live chunk(s)");

        std::size_t seen = 0;
        for (std::size_t i = 0; i < m_entries.size(); i++) {
            if (!m_entries[i].is_live()) {
                continue;
            }
            if (seen == logical) {
                return i;
            }
            seen++;
        }
        // m_live is out of sync with the entries
        PNGCHUNK_THROW(index_out_of_range_error, "Index ", logical, " not found in edit log");
    }

    entry_id edit_log::push_back(entry_content content) {
        edit_entry e{m_next_id, std::move(content)};
        const bool live = e.is_live();
        m_entries.push_back(std::move(e));
        if (live) {
            m_live++;
        }
        return m_next_id++;
    }

    entry_id edit_log::insert_at(std::size_t logical, entry_content content) {
        PNGCHUNK_THROW_IF(logical > m_live, index_out_of_range_error,
                          "Insert position ", logical, " out of range, edit log has ", m_live,
                          " live chunk(s)");
        if (logical == m_live) {
            return push_back(std::move(content));
        }

        const std::size_t pos = physical_index(logical);
        edit_entry e{m_next_id, std::move(content)};
        const bool live = e.is_live();
        m_entries.insert(m_entries.begin() + static_cast<std::ptrdiff_t>(pos), std::move(e));
        if (live) {
            m_live++;
        }
        return m_next_id++;
    }

    void edit_log::tombstone(std::size_t logical) {
        const std::size_t pos = physical_index(logical);
        m_entries[pos].content = removed_chunk{};
        m_live--;
    }

    void edit_log::overwrite(std::size_t logical, entry_content content) {
        const std::size_t pos = physical_index(logical);
        const bool live = !std::holds_alternative<removed_chunk>(content);
        m_entries[pos].content = std::move(content);
        if (!live) {
            m_live--;
        }
    }

    void edit_log::permute(std::span<const std::size_t> order) {
        PNGCHUNK_THROW_IF(order.size() != m_live, invalid_permutation_error,
                          "Permutation has ", order.size(), " element(s), edit log has ", m_live,
                          " live chunk(s)");

        std::vector<bool> used(m_live, false);
        for (std::size_t k = 0; k < order.size(); k++) {
            const std::size_t from = order[k];
            PNGCHUNK_THROW_IF(from >= m_live, invalid_permutation_error,
                              "Permutation element ", k, " refers to index ", from,
                              ", edit log has ", m_live, " live chunk(s)");
            PNGCHUNK_THROW_IF(used[from], invalid_permutation_error,
                              "Permutation element ", k, " repeats index ", from);
            used[from] = true;
        }

        std::vector<std::size_t> live_positions;
        live_positions.reserve(m_live);
        for (std::size_t i = 0; i < m_entries.size(); i++) {
            if (m_entries[i].is_live()) {
                live_positions.push_back(i);
            }
        }

        std::vector<edit_entry> reordered;
        reordered.reserve(m_live);
        for (std::size_t from : order) {
            reordered.push_back(std::move(m_entries[live_positions[from]]));
        }
        m_entries = std::move(reordered);
    }

    const edit_entry& edit_log::at(std::size_t logical) const {
        return m_entries[physical_index(logical)];
    }

    std::optional<std::size_t> edit_log::logical_index(entry_id id) const {
        std::size_t logical = 0;
        for (const auto& e : m_entries) {
            if (e.id == id) {
                if (!e.is_live()) {
                    return std::nullopt;
                }
                return logical;
            }
            if (e.is_live()) {
                logical++;
            }
        }
        return std::nullopt;
    }

} // namespace pngchunk
