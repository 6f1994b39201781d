/**
 * @file parser.hh
 * @brief Callback style traversal of a chunk sequence
 */

#pragma once

#include <cstddef>
#include <span>

#include <pngchunk/reader.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @brief Call a function for every chunk with custom options
     *
     * Chunks are delivered as they are scanned; an error thrown by the
     * reader propagates after the chunks before it have been delivered.
     *
     * @tparam Func Callable type accepting const chunk_view&
     * @param source Source buffer, must stay alive during the call
     * @param func Function to call for each chunk
     * @param options Parse options for controlling parsing behavior
     * @return Number of chunks delivered
     */
    template<typename Func>
    std::size_t for_each_chunk(std::span<const std::byte> source, Func func, const parse_options& options) {
        reader r(source, options);

        while (r.has_next()) {
            const chunk_view chunk = r.next();
            func(chunk);
        }
        return r.chunks_read();
    }

    /**
     * @brief Call a function for every chunk with default options
     */
    template<typename Func>
    std::size_t for_each_chunk(std::span<const std::byte> source, Func func) {
        return for_each_chunk(source, func, parse_options{});
    }

} // namespace pngchunk
