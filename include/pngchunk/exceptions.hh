/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngchunk library
 *
 * Every failure of the reader or the builder is reported by throwing one of
 * the classes below. Each error kind has its own class so callers can branch
 * on the kind with ordinary catch clauses.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

#include <pngchunk/chunk_type.hh>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all pngchunk errors
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class format_error
     * @brief Base class for errors found while scanning a source buffer
     */
    class format_error : public pngchunk_error {
    public:
        explicit format_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /// Buffer shorter than the signature, or the magic bytes do not match.
    class signature_error : public format_error {
    public:
        explicit signature_error(const std::string& msg) : format_error(msg) {}
    };

    /// Fewer bytes remain than the chunk framing requires.
    class truncated_chunk_error : public format_error {
    public:
        explicit truncated_chunk_error(const std::string& msg) : format_error(msg) {}
    };

    /// A type tag byte is not an ASCII letter (also raised by the builder).
    class invalid_type_tag_error : public format_error {
    public:
        explicit invalid_type_tag_error(const std::string& msg) : format_error(msg) {}
    };

    /// Declared or requested payload length exceeds the hard maximum.
    class chunk_too_large_error : public format_error {
    public:
        explicit chunk_too_large_error(const std::string& msg) : format_error(msg) {}
    };

    /// The first chunk is not the header chunk (also raised by the builder).
    class missing_header_error : public format_error {
    public:
        explicit missing_header_error(const std::string& msg) : format_error(msg) {}
    };

    /// No well formed terminator chunk ends the sequence (also raised by the builder).
    class missing_terminator_error : public format_error {
    public:
        explicit missing_terminator_error(const std::string& msg) : format_error(msg) {}
    };

    /// Bytes remain after the terminator chunk.
    class trailing_data_error : public format_error {
    public:
        explicit trailing_data_error(const std::string& msg) : format_error(msg) {}
    };

    /**
     * @class checksum_mismatch_error
     * @brief Stored CRC-32 of a chunk differs from the one computed over its type and payload
     *
     * Carries the offending chunk's type and position so callers can report
     * or skip it without parsing the message.
     */
    class checksum_mismatch_error : public format_error {
    public:
        checksum_mismatch_error(const std::string& msg,
                                chunk_type type,
                                std::size_t index,
                                std::size_t offset,
                                std::uint32_t stored,
                                std::uint32_t computed)
            : format_error(msg),
              m_type(type),
              m_index(index),
              m_offset(offset),
              m_stored(stored),
              m_computed(computed) {}

        [[nodiscard]] chunk_type type() const { return m_type; }
        [[nodiscard]] std::size_t index() const { return m_index; }
        [[nodiscard]] std::size_t offset() const { return m_offset; }
        [[nodiscard]] std::uint32_t stored() const { return m_stored; }
        [[nodiscard]] std::uint32_t computed() const { return m_computed; }

    private:
        chunk_type m_type;
        std::size_t m_index;
        std::size_t m_offset;
        std::uint32_t m_stored;
        std::uint32_t m_computed;
    };

    /**
     * @class builder_error
     * @brief Base class for misuse of the builder API
     */
    class builder_error : public pngchunk_error {
    public:
        explicit builder_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /// Logical index outside the live range of the edit log.
    class index_out_of_range_error : public builder_error {
    public:
        explicit index_out_of_range_error(const std::string& msg) : builder_error(msg) {}
    };

    /// Reorder argument is not a bijection over the live indices.
    class invalid_permutation_error : public builder_error {
    public:
        explicit invalid_permutation_error(const std::string& msg) : builder_error(msg) {}
    };

    /// Finalize would produce a file without chunks.
    class empty_output_error : public builder_error {
    public:
        explicit empty_output_error(const std::string& msg) : builder_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def PNGCHUNK_THROW
     * @brief Throw an exception of the given class with formatted message
     * @param type Exception class (must be constructible from std::string)
     * @param ... Variable arguments to format into error message
     */
    #define PNGCHUNK_THROW(type, ...) \
        throw type(::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGCHUNK_THROW_IF
     * @brief Conditionally throw an exception of the given class
     */
    #define PNGCHUNK_THROW_IF(condition, type, ...) \
        do { if (condition) PNGCHUNK_THROW(type, __VA_ARGS__); } while(0)

    /**
     * @def PNGCHUNK_THROW_UNLESS
     * @brief Throw an exception of the given class unless condition is true
     */
    #define PNGCHUNK_THROW_UNLESS(condition, type, ...) \
        do { if (!(condition)) PNGCHUNK_THROW(type, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
