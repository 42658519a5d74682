/**
 * @file decoder.hpp
 * @brief RESP3 decoding engine.
 *
 * Decodes one complete message held in memory into a Value tree:
 * - Scalars (simple/blob/verbatim strings, integers, doubles, booleans,
 *   simple/blob errors, null) borrow their bytes from the message.
 * - Aggregates (arrays, maps, sets, pushes, attributes) are decoded
 *   recursively into containers allocated from a caller-supplied
 *   std::pmr::memory_resource.
 *
 * @authors resp3 contributors
 *
 * @see https://github.com/redis/redis-specifications/blob/master/protocol/RESP3.md
 */

#ifndef RESP3_DECODER_HPP
#define RESP3_DECODER_HPP

#include <memory_resource>
#include <string_view>

#include "config.hpp"
#include "error.hpp"
#include "reader.hpp"
#include "value.hpp"

namespace resp3 {

/**
 * @brief Leading byte of every encoded value.
 */
enum class TypeTag : std::uint8_t {
    SimpleString = '+',
    BlobString = '$',
    Number = ':',
    Float = ',',
    Boolean = '#',
    SimpleError = '-',
    BlobError = '!',
    Null = '_',
    Array = '*',
    VerbatimString = '=',
    Map = '%',
    Push = '>',
    Set = '~',
    Attribute = '|',
    BigNumber = ')'
};

/**
 * @brief RESP3 decoder over one buffer.
 *
 * Holds the cursor and the current nesting depth. Successive decode()
 * calls read consecutive values from the buffer.
 * The message buffer must outlive every Value produced from it.
 */
class Decoder {
public:
    /**
     * @brief Construct a decoder over a message.
     *
     * @param message Complete encoded message
     * @param resource Memory resource for aggregate storage
     * @param max_depth Maximum number of nested non-empty aggregates
     */
    explicit Decoder(std::string_view message,
                     std::pmr::memory_resource* resource = std::pmr::get_default_resource(),
                     std::size_t max_depth = MAX_NESTING_DEPTH) noexcept
        : reader_(message), resource_(resource), depth_(0), max_depth_(max_depth) {}

    Decoder(const std::uint8_t* data, std::size_t size,
            std::pmr::memory_resource* resource = std::pmr::get_default_resource(),
            std::size_t max_depth = MAX_NESTING_DEPTH) noexcept
        : reader_(data, size), resource_(resource), depth_(0), max_depth_(max_depth) {}

    /**
     * @brief Decode the next value.
     *
     * On failure nothing allocated during the call stays alive and
     * out is left untouched.
     *
     * @param[out] out Decoded value
     * @return Error::Ok on success
     */
    Error decode(Value& out) noexcept;

    /**
     * @brief Get current position.
     *
     * @return Number of bytes consumed so far
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return reader_.position();
    }

    /**
     * @brief Get current nesting depth.
     */
    [[nodiscard]] std::size_t depth() const noexcept {
        return depth_;
    }

private:
    Error read_next(Value& out);

    Error decode_simple_string(Value& out) noexcept;
    Error decode_blob_string(Value& out) noexcept;
    Error decode_number(Value& out) noexcept;
    Error decode_float(Value& out) noexcept;
    Error decode_boolean(Value& out) noexcept;
    Error decode_simple_error(Value& out) noexcept;
    Error decode_blob_error(Value& out) noexcept;
    Error decode_null(Value& out) noexcept;
    Error decode_verbatim_string(Value& out) noexcept;
    Error decode_array(Value& out);
    Error decode_set(Value& out);
    Error decode_push(Value& out);
    Error decode_map(Value& out);
    Error decode_attribute(Value& out);

    /// Length-prefixed payload followed by CR LF ($ and !)
    Error read_blob(std::string_view& bytes) noexcept;

    /// Count line then that many values, shared by *, ~ and >
    Error decode_sequence(Sequence& items);

    /// Count line then that many key/value pairs, shared by % and |
    Error decode_entries(Entries& entries);

    /// Check depth limit before descending into a non-empty aggregate
    Error enter_aggregate() noexcept;

    Reader reader_;
    std::pmr::memory_resource* resource_;
    std::size_t depth_;
    std::size_t max_depth_;
};

/**
 * @brief Parse a signed 64-bit decimal integer.
 *
 * @param text Decimal text, optional leading '-'
 * @param[out] value Parsed value
 * @return Error::Ok, Error::InvalidCharacter, or Error::InternalError on overflow
 */
Error parse_integer(std::string_view text, std::int64_t& value) noexcept;

/**
 * @brief Parse a RESP3 double.
 *
 * "inf", "-inf" and "nan" map to the IEEE special values; anything else
 * must be a decimal floating-point literal. Literals beyond the range of
 * double round to signed infinity or signed zero.
 *
 * @param text Double text
 * @param[out] value Parsed value
 * @return Error::Ok or Error::InvalidCharacter
 */
Error parse_float(std::string_view text, double& value) noexcept;

/**
 * @brief Split error text into code and message.
 *
 * @param text Raw error text
 * @param[out] code Leading run of upper-case ASCII letters
 * @param[out] message Remainder with surrounding whitespace trimmed
 */
void split_error(std::string_view text, std::string_view& code, std::string_view& message) noexcept;

} // namespace resp3

#endif // RESP3_DECODER_HPP
