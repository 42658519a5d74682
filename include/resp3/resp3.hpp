/**
 * @file resp3.hpp
 * @brief High-level RESP3 decoding API.
 *
 * One-shot wrappers that create a Decoder, decode a single message and
 * hand the root value to the caller.
 *
 * @authors resp3 contributors
 *
 * @see https://github.com/redis/redis-specifications/blob/master/protocol/RESP3.md
 */

#ifndef RESP3_HPP
#define RESP3_HPP

#include <memory_resource>
#include <string_view>

#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "reader.hpp"
#include "value.hpp"

namespace resp3 {

/**
 * @brief Decode one message.
 *
 * Scalars in the result borrow from message; aggregates are allocated
 * from arena. Both must outlive the result.
 *
 * @param message Complete encoded message
 * @param[out] out Decoded root value, untouched on failure
 * @param arena Memory resource for aggregate storage
 * @return Error::Ok on success
 */
inline Error decode(std::string_view message, Value& out,
                    std::pmr::memory_resource* arena = std::pmr::get_default_resource()) noexcept {
    Decoder decoder(message, arena);
    return decoder.decode(out);
}

/**
 * @brief Decode one message from raw bytes.
 *
 * @param data Message bytes
 * @param size Message size in bytes
 * @param[out] out Decoded root value, untouched on failure
 * @param arena Memory resource for aggregate storage
 * @return Error::Ok on success
 */
inline Error decode(const std::uint8_t* data, std::size_t size, Value& out,
                    std::pmr::memory_resource* arena = std::pmr::get_default_resource()) noexcept {
    Decoder decoder(data, size, arena);
    return decoder.decode(out);
}

#if !RESP3_NO_EXCEPTIONS

/**
 * @brief Decode one message, throwing on failure.
 *
 * @param message Complete encoded message
 * @param arena Memory resource for aggregate storage
 * @return Decoded root value
 * @throws DecodeException carrying the error code
 */
inline Value decode_or_throw(std::string_view message,
                             std::pmr::memory_resource* arena = std::pmr::get_default_resource()) {
    Value value;
    auto result = decode(message, value, arena);
    if (result != Error::Ok) {
        throw DecodeException(result);
    }
    return value;
}

#endif // !RESP3_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace resp3

#endif // RESP3_HPP
