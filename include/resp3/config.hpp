/**
 * @file config.hpp
 * @brief RESP3 decoder compile-time configuration.
 *
 * RESP3: the Redis serialization protocol, version 3.
 *
 * @authors resp3 contributors
 *
 * @see https://github.com/redis/redis-specifications/blob/master/protocol/RESP3.md
 */

#ifndef RESP3_CONFIG_HPP
#define RESP3_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace resp3 {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Maximum number of nested non-empty aggregates in one message
#ifndef RESP3_MAX_NESTING_DEPTH
#define RESP3_MAX_NESTING_DEPTH 512U
#endif

inline constexpr std::size_t MAX_NESTING_DEPTH = RESP3_MAX_NESTING_DEPTH;

/// Smallest possible encoded value: tag byte followed by CRLF ("_\r\n")
inline constexpr std::size_t MIN_VALUE_BYTES = 3U;

/// Length of the format prefix of a verbatim string ("txt" / "mkd")
inline constexpr std::size_t VERBATIM_FORMAT_LENGTH = 3U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define RESP3_NO_EXCEPTIONS=1 to build without exceptions.
 * @{
 */
#ifndef RESP3_NO_EXCEPTIONS
#define RESP3_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace resp3

#endif // RESP3_CONFIG_HPP
