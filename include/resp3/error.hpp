/**
 * @file error.hpp
 * @brief RESP3 decoder error handling.
 *
 * Every decoding failure is reported as exactly one Error code. An
 * exception type wrapping the code is available unless the library is
 * built with RESP3_NO_EXCEPTIONS=1.
 *
 * @authors resp3 contributors
 */

#ifndef RESP3_ERROR_HPP
#define RESP3_ERROR_HPP

#include "config.hpp"

#if !RESP3_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace resp3 {

/**
 * @brief Decoding status codes.
 */
enum class Error {
    Ok = 0,                               ///< Success
    EndOfMessage,                         ///< Input ended while content was expected
    ExpectedLength,                       ///< Length prefix does not start with a digit
    InvalidCharacter,                     ///< Malformed number, boolean or map key
    ExpectedCRLF,                         ///< Missing or wrong CR LF terminator
    ExpectedEOL,                          ///< Blob payload not followed by CR
    UnexpectedCharacterAfterNull,         ///< Null tag not followed by CR LF
    InvalidVerbatimStringFormat,          ///< Verbatim format is not "txt" or "mkd"
    InvalidCharacterAfterVerbatimFormat,  ///< Verbatim format not followed by ':'
    PushZeroLength,                       ///< Push message without elements
    PushExpectedString,                   ///< Push message not starting with a string
    IllegalPushPosition,                  ///< Push message nested inside an aggregate
    InternalError,                        ///< Numeric overflow or allocation failure
    Unsupported,                          ///< Big number or unknown type tag
    NestingTooDeep                        ///< Aggregates nested beyond the configured limit
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::EndOfMessage:
        return "Unexpected end of message";
    case Error::ExpectedLength:
        return "Expected length";
    case Error::InvalidCharacter:
        return "Invalid character";
    case Error::ExpectedCRLF:
        return "Expected CRLF";
    case Error::ExpectedEOL:
        return "Expected end of line";
    case Error::UnexpectedCharacterAfterNull:
        return "Unexpected character after null";
    case Error::InvalidVerbatimStringFormat:
        return "Invalid verbatim string format";
    case Error::InvalidCharacterAfterVerbatimFormat:
        return "Invalid character after verbatim string format";
    case Error::PushZeroLength:
        return "Push message has zero length";
    case Error::PushExpectedString:
        return "Push message must start with a string";
    case Error::IllegalPushPosition:
        return "Push message is only allowed at the top level";
    case Error::InternalError:
        return "Internal error";
    case Error::Unsupported:
        return "Unsupported message type";
    case Error::NestingTooDeep:
        return "Maximum nesting depth exceeded";
    default:
        return "Unknown error";
    }
}

#if !RESP3_NO_EXCEPTIONS

/**
 * @brief Exception thrown by the throwing decode wrappers.
 */
class DecodeException : public std::runtime_error {
public:
    explicit DecodeException(Error code)
        : std::runtime_error(error_string(code)), error_code_(code) {}

    DecodeException(const std::string& message, Error code)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

#endif // !RESP3_NO_EXCEPTIONS

} // namespace resp3

#endif // RESP3_ERROR_HPP
