/**
 * @file reader.hpp
 * @brief Cursor over a RESP3 message buffer.
 *
 * The reader hands out views into the buffer; it never copies payload
 * bytes. Every read either succeeds and advances the cursor or reports
 * why the buffer cannot satisfy it.
 *
 * @authors resp3 contributors
 */

#ifndef RESP3_READER_HPP
#define RESP3_READER_HPP

#include <string_view>

#include "config.hpp"
#include "error.hpp"

namespace resp3 {

/**
 * @brief Sequential byte reader for RESP3 messages.
 */
class Reader {
public:
    /**
     * @brief Construct a reader.
     *
     * @param data Pointer to message bytes
     * @param size Number of valid bytes in buffer
     */
    Reader(const std::uint8_t* data, std::size_t size) noexcept
        : data_(reinterpret_cast<const char*>(data)), size_(size), pos_(0) {}

    explicit Reader(std::string_view message) noexcept
        : data_(message.data()), size_(message.size()), pos_(0) {}

    /**
     * @brief Read a single byte.
     *
     * @param[out] byte Byte read
     * @return Error::Ok, or Error::EndOfMessage if no bytes remain
     */
    Error read_byte(std::uint8_t& byte) noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return Error::EndOfMessage;
        }
        byte = static_cast<std::uint8_t>(data_[pos_++]);
        return Error::Ok;
    }

    /**
     * @brief Look at the next byte without consuming it.
     *
     * @param[out] byte Next byte
     * @return Error::Ok, or Error::EndOfMessage if no bytes remain
     */
    Error peek(std::uint8_t& byte) const noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return Error::EndOfMessage;
        }
        byte = static_cast<std::uint8_t>(data_[pos_]);
        return Error::Ok;
    }

    /**
     * @brief Read everything up to the next CR, then consume CR LF.
     *
     * @param[out] line Bytes before the CR (may be empty)
     * @return Error::Ok, Error::EndOfMessage if no CR follows,
     *         Error::ExpectedCRLF if the CR is not followed by LF
     */
    Error read_line(std::string_view& line) noexcept;

    /**
     * @brief Read a fixed number of bytes.
     *
     * @param count Number of bytes
     * @param[out] bytes View of the bytes read
     * @return Error::Ok, or Error::EndOfMessage if the buffer is too short
     */
    Error read_bytes(std::size_t count, std::string_view& bytes) noexcept {
        if (pos_ >= size_ || count > size_ - pos_) [[unlikely]] {
            return Error::EndOfMessage;
        }
        bytes = std::string_view(data_ + pos_, count);
        pos_ += count;
        return Error::Ok;
    }

    /**
     * @brief Read a length or count line.
     *
     * The line must start with a digit and hold an unsigned decimal.
     *
     * @param[out] length Parsed value
     * @return Error::Ok, Error::ExpectedLength, Error::InvalidCharacter,
     *         Error::InternalError on overflow, or a line reading error
     */
    Error read_length(std::size_t& length) noexcept;

    /**
     * @brief Consume a mandatory CR LF.
     *
     * @return Error::Ok, Error::EndOfMessage if fewer than two bytes
     *         remain, Error::ExpectedCRLF if they are not CR LF
     */
    Error expect_crlf() noexcept {
        if (size_ - pos_ < 2) [[unlikely]] {
            return Error::EndOfMessage;
        }
        if (data_[pos_] != '\r' || data_[pos_ + 1] != '\n') {
            return Error::ExpectedCRLF;
        }
        pos_ += 2;
        return Error::Ok;
    }

    /**
     * @brief Get current position.
     *
     * @return Number of bytes already consumed
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     *
     * @return Number of bytes left to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (pos_ < size_) ? (size_ - pos_) : 0;
    }

private:
    const char* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace resp3

#endif // RESP3_READER_HPP
