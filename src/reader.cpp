/**
 * @file reader.cpp
 * @brief Line and length-prefix reading.
 *
 * @authors resp3 contributors
 */

#include <resp3/reader.hpp>

#include <charconv>
#include <cstring>
#include <system_error>

namespace resp3 {

Error Reader::read_line(std::string_view& line) noexcept {
    if (pos_ >= size_) {
        return Error::EndOfMessage;
    }

    const char* start = data_ + pos_;
    const auto* cr = static_cast<const char*>(std::memchr(start, '\r', size_ - pos_));
    if (cr == nullptr) {
        return Error::EndOfMessage;
    }

    std::size_t line_length = static_cast<std::size_t>(cr - start);
    pos_ += line_length;
    auto status = expect_crlf();
    if (status != Error::Ok) {
        return status;
    }

    line = std::string_view(start, line_length);
    return Error::Ok;
}

Error Reader::read_length(std::size_t& length) noexcept {
    std::uint8_t first = 0;
    auto status = peek(first);
    if (status != Error::Ok) {
        return status;
    }
    if (first < '0' || first > '9') {
        return Error::ExpectedLength;
    }

    std::string_view line;
    status = read_line(line);
    if (status != Error::Ok) {
        return status;
    }

    std::size_t parsed = 0;
    const char* end = line.data() + line.size();
    auto [ptr, ec] = std::from_chars(line.data(), end, parsed);
    if (ec == std::errc::result_out_of_range) {
        return Error::InternalError;
    }
    if (ec != std::errc() || ptr != end) {
        return Error::InvalidCharacter;
    }

    length = parsed;
    return Error::Ok;
}

} // namespace resp3
