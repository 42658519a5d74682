/**
 * @file decoder.cpp
 * @brief RESP3 decoding engine.
 *
 * Aggregates are decoded into local containers that are moved into the
 * result only on success. Any early return drops the local container,
 * whose destructor releases every element decoded so far.
 *
 * @authors resp3 contributors
 */

#include <resp3/decoder.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <new>
#include <optional>
#include <system_error>
#include <unordered_map>

namespace resp3 {

namespace {

/// Keeps the decoder depth raised while the children of an aggregate are read
class DepthScope {
public:
    explicit DepthScope(std::size_t& depth) noexcept : depth_(depth) {
        ++depth_;
    }

    ~DepthScope() {
        --depth_;
    }

    DepthScope(const DepthScope&) = delete;
    DepthScope& operator=(const DepthScope&) = delete;

private:
    std::size_t& depth_;
};

constexpr std::string_view WHITESPACE = " \t\r\n\v\f";

/// Drop a '+' sign that from_chars would reject
std::string_view strip_plus(std::string_view text) noexcept {
    if (text.size() > 1 && text[0] == '+' && text[1] != '-' && text[1] != '+') {
        text.remove_prefix(1);
    }
    return text;
}

/**
 * Decide which end of the double range a literal rejected as out of
 * range falls off. digits is the literal without its sign.
 *
 * @return true if the magnitude is too large, false if too small
 */
bool overflows_double(std::string_view digits) noexcept {
    auto exponent_at = digits.find_first_of("eE");
    std::string_view mantissa = digits.substr(0, exponent_at);

    std::int32_t exponent = 0;
    if (exponent_at != std::string_view::npos) {
        std::string_view text = strip_plus(digits.substr(exponent_at + 1));
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), exponent);
        (void)ptr;
        if (ec == std::errc::result_out_of_range) {
            return text.front() != '-';
        }
    }

    // Decimal position of the leading significant digit
    auto point = mantissa.find('.');
    std::string_view integral = mantissa.substr(0, point);
    auto first = integral.find_first_not_of('0');
    if (first != std::string_view::npos) {
        return static_cast<std::int64_t>(integral.size() - first) + exponent > 0;
    }
    std::string_view fraction =
        (point == std::string_view::npos) ? std::string_view() : mantissa.substr(point + 1);
    auto leading_zeros = fraction.find_first_not_of('0');
    if (leading_zeros == std::string_view::npos) {
        return false;
    }
    return static_cast<std::int64_t>(exponent) - static_cast<std::int64_t>(leading_zeros) > 0;
}

} // namespace

// ============================================================================
// Scalar parsing
// ============================================================================

Error parse_integer(std::string_view text, std::int64_t& value) noexcept {
    text = strip_plus(text);
    const char* end = text.data() + text.size();
    std::int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
    if (ec == std::errc::result_out_of_range) {
        return Error::InternalError;
    }
    if (ec != std::errc() || ptr != end) {
        return Error::InvalidCharacter;
    }
    value = parsed;
    return Error::Ok;
}

Error parse_float(std::string_view text, double& value) noexcept {
    if (text == "inf") {
        value = std::numeric_limits<double>::infinity();
        return Error::Ok;
    }
    if (text == "-inf") {
        value = -std::numeric_limits<double>::infinity();
        return Error::Ok;
    }
    if (text == "nan") {
        value = std::numeric_limits<double>::quiet_NaN();
        return Error::Ok;
    }

    text = strip_plus(text);
    const char* end = text.data() + text.size();
    double parsed = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), end, parsed, std::chars_format::general);
    if (ec == std::errc::result_out_of_range && ptr == end) {
        // Round to infinity or zero, keeping the sign
        bool negative = text.front() == '-';
        std::string_view digits = negative ? text.substr(1) : text;
        if (overflows_double(digits)) {
            value = negative ? -std::numeric_limits<double>::infinity()
                             : std::numeric_limits<double>::infinity();
        } else {
            value = negative ? -0.0 : 0.0;
        }
        return Error::Ok;
    }
    if (ec != std::errc() || ptr != end) {
        return Error::InvalidCharacter;
    }
    // Only the exact literals above may spell infinity or NaN
    if (std::isinf(parsed) || std::isnan(parsed)) {
        return Error::InvalidCharacter;
    }
    value = parsed;
    return Error::Ok;
}

void split_error(std::string_view text, std::string_view& code, std::string_view& message) noexcept {
    std::size_t code_length = 0;
    while (code_length < text.size() && text[code_length] >= 'A' && text[code_length] <= 'Z') {
        ++code_length;
    }
    code = text.substr(0, code_length);

    std::string_view rest = text.substr(code_length);
    auto first = rest.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        message = rest.substr(rest.size());
        return;
    }
    auto last = rest.find_last_not_of(WHITESPACE);
    message = rest.substr(first, last - first + 1);
}

// ============================================================================
// Dispatch
// ============================================================================

Error Decoder::decode(Value& out) noexcept {
#if !RESP3_NO_EXCEPTIONS
    try {
#endif
        Value value;
        auto status = read_next(value);
        if (status != Error::Ok) {
            return status;
        }
        // Reset first: move-assigning over an aggregate of the same kind
        // would rebuild the new tree in the resource of the old one
        out = Value();
        out = std::move(value);
        return Error::Ok;
#if !RESP3_NO_EXCEPTIONS
    } catch (const std::bad_alloc&) {
        // Partially built aggregates were released during unwinding
        return Error::InternalError;
    }
#endif
}

Error Decoder::read_next(Value& out) {
    std::uint8_t tag = 0;
    auto status = reader_.read_byte(tag);
    if (status != Error::Ok) {
        return status;
    }

    switch (static_cast<TypeTag>(tag)) {
    case TypeTag::SimpleString:
        return decode_simple_string(out);
    case TypeTag::BlobString:
        return decode_blob_string(out);
    case TypeTag::Number:
        return decode_number(out);
    case TypeTag::Float:
        return decode_float(out);
    case TypeTag::Boolean:
        return decode_boolean(out);
    case TypeTag::SimpleError:
        return decode_simple_error(out);
    case TypeTag::BlobError:
        return decode_blob_error(out);
    case TypeTag::Null:
        return decode_null(out);
    case TypeTag::Array:
        return decode_array(out);
    case TypeTag::VerbatimString:
        return decode_verbatim_string(out);
    case TypeTag::Map:
        return decode_map(out);
    case TypeTag::Push:
        return decode_push(out);
    case TypeTag::Set:
        return decode_set(out);
    case TypeTag::Attribute:
        return decode_attribute(out);
    case TypeTag::BigNumber:
        return Error::Unsupported;
    default:
        return Error::Unsupported;
    }
}

// ============================================================================
// Scalars
// ============================================================================

Error Decoder::decode_simple_string(Value& out) noexcept {
    std::string_view line;
    auto status = reader_.read_line(line);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(SimpleString{line}, depth_);
    return Error::Ok;
}

Error Decoder::read_blob(std::string_view& bytes) noexcept {
    std::size_t length = 0;
    auto status = reader_.read_length(length);
    if (status != Error::Ok) {
        return status;
    }

    std::string_view payload;
    status = reader_.read_bytes(length, payload);
    if (status != Error::Ok) {
        return status;
    }

    std::uint8_t next = 0;
    status = reader_.peek(next);
    if (status != Error::Ok) {
        return status;
    }
    if (next != '\r') {
        return Error::ExpectedEOL;
    }

    status = reader_.expect_crlf();
    if (status != Error::Ok) {
        return status;
    }

    bytes = payload;
    return Error::Ok;
}

Error Decoder::decode_blob_string(Value& out) noexcept {
    std::string_view bytes;
    auto status = read_blob(bytes);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(BlobString{bytes}, depth_);
    return Error::Ok;
}

Error Decoder::decode_number(Value& out) noexcept {
    std::string_view line;
    auto status = reader_.read_line(line);
    if (status != Error::Ok) {
        return status;
    }

    std::int64_t number = 0;
    status = parse_integer(line, number);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(Number{number}, depth_);
    return Error::Ok;
}

Error Decoder::decode_float(Value& out) noexcept {
    std::string_view line;
    auto status = reader_.read_line(line);
    if (status != Error::Ok) {
        return status;
    }

    double number = 0.0;
    status = parse_float(line, number);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(Float{number}, depth_);
    return Error::Ok;
}

Error Decoder::decode_boolean(Value& out) noexcept {
    std::string_view line;
    auto status = reader_.read_line(line);
    if (status != Error::Ok) {
        return status;
    }

    if (line == "t") {
        out = Value(Boolean{true}, depth_);
        return Error::Ok;
    }
    if (line == "f") {
        out = Value(Boolean{false}, depth_);
        return Error::Ok;
    }
    return Error::InvalidCharacter;
}

Error Decoder::decode_simple_error(Value& out) noexcept {
    std::string_view line;
    auto status = reader_.read_line(line);
    if (status != Error::Ok) {
        return status;
    }

    SimpleError error;
    split_error(line, error.code, error.message);
    out = Value(error, depth_);
    return Error::Ok;
}

Error Decoder::decode_blob_error(Value& out) noexcept {
    std::string_view bytes;
    auto status = read_blob(bytes);
    if (status != Error::Ok) {
        return status;
    }

    BlobError error;
    split_error(bytes, error.code, error.message);
    out = Value(error, depth_);
    return Error::Ok;
}

Error Decoder::decode_null(Value& out) noexcept {
    std::uint8_t next = 0;
    auto status = reader_.peek(next);
    if (status != Error::Ok) {
        return status;
    }
    if (next != '\r') {
        return Error::UnexpectedCharacterAfterNull;
    }

    status = reader_.expect_crlf();
    if (status != Error::Ok) {
        return status;
    }
    out = Value(Null{}, depth_);
    return Error::Ok;
}

Error Decoder::decode_verbatim_string(Value& out) noexcept {
    std::size_t length = 0;
    auto status = reader_.read_length(length);
    if (status != Error::Ok) {
        return status;
    }

    std::string_view payload;
    status = reader_.read_bytes(length, payload);
    if (status != Error::Ok) {
        return status;
    }

    VerbatimString verbatim;
    if (length > 0) {
        std::string_view format = payload.substr(0, VERBATIM_FORMAT_LENGTH);
        if (format == "txt") {
            verbatim.format = VerbatimFormat::Text;
        } else if (format == "mkd") {
            verbatim.format = VerbatimFormat::Markdown;
        } else {
            return Error::InvalidVerbatimStringFormat;
        }

        if (payload.size() <= VERBATIM_FORMAT_LENGTH || payload[VERBATIM_FORMAT_LENGTH] != ':') {
            return Error::InvalidCharacterAfterVerbatimFormat;
        }
        verbatim.content = payload.substr(VERBATIM_FORMAT_LENGTH + 1);
    } else {
        verbatim.content = payload;
    }

    status = reader_.expect_crlf();
    if (status != Error::Ok) {
        return status;
    }
    out = Value(verbatim, depth_);
    return Error::Ok;
}

// ============================================================================
// Aggregates
// ============================================================================

Error Decoder::enter_aggregate() noexcept {
    if (depth_ >= max_depth_) {
        return Error::NestingTooDeep;
    }
    return Error::Ok;
}

Error Decoder::decode_sequence(Sequence& items) {
    std::size_t count = 0;
    auto status = reader_.read_length(count);
    if (status != Error::Ok) {
        return status;
    }
    if (count == 0) {
        return Error::Ok;
    }

    status = enter_aggregate();
    if (status != Error::Ok) {
        return status;
    }

    // A declared count can never exceed what the remaining bytes can hold
    items.reserve(std::min(count, reader_.remaining() / MIN_VALUE_BYTES));

    DepthScope scope(depth_);
    for (std::size_t i = 0; i < count; ++i) {
        Value element;
        status = read_next(element);
        if (status != Error::Ok) {
            return status;
        }
        if (element.is<Push>()) {
            return Error::IllegalPushPosition;
        }
        items.push_back(std::move(element));
    }
    return Error::Ok;
}

Error Decoder::decode_entries(Entries& entries) {
    std::size_t count = 0;
    auto status = reader_.read_length(count);
    if (status != Error::Ok) {
        return status;
    }
    if (count == 0) {
        return Error::Ok;
    }

    status = enter_aggregate();
    if (status != Error::Ok) {
        return status;
    }

    std::size_t capacity = std::min(count, reader_.remaining() / (2 * MIN_VALUE_BYTES));
    entries.reserve(capacity);

    // Position of each key in entries; a repeated key replaces the value
    std::pmr::unordered_map<std::string_view, std::size_t> positions(resource_);
    positions.reserve(capacity);

    DepthScope scope(depth_);
    for (std::size_t i = 0; i < count; ++i) {
        Value key;
        status = read_next(key);
        if (status != Error::Ok) {
            return status;
        }
        const auto* text = key.get_if<SimpleString>();
        if (text == nullptr) {
            return Error::InvalidCharacter;
        }

        Value value;
        status = read_next(value);
        if (status != Error::Ok) {
            return status;
        }
        if (value.is<Push>()) {
            return Error::IllegalPushPosition;
        }

        auto [slot, inserted] = positions.try_emplace(text->text, entries.size());
        if (inserted) {
            entries.push_back(Entry{text->text, std::move(value)});
        } else {
            entries[slot->second].value = std::move(value);
        }
    }
    return Error::Ok;
}

Error Decoder::decode_array(Value& out) {
    Array array(resource_);
    auto status = decode_sequence(array.items);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(std::move(array), depth_);
    return Error::Ok;
}

Error Decoder::decode_set(Value& out) {
    Set set(resource_);
    auto status = decode_sequence(set.items);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(std::move(set), depth_);
    return Error::Ok;
}

Error Decoder::decode_push(Value& out) {
    Sequence items(resource_);
    auto status = decode_sequence(items);
    if (status != Error::Ok) {
        return status;
    }

    std::optional<Push> push;
    status = Push::create(std::move(items), push);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(std::move(*push), depth_);
    return Error::Ok;
}

Error Decoder::decode_map(Value& out) {
    Map map(resource_);
    auto status = decode_entries(map.entries);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(std::move(map), depth_);
    return Error::Ok;
}

Error Decoder::decode_attribute(Value& out) {
    Attribute attribute(resource_);
    auto status = decode_entries(attribute.entries);
    if (status != Error::Ok) {
        return status;
    }
    out = Value(std::move(attribute), depth_);
    return Error::Ok;
}

} // namespace resp3
