/**
 * @file value.hpp
 * @brief In-memory representation of decoded RESP3 values.
 *
 * A Value is a closed sum type with one alternative per wire type.
 * Scalar payloads borrow from the decoded input buffer and are only
 * valid while that buffer is alive. Aggregate payloads own their
 * children through std::pmr containers, so destroying an aggregate
 * releases every descendant before its own storage.
 *
 * @authors resp3 contributors
 */

#ifndef RESP3_VALUE_HPP
#define RESP3_VALUE_HPP

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace resp3 {

struct Value;
struct Entry;

/// Ordered element storage of Array, Set and Push
using Sequence = std::pmr::vector<Value>;

/// Key/value storage of Map and Attribute
using Entries = std::pmr::vector<Entry>;

/**
 * @brief Value alternatives, in the order of Value::Variant.
 */
enum class Kind {
    Null = 0,
    String,
    VerbatimString,
    BlobString,
    Number,
    Float,
    Boolean,
    Error,
    BlobError,
    Array,
    Map,
    Set,
    Push,
    Attribute
};

/**
 * @brief Get display name of a value kind.
 * @param kind Value kind
 * @return Lower-case name, e.g. "blob string"
 */
const char* kind_name(Kind kind) noexcept;

/// Format hint carried by a verbatim string
enum class VerbatimFormat { Markdown, Text };

struct Null {
    friend bool operator==(const Null&, const Null&) = default;
};

/// Simple string (+), text up to CRLF
struct SimpleString {
    std::string_view text;

    friend bool operator==(const SimpleString&, const SimpleString&) = default;
};

/// Verbatim string (=), length-prefixed "fmt:content"
struct VerbatimString {
    std::string_view content;
    VerbatimFormat format = VerbatimFormat::Text;

    friend bool operator==(const VerbatimString&, const VerbatimString&) = default;
};

/// Blob string ($), length-prefixed bytes
struct BlobString {
    std::string_view bytes;

    friend bool operator==(const BlobString&, const BlobString&) = default;
};

/// Integer (:)
struct Number {
    std::int64_t value = 0;

    friend bool operator==(const Number&, const Number&) = default;
};

/// Double (,), may hold infinities and NaN
struct Float {
    double value = 0.0;

    friend bool operator==(const Float&, const Float&) = default;
};

/// Boolean (#)
struct Boolean {
    bool value = false;

    friend bool operator==(const Boolean&, const Boolean&) = default;
};

/**
 * @brief Simple error (-).
 *
 * The code is the leading run of upper-case ASCII letters (possibly
 * empty); the message is the rest of the line with surrounding
 * whitespace trimmed.
 */
struct SimpleError {
    std::string_view code;
    std::string_view message;

    friend bool operator==(const SimpleError&, const SimpleError&) = default;
};

/// Blob error (!), split into code and message like SimpleError
struct BlobError {
    std::string_view code;
    std::string_view message;

    friend bool operator==(const BlobError&, const BlobError&) = default;
};

/**
 * @brief Common storage of the sequence-shaped aggregates.
 */
struct SequenceValue {
    Sequence items;

    explicit SequenceValue(std::pmr::memory_resource* resource = std::pmr::get_default_resource())
        : items(resource) {}

    explicit SequenceValue(Sequence&& values) noexcept : items(std::move(values)) {}

    [[nodiscard]] std::size_t size() const noexcept {
        return items.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return items.empty();
    }

    const Value& operator[](std::size_t index) const noexcept;
};

bool operator==(const SequenceValue& lhs, const SequenceValue& rhs);

/**
 * @brief Common storage of the map-shaped aggregates.
 *
 * Entries keep the order in which each key first appeared. Keys are
 * always text and unique.
 */
struct EntryMap {
    Entries entries;

    explicit EntryMap(std::pmr::memory_resource* resource = std::pmr::get_default_resource())
        : entries(resource) {}

    [[nodiscard]] std::size_t size() const noexcept {
        return entries.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return entries.empty();
    }

    /**
     * @brief Look up a value by key.
     *
     * @param key Key text
     * @return Pointer to the value, or nullptr if absent
     */
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;

    /**
     * @brief Add an entry, or replace the value of an existing key.
     * @param key Key text (borrowed)
     * @param value Value, moved into the map
     */
    void insert(std::string_view key, Value&& value);
};

bool operator==(const EntryMap& lhs, const EntryMap& rhs);

/// Array (*)
struct Array : SequenceValue {
    using SequenceValue::SequenceValue;
};

/// Set (~), structurally an Array
struct Set : SequenceValue {
    using SequenceValue::SequenceValue;
};

/// Map (%)
struct Map : EntryMap {
    using EntryMap::EntryMap;
};

/// Attribute (|), structurally a Map
struct Attribute : EntryMap {
    using EntryMap::EntryMap;
};

/**
 * @brief Push message (>).
 *
 * Always non-empty with a String as first element. The only way to
 * build one is create(), which checks both conditions.
 */
class Push {
public:
    /**
     * @brief Build a push message from its elements.
     *
     * @param items Elements; moved from only on success
     * @param[out] out Receives the push message on success
     * @return Error::Ok, Error::PushZeroLength or Error::PushExpectedString
     */
    static Error create(Sequence&& items, std::optional<Push>& out);

    [[nodiscard]] const Sequence& items() const noexcept {
        return items_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return items_.size();
    }

    const Value& operator[](std::size_t index) const noexcept;

    /// Text of the leading string, e.g. "message" or "invalidate"
    [[nodiscard]] std::string_view name() const noexcept;

    friend inline bool operator==(const Push& lhs, const Push& rhs);

private:
    explicit Push(Sequence&& items) noexcept : items_(std::move(items)) {}

    Sequence items_;
};

/**
 * @brief A decoded RESP3 value.
 *
 * depth counts the aggregates enclosing the value in the decoded
 * message. It is display metadata and takes no part in equality.
 */
struct Value {
    using Variant = std::variant<Null, SimpleString, VerbatimString, BlobString, Number, Float,
                                 Boolean, SimpleError, BlobError, Array, Map, Set, Push,
                                 Attribute>;

    Variant data;
    std::size_t depth = 0;

    Value() = default;

    explicit Value(Variant payload, std::size_t nesting = 0) noexcept
        : data(std::move(payload)), depth(nesting) {}

    [[nodiscard]] Kind kind() const noexcept {
        return static_cast<Kind>(data.index());
    }

    template <typename T> [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(data);
    }

    template <typename T> [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&data);
    }

    template <typename T> [[nodiscard]] T* get_if() noexcept {
        return std::get_if<T>(&data);
    }

    /// Access the payload; throws std::bad_variant_access on kind mismatch
    template <typename T> [[nodiscard]] const T& get() const {
        return std::get<T>(data);
    }

    friend bool operator==(const Value& lhs, const Value& rhs) {
        return lhs.data == rhs.data;
    }
};

static_assert(std::variant_size_v<Value::Variant> == static_cast<std::size_t>(Kind::Attribute) + 1,
              "Kind must list every Value alternative");

/// One key/value pair of a Map or Attribute
struct Entry {
    std::string_view key;
    Value value;

    friend bool operator==(const Entry&, const Entry&) = default;
};

inline const Value& SequenceValue::operator[](std::size_t index) const noexcept {
    return items[index];
}

inline bool operator==(const SequenceValue& lhs, const SequenceValue& rhs) {
    return lhs.items == rhs.items;
}

inline bool operator==(const EntryMap& lhs, const EntryMap& rhs) {
    return lhs.entries == rhs.entries;
}

inline const Value& Push::operator[](std::size_t index) const noexcept {
    return items_[index];
}

inline bool operator==(const Push& lhs, const Push& rhs) {
    return lhs.items_ == rhs.items_;
}

/**
 * @brief Render a value as indented text.
 *
 * Scalars render on one line; aggregates render a "(kind) size" header
 * followed by their children, each indented two spaces deeper.
 *
 * @param value Value to render
 * @return Rendered text, newline-terminated
 */
std::string to_string(const Value& value);

std::ostream& operator<<(std::ostream& os, const Value& value);

} // namespace resp3

#endif // RESP3_VALUE_HPP
