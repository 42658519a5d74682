/**
 * @file value.cpp
 * @brief Value model: push construction, map lookup and rendering.
 *
 * @authors resp3 contributors
 */

#include <resp3/value.hpp>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <ostream>

namespace resp3 {

const char* kind_name(Kind kind) noexcept {
    switch (kind) {
    case Kind::Null:
        return "null";
    case Kind::String:
        return "string";
    case Kind::VerbatimString:
        return "verbatim string";
    case Kind::BlobString:
        return "blob string";
    case Kind::Number:
        return "integer";
    case Kind::Float:
        return "double";
    case Kind::Boolean:
        return "boolean";
    case Kind::Error:
        return "error";
    case Kind::BlobError:
        return "blob error";
    case Kind::Array:
        return "array";
    case Kind::Map:
        return "map";
    case Kind::Set:
        return "set";
    case Kind::Push:
        return "push";
    case Kind::Attribute:
        return "attribute";
    default:
        return "unknown";
    }
}

// ============================================================================
// Aggregates
// ============================================================================

const Value* EntryMap::find(std::string_view key) const noexcept {
    for (const auto& entry : entries) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

void EntryMap::insert(std::string_view key, Value&& value) {
    for (auto& entry : entries) {
        if (entry.key == key) {
            entry.value = std::move(value);
            return;
        }
    }
    entries.push_back(Entry{key, std::move(value)});
}

Error Push::create(Sequence&& items, std::optional<Push>& out) {
    if (items.empty()) {
        return Error::PushZeroLength;
    }
    if (!items.front().is<SimpleString>()) {
        return Error::PushExpectedString;
    }
    out = Push(std::move(items));
    return Error::Ok;
}

std::string_view Push::name() const noexcept {
    // create() guarantees a leading string
    return items_.front().get_if<SimpleString>()->text;
}

// ============================================================================
// Rendering
// ============================================================================

namespace {

constexpr std::size_t INDENT_WIDTH = 2;

void append_indent(std::string& out, std::size_t level) {
    out.append(level * INDENT_WIDTH, ' ');
}

void append_quoted(std::string& out, std::string_view text) {
    out.push_back('"');
    for (char c : text) {
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        default: {
            auto byte = static_cast<unsigned char>(c);
            if (byte < 0x20 || byte >= 0x7F) {
                char hex[8];
                std::snprintf(hex, sizeof(hex), "\\x%02X", byte);
                out += hex;
            } else {
                out.push_back(c);
            }
            break;
        }
        }
    }
    out.push_back('"');
}

void append_integer(std::string& out, std::int64_t value) {
    char buffer[24];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    (void)ec; // 24 bytes always fit an int64
    out.append(buffer, end);
}

void append_double(std::string& out, double value) {
    if (std::isnan(value)) {
        out += "nan";
        return;
    }
    if (std::isinf(value)) {
        out += value < 0 ? "-inf" : "inf";
        return;
    }
    char buffer[32];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    (void)ec; // shortest round-trip form of a double fits in 32 bytes
    out.append(buffer, end);
}

void append_error(std::string& out, const char* label, std::string_view code,
                  std::string_view message) {
    out += label;
    out.append(code);
    if (!code.empty() && !message.empty()) {
        out.push_back(' ');
    }
    out.append(message);
}

void render(std::string& out, const Value& value, std::size_t level);

void render_header(std::string& out, Kind kind, std::size_t size) {
    out.push_back('(');
    out += kind_name(kind);
    out += ") ";
    append_integer(out, static_cast<std::int64_t>(size));
    out.push_back('\n');
}

void render_items(std::string& out, const Sequence& items, std::size_t level) {
    for (const auto& item : items) {
        append_indent(out, level);
        render(out, item, level);
    }
}

void render_entries(std::string& out, const Entries& entries, std::size_t level) {
    for (const auto& entry : entries) {
        append_indent(out, level);
        append_quoted(out, entry.key);
        out += " => ";
        render(out, entry.value, level);
    }
}

void render(std::string& out, const Value& value, std::size_t level) {
    switch (value.kind()) {
    case Kind::Null:
        out += "(null)\n";
        return;
    case Kind::String:
        append_quoted(out, value.get_if<SimpleString>()->text);
        break;
    case Kind::VerbatimString: {
        const auto* verbatim = value.get_if<VerbatimString>();
        out += verbatim->format == VerbatimFormat::Markdown ? "=mkd:" : "=txt:";
        append_quoted(out, verbatim->content);
        break;
    }
    case Kind::BlobString:
        out.push_back('$');
        append_quoted(out, value.get_if<BlobString>()->bytes);
        break;
    case Kind::Number:
        out += "(integer) ";
        append_integer(out, value.get_if<Number>()->value);
        break;
    case Kind::Float:
        out += "(double) ";
        append_double(out, value.get_if<Float>()->value);
        break;
    case Kind::Boolean:
        out += value.get_if<Boolean>()->value ? "(boolean) true" : "(boolean) false";
        break;
    case Kind::Error: {
        const auto* error = value.get_if<SimpleError>();
        append_error(out, "(error) ", error->code, error->message);
        break;
    }
    case Kind::BlobError: {
        const auto* error = value.get_if<BlobError>();
        append_error(out, "(blob error) ", error->code, error->message);
        break;
    }
    case Kind::Array: {
        const auto& items = value.get_if<Array>()->items;
        render_header(out, Kind::Array, items.size());
        render_items(out, items, level + 1);
        return;
    }
    case Kind::Set: {
        const auto& items = value.get_if<Set>()->items;
        render_header(out, Kind::Set, items.size());
        render_items(out, items, level + 1);
        return;
    }
    case Kind::Push: {
        const auto& items = value.get_if<Push>()->items();
        render_header(out, Kind::Push, items.size());
        render_items(out, items, level + 1);
        return;
    }
    case Kind::Map: {
        const auto& entries = value.get_if<Map>()->entries;
        render_header(out, Kind::Map, entries.size());
        render_entries(out, entries, level + 1);
        return;
    }
    case Kind::Attribute: {
        const auto& entries = value.get_if<Attribute>()->entries;
        render_header(out, Kind::Attribute, entries.size());
        render_entries(out, entries, level + 1);
        return;
    }
    }
    out.push_back('\n');
}

} // namespace

std::string to_string(const Value& value) {
    std::string out;
    render(out, value, 0);
    return out;
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    return os << to_string(value);
}

} // namespace resp3
