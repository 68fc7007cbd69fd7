#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>
#include "byte_io.hpp"
#include "core.hpp"
#include "error.hpp"
#include "mutf8.hpp"
#include "tag.hpp"

namespace nbt {

// =============================================================================
// Tag Codec
// =============================================================================
//
// Wire grammar (big-endian unless the little-endian variant is selected):
// - Named tag: kind:u8 + name:string + payload
// - String: u16 byte length + modified UTF-8 bytes
// - Byte/Int/Long arrays: i32 element count + raw elements
// - List: element kind:u8 + i32 count + count unnamed payloads
// - Compound: named tags, terminated by a single End (0) byte
//
// List elements carry neither a kind byte nor a name; that is the only
// place the grammar drops them, so `has_name` is threaded through every
// recursive read.
//
// =============================================================================

// -----------------------------------------------------------------------------
// Strings
// -----------------------------------------------------------------------------

inline auto read_string(byte_reader_t& in) -> std::string {
    auto length = in.read<uint16_t>();
    auto start = in.position();
    auto bytes = in.read_bytes(length);
    try {
        return mutf8::decode(bytes);
    } catch (const nbt_error& e) {
        // Rebase the offset from the string's bytes onto the whole stream
        throw nbt_error(error_kind::invalid_encoding,
            e.detail() + " (string starting at offset " + std::to_string(start) + ")",
            start + e.offset().value_or(0));
    }
}

inline void write_string(byte_writer_t& out, const std::string& value) {
    auto bytes = mutf8::encode(value);
    if (bytes.size() > max_string_bytes) {
        throw nbt_error(error_kind::malformed_length,
            "string of " + std::to_string(bytes.size()) + " bytes exceeds the 65535 byte limit");
    }
    out.write(static_cast<uint16_t>(bytes.size()));
    out.write_bytes(bytes);
}

// -----------------------------------------------------------------------------
// Read
// -----------------------------------------------------------------------------

namespace detail {

inline auto read_kind(byte_reader_t& in) -> tag_kind {
    auto offset = in.position();
    auto id = in.read<uint8_t>();
    if (!is_valid_kind(id)) {
        throw nbt_error(error_kind::unknown_tag_kind,
            "kind id " + std::to_string(id) + " is outside 0-" + std::to_string(max_tag_id), offset);
    }
    return static_cast<tag_kind>(id);
}

// Reads an i32 element count and checks that `count * min_size` bytes remain.
inline auto read_count(byte_reader_t& in, std::size_t min_size) -> std::size_t {
    auto offset = in.position();
    auto count = in.read<int32_t>();
    if (count < 0) {
        throw nbt_error(error_kind::malformed_length,
            "negative length " + std::to_string(count), offset);
    }
    auto n = static_cast<std::size_t>(count);
    in.require(n * min_size);
    return n;
}

template<typename T>
auto read_array(byte_reader_t& in) -> std::vector<T> {
    auto n = read_count(in, sizeof(T));
    auto result = std::vector<T>(n);
    for (auto& v : result) {
        v = in.read<T>();
    }
    return result;
}

} // namespace detail

inline auto read_payload(byte_reader_t& in, tag_kind kind, int depth) -> value_t;
inline auto read_compound(byte_reader_t& in, int depth) -> compound_t;

// Decodes one tag of the given kind. When `has_name` is set the name string
// precedes the payload; list elements are read with has_name = false.
inline auto read_tag(byte_reader_t& in, tag_kind kind, bool has_name, int depth = default_max_depth) -> tag_t {
    auto name = has_name ? std::optional<std::string>(read_string(in)) : std::nullopt;
    return tag_t(std::move(name), read_payload(in, kind, depth));
}

inline auto read_payload(byte_reader_t& in, tag_kind kind, int depth) -> value_t {
    switch (kind) {
        case tag_kind::byte:       return in.read<int8_t>();
        case tag_kind::short_:     return in.read<int16_t>();
        case tag_kind::int_:       return in.read<int32_t>();
        case tag_kind::long_:      return in.read<int64_t>();
        case tag_kind::float_:     return in.read<float>();
        case tag_kind::double_:    return in.read<double>();
        case tag_kind::byte_array: return detail::read_array<int8_t>(in);
        case tag_kind::string:     return read_string(in);
        case tag_kind::int_array:  return detail::read_array<int32_t>(in);
        case tag_kind::long_array: return detail::read_array<int64_t>(in);

        case tag_kind::list: {
            if (depth <= 0) {
                throw nbt_error(error_kind::nesting_too_deep, "list nested too deeply", in.position());
            }
            auto offset = in.position();
            auto element_kind = detail::read_kind(in);
            // Every element except TAG_End occupies at least one byte
            auto count = detail::read_count(in, 1);
            if (element_kind == tag_kind::end && count != 0) {
                throw nbt_error(error_kind::unknown_tag_kind,
                    "list of TAG_End declares " + std::to_string(count) + " elements", offset);
            }
            // No reserve: the count is only bounded by the bytes left, and
            // nested lists would multiply an up-front allocation.
            auto list = list_t(element_kind);
            for (std::size_t i = 0; i < count; ++i) {
                list.push_back(read_tag(in, element_kind, false, depth - 1));
            }
            return value_t(std::move(list));
        }

        case tag_kind::compound:
            return value_t(read_compound(in, depth));

        case tag_kind::end:
            break;
    }
    throw nbt_error(error_kind::unknown_tag_kind, "TAG_End has no payload", in.position());
}

// Reads named children up to and including the terminating End byte.
inline auto read_compound(byte_reader_t& in, int depth) -> compound_t {
    if (depth <= 0) {
        throw nbt_error(error_kind::nesting_too_deep, "compound nested too deeply", in.position());
    }
    auto compound = compound_t();
    while (true) {
        auto child_kind = detail::read_kind(in);
        if (child_kind == tag_kind::end) {
            break;
        }
        auto child = read_tag(in, child_kind, true, depth - 1);
        auto key = *child.name();
        // Duplicate names: the last occurrence wins
        compound.insert(std::move(key), std::move(child));
    }
    return compound;
}

// -----------------------------------------------------------------------------
// Write
// -----------------------------------------------------------------------------

namespace detail {

template<typename T>
void write_array(byte_writer_t& out, const std::vector<T>& values) {
    if (values.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
        throw nbt_error(error_kind::malformed_length, "array too long for an i32 length");
    }
    out.write(static_cast<int32_t>(values.size()));
    for (auto v : values) {
        out.write(v);
    }
}

} // namespace detail

inline void write_payload(byte_writer_t& out, const value_t& value);

inline void write_compound(byte_writer_t& out, const compound_t& compound) {
    for (const auto& child : compound) {
        if (!child.name()) {
            throw nbt_error(error_kind::missing_key, "compound child without a name");
        }
        out.write(static_cast<uint8_t>(child.kind()));
        write_string(out, *child.name());
        write_payload(out, child.value());
    }
    out.write(static_cast<uint8_t>(tag_kind::end));
}

inline void write_payload(byte_writer_t& out, const value_t& value) {
    std::visit([&out](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_arithmetic_v<T>) {
            out.write(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            write_string(out, v);
        } else if constexpr (std::is_same_v<T, byte_array_t> ||
                             std::is_same_v<T, int_array_t> ||
                             std::is_same_v<T, long_array_t>) {
            detail::write_array(out, v);
        } else if constexpr (std::is_same_v<T, list_t>) {
            if (v.size() > static_cast<std::size_t>(std::numeric_limits<int32_t>::max())) {
                throw nbt_error(error_kind::malformed_length, "list too long for an i32 count");
            }
            out.write(static_cast<uint8_t>(v.element_kind()));
            out.write(static_cast<int32_t>(v.size()));
            for (const auto& element : v) {
                if (element.kind() != v.element_kind()) {
                    throw nbt_error(error_kind::type_mismatch,
                        std::string("list of ") + to_string(v.element_kind()) + " holds a " +
                        to_string(element.kind()));
                }
                write_payload(out, element.value());
            }
        } else if constexpr (std::is_same_v<T, compound_t>) {
            write_compound(out, v);
        } else {
            static_assert(detail::always_false<T>, "unhandled tag value type");
        }
    }, value);
}

// Writes kind byte, name and payload. A tag without a name (a list element)
// has only a payload on the wire.
inline void write_tag(byte_writer_t& out, const tag_t& tag) {
    if (tag.name()) {
        out.write(static_cast<uint8_t>(tag.kind()));
        write_string(out, *tag.name());
    }
    write_payload(out, tag.value());
}

// -----------------------------------------------------------------------------
// Buffer conveniences (no compression, no vendor header)
// -----------------------------------------------------------------------------

inline auto encode(const tag_t& tag, byte_order order = byte_order::big) -> std::vector<uint8_t> {
    auto out = byte_writer_t(order);
    write_tag(out, tag);
    return out.take();
}

inline auto decode(std::span<const uint8_t> bytes, byte_order order = byte_order::big,
                   int max_depth = default_max_depth) -> tag_t {
    auto in = byte_reader_t(bytes, order);
    auto kind = detail::read_kind(in);
    if (kind == tag_kind::end) {
        throw nbt_error(error_kind::unknown_tag_kind, "a named tag cannot be TAG_End", 0);
    }
    return read_tag(in, kind, true, max_depth);
}

} // namespace nbt
