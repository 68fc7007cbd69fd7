#pragma once

// Struct binding: maps plain C++ values onto Compound tag trees through a
// tag_sink (writing) and a tag_source (reading).

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <map>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "../tag.hpp"
#include "sink.hpp"
#include "source.hpp"

namespace nbt {
namespace archive {

// ============================================================================
// Field descriptors
// ============================================================================

template <typename T>
constexpr auto field(const char* name, T& value) {
    return std::pair<const char*, T&>{name, value};
}

template <typename T>
constexpr auto field(const char* name, const T& value) {
    return std::pair<const char*, const T&>{name, value};
}

// A struct takes part by providing ADL overloads fields(T&) and
// fields(const T&), each returning a tuple of field() pairs.
template <typename T>
concept HasFields = requires(T& t) { fields(t); };

template <typename T>
concept HasConstFields = requires(const T& t) { fields(t); };

// Enums are stored as String tags holding their ADL to_string name.
template <typename E>
concept HasEnumStrings = std::is_enum_v<E> && requires(E e, const std::string& s) {
    { to_string(e) } -> std::convertible_to<const char*>;
    { from_string(std::type_identity<E>{}, s) } -> std::same_as<E>;
};

namespace detail {

template <typename T> inline constexpr bool is_vector = false;
template <typename T> inline constexpr bool is_vector<std::vector<T>> = true;

template <typename T> inline constexpr bool is_array = false;
template <typename T, std::size_t N> inline constexpr bool is_array<std::array<T, N>> = true;

template <typename T> inline constexpr bool is_string_map = false;
template <typename T> inline constexpr bool is_string_map<std::map<std::string, T>> = true;

template <typename T> inline constexpr bool is_optional = false;
template <typename T> inline constexpr bool is_optional<std::optional<T>> = true;

} // namespace detail

// ============================================================================
// Write
// ============================================================================
//
//   arithmetic, std::string      scalar tag (see sink.hpp for the kinds)
//   enum with string names       String
//   vector/array of numbers      array tag or List
//   vector/array of others       List
//   std::map<std::string, T>     Compound keyed by map key
//   std::optional<T>             the value, or no entry at all
//   struct with fields()         Compound
//
// ============================================================================

template <typename T>
void write(tag_sink& sink, const T& value);

template <typename T>
void write(tag_sink& sink, const char* name, const T& value) {
    sink.begin_named(name);
    write(sink, value);
}

namespace detail {

template <typename Tuple>
void write_fields(tag_sink& sink, const Tuple& descriptors) {
    std::apply([&sink](const auto&... f) {
        (write(sink, f.first, f.second), ...);
    }, descriptors);
}

} // namespace detail

template <typename T>
void write(tag_sink& sink, const T& value) {
    if constexpr (std::is_arithmetic_v<T> || std::is_same_v<T, std::string>) {
        sink.write(value);
    } else if constexpr (HasEnumStrings<T>) {
        sink.write(std::string(to_string(value)));
    } else if constexpr (detail::is_vector<T> || detail::is_array<T>) {
        using E = typename T::value_type;
        if constexpr (std::is_arithmetic_v<E>) {
            sink.write(std::vector<E>(value.begin(), value.end()));
        } else {
            sink.begin_list();
            for (const auto& elem : value) {
                write(sink, elem);
            }
            sink.end_list();
        }
    } else if constexpr (detail::is_string_map<T>) {
        sink.begin_group();
        for (const auto& [key, elem] : value) {
            write(sink, key.c_str(), elem);
        }
        sink.end_group();
    } else if constexpr (detail::is_optional<T>) {
        if (value) {
            write(sink, *value);
        } else {
            sink.skip();
        }
    } else if constexpr (HasConstFields<T>) {
        sink.begin_group();
        detail::write_fields(sink, fields(value));
        sink.end_group();
    } else {
        static_assert(nbt::detail::always_false<T>, "type has no tag mapping");
    }
}

// ============================================================================
// Read
// ============================================================================
//
// Each read returns false when the value is absent and leaves the target
// untouched. A present value of the wrong kind throws type_mismatch.
//
// ============================================================================

template <typename T>
auto read(tag_source& source, T& value) -> bool;

template <typename T>
auto read(tag_source& source, const char* name, T& value) -> bool {
    source.begin_named(name);
    return read(source, value);
}

namespace detail {

template <typename Tuple>
void read_fields(tag_source& source, Tuple&& descriptors) {
    std::apply([&source](auto&... f) {
        (read(source, f.first, f.second), ...);
    }, descriptors);
}

} // namespace detail

template <typename T>
auto read(tag_source& source, T& value) -> bool {
    if constexpr (std::is_arithmetic_v<T> || std::is_same_v<T, std::string>) {
        return source.read(value);
    } else if constexpr (HasEnumStrings<T>) {
        auto text = std::string{};
        if (!source.read(text)) return false;
        value = from_string(std::type_identity<T>{}, text);
        return true;
    } else if constexpr (detail::is_vector<T>) {
        using E = typename T::value_type;
        if constexpr (std::is_arithmetic_v<E>) {
            return source.read(value);
        } else {
            if (!source.begin_list()) return false;
            value.clear();
            for (auto elem = E{}; read(source, elem); elem = E{}) {
                value.push_back(std::move(elem));
            }
            source.end_list();
            return true;
        }
    } else if constexpr (detail::is_array<T>) {
        using E = typename T::value_type;
        if constexpr (std::is_arithmetic_v<E>) {
            auto elems = std::vector<E>{};
            if (!source.read(elems) || elems.size() != value.size()) return false;
            std::copy(elems.begin(), elems.end(), value.begin());
            return true;
        } else {
            if (!source.begin_list()) return false;
            auto complete = std::all_of(value.begin(), value.end(),
                [&source](E& elem) { return read(source, elem); });
            source.end_list();
            return complete;
        }
    } else if constexpr (detail::is_string_map<T>) {
        if (!source.begin_group()) return false;
        value.clear();
        for (const auto& key : source.keys()) {
            read(source, key.c_str(), value[key]);
        }
        source.end_group();
        return true;
    } else if constexpr (detail::is_optional<T>) {
        if (!source.has_next()) {
            source.skip();
            return false;
        }
        auto inner = typename T::value_type{};
        if (!read(source, inner)) return false;
        value = std::move(inner);
        return true;
    } else if constexpr (HasFields<T>) {
        if (!source.begin_group()) return false;
        detail::read_fields(source, fields(value));
        source.end_group();
        return true;
    } else {
        static_assert(nbt::detail::always_false<T>, "type has no tag mapping");
    }
}

// ============================================================================
// Whole-struct conversions
// ============================================================================

// The struct's fields become the entries of the returned Compound.
template <HasConstFields T>
auto to_compound(const T& value) -> compound_t {
    auto sink = tag_sink{};
    detail::write_fields(sink, fields(value));
    return sink.take();
}

// Fields absent from the Compound keep their current values.
template <HasFields T>
void from_compound(const compound_t& compound, T& value) {
    auto source = tag_source(compound);
    detail::read_fields(source, fields(value));
}

template <HasFields T>
auto from_compound(const compound_t& compound) -> T {
    auto value = T{};
    from_compound(compound, value);
    return value;
}

// ============================================================================
// Dot-path overrides
// ============================================================================

namespace detail {

template <typename T>
auto parse_value(const std::string& text) -> T {
    if constexpr (std::is_same_v<T, bool>) {
        if (text == "true" || text == "1") return true;
        if (text == "false" || text == "0") return false;
        throw std::runtime_error("expected true or false, got '" + text + "'");
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        auto v = std::stoll(text);
        if (!std::in_range<T>(v)) {
            throw std::runtime_error("value out of range: " + text);
        }
        return static_cast<T>(v);
    } else if constexpr (std::is_integral_v<T>) {
        // stoull accepts a leading minus and wraps it
        if (text.find('-') != std::string::npos) {
            throw std::runtime_error("value out of range: " + text);
        }
        auto v = std::stoull(text);
        if (!std::in_range<T>(v)) {
            throw std::runtime_error("value out of range: " + text);
        }
        return static_cast<T>(v);
    } else if constexpr (std::is_floating_point_v<T>) {
        return static_cast<T>(std::stod(text));
    } else if constexpr (std::is_same_v<T, std::string>) {
        return text;
    } else if constexpr (HasEnumStrings<T>) {
        return from_string(std::type_identity<T>{}, text);
    } else {
        throw std::runtime_error("'" + text + "' cannot be assigned to a whole group");
    }
}

template <typename T>
void assign_path(T& target, std::span<const std::string> path, const std::string& text) {
    if (path.empty()) {
        target = parse_value<T>(text);
        return;
    }
    if constexpr (HasFields<T>) {
        auto found = false;
        auto descriptors = fields(target);
        std::apply([&](auto&... f) {
            auto visit = [&](auto& descriptor) {
                if (!found && path.front() == descriptor.first) {
                    assign_path(descriptor.second, path.subspan(1), text);
                    found = true;
                }
            };
            (visit(f), ...);
        }, descriptors);
        if (!found) {
            throw std::runtime_error("field not found: " + path.front());
        }
    } else {
        throw std::runtime_error("cannot descend into '" + path.front() + "': not a struct");
    }
}

inline auto split_path(const std::string& path) -> std::vector<std::string> {
    auto segments = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (true) {
        auto dot = path.find('.', start);
        segments.push_back(path.substr(start, dot - start));
        if (dot == std::string::npos) {
            return segments;
        }
        start = dot + 1;
    }
}

} // namespace detail

/**
 * Set a field in a struct by dot-separated path.
 *
 * Example:
 *   set(opts, "read.max_depth", "64");
 *   set(opts, "write.compression", "zlib");  // enum by its to_string name
 */
template <HasFields T>
void set(T& obj, const std::string& path, const std::string& value) {
    auto segments = detail::split_path(path);
    detail::assign_path(obj, std::span<const std::string>(segments), value);
}

} // namespace archive
} // namespace nbt
