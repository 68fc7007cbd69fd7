#pragma once

// Core library

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace nbt {

// =============================================================================
// Concepts
// =============================================================================

template<typename T>
concept Arithmetic = std::is_arithmetic_v<T>;

// =============================================================================
// Limits
// =============================================================================

constexpr std::size_t max_string_bytes = 65535;
constexpr int default_max_depth = 512;

// =============================================================================
// Tag kinds (wire ids)
// =============================================================================

enum class tag_kind : uint8_t {
    end        = 0,
    byte       = 1,
    short_     = 2,
    int_       = 3,
    long_      = 4,
    float_     = 5,
    double_    = 6,
    byte_array = 7,
    string     = 8,
    list       = 9,
    compound   = 10,
    int_array  = 11,
    long_array = 12,
};

constexpr uint8_t max_tag_id = 12;

constexpr auto is_valid_kind(uint8_t id) -> bool {
    return id <= max_tag_id;
}

constexpr auto is_numeric(tag_kind k) -> bool {
    return k >= tag_kind::byte && k <= tag_kind::double_;
}

inline auto to_string(tag_kind k) -> const char* {
    switch (k) {
        case tag_kind::end:        return "TAG_End";
        case tag_kind::byte:       return "TAG_Byte";
        case tag_kind::short_:     return "TAG_Short";
        case tag_kind::int_:       return "TAG_Int";
        case tag_kind::long_:      return "TAG_Long";
        case tag_kind::float_:     return "TAG_Float";
        case tag_kind::double_:    return "TAG_Double";
        case tag_kind::byte_array: return "TAG_Byte_Array";
        case tag_kind::string:     return "TAG_String";
        case tag_kind::list:       return "TAG_List";
        case tag_kind::compound:   return "TAG_Compound";
        case tag_kind::int_array:  return "TAG_Int_Array";
        case tag_kind::long_array: return "TAG_Long_Array";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<tag_kind>, const std::string& s) -> tag_kind {
    for (uint8_t id = 0; id <= max_tag_id; ++id) {
        auto k = static_cast<tag_kind>(id);
        if (s == to_string(k)) return k;
    }
    throw std::runtime_error("unknown tag kind: " + s);
}

// =============================================================================
// Byte order
// =============================================================================

enum class byte_order {
    big,
    little,
};

inline auto to_string(byte_order o) -> const char* {
    switch (o) {
        case byte_order::big:    return "big";
        case byte_order::little: return "little";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<byte_order>, const std::string& s) -> byte_order {
    if (s == "big")    return byte_order::big;
    if (s == "little") return byte_order::little;
    throw std::runtime_error("unknown byte order: " + s);
}

} // namespace nbt
