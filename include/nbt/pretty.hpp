#pragma once

#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>
#include "document.hpp"
#include "region.hpp"
#include "tag.hpp"

namespace nbt {

// =============================================================================
// Pretty printer
// =============================================================================
//
// TAG_Compound('Level'): 2 entries
// {
//   TAG_Int('xPos'): 3
//   TAG_List('Sections'): 1 entries
//   {
//     TAG_Compound(None): 0 entries
//     {
//     }
//   }
// }
//
// =============================================================================

namespace detail {

template<typename T>
auto format_number(T value) -> std::string {
    if constexpr (std::is_floating_point_v<T>) {
        std::ostringstream oss;
        oss << std::setprecision(std::is_same_v<T, float> ? 9 : 17) << value;
        auto s = oss.str();
        if (s.find_first_of(".einf") == std::string::npos) {
            s += ".0";
        }
        return s;
    } else {
        return std::to_string(static_cast<int64_t>(value));
    }
}

inline auto quote(const std::string& s) -> std::string {
    std::string result = "'";
    for (char c : s) {
        switch (c) {
            case '\\': result += "\\\\"; break;
            case '\'': result += "\\'"; break;
            case '\n': result += "\\n"; break;
            case '\t': result += "\\t"; break;
            case '\r': result += "\\r"; break;
            default:   result += c; break;
        }
    }
    return result + "'";
}

inline void pretty_into(std::ostream& os, const std::optional<std::string>& name, const value_t& value,
                        int level, const std::string& unit);

// One entry: its header line, then a braced block for composites.
template<typename T>
void pretty_entry(std::ostream& os, const std::optional<std::string>& name, const T& v,
                  int level, const std::string& unit) {
    auto indent = std::string{};
    for (int i = 0; i < level; ++i) indent += unit;

    os << indent << to_string(kind_of<T>) << "(" << (name ? quote(*name) : std::string("None")) << "): ";

    if constexpr (std::is_arithmetic_v<T>) {
        os << format_number(v) << "\n";
    } else if constexpr (std::is_same_v<T, std::string>) {
        os << quote(v) << "\n";
    } else if constexpr (std::is_same_v<T, byte_array_t>) {
        os << "[" << v.size() << " bytes]\n";
    } else if constexpr (std::is_same_v<T, int_array_t>) {
        os << "[" << v.size() << " ints]\n";
    } else if constexpr (std::is_same_v<T, long_array_t>) {
        os << "[" << v.size() << " longs]\n";
    } else if constexpr (std::is_same_v<T, list_t> || std::is_same_v<T, compound_t>) {
        os << v.size() << " entries\n" << indent << "{\n";
        for (const auto& child : v) {
            pretty_into(os, child.name(), child.value(), level + 1, unit);
        }
        os << indent << "}\n";
    } else {
        static_assert(detail::always_false<T>, "unhandled tag value type");
    }
}

inline void pretty_into(std::ostream& os, const std::optional<std::string>& name, const value_t& value,
                        int level, const std::string& unit) {
    std::visit([&](const auto& v) { pretty_entry(os, name, v, level, unit); }, value);
}

} // namespace detail

inline void pretty(std::ostream& os, const tag_t& tag, const std::string& indent_unit = "  ") {
    detail::pretty_into(os, tag.name(), tag.value(), 0, indent_unit);
}

inline auto pretty(const tag_t& tag, const std::string& indent_unit = "  ") -> std::string {
    std::ostringstream oss;
    pretty(oss, tag, indent_unit);
    return oss.str();
}

inline void pretty(std::ostream& os, const document_t& doc, const std::string& indent_unit = "  ") {
    detail::pretty_entry(os, std::optional<std::string>(doc.name()), doc.root(), 0, indent_unit);
}

inline auto pretty(const document_t& doc, const std::string& indent_unit = "  ") -> std::string {
    std::ostringstream oss;
    pretty(oss, doc, indent_unit);
    return oss.str();
}

// Each present chunk's document, preceded by its coordinates.
inline auto pretty(const region_t& region, const std::string& indent_unit = "  ") -> std::string {
    std::ostringstream oss;
    for (const auto& chunk : region.chunks) {
        if (!chunk) continue;
        oss << "chunk (" << chunk->x << ", " << chunk->z << ") timestamp " << chunk->timestamp << "\n";
        pretty(oss, chunk->data, indent_unit);
    }
    return oss.str();
}

} // namespace nbt
