#pragma once

// Source for the struct binding protocol: key-based lookup in a Compound
// tag tree. Missing keys return false.

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "../error.hpp"
#include "../tag.hpp"

namespace nbt {
namespace archive {

namespace detail {

// Numbers convert only when the target type holds the stored value exactly
// (floating targets take any number). Anything else is a type_mismatch.
template <typename T, typename V>
auto convert_number(V v, tag_kind stored) -> T {
    auto unrepresentable = [stored]() {
        return nbt_error(error_kind::type_mismatch,
            std::string(to_string(stored)) + " value does not fit the target field");
    };
    if constexpr (std::is_same_v<T, bool>) {
        return v != 0;
    } else if constexpr (std::is_floating_point_v<T>) {
        return static_cast<T>(v);
    } else if constexpr (std::is_integral_v<V>) {
        if (!std::in_range<T>(v)) throw unrepresentable();
        return static_cast<T>(v);
    } else {
        // min and max + 1 are powers of two, so both bounds are exact
        auto x = static_cast<long double>(v);
        auto upper = std::ldexp(1.0L, std::numeric_limits<T>::digits);
        if (!std::isfinite(x) || std::trunc(x) != x ||
            x < static_cast<long double>(std::numeric_limits<T>::min()) || x >= upper) {
            throw unrepresentable();
        }
        return static_cast<T>(x);
    }
}

template <typename T>
    requires std::is_arithmetic_v<T>
auto from_tag(const tag_t& tag) -> T {
    return std::visit([&tag](const auto& v) -> T {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_arithmetic_v<V>) {
            return convert_number<T>(v, tag.kind());
        } else {
            throw nbt_error(error_kind::type_mismatch,
                std::string("expected a number, found ") + to_string(tag.kind()));
        }
    }, tag.value());
}

} // namespace detail

// ============================================================================
// tag_source
// ============================================================================

class tag_source {
public:
    explicit tag_source(const compound_t& root) {
        frames.push_back(frame_t{&root, nullptr, 0});
    }

    // --- Name context ---

    void begin_named(const char* name) {
        pending_name = name;
    }

    // True when the pending name (or the next list element) exists.
    auto has_next() const -> bool {
        const auto& top = frames.back();
        if (top.list) {
            return top.index < top.list->size();
        }
        return pending_name && top.compound->contains(*pending_name);
    }

    void skip() {
        pending_name.reset();
    }

    // --- Scalars ---

    template <typename T>
        requires std::is_arithmetic_v<T>
    auto read(T& value) -> bool {
        const auto* t = next();
        if (!t) return false;
        value = detail::from_tag<T>(*t);
        return true;
    }

    auto read(std::string& value) -> bool {
        const auto* t = next();
        if (!t) return false;
        value = t->as<std::string>();
        return true;
    }

    // --- Arrays ---

    template <typename T>
        requires std::is_arithmetic_v<T>
    auto read(std::vector<T>& value) -> bool {
        const auto* t = next();
        if (!t) return false;
        value.clear();
        auto append = [&value, t](const auto& elems) {
            for (auto x : elems) {
                value.push_back(detail::convert_number<T>(x, t->kind()));
            }
        };
        if (const auto* a = t->get_if<byte_array_t>()) {
            append(*a);
        } else if (const auto* a = t->get_if<int_array_t>()) {
            append(*a);
        } else if (const auto* a = t->get_if<long_array_t>()) {
            append(*a);
        } else {
            for (const auto& elem : t->as<list_t>()) {
                value.push_back(detail::from_tag<T>(elem));
            }
        }
        return true;
    }

    // --- Groups ---

    auto begin_group() -> bool {
        const auto* t = next();
        if (!t) return false;
        frames.push_back(frame_t{&t->as<compound_t>(), nullptr, 0});
        return true;
    }

    void end_group() {
        pop();
    }

    auto begin_list() -> bool {
        const auto* t = next();
        if (!t) return false;
        const auto& list = t->as<list_t>();
        frames.push_back(frame_t{nullptr, &list, 0});
        return true;
    }

    void end_list() {
        pop();
    }

    // Names in the current Compound, in insertion order.
    auto keys() const -> std::vector<std::string> {
        auto result = std::vector<std::string>{};
        if (const auto* c = frames.back().compound) {
            for (const auto& child : *c) {
                result.push_back(*child.name());
            }
        }
        return result;
    }

private:
    struct frame_t {
        const compound_t* compound;
        const list_t* list;
        std::size_t index;
    };

    std::vector<frame_t> frames;
    std::optional<std::string> pending_name;

    auto next() -> const tag_t* {
        auto& top = frames.back();
        if (top.list) {
            pending_name.reset();
            if (top.index >= top.list->size()) return nullptr;
            return &(*top.list)[top.index++];
        }
        if (!pending_name) return nullptr;
        const auto* t = top.compound->find(*pending_name);
        pending_name.reset();
        return t;
    }

    void pop() {
        if (frames.size() < 2) {
            throw std::runtime_error("tag_source: end without begin");
        }
        frames.pop_back();
    }
};

} // namespace archive
} // namespace nbt
