#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>
#include "core.hpp"
#include "error.hpp"

namespace nbt {

// =============================================================================
// Tag model
// =============================================================================
//
// A tag is an optional name plus a value drawn from a closed set of twelve
// alternatives. The variant's alternative index is always (wire id - 1), so
// the kind of a tag is never stored separately from its value.
//
// Ownership is strictly hierarchical: list_t and compound_t own their
// children by value. Children are reachable only as const tags; in-place
// edits go through get<T>(), which cannot change a child's kind or name.
//
// =============================================================================

class tag_t;

using byte_array_t = std::vector<int8_t>;
using int_array_t  = std::vector<int32_t>;
using long_array_t = std::vector<int64_t>;

// =============================================================================
// list_t - ordered, single-kind sequence of unnamed tags
// =============================================================================

class list_t {
public:
    explicit list_t(tag_kind element_kind = tag_kind::end);
    list_t(tag_kind element_kind, std::vector<tag_t> elements);

    auto element_kind() const -> tag_kind { return element_kind_; }
    auto size() const -> std::size_t;
    auto empty() const -> bool;

    // Converts the element to the declared kind (see coerce) and strips its
    // name. Throws error_kind::type_mismatch if no conversion exists.
    void push_back(tag_t element);

    template<typename V>
        requires (!std::is_same_v<std::decay_t<V>, tag_t>)
    void push_back(V&& value);

    // Replaces element i, converting it as push_back does.
    void set(std::size_t i, tag_t element);

    template<typename V>
        requires (!std::is_same_v<std::decay_t<V>, tag_t>)
    void set(std::size_t i, V&& value);

    auto operator[](std::size_t i) const -> const tag_t&;
    auto at(std::size_t i) const -> const tag_t&;

    // Throws std::out_of_range, or error_kind::type_mismatch when T is not
    // the element kind.
    template<typename T>
    auto get(std::size_t i) -> T&;

    auto begin() const;
    auto end() const;

    auto elements() const -> const std::vector<tag_t>& { return elements_; }

    void reserve(std::size_t n);
    void clear();
    void erase(std::size_t i);

    auto operator==(const list_t& other) const -> bool;

private:
    tag_kind element_kind_;
    std::vector<tag_t> elements_;
};

// =============================================================================
// compound_t - name-keyed collection of tags, insertion order preserved
// =============================================================================
//
// The key is the child's own name: insert() sets it, and children are only
// handed out const, so the two can never diverge. A hash index from name to
// position keeps lookup constant time while the vector keeps insertion order.
//
// =============================================================================

class compound_t {
public:
    compound_t() = default;
    compound_t(std::initializer_list<std::pair<std::string, tag_t>> entries);

    // Inserts `tag` under `name`, setting the tag's name to `name`. An
    // existing entry of the same name is replaced in place.
    auto insert(std::string name, tag_t tag) -> const tag_t&;

    auto find(std::string_view name) const -> const tag_t*;
    auto contains(std::string_view name) const -> bool { return find(name) != nullptr; }

    // Throws error_kind::missing_key if absent.
    auto at(std::string_view name) const -> const tag_t&;

    // Throws error_kind::missing_key or error_kind::type_mismatch.
    template<typename T>
    auto get(std::string_view name) -> T&;
    template<typename T>
    auto get(std::string_view name) const -> const T&;

    auto erase(std::string_view name) -> bool;

    auto size() const -> std::size_t;
    auto empty() const -> bool;
    void clear();

    auto begin() const;
    auto end() const;

    // Order-insensitive: equal when both hold the same name -> tag pairs.
    auto operator==(const compound_t& other) const -> bool;

private:
    std::vector<tag_t> entries_;
    std::unordered_map<std::string, std::size_t> index_;

    auto position(std::string_view name) const -> std::optional<std::size_t>;
};

using value_t = std::variant<
    int8_t,
    int16_t,
    int32_t,
    int64_t,
    float,
    double,
    byte_array_t,
    std::string,
    list_t,
    compound_t,
    int_array_t,
    long_array_t>;

namespace detail {

template<typename T, typename... Ts>
constexpr auto index_of(std::variant<Ts...>*) -> std::size_t {
    std::size_t i = 0;
    bool found = ((std::is_same_v<T, Ts> ? true : (++i, false)) || ...);
    return found ? i : sizeof...(Ts);
}

template<typename T>
constexpr std::size_t value_index = index_of<T>(static_cast<value_t*>(nullptr));

template<typename T>
inline constexpr bool always_false = false;

} // namespace detail

template<typename T>
concept TagValue = detail::value_index<T> < std::variant_size_v<value_t>;

template<TagValue T>
constexpr tag_kind kind_of = static_cast<tag_kind>(detail::value_index<T> + 1);

static_assert(kind_of<int8_t> == tag_kind::byte);
static_assert(kind_of<std::string> == tag_kind::string);
static_assert(kind_of<compound_t> == tag_kind::compound);
static_assert(kind_of<long_array_t> == tag_kind::long_array);

// =============================================================================
// tag_t
// =============================================================================

class tag_t {
public:
    tag_t() = default;

    template<typename V>
        requires TagValue<std::decay_t<V>>
    tag_t(V&& value) : value_(std::forward<V>(value)) {}

    tag_t(const char* value) : value_(std::string(value)) {}
    tag_t(std::string_view value) : value_(std::string(value)) {}

    tag_t(std::optional<std::string> name, value_t value)
        : name_(std::move(name)), value_(std::move(value)) {}

    auto kind() const -> tag_kind { return static_cast<tag_kind>(value_.index() + 1); }

    // Present for compound children and document roots, absent for list
    // elements.
    auto name() const -> const std::optional<std::string>& { return name_; }

    // Read-only: replacing the whole value could change the kind of a list
    // element. Use as<T>() to edit a value of known kind.
    auto value() const& -> const value_t& { return value_; }
    auto value() && -> value_t { return std::move(value_); }

    template<TagValue T>
    auto is() const -> bool { return std::holds_alternative<T>(value_); }

    template<TagValue T>
    auto get_if() -> T* { return std::get_if<T>(&value_); }

    template<TagValue T>
    auto get_if() const -> const T* { return std::get_if<T>(&value_); }

    template<TagValue T>
    auto as() -> T& {
        if (auto* p = std::get_if<T>(&value_)) return *p;
        throw mismatch(kind_of<T>);
    }

    template<TagValue T>
    auto as() const -> const T& {
        if (auto* p = std::get_if<T>(&value_)) return *p;
        throw mismatch(kind_of<T>);
    }

    friend auto operator==(const tag_t& a, const tag_t& b) -> bool {
        return a.name_ == b.name_ && a.value_ == b.value_;
    }

private:
    friend class list_t;
    friend class compound_t;

    std::optional<std::string> name_;
    value_t value_;

    void set_name(std::optional<std::string> name) { name_ = std::move(name); }

    auto mismatch(tag_kind expected) const -> nbt_error {
        return nbt_error(error_kind::type_mismatch,
            std::string("expected ") + to_string(expected) + ", found " + to_string(kind()));
    }
};

// =============================================================================
// Coercion
// =============================================================================
//
// The explicit conversion applied at a list's insertion boundary:
// - integers convert to any integer kind whose range holds the value
// - integers convert to Float or Double
// - floating values convert to Float or Double; a finite double outside the
//   range of float does not convert
// - non-numeric values convert only to their own kind
//
// =============================================================================

namespace detail {

template<typename To, typename From>
auto convert_numeric(From v, tag_kind target) -> tag_t {
    auto fail = [&]() -> nbt_error {
        return nbt_error(error_kind::type_mismatch,
            std::string("value not representable as ") + to_string(target));
    };
    if constexpr (std::is_integral_v<To>) {
        if constexpr (std::is_integral_v<From>) {
            if (!std::in_range<To>(v)) throw fail();
            return tag_t(static_cast<To>(v));
        } else {
            throw fail();
        }
    } else {
        if constexpr (std::is_same_v<To, float> && std::is_floating_point_v<From>) {
            if (std::isfinite(v) && std::fabs(static_cast<double>(v)) > std::numeric_limits<float>::max()) {
                throw fail();
            }
        }
        return tag_t(static_cast<To>(v));
    }
}

} // namespace detail

template<Arithmetic T>
auto coerce(T raw, tag_kind target) -> tag_t {
    // std::in_range rejects bool and the character types
    using From = std::conditional_t<std::is_same_v<T, bool> || std::is_same_v<T, char>, int, T>;
    auto v = static_cast<From>(raw);
    switch (target) {
        case tag_kind::byte:    return detail::convert_numeric<int8_t>(v, target);
        case tag_kind::short_:  return detail::convert_numeric<int16_t>(v, target);
        case tag_kind::int_:    return detail::convert_numeric<int32_t>(v, target);
        case tag_kind::long_:   return detail::convert_numeric<int64_t>(v, target);
        case tag_kind::float_:  return detail::convert_numeric<float>(v, target);
        case tag_kind::double_: return detail::convert_numeric<double>(v, target);
        default:
            throw nbt_error(error_kind::type_mismatch,
                std::string("a number cannot be stored as ") + to_string(target));
    }
}

// The returned tag never carries a name.
inline auto coerce(tag_t tag, tag_kind target) -> tag_t {
    if (tag.kind() == target) {
        return tag_t(std::nullopt, std::move(tag).value());
    }
    if (is_numeric(tag.kind()) && is_numeric(target)) {
        return std::visit([target](const auto& v) -> tag_t {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::is_arithmetic_v<V>) {
                return coerce(v, target);
            } else {
                throw nbt_error(error_kind::type_mismatch, "non-numeric value");
            }
        }, tag.value());
    }
    throw nbt_error(error_kind::type_mismatch,
        std::string("cannot store ") + to_string(tag.kind()) + " in a list of " + to_string(target));
}

// =============================================================================
// list_t implementation
// =============================================================================

inline list_t::list_t(tag_kind element_kind) : element_kind_(element_kind) {}

inline list_t::list_t(tag_kind element_kind, std::vector<tag_t> elements)
    : element_kind_(element_kind) {
    elements_.reserve(elements.size());
    for (auto& e : elements) {
        push_back(std::move(e));
    }
}

inline auto list_t::size() const -> std::size_t { return elements_.size(); }
inline auto list_t::empty() const -> bool { return elements_.empty(); }

inline void list_t::push_back(tag_t element) {
    if (element_kind_ == tag_kind::end) {
        throw nbt_error(error_kind::type_mismatch,
            std::string("cannot store ") + to_string(element.kind()) + " in a list of TAG_End");
    }
    elements_.push_back(coerce(std::move(element), element_kind_));
}

template<typename V>
    requires (!std::is_same_v<std::decay_t<V>, tag_t>)
void list_t::push_back(V&& value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<V>>) {
        if (element_kind_ == tag_kind::end) {
            throw nbt_error(error_kind::type_mismatch, "cannot store a number in a list of TAG_End");
        }
        elements_.push_back(coerce(value, element_kind_));
    } else {
        push_back(tag_t(std::forward<V>(value)));
    }
}

inline void list_t::set(std::size_t i, tag_t element) {
    if (i >= elements_.size()) {
        throw std::out_of_range("list index " + std::to_string(i) + " out of range");
    }
    elements_[i] = coerce(std::move(element), element_kind_);
}

template<typename V>
    requires (!std::is_same_v<std::decay_t<V>, tag_t>)
void list_t::set(std::size_t i, V&& value) {
    if constexpr (std::is_arithmetic_v<std::decay_t<V>>) {
        if (i >= elements_.size()) {
            throw std::out_of_range("list index " + std::to_string(i) + " out of range");
        }
        elements_[i] = coerce(value, element_kind_);
    } else {
        set(i, tag_t(std::forward<V>(value)));
    }
}

inline auto list_t::operator[](std::size_t i) const -> const tag_t& { return elements_[i]; }

inline auto list_t::at(std::size_t i) const -> const tag_t& {
    if (i >= elements_.size()) {
        throw std::out_of_range("list index " + std::to_string(i) + " out of range");
    }
    return elements_[i];
}

template<typename T>
auto list_t::get(std::size_t i) -> T& {
    if (i >= elements_.size()) {
        throw std::out_of_range("list index " + std::to_string(i) + " out of range");
    }
    return elements_[i].template as<T>();
}

inline auto list_t::begin() const { return elements_.cbegin(); }
inline auto list_t::end() const { return elements_.cend(); }

inline void list_t::reserve(std::size_t n) { elements_.reserve(n); }
inline void list_t::clear() { elements_.clear(); }

inline void list_t::erase(std::size_t i) {
    if (i < elements_.size()) {
        elements_.erase(elements_.begin() + static_cast<std::ptrdiff_t>(i));
    }
}

inline auto list_t::operator==(const list_t& other) const -> bool {
    return element_kind_ == other.element_kind_ && elements_ == other.elements_;
}

// =============================================================================
// compound_t implementation
// =============================================================================

inline compound_t::compound_t(std::initializer_list<std::pair<std::string, tag_t>> entries) {
    for (const auto& [name, tag] : entries) {
        insert(name, tag);
    }
}

inline auto compound_t::insert(std::string name, tag_t tag) -> const tag_t& {
    tag.set_name(name);
    if (auto i = position(name)) {
        entries_[*i] = std::move(tag);
        return entries_[*i];
    }
    index_.emplace(std::move(name), entries_.size());
    entries_.push_back(std::move(tag));
    return entries_.back();
}

inline auto compound_t::position(std::string_view name) const -> std::optional<std::size_t> {
    auto it = index_.find(std::string(name));
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

inline auto compound_t::find(std::string_view name) const -> const tag_t* {
    auto i = position(name);
    return i ? &entries_[*i] : nullptr;
}

inline auto compound_t::at(std::string_view name) const -> const tag_t& {
    if (const auto* t = find(name)) return *t;
    throw nbt_error(error_kind::missing_key, "no entry named '" + std::string(name) + "'");
}

template<typename T>
auto compound_t::get(std::string_view name) -> T& {
    if (auto i = position(name)) return entries_[*i].template as<T>();
    throw nbt_error(error_kind::missing_key, "no entry named '" + std::string(name) + "'");
}

template<typename T>
auto compound_t::get(std::string_view name) const -> const T& {
    return at(name).template as<T>();
}

// Linear in the number of entries after the erased one.
inline auto compound_t::erase(std::string_view name) -> bool {
    auto i = position(name);
    if (!i) return false;
    index_.erase(std::string(name));
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(*i));
    for (auto j = *i; j < entries_.size(); ++j) {
        index_[*entries_[j].name()] = j;
    }
    return true;
}

inline auto compound_t::size() const -> std::size_t { return entries_.size(); }
inline auto compound_t::empty() const -> bool { return entries_.empty(); }
inline void compound_t::clear() {
    entries_.clear();
    index_.clear();
}

inline auto compound_t::begin() const { return entries_.cbegin(); }
inline auto compound_t::end() const { return entries_.cend(); }

inline auto compound_t::operator==(const compound_t& other) const -> bool {
    if (entries_.size() != other.entries_.size()) return false;
    for (const auto& entry : entries_) {
        const auto* match = other.find(*entry.name());
        if (!match || !(*match == entry)) return false;
    }
    return true;
}

} // namespace nbt
