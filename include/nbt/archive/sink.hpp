#pragma once

// Sink for the struct binding protocol: builds a Compound tag tree.

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "../tag.hpp"

namespace nbt {
namespace archive {

// ============================================================================
// Arithmetic type -> tag value mapping
// ============================================================================

namespace detail {

template <typename T>
    requires std::is_arithmetic_v<T>
auto to_tag(T value) -> tag_t {
    if constexpr (std::is_same_v<T, bool>) {
        return tag_t(static_cast<int8_t>(value ? 1 : 0));
    } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
        return tag_t(value);
    } else if constexpr (std::is_floating_point_v<T>) {
        return tag_t(static_cast<double>(value));
    } else if constexpr (sizeof(T) == 1) {
        return tag_t(static_cast<int8_t>(value));
    } else if constexpr (sizeof(T) == 2) {
        return tag_t(static_cast<int16_t>(value));
    } else if constexpr (sizeof(T) == 4) {
        return tag_t(static_cast<int32_t>(value));
    } else {
        return tag_t(static_cast<int64_t>(value));
    }
}

} // namespace detail

// ============================================================================
// tag_sink - writes named values into nested Compounds and Lists
// ============================================================================

class tag_sink {
public:
    tag_sink() {
        frames.push_back(frame_t{});
    }

    // --- Name context ---

    void begin_named(const char* name) {
        pending_name = std::string(name);
    }

    // Drops the pending name without writing a value (an empty optional).
    void skip() {
        pending_name.reset();
    }

    // --- Scalars ---

    template <typename T>
        requires std::is_arithmetic_v<T>
    void write(const T& value) {
        place(detail::to_tag(value));
    }

    void write(const std::string& value) {
        place(tag_t(value));
    }

    void write(const char* value) {
        write(std::string(value));
    }

    // --- Arrays ---

    template <typename T>
        requires std::is_arithmetic_v<T>
    void write(const std::vector<T>& value) {
        if constexpr (std::is_same_v<T, int8_t> || std::is_same_v<T, int32_t> ||
                      std::is_same_v<T, int64_t>) {
            place(tag_t(value));
        } else {
            auto kind = detail::to_tag(T{}).kind();
            auto list = list_t(kind);
            list.reserve(value.size());
            for (const auto& elem : value) {
                list.push_back(detail::to_tag(static_cast<T>(elem)));
            }
            place(tag_t(std::move(list)));
        }
    }

    // --- Groups ---

    void begin_group() {
        open(false);
    }

    void end_group() {
        close();
    }

    void begin_list() {
        open(true);
    }

    void end_list() {
        close();
    }

    // --- Result ---

    auto root() const -> const compound_t& {
        return frames.front().compound;
    }

    auto take() -> compound_t {
        if (frames.size() != 1) {
            throw std::runtime_error("tag_sink: unbalanced begin/end");
        }
        return std::move(frames.front().compound);
    }

private:
    struct frame_t {
        bool is_list = false;
        std::optional<std::string> name;
        compound_t compound;
        std::vector<tag_t> elements;
    };

    std::vector<frame_t> frames;
    std::optional<std::string> pending_name;

    void open(bool is_list) {
        auto f = frame_t{};
        f.is_list = is_list;
        f.name = std::move(pending_name);
        pending_name.reset();
        frames.push_back(std::move(f));
    }

    void close() {
        if (frames.size() < 2) {
            throw std::runtime_error("tag_sink: end without begin");
        }
        auto f = std::move(frames.back());
        frames.pop_back();
        pending_name = std::move(f.name);

        if (f.is_list) {
            auto kind = f.elements.empty() ? tag_kind::end : f.elements.front().kind();
            place(tag_t(list_t(kind, std::move(f.elements))));
        } else {
            place(tag_t(std::move(f.compound)));
        }
    }

    void place(tag_t tag) {
        auto& top = frames.back();
        if (top.is_list) {
            pending_name.reset();
            top.elements.push_back(std::move(tag));
            return;
        }
        if (!pending_name) {
            throw std::runtime_error("tag_sink: unnamed value inside a compound");
        }
        top.compound.insert(std::move(*pending_name), std::move(tag));
        pending_name.reset();
    }
};

} // namespace archive
} // namespace nbt
