#pragma once

#include <bit>
#include <cstdint>
#include <cstring>
#include <istream>
#include <iterator>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "core.hpp"
#include "error.hpp"

namespace nbt {

// =============================================================================
// Byte order helpers
// =============================================================================

namespace detail {

inline auto native_order() -> byte_order {
    return std::endian::native == std::endian::little ? byte_order::little : byte_order::big;
}

template<typename T>
void swap_if_needed(unsigned char (&bytes)[sizeof(T)], byte_order order) {
    if (order != native_order()) {
        for (std::size_t i = 0; i < sizeof(T) / 2; ++i) {
            std::swap(bytes[i], bytes[sizeof(T) - 1 - i]);
        }
    }
}

} // namespace detail

// =============================================================================
// Byte Reader - sequential cursor over an in-memory buffer
// =============================================================================
//
// Every read is bounds-checked; a short read throws
// error_kind::unexpected_end_of_input carrying the offset of the read.
//
// =============================================================================

class byte_reader_t {
public:
    explicit byte_reader_t(std::span<const uint8_t> data, byte_order order = byte_order::big)
        : data_(data), order_(order) {}

    template<typename T>
        requires std::is_arithmetic_v<T>
    auto read() -> T {
        require(sizeof(T));
        unsigned char bytes[sizeof(T)];
        std::memcpy(bytes, data_.data() + pos_, sizeof(T));
        detail::swap_if_needed<T>(bytes, order_);
        pos_ += sizeof(T);
        T value;
        std::memcpy(&value, bytes, sizeof(T));
        return value;
    }

    auto read_bytes(std::size_t count) -> std::span<const uint8_t> {
        require(count);
        auto result = data_.subspan(pos_, count);
        pos_ += count;
        return result;
    }

    // Throws unless `count` more bytes are available.
    void require(std::size_t count) const {
        if (count > remaining()) {
            throw nbt_error(error_kind::unexpected_end_of_input,
                "needed " + std::to_string(count) + " bytes, " +
                std::to_string(remaining()) + " remain", pos_);
        }
    }

    auto position() const -> std::size_t { return pos_; }
    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto order() const -> byte_order { return order_; }

private:
    std::span<const uint8_t> data_;
    byte_order order_;
    std::size_t pos_ = 0;
};

// =============================================================================
// Byte Writer - appends packed values to an owned buffer
// =============================================================================

class byte_writer_t {
public:
    explicit byte_writer_t(byte_order order = byte_order::big) : order_(order) {}

    template<typename T>
        requires std::is_arithmetic_v<T>
    void write(T value) {
        unsigned char bytes[sizeof(T)];
        std::memcpy(bytes, &value, sizeof(T));
        detail::swap_if_needed<T>(bytes, order_);
        buffer_.insert(buffer_.end(), bytes, bytes + sizeof(T));
    }

    void write_bytes(std::span<const uint8_t> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    auto bytes() const -> const std::vector<uint8_t>& { return buffer_; }
    auto take() -> std::vector<uint8_t> { return std::move(buffer_); }
    auto size() const -> std::size_t { return buffer_.size(); }
    auto order() const -> byte_order { return order_; }

private:
    std::vector<uint8_t> buffer_;
    byte_order order_;
};

// =============================================================================
// Stream helpers
// =============================================================================

inline auto read_all(std::istream& is) -> std::vector<uint8_t> {
    auto result = std::vector<uint8_t>(
        std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    if (is.bad()) {
        throw nbt_error(error_kind::io_failure, "failed to read stream");
    }
    return result;
}

inline auto read_exact(std::istream& is, std::size_t count) -> std::vector<uint8_t> {
    auto start = static_cast<std::streamoff>(is.tellg());
    auto result = std::vector<uint8_t>(count);
    if (count > 0) {
        is.read(reinterpret_cast<char*>(result.data()), static_cast<std::streamsize>(count));
    }
    if (!is) {
        auto offset = start < 0 ? std::size_t{0} : static_cast<std::size_t>(start);
        throw nbt_error(error_kind::unexpected_end_of_input,
            "needed " + std::to_string(count) + " bytes, got " + std::to_string(is.gcount()),
            offset);
    }
    return result;
}

template<typename T>
    requires std::is_arithmetic_v<T>
auto read_value(std::istream& is, byte_order order) -> T {
    auto bytes = read_exact(is, sizeof(T));
    return byte_reader_t(bytes, order).read<T>();
}

} // namespace nbt
