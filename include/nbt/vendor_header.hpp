#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include "byte_io.hpp"
#include "core.hpp"
#include "error.hpp"

namespace nbt {

// =============================================================================
// Vendor headers
// =============================================================================
//
// Bedrock edition files prefix the (little-endian) tag stream with a small
// header that is not part of the NBT grammar:
//
//   level.dat     version:u32le  length:u32le
//   entities.dat  "ENT\0"  version:u32le  length:u32le
//
// `length` is the byte count of the tag stream that follows. The header is
// always little-endian, independent of the byte order of the payload.
//
// =============================================================================

enum class vendor_format_t {
    level_dat,
    entities_dat,
};

inline auto to_string(vendor_format_t f) -> const char* {
    switch (f) {
        case vendor_format_t::level_dat:    return "level_dat";
        case vendor_format_t::entities_dat: return "entities_dat";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<vendor_format_t>, const std::string& s) -> vendor_format_t {
    if (s == "level_dat")    return vendor_format_t::level_dat;
    if (s == "entities_dat") return vendor_format_t::entities_dat;
    throw std::runtime_error("unknown vendor format: " + s);
}

struct vendor_header_t {
    vendor_format_t format = vendor_format_t::level_dat;
    uint32_t version = 0;

    auto size() const -> std::size_t {
        return format == vendor_format_t::entities_dat ? 12 : 8;
    }

    friend auto operator==(const vendor_header_t&, const vendor_header_t&) -> bool = default;
};

// Returns the header found at the start of an uncompressed stream, or
// nothing if the stream is a bare tag stream.
using header_detector_t = std::function<std::optional<vendor_header_t>(std::span<const uint8_t>)>;

namespace detail {

constexpr uint8_t entities_magic[4] = {'E', 'N', 'T', 0};

inline auto starts_with_entities_magic(std::span<const uint8_t> bytes) -> bool {
    return bytes.size() >= 4 &&
        bytes[0] == entities_magic[0] && bytes[1] == entities_magic[1] &&
        bytes[2] == entities_magic[2] && bytes[3] == entities_magic[3];
}

} // namespace detail

// The default detector. A header is reported only when its declared length
// equals the remaining byte count and the payload starts with a Compound id,
// so a bare big-endian file is never mistaken for one.
inline auto detect_vendor_header(std::span<const uint8_t> bytes) -> std::optional<vendor_header_t> {
    auto check = [&](vendor_format_t format, std::size_t at) -> std::optional<vendor_header_t> {
        auto header = vendor_header_t{format, 0};
        if (bytes.size() <= header.size()) {
            return std::nullopt;
        }
        auto in = byte_reader_t(bytes.subspan(at), byte_order::little);
        header.version = in.read<uint32_t>();
        auto length = in.read<uint32_t>();
        auto payload = bytes.subspan(header.size());
        if (length != payload.size() || payload[0] != static_cast<uint8_t>(tag_kind::compound)) {
            return std::nullopt;
        }
        return header;
    };

    if (detail::starts_with_entities_magic(bytes)) {
        return check(vendor_format_t::entities_dat, 4);
    }
    return check(vendor_format_t::level_dat, 0);
}

// Looser sniff used by file tooling: an "ENT\0" prefix marks entities.dat,
// any first byte other than a Compound id marks level.dat.
inline auto is_pocket(std::span<const uint8_t> bytes) -> std::optional<vendor_format_t> {
    if (detail::starts_with_entities_magic(bytes)) {
        return vendor_format_t::entities_dat;
    }
    if (!bytes.empty() && bytes[0] != static_cast<uint8_t>(tag_kind::compound)) {
        return vendor_format_t::level_dat;
    }
    return std::nullopt;
}

inline void write_vendor_header(byte_writer_t& out, const vendor_header_t& header, std::size_t payload_size) {
    if (payload_size > 0xFFFFFFFFu) {
        throw nbt_error(error_kind::malformed_length, "payload too large for a vendor header");
    }
    auto le = byte_writer_t(byte_order::little);
    if (header.format == vendor_format_t::entities_dat) {
        le.write_bytes(std::span<const uint8_t>(detail::entities_magic, 4));
    }
    le.write(header.version);
    le.write(static_cast<uint32_t>(payload_size));
    out.write_bytes(le.bytes());
}

} // namespace nbt
