#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include <zlib.h>
#include "error.hpp"

namespace nbt {

// =============================================================================
// Compression framing
// =============================================================================

enum class compression_t {
    automatic,  // reading only: sniff gzip / zlib / raw from the first bytes
    none,
    gzip,
    zlib,
};

inline auto to_string(compression_t c) -> const char* {
    switch (c) {
        case compression_t::automatic: return "automatic";
        case compression_t::none:      return "none";
        case compression_t::gzip:      return "gzip";
        case compression_t::zlib:      return "zlib";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<compression_t>, const std::string& s) -> compression_t {
    if (s == "automatic") return compression_t::automatic;
    if (s == "none")      return compression_t::none;
    if (s == "gzip")      return compression_t::gzip;
    if (s == "zlib")      return compression_t::zlib;
    throw std::runtime_error("unknown compression: " + s);
}

inline auto detect_compression(std::span<const uint8_t> bytes) -> compression_t {
    if (bytes.size() >= 2 && bytes[0] == 0x1F && bytes[1] == 0x8B) {
        return compression_t::gzip;
    }
    // zlib header: CM = 8 (deflate), CINFO <= 7, (CMF * 256 + FLG) % 31 == 0
    if (bytes.size() >= 2 && (bytes[0] & 0x0F) == 8 && (bytes[0] >> 4) <= 7 &&
        ((bytes[0] << 8) | bytes[1]) % 31 == 0) {
        return compression_t::zlib;
    }
    return compression_t::none;
}

namespace detail {

inline auto window_bits(compression_t c) -> int {
    // 15 = 32 KiB window; +16 selects the gzip wrapper
    return c == compression_t::gzip ? 15 + 16 : 15;
}

constexpr std::size_t chunk_size = 64 * 1024;

} // namespace detail

// -----------------------------------------------------------------------------
// decompress
// -----------------------------------------------------------------------------

inline auto decompress(std::span<const uint8_t> input, compression_t c) -> std::vector<uint8_t> {
    if (c == compression_t::automatic) {
        c = detect_compression(input);
    }
    if (c == compression_t::none) {
        return std::vector<uint8_t>(input.begin(), input.end());
    }

    z_stream zs{};
    int rc = inflateInit2(&zs, detail::window_bits(c));
    if (rc != Z_OK) {
        throw nbt_error(error_kind::compression_failure, "inflateInit2 failed");
    }

    zs.next_in = const_cast<Bytef*>(input.data());
    zs.avail_in = static_cast<uInt>(input.size());

    std::vector<uint8_t> output;
    uint8_t buffer[detail::chunk_size];

    do {
        zs.next_out = buffer;
        zs.avail_out = sizeof(buffer);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
            auto msg = std::string(zs.msg ? zs.msg : zError(rc));
            inflateEnd(&zs);
            throw nbt_error(error_kind::compression_failure, std::string("inflate: ") + msg);
        }
        output.insert(output.end(), buffer, buffer + (sizeof(buffer) - zs.avail_out));
        if (rc == Z_BUF_ERROR && zs.avail_in == 0) {
            inflateEnd(&zs);
            throw nbt_error(error_kind::unexpected_end_of_input, "compressed stream is truncated");
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&zs);
    return output;
}

// -----------------------------------------------------------------------------
// compress
// -----------------------------------------------------------------------------

inline auto compress(std::span<const uint8_t> input, compression_t c,
                     int level = Z_DEFAULT_COMPRESSION) -> std::vector<uint8_t> {
    if (c == compression_t::none || c == compression_t::automatic) {
        return std::vector<uint8_t>(input.begin(), input.end());
    }

    z_stream zs{};
    int rc = deflateInit2(&zs, level, Z_DEFLATED, detail::window_bits(c), 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw nbt_error(error_kind::compression_failure, "deflateInit2 failed");
    }

    zs.next_in = const_cast<Bytef*>(input.data());
    zs.avail_in = static_cast<uInt>(input.size());

    std::vector<uint8_t> output;
    uint8_t buffer[detail::chunk_size];

    do {
        zs.next_out = buffer;
        zs.avail_out = sizeof(buffer);
        rc = deflate(&zs, Z_FINISH);
        if (rc == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            throw nbt_error(error_kind::compression_failure, "deflate failed");
        }
        output.insert(output.end(), buffer, buffer + (sizeof(buffer) - zs.avail_out));
    } while (rc != Z_STREAM_END);

    deflateEnd(&zs);
    return output;
}

} // namespace nbt
