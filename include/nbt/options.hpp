#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include "archive/protocol.hpp"
#include "compression.hpp"
#include "core.hpp"
#include "vendor_header.hpp"

namespace nbt {

// =============================================================================
// Header policy on save
// =============================================================================

enum class header_policy_t {
    keep,   // re-emit the vendor header the document was loaded with
    drop,   // write a bare tag stream
};

inline auto to_string(header_policy_t p) -> const char* {
    switch (p) {
        case header_policy_t::keep: return "keep";
        case header_policy_t::drop: return "drop";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<header_policy_t>, const std::string& s) -> header_policy_t {
    if (s == "keep") return header_policy_t::keep;
    if (s == "drop") return header_policy_t::drop;
    throw std::runtime_error("unknown header policy: " + s);
}

// =============================================================================
// Options
// =============================================================================

struct read_options_t {
    byte_order order = byte_order::big;
    compression_t compression = compression_t::automatic;
    bool detect_header = true;
    int max_depth = default_max_depth;

    // Consulted only when detect_header is set; empty means detect_vendor_header
    header_detector_t detector;
};

struct write_options_t {
    byte_order order = byte_order::big;
    compression_t compression = compression_t::gzip;
    header_policy_t header = header_policy_t::keep;
};

struct region_options_t {
    bool skip_corrupt = true;
    std::size_t threads = 1;
};

inline auto fields(const read_options_t& o) {
    return std::make_tuple(
        archive::field("order", o.order),
        archive::field("compression", o.compression),
        archive::field("detect_header", o.detect_header),
        archive::field("max_depth", o.max_depth)
    );
}

inline auto fields(read_options_t& o) {
    return std::make_tuple(
        archive::field("order", o.order),
        archive::field("compression", o.compression),
        archive::field("detect_header", o.detect_header),
        archive::field("max_depth", o.max_depth)
    );
}

inline auto fields(const write_options_t& o) {
    return std::make_tuple(
        archive::field("order", o.order),
        archive::field("compression", o.compression),
        archive::field("header", o.header)
    );
}

inline auto fields(write_options_t& o) {
    return std::make_tuple(
        archive::field("order", o.order),
        archive::field("compression", o.compression),
        archive::field("header", o.header)
    );
}

inline auto fields(const region_options_t& o) {
    return std::make_tuple(
        archive::field("skip_corrupt", o.skip_corrupt),
        archive::field("threads", o.threads)
    );
}

inline auto fields(region_options_t& o) {
    return std::make_tuple(
        archive::field("skip_corrupt", o.skip_corrupt),
        archive::field("threads", o.threads)
    );
}

} // namespace nbt
