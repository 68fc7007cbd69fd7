#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <fstream>
#include <initializer_list>
#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include "byte_io.hpp"
#include "compression.hpp"
#include "document.hpp"
#include "error.hpp"
#include "log.hpp"
#include "options.hpp"
#include "parallel.hpp"

namespace nbt {

// =============================================================================
// Region container (.mca / .mcr)
// =============================================================================
//
// File layout:
//   [0, 4096)     1024 x location:u32be   (sector offset << 8 | sector count)
//   [4096, 8192)  1024 x timestamp:u32be
//   [8192, ...)   chunk blobs, each starting on a 4096-byte sector boundary
//
// Chunk blob:
//   length:u32be  scheme:u8  data[length - 1]
//
// Slot i holds the chunk at local coordinate (i mod 32, i div 32).
//
// =============================================================================

constexpr std::size_t sector_size = 4096;
constexpr std::size_t region_width = 32;
constexpr std::size_t region_chunks = region_width * region_width;
constexpr std::size_t region_header_size = 2 * sector_size;

// -----------------------------------------------------------------------------
// Coordinates and locations
// -----------------------------------------------------------------------------

struct chunk_coord_t {
    int x = 0;
    int z = 0;

    friend auto operator==(const chunk_coord_t&, const chunk_coord_t&) -> bool = default;
};

inline auto chunk_index(int x, int z) -> std::size_t {
    return static_cast<std::size_t>(x & 31) + static_cast<std::size_t>(z & 31) * region_width;
}

inline auto chunk_coord(std::size_t index) -> chunk_coord_t {
    return {static_cast<int>(index % region_width), static_cast<int>(index / region_width)};
}

struct chunk_location_t {
    uint32_t offset_sectors = 0;
    uint32_t sector_count = 0;

    static auto unpack(uint32_t raw) -> chunk_location_t {
        return {raw >> 8, raw & 0xFF};
    }

    auto pack() const -> uint32_t {
        return (offset_sectors << 8) | (sector_count & 0xFF);
    }

    auto byte_offset() const -> std::size_t { return std::size_t(offset_sectors) * sector_size; }
    auto byte_length() const -> std::size_t { return std::size_t(sector_count) * sector_size; }
    auto empty() const -> bool { return pack() == 0; }

    friend auto operator==(const chunk_location_t&, const chunk_location_t&) -> bool = default;
};

// -----------------------------------------------------------------------------
// Compression schemes
// -----------------------------------------------------------------------------

enum class chunk_scheme_t : uint8_t {
    absent = 0,     // unallocated or improperly erased
    gzip = 1,
    zlib = 2,
    none = 3,
};

inline auto to_string(chunk_scheme_t s) -> const char* {
    switch (s) {
        case chunk_scheme_t::absent: return "absent";
        case chunk_scheme_t::gzip:   return "gzip";
        case chunk_scheme_t::zlib:   return "zlib";
        case chunk_scheme_t::none:   return "none";
    }
    return "unknown";
}

inline auto from_string(std::type_identity<chunk_scheme_t>, const std::string& s) -> chunk_scheme_t {
    if (s == "absent") return chunk_scheme_t::absent;
    if (s == "gzip")   return chunk_scheme_t::gzip;
    if (s == "zlib")   return chunk_scheme_t::zlib;
    if (s == "none")   return chunk_scheme_t::none;
    throw std::runtime_error("unknown chunk scheme: " + s);
}

inline auto to_compression(chunk_scheme_t s) -> compression_t {
    switch (s) {
        case chunk_scheme_t::gzip: return compression_t::gzip;
        case chunk_scheme_t::zlib: return compression_t::zlib;
        case chunk_scheme_t::none: return compression_t::none;
        case chunk_scheme_t::absent: break;
    }
    throw nbt_error(error_kind::unsupported_compression_scheme, "an absent chunk has no compression");
}

// -----------------------------------------------------------------------------
// Chunks
// -----------------------------------------------------------------------------

struct chunk_blob_t {
    std::size_t index = 0;
    uint32_t timestamp = 0;
    chunk_scheme_t scheme = chunk_scheme_t::zlib;
    std::vector<uint8_t> data;
};

struct chunk_t {
    int x = 0;
    int z = 0;
    uint32_t timestamp = 0;
    document_t data;
};

struct chunk_failure_t {
    std::size_t index = 0;
    error_kind kind = error_kind::unexpected_end_of_input;
    std::string message;
    std::exception_ptr error;
};

struct region_t {
    std::array<std::optional<chunk_t>, region_chunks> chunks;
    std::vector<chunk_failure_t> failures;

    auto at(int x, int z) -> std::optional<chunk_t>& { return chunks[chunk_index(x, z)]; }
    auto at(int x, int z) const -> const std::optional<chunk_t>& { return chunks[chunk_index(x, z)]; }

    // Places the chunk in the slot named by its own coordinates.
    void insert(chunk_t chunk) {
        auto i = chunk_index(chunk.x, chunk.z);
        chunks[i] = std::move(chunk);
    }

    auto present() const -> std::vector<chunk_coord_t> {
        auto result = std::vector<chunk_coord_t>{};
        for (std::size_t i = 0; i < region_chunks; ++i) {
            if (chunks[i]) result.push_back(chunk_coord(i));
        }
        return result;
    }

    auto size() const -> std::size_t {
        auto n = std::size_t{0};
        for (const auto& c : chunks) {
            if (c) ++n;
        }
        return n;
    }
};

// =============================================================================
// Chunk decode (no I/O; safe to run on any worker)
// =============================================================================

inline auto decode_chunk(const chunk_blob_t& blob, int max_depth = default_max_depth) -> chunk_t {
    auto raw = decompress(blob.data, to_compression(blob.scheme));
    auto options = read_options_t{};
    options.compression = compression_t::none;
    options.detect_header = false;
    options.max_depth = max_depth;

    auto coord = chunk_coord(blob.index);
    return chunk_t{coord.x, coord.z, blob.timestamp, document_t::load(raw, options)};
}

// =============================================================================
// Index-only scan
// =============================================================================

inline auto read_location_table(std::istream& is) -> std::array<uint32_t, region_chunks> {
    auto bytes = read_exact(is, sector_size);
    auto in = byte_reader_t(bytes, byte_order::big);
    auto table = std::array<uint32_t, region_chunks>{};
    for (auto& entry : table) {
        entry = in.read<uint32_t>();
    }
    return table;
}

// Coordinates of every slot with a non-zero location; reads 4 KiB only.
inline auto scan_region(std::istream& is) -> std::vector<chunk_coord_t> {
    auto table = read_location_table(is);
    auto result = std::vector<chunk_coord_t>{};
    for (std::size_t i = 0; i < region_chunks; ++i) {
        if (table[i] != 0) result.push_back(chunk_coord(i));
    }
    return result;
}

// Parses the region coordinates out of an "r.<x>.<z>.mca" (or .mcr) name.
inline auto parse_region_name(const std::string& path) -> std::optional<chunk_coord_t> {
    auto slash = path.find_last_of("/\\");
    auto name = slash == std::string::npos ? path : path.substr(slash + 1);

    auto parts = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (true) {
        auto dot = name.find('.', start);
        parts.push_back(name.substr(start, dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    if (parts.size() != 4 || parts[0] != "r") {
        return std::nullopt;
    }
    try {
        std::size_t nx = 0, nz = 0;
        auto x = std::stoi(parts[1], &nx);
        auto z = std::stoi(parts[2], &nz);
        if (nx != parts[1].size() || nz != parts[2].size()) {
            return std::nullopt;
        }
        return chunk_coord_t{x, z};
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

// World chunk coordinates of the chunks present in a region file.
inline auto used_chunks(const std::string& path) -> std::vector<chunk_coord_t> {
    auto region = parse_region_name(path);
    if (!region) {
        throw nbt_error(error_kind::io_failure, "'" + path + "' is not named r.<x>.<z>.mca");
    }
    auto file = std::ifstream(path, std::ios::binary);
    if (!file) {
        throw nbt_error(error_kind::io_failure, "cannot open '" + path + "' for reading");
    }
    auto result = scan_region(file);
    for (auto& c : result) {
        c.x += region->x * static_cast<int>(region_width);
        c.z += region->z * static_cast<int>(region_width);
    }
    return result;
}

// =============================================================================
// region_reader_t - random access to the chunks of a seekable stream
// =============================================================================

class region_reader_t {
public:
    explicit region_reader_t(std::istream& is) : is_(is) {
        is_.clear();
        is_.seekg(0);
        auto header = read_exact(is_, region_header_size);
        auto in = byte_reader_t(header, byte_order::big);
        for (auto& entry : locations_) {
            entry = in.read<uint32_t>();
        }
        for (auto& entry : timestamps_) {
            entry = in.read<uint32_t>();
        }
    }

    auto location(std::size_t index) const -> chunk_location_t {
        return chunk_location_t::unpack(locations_.at(index));
    }

    auto timestamp(std::size_t index) const -> uint32_t {
        return timestamps_.at(index);
    }

    auto present() const -> std::vector<chunk_coord_t> {
        auto result = std::vector<chunk_coord_t>{};
        for (std::size_t i = 0; i < region_chunks; ++i) {
            if (locations_[i] != 0) result.push_back(chunk_coord(i));
        }
        return result;
    }

    // Raw scheme and compressed bytes of one slot; nothing for an
    // unallocated slot or a scheme-0 blob.
    auto read_blob(std::size_t index) -> std::optional<chunk_blob_t> {
        auto loc = location(index);
        if (loc.empty()) {
            return std::nullopt;
        }
        if (loc.offset_sectors < 2) {
            throw nbt_error(error_kind::malformed_length,
                "chunk " + std::to_string(index) + " points into the region header");
        }

        is_.clear();
        is_.seekg(static_cast<std::streamoff>(loc.byte_offset()));
        if (!is_) {
            throw nbt_error(error_kind::unexpected_end_of_input,
                "chunk " + std::to_string(index) + " lies beyond the end of the file",
                loc.byte_offset());
        }

        auto length = read_value<uint32_t>(is_, byte_order::big);
        auto scheme = read_value<uint8_t>(is_, byte_order::big);

        if (scheme == static_cast<uint8_t>(chunk_scheme_t::absent)) {
            return std::nullopt;
        }
        if (scheme > static_cast<uint8_t>(chunk_scheme_t::none)) {
            throw nbt_error(error_kind::unsupported_compression_scheme,
                "chunk " + std::to_string(index) + " uses scheme " + std::to_string(scheme),
                loc.byte_offset() + 4);
        }
        if (length == 0 || std::size_t(length) + 4 > loc.byte_length()) {
            throw nbt_error(error_kind::malformed_length,
                "chunk " + std::to_string(index) + " declares " + std::to_string(length) +
                " bytes in " + std::to_string(loc.sector_count) + " sectors",
                loc.byte_offset());
        }

        auto blob = chunk_blob_t{};
        blob.index = index;
        blob.timestamp = timestamps_[index];
        blob.scheme = static_cast<chunk_scheme_t>(scheme);
        blob.data = read_exact(is_, length - 1);
        return blob;
    }

    // Failures are confined to the requested chunk.
    auto read_chunk(std::size_t index, int max_depth = default_max_depth) -> std::optional<chunk_t> {
        auto blob = read_blob(index);
        if (!blob) {
            return std::nullopt;
        }
        return decode_chunk(*blob, max_depth);
    }

    auto read_chunk_at(int x, int z) -> std::optional<chunk_t> {
        return read_chunk(chunk_index(x, z));
    }

private:
    std::istream& is_;
    std::array<uint32_t, region_chunks> locations_{};
    std::array<uint32_t, region_chunks> timestamps_{};
};

// =============================================================================
// Parallel decode
// =============================================================================

struct chunk_result_t {
    std::size_t index = 0;
    std::optional<chunk_t> chunk;
    std::optional<chunk_failure_t> failure;
};

// Decodes each blob as a separate task. Results come back in the order of
// `blobs`, not in completion order. nbt_error is reported per chunk; any
// other exception is rethrown once every task has finished.
template<parallel::Scheduler S>
auto decode_chunks(std::vector<chunk_blob_t> blobs, S& scheduler,
                   int max_depth = default_max_depth) -> std::vector<chunk_result_t> {
    struct outcome_t {
        chunk_result_t result;
        std::exception_ptr exception;
    };
    auto queue = parallel::blocking_queue<std::pair<std::size_t, outcome_t>>{};
    auto n = blobs.size();

    for (std::size_t i = 0; i < n; ++i) {
        scheduler.spawn([&queue, i, max_depth, blob = std::move(blobs[i])]() mutable {
            auto outcome = outcome_t{};
            outcome.result.index = blob.index;
            try {
                outcome.result.chunk = decode_chunk(blob, max_depth);
            } catch (const nbt_error& e) {
                outcome.result.failure = chunk_failure_t{blob.index, e.kind(), e.what(), std::current_exception()};
            } catch (...) {
                outcome.exception = std::current_exception();
            }
            queue.send({i, std::move(outcome)});
        });
    }

    auto results = std::vector<chunk_result_t>(n);
    auto first_exception = std::exception_ptr{};
    for (std::size_t i = 0; i < n; ++i) {
        auto [idx, outcome] = queue.recv();
        if (outcome.exception && !first_exception) {
            first_exception = outcome.exception;
        }
        results[idx] = std::move(outcome.result);
    }
    if (first_exception) {
        std::rethrow_exception(first_exception);
    }
    return results;
}

// =============================================================================
// Whole-region load
// =============================================================================

namespace detail {

inline void record_failure(region_t& region, chunk_failure_t failure,
                           const region_options_t& options, log_t* log) {
    if (!options.skip_corrupt && failure.error) {
        std::rethrow_exception(failure.error);
    }
    if (log) {
        auto coord = chunk_coord(failure.index);
        (*log)("skipping chunk (" + std::to_string(coord.x) + ", " + std::to_string(coord.z) +
               "): " + failure.message);
    }
    region.failures.push_back(std::move(failure));
}

inline void record_failure(region_t& region, std::size_t index, const nbt_error& e,
                           const region_options_t& options, log_t* log) {
    record_failure(region, chunk_failure_t{index, e.kind(), e.what(), std::current_exception()},
                   options, log);
}

} // namespace detail

inline auto load_region(std::istream& is, const region_options_t& options = {},
                        log_t* log = nullptr) -> region_t {
    auto reader = region_reader_t(is);
    auto region = region_t{};

    if (options.threads <= 1) {
        for (std::size_t i = 0; i < region_chunks; ++i) {
            try {
                if (auto chunk = reader.read_chunk(i)) {
                    region.chunks[i] = std::move(*chunk);
                }
            } catch (const nbt_error& e) {
                detail::record_failure(region, i, e, options, log);
            }
        }
        return region;
    }

    // Reads stay on the calling thread; only decode is spread over workers
    auto blobs = std::vector<chunk_blob_t>{};
    for (std::size_t i = 0; i < region_chunks; ++i) {
        try {
            if (auto blob = reader.read_blob(i)) {
                blobs.push_back(std::move(*blob));
            }
        } catch (const nbt_error& e) {
            detail::record_failure(region, i, e, options, log);
        }
    }

    auto pool = parallel::thread_pool_t(options.threads);
    for (auto& r : decode_chunks(std::move(blobs), pool)) {
        if (r.chunk) {
            region.chunks[r.index] = std::move(*r.chunk);
        } else if (r.failure) {
            detail::record_failure(region, std::move(*r.failure), options, log);
        }
    }
    return region;
}

inline auto load_region_file(const std::string& path, const region_options_t& options = {},
                             log_t* log = nullptr) -> region_t {
    auto file = std::ifstream(path, std::ios::binary);
    if (!file) {
        throw nbt_error(error_kind::io_failure, "cannot open '" + path + "' for reading");
    }
    return load_region(file, options, log);
}

// =============================================================================
// Write
// =============================================================================

// Chunks are packed back to back in slot order starting at sector 2.
inline void write_region(std::ostream& os, const region_t& region,
                         chunk_scheme_t scheme = chunk_scheme_t::zlib) {
    if (scheme == chunk_scheme_t::absent) {
        throw nbt_error(error_kind::unsupported_compression_scheme, "cannot write chunks as absent");
    }
    auto chunk_options = write_options_t{};
    chunk_options.compression = compression_t::none;
    chunk_options.header = header_policy_t::drop;

    auto header = byte_writer_t(byte_order::big);
    auto timestamps = byte_writer_t(byte_order::big);
    auto body = byte_writer_t(byte_order::big);
    auto next_sector = uint32_t{2};

    for (std::size_t i = 0; i < region_chunks; ++i) {
        const auto& chunk = region.chunks[i];
        if (!chunk) {
            header.write(uint32_t{0});
            timestamps.write(uint32_t{0});
            continue;
        }
        auto data = compress(chunk->data.to_bytes(chunk_options), to_compression(scheme));
        auto blob_size = data.size() + 5;
        auto sectors = (blob_size + sector_size - 1) / sector_size;
        if (sectors > 0xFF) {
            throw nbt_error(error_kind::malformed_length,
                "chunk " + std::to_string(i) + " needs " + std::to_string(sectors) +
                " sectors, more than a location entry can address");
        }

        auto loc = chunk_location_t{next_sector, static_cast<uint32_t>(sectors)};
        header.write(loc.pack());
        timestamps.write(chunk->timestamp);
        next_sector += static_cast<uint32_t>(sectors);

        body.write(static_cast<uint32_t>(data.size() + 1));
        body.write(static_cast<uint8_t>(scheme));
        body.write_bytes(data);
        auto padding = sectors * sector_size - blob_size;
        body.write_bytes(std::vector<uint8_t>(padding, 0));
    }

    for (const auto* part : {&header, &timestamps, &body}) {
        const auto& bytes = part->bytes();
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (!os) {
        throw nbt_error(error_kind::io_failure, "stream write failed");
    }
}

inline void write_region_file(const std::string& path, const region_t& region,
                              chunk_scheme_t scheme = chunk_scheme_t::zlib) {
    auto file = std::ofstream(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw nbt_error(error_kind::io_failure, "cannot open '" + path + "' for writing");
    }
    write_region(file, region, scheme);
}

} // namespace nbt
