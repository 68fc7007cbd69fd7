#include <algorithm>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "nbt/pretty.hpp"
#include "nbt/region.hpp"

using namespace nbt;

// =============================================================================
// Helpers
// =============================================================================

template<typename F>
auto throws(error_kind kind, F&& f) -> bool {
    try {
        f();
    } catch (const nbt_error& e) {
        return e.kind() == kind;
    }
    return false;
}

auto make_chunk(int x, int z, uint32_t timestamp, std::size_t blocks = 256) -> chunk_t {
    auto level = compound_t{
        {"xPos", int32_t{x}},
        {"zPos", int32_t{z}},
        {"LastUpdate", int64_t{timestamp} * 20},
        {"Blocks", byte_array_t(blocks, 1)},
    };
    return chunk_t{x, z, timestamp, document_t("", compound_t{{"Level", std::move(level)}})};
}

const std::vector<chunk_coord_t> test_coords = {
    {0, 0}, {1, 0}, {31, 0}, {0, 1}, {5, 7}, {31, 31},
};

auto make_test_region() -> region_t {
    auto region = region_t{};
    auto t = uint32_t{1700000000};
    for (const auto& c : test_coords) {
        region.insert(make_chunk(c.x, c.z, t++));
    }
    return region;
}

auto to_stream(const region_t& region, chunk_scheme_t scheme = chunk_scheme_t::zlib) -> std::stringstream {
    auto ss = std::stringstream(std::ios::binary | std::ios::in | std::ios::out);
    write_region(ss, region, scheme);
    ss.seekg(0);
    return ss;
}

auto same_coords(std::vector<chunk_coord_t> a, std::vector<chunk_coord_t> b) -> bool {
    auto less = [](const chunk_coord_t& p, const chunk_coord_t& q) {
        return chunk_index(p.x, p.z) < chunk_index(q.x, q.z);
    };
    std::sort(a.begin(), a.end(), less);
    std::sort(b.begin(), b.end(), less);
    return a == b;
}

auto same_chunks(const region_t& a, const region_t& b) -> bool {
    for (std::size_t i = 0; i < region_chunks; ++i) {
        const auto& p = a.chunks[i];
        const auto& q = b.chunks[i];
        if (p.has_value() != q.has_value()) return false;
        if (!p) continue;
        if (p->x != q->x || p->z != q->z || p->timestamp != q->timestamp) return false;
        if (!(p->data == q->data)) return false;
    }
    return true;
}

// Byte offset of slot `index`'s blob in a serialized region.
auto blob_offset(const std::string& file, std::size_t index) -> std::size_t {
    auto p = reinterpret_cast<const uint8_t*>(file.data()) + index * 4;
    auto raw = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
    return chunk_location_t::unpack(raw).byte_offset();
}

auto patched(const region_t& region, std::size_t index, std::size_t delta, uint8_t value) -> std::stringstream {
    auto file = to_stream(region).str();
    file[blob_offset(file, index) + delta] = static_cast<char>(value);
    return std::stringstream(file, std::ios::binary | std::ios::in | std::ios::out);
}

// =============================================================================
// Layout
// =============================================================================

void test_location_packing() {
    std::cout << "Testing location packing... ";
    auto loc = chunk_location_t::unpack(0x00000302);
    assert(loc.offset_sectors == 3);
    assert(loc.sector_count == 2);
    assert(loc.byte_offset() == 3 * 4096);
    assert(loc.byte_length() == 2 * 4096);
    assert(loc.pack() == 0x00000302);
    assert(chunk_location_t::unpack(0).empty());

    assert(chunk_index(5, 7) == 5 + 7 * 32);
    assert(chunk_index(-1, -1) == 1023);
    assert((chunk_coord(5 + 7 * 32) == chunk_coord_t{5, 7}));
    std::cout << "PASSED\n";
}

void test_write_layout() {
    std::cout << "Testing written header and sectors... ";
    auto file = to_stream(make_test_region()).str();
    assert(file.size() % sector_size == 0);
    assert(file.size() >= region_header_size + test_coords.size() * sector_size);

    // First chunk in slot order lands right after the header
    assert(blob_offset(file, chunk_index(0, 0)) == region_header_size);
    auto scheme = static_cast<uint8_t>(file[region_header_size + 4]);
    assert(scheme == static_cast<uint8_t>(chunk_scheme_t::zlib));
    std::cout << "PASSED\n";
}

// =============================================================================
// Scan and load
// =============================================================================

void test_scan_matches_load() {
    std::cout << "Testing index scan against full load... ";
    auto region = make_test_region();
    auto ss = to_stream(region);

    auto scanned = scan_region(ss);
    assert(ss.tellg() == std::streampos(sector_size));
    assert(same_coords(scanned, test_coords));

    ss.seekg(0);
    auto loaded = load_region(ss);
    assert(same_coords(loaded.present(), scanned));
    assert(loaded.size() == test_coords.size());
    assert(loaded.failures.empty());
    assert(same_chunks(loaded, region));
    std::cout << "PASSED\n";
}

void test_every_scheme() {
    std::cout << "Testing gzip, zlib and uncompressed chunks... ";
    auto region = make_test_region();
    for (auto scheme : {chunk_scheme_t::gzip, chunk_scheme_t::zlib, chunk_scheme_t::none}) {
        auto ss = to_stream(region, scheme);
        assert(same_chunks(load_region(ss), region));
    }
    assert(throws(error_kind::unsupported_compression_scheme, [&] {
        auto ss = std::stringstream();
        write_region(ss, region, chunk_scheme_t::absent);
    }));
    std::cout << "PASSED\n";
}

void test_multi_sector_chunk() {
    std::cout << "Testing chunk spanning several sectors... ";
    auto region = region_t{};
    region.insert(make_chunk(2, 3, 42, 10000));
    region.insert(make_chunk(4, 3, 43));
    auto ss = to_stream(region, chunk_scheme_t::none);

    auto reader = region_reader_t(ss);
    auto loc = reader.location(chunk_index(2, 3));
    assert(loc.offset_sectors == 2);
    assert(loc.sector_count == 3);
    assert(reader.location(chunk_index(4, 3)).offset_sectors == 5);
    assert(reader.timestamp(chunk_index(2, 3)) == 42);

    auto chunk = reader.read_chunk_at(2, 3);
    assert(chunk && chunk->x == 2 && chunk->z == 3);
    assert(chunk->data.get<compound_t>("Level").get<byte_array_t>("Blocks").size() == 10000);
    assert(!reader.read_chunk_at(0, 0));
    std::cout << "PASSED\n";
}

void test_region_file_helpers() {
    std::cout << "Testing region files and used_chunks... ";
    auto region = make_test_region();
    write_region_file("r.1.-2.mca", region);

    auto used = used_chunks("r.1.-2.mca");
    auto expected = std::vector<chunk_coord_t>{};
    for (const auto& c : test_coords) {
        expected.push_back({c.x + 32, c.z - 64});
    }
    assert(used == expected);
    assert(same_chunks(load_region_file("r.1.-2.mca"), region));
    std::remove("r.1.-2.mca");

    assert((parse_region_name("world/region/r.-3.7.mca") == chunk_coord_t{-3, 7}));
    assert(!parse_region_name("r.a.0.mca"));
    assert(!parse_region_name("level.dat"));
    assert(throws(error_kind::io_failure, [] { used_chunks("level.dat"); }));
    std::cout << "PASSED\n";
}

// =============================================================================
// Per-chunk failures
// =============================================================================

void test_corrupt_chunk_isolation() {
    std::cout << "Testing corrupt chunk isolation... ";
    auto region = make_test_region();
    auto bad = chunk_index(5, 7);

    // Unknown compression scheme in one slot
    {
        auto ss = patched(region, bad, 4, 9);
        auto loaded = load_region(ss);
        assert(loaded.size() == test_coords.size() - 1);
        assert(!loaded.chunks[bad]);
        assert(loaded.failures.size() == 1);
        assert(loaded.failures[0].index == bad);
        assert(loaded.failures[0].kind == error_kind::unsupported_compression_scheme);
    }

    // Garbage where the zlib header should be
    {
        auto ss = patched(region, bad, 5, 0xFF);
        auto reader = region_reader_t(ss);
        assert(throws(error_kind::compression_failure, [&] { reader.read_chunk(bad); }));
        assert(reader.read_chunk_at(31, 31));
        assert(reader.read_chunk_at(0, 0));
    }

    // Strict loading propagates the first failure
    {
        auto ss = patched(region, bad, 4, 9);
        auto strict = region_options_t{};
        strict.skip_corrupt = false;
        assert(throws(error_kind::unsupported_compression_scheme, [&] { load_region(ss, strict); }));
    }
    std::cout << "PASSED\n";
}

void test_erased_chunk() {
    std::cout << "Testing scheme 0 chunk is absent... ";
    auto region = make_test_region();
    auto erased = chunk_index(1, 0);
    auto ss = patched(region, erased, 4, 0);

    auto scanned = scan_region(ss);
    assert(scanned.size() == test_coords.size());

    ss.seekg(0);
    auto loaded = load_region(ss);
    assert(!loaded.chunks[erased]);
    assert(loaded.failures.empty());
    assert(loaded.size() == test_coords.size() - 1);
    std::cout << "PASSED\n";
}

void test_bad_locations() {
    std::cout << "Testing locations outside the file... ";
    auto region = region_t{};
    region.insert(make_chunk(0, 0, 1));
    auto file = to_stream(region).str();

    // Point slot 1 into the header, slot 2 past the end of the file
    auto ptr = [&](std::size_t slot) { return &file[slot * 4]; };
    auto into_header = std::string("\x00\x00\x01\x01", 4);
    auto past_end = std::string("\x00\x01\x00\x01", 4);
    std::copy(into_header.begin(), into_header.end(), ptr(1));
    std::copy(past_end.begin(), past_end.end(), ptr(2));

    auto ss = std::stringstream(file, std::ios::binary | std::ios::in | std::ios::out);
    auto reader = region_reader_t(ss);
    assert(throws(error_kind::malformed_length, [&] { reader.read_chunk(1); }));
    assert(throws(error_kind::unexpected_end_of_input, [&] { reader.read_chunk(2); }));
    assert(reader.read_chunk(0));

    auto out = std::ostringstream{};
    auto log = log_t(out);
    ss.seekg(0);
    auto loaded = load_region(ss, region_options_t{}, &log);
    assert(loaded.size() == 1);
    assert(loaded.failures.size() == 2);
    assert(out.str().find("skipping chunk (1, 0)") != std::string::npos);
    assert(out.str().find("skipping chunk (2, 0)") != std::string::npos);
    std::cout << "PASSED\n";
}

// =============================================================================
// Parallel decode
// =============================================================================

void test_decode_chunks_order() {
    std::cout << "Testing decode_chunks keeps blob order... ";
    auto region = make_test_region();
    auto ss = to_stream(region);
    auto reader = region_reader_t(ss);

    auto blobs = std::vector<chunk_blob_t>{};
    for (const auto& c : test_coords) {
        blobs.push_back(*reader.read_blob(chunk_index(c.x, c.z)));
    }
    std::reverse(blobs.begin(), blobs.end());
    blobs[2].data[0] = 0xFF;

    auto sequential = parallel::sequential_scheduler_t{};
    auto pool = parallel::thread_pool_t(4);
    for (auto results : {decode_chunks(blobs, sequential), decode_chunks(blobs, pool)}) {
        assert(results.size() == blobs.size());
        for (std::size_t i = 0; i < results.size(); ++i) {
            assert(results[i].index == blobs[i].index);
            if (i == 2) {
                assert(!results[i].chunk);
                assert(results[i].failure && results[i].failure->kind == error_kind::compression_failure);
            } else {
                assert(results[i].chunk);
                assert(chunk_index(results[i].chunk->x, results[i].chunk->z) == blobs[i].index);
            }
        }
    }
    std::cout << "PASSED\n";
}

void test_parallel_load() {
    std::cout << "Testing threaded region load... ";
    auto region = make_test_region();
    auto bad = chunk_index(31, 0);

    auto threaded = region_options_t{};
    threaded.threads = 4;

    auto ss = to_stream(region);
    assert(same_chunks(load_region(ss, threaded), region));

    auto corrupt = patched(region, bad, 5, 0xFF);
    auto loaded = load_region(corrupt, threaded);
    assert(loaded.size() == test_coords.size() - 1);
    assert(loaded.failures.size() == 1 && loaded.failures[0].index == bad);
    std::cout << "PASSED\n";
}

void test_pretty_region() {
    std::cout << "Testing region pretty print... ";
    auto region = region_t{};
    region.insert(make_chunk(3, 4, 99, 2));
    auto text = pretty(region);
    assert(text.find("chunk (3, 4) timestamp 99\n") == 0);
    assert(text.find("TAG_Byte_Array('Blocks'): [2 bytes]") != std::string::npos);
    std::cout << "PASSED\n";
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Layout ===\n\n";

    test_location_packing();
    test_write_layout();

    std::cout << "\n=== Scan and Load ===\n\n";

    test_scan_matches_load();
    test_every_scheme();
    test_multi_sector_chunk();
    test_region_file_helpers();

    std::cout << "\n=== Per-chunk Failures ===\n\n";

    test_corrupt_chunk_isolation();
    test_erased_chunk();
    test_bad_locations();

    std::cout << "\n=== Parallel ===\n\n";

    test_decode_chunks_order();
    test_parallel_load();
    test_pretty_region();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
