#pragma once

#include <cstdint>
#include <fstream>
#include <istream>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "byte_io.hpp"
#include "codec.hpp"
#include "compression.hpp"
#include "error.hpp"
#include "log.hpp"
#include "options.hpp"
#include "tag.hpp"
#include "vendor_header.hpp"

namespace nbt {

// =============================================================================
// document_t - a named root Compound, as stored in a .dat file
// =============================================================================
//
// Load pipeline:
//   1. strip gzip / zlib framing (sniffed, or as requested)
//   2. detect and strip a vendor header (when enabled)
//   3. require a Compound root and decode it
//
// Save applies the same steps in reverse. Bytes after the root Compound are
// ignored on load.
//
// =============================================================================

class document_t : public compound_t {
public:
    document_t() = default;

    explicit document_t(std::string name, compound_t root = {})
        : compound_t(std::move(root)), name_(std::move(name)) {}

    auto name() const -> const std::string& { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    auto root() -> compound_t& { return *this; }
    auto root() const -> const compound_t& { return *this; }

    auto vendor_header() const -> const std::optional<vendor_header_t>& { return header_; }
    void set_vendor_header(std::optional<vendor_header_t> header) { header_ = std::move(header); }

    // The root as a named Compound tag.
    auto to_tag() const -> tag_t {
        return tag_t(name_, value_t(root()));
    }

    // -------------------------------------------------------------------------
    // Load
    // -------------------------------------------------------------------------

    static auto load(std::span<const uint8_t> bytes,
                     const read_options_t& options = {},
                     log_t* log = nullptr) -> document_t {
        auto compression = options.compression;
        if (compression == compression_t::automatic) {
            compression = detect_compression(bytes);
            if (log) (*log)(std::string("detected compression: ") + to_string(compression));
        }
        auto raw = decompress(bytes, compression);
        auto payload = std::span<const uint8_t>(raw);

        auto header = std::optional<vendor_header_t>{};
        if (options.detect_header) {
            header = options.detector ? options.detector(payload) : detect_vendor_header(payload);
            if (header) {
                if (header->size() > payload.size()) {
                    throw nbt_error(error_kind::unexpected_end_of_input,
                        "vendor header longer than the stream", payload.size());
                }
                payload = payload.subspan(header->size());
                if (log) {
                    (*log)(std::string("vendor header: ") + to_string(header->format) +
                           " version " + std::to_string(header->version));
                }
            }
        }

        auto in = byte_reader_t(payload, options.order);
        auto id = in.read<uint8_t>();
        if (id != static_cast<uint8_t>(tag_kind::compound)) {
            throw nbt_error(error_kind::not_a_compound_document,
                "root kind id is " + std::to_string(id) + ", expected 10", 0);
        }
        auto name = read_string(in);
        auto doc = document_t(std::move(name), read_compound(in, options.max_depth));
        doc.header_ = header;
        return doc;
    }

    static auto load(std::istream& is, const read_options_t& options = {},
                     log_t* log = nullptr) -> document_t {
        auto bytes = read_all(is);
        return load(bytes, options, log);
    }

    static auto load_file(const std::string& filename, const read_options_t& options = {},
                          log_t* log = nullptr) -> document_t {
        auto file = std::ifstream(filename, std::ios::binary);
        if (!file) {
            throw nbt_error(error_kind::io_failure, "cannot open '" + filename + "' for reading");
        }
        return load(file, options, log);
    }

    // -------------------------------------------------------------------------
    // Save
    // -------------------------------------------------------------------------

    auto to_bytes(const write_options_t& options = {}) const -> std::vector<uint8_t> {
        auto body = byte_writer_t(options.order);
        body.write(static_cast<uint8_t>(tag_kind::compound));
        write_string(body, name_);
        write_compound(body, root());

        auto framed = byte_writer_t(options.order);
        if (header_ && options.header == header_policy_t::keep) {
            write_vendor_header(framed, *header_, body.size());
        }
        framed.write_bytes(body.bytes());
        return compress(framed.bytes(), options.compression);
    }

    void save(std::ostream& os, const write_options_t& options = {}) const {
        auto bytes = to_bytes(options);
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        if (!os) {
            throw nbt_error(error_kind::io_failure, "stream write failed");
        }
    }

    void save_file(const std::string& filename, const write_options_t& options = {}) const {
        auto file = std::ofstream(filename, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw nbt_error(error_kind::io_failure, "cannot open '" + filename + "' for writing");
        }
        save(file, options);
    }

    // Root name and entries; the vendor header is framing, not content.
    friend auto operator==(const document_t& a, const document_t& b) -> bool {
        return a.name_ == b.name_ && a.root() == b.root();
    }

private:
    std::string name_;
    std::optional<vendor_header_t> header_;
};

} // namespace nbt
