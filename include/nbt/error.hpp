#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace nbt {

// =============================================================================
// Error taxonomy
// =============================================================================

enum class error_kind {
    unexpected_end_of_input,
    unknown_tag_kind,
    not_a_compound_document,
    malformed_length,
    invalid_encoding,
    unsupported_compression_scheme,
    type_mismatch,
    missing_key,
    nesting_too_deep,
    compression_failure,
    io_failure,
};

inline auto to_string(error_kind k) -> const char* {
    switch (k) {
        case error_kind::unexpected_end_of_input:        return "unexpected end of input";
        case error_kind::unknown_tag_kind:               return "unknown tag kind";
        case error_kind::not_a_compound_document:        return "not a compound document";
        case error_kind::malformed_length:               return "malformed length";
        case error_kind::invalid_encoding:               return "invalid encoding";
        case error_kind::unsupported_compression_scheme: return "unsupported compression scheme";
        case error_kind::type_mismatch:                  return "type mismatch";
        case error_kind::missing_key:                    return "missing key";
        case error_kind::nesting_too_deep:               return "nesting too deep";
        case error_kind::compression_failure:            return "compression failure";
        case error_kind::io_failure:                     return "i/o failure";
    }
    return "unknown error";
}

// =============================================================================
// nbt_error - every load/save failure is reported with one of these
// =============================================================================

class nbt_error : public std::runtime_error {
public:
    nbt_error(error_kind kind, const std::string& detail)
        : std::runtime_error(format(kind, detail, std::nullopt)), kind_(kind), detail_(detail) {}

    nbt_error(error_kind kind, const std::string& detail, std::size_t offset)
        : std::runtime_error(format(kind, detail, offset)), kind_(kind), detail_(detail), offset_(offset) {}

    auto kind() const -> error_kind { return kind_; }
    auto offset() const -> std::optional<std::size_t> { return offset_; }

    // The message without the kind and offset prefix.
    auto detail() const -> const std::string& { return detail_; }

private:
    error_kind kind_;
    std::string detail_;
    std::optional<std::size_t> offset_;

    static auto format(error_kind kind, const std::string& detail, std::optional<std::size_t> offset) -> std::string {
        auto msg = std::string(to_string(kind));
        if (offset) {
            msg += " at offset " + std::to_string(*offset);
        }
        if (!detail.empty()) {
            msg += ": " + detail;
        }
        return msg;
    }
};

} // namespace nbt
