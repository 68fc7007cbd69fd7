#pragma once

#include <fstream>
#include <optional>
#include <ostream>
#include <string>
#include "error.hpp"

namespace nbt {

// =============================================================================
// log_t - line logger, silent unless a stream or file is attached
// =============================================================================

class log_t {
public:
    log_t() = default;
    explicit log_t(std::ostream& os) : stream_(&os) {}

    log_t(const log_t&) = delete;
    log_t& operator=(const log_t&) = delete;

    void attach(std::ostream& os) {
        file_.reset();
        stream_ = &os;
    }

    void open(const std::string& filename) {
        file_.emplace(filename, std::ios::app);
        if (!*file_) {
            file_.reset();
            stream_ = nullptr;
            throw nbt_error(error_kind::io_failure, "cannot open log file '" + filename + "'");
        }
        stream_ = &*file_;
    }

    void detach() {
        file_.reset();
        stream_ = nullptr;
    }

    auto enabled() const -> bool { return stream_ != nullptr; }

    void operator()(const std::string& message) {
        if (stream_) {
            *stream_ << message << "\n";
            stream_->flush();
        }
    }

private:
    std::optional<std::ofstream> file_;
    std::ostream* stream_ = nullptr;
};

} // namespace nbt
