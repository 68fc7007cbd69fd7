#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <tuple>
#include "nbt/nbt.hpp"

using namespace nbt;

// =============================================================================
// Inspector configuration, overridable with key=value arguments
// =============================================================================

struct inspect_config_t {
    read_options_t read;
    write_options_t write;
    region_options_t region;
    chunk_scheme_t chunk_scheme = chunk_scheme_t::zlib;
    std::string indent = "  ";
    std::string output;
    std::string log_file;
    bool verbose = false;
};

inline auto fields(const inspect_config_t& c) {
    return std::make_tuple(
        archive::field("read", c.read),
        archive::field("write", c.write),
        archive::field("region", c.region),
        archive::field("chunk_scheme", c.chunk_scheme),
        archive::field("indent", c.indent),
        archive::field("output", c.output),
        archive::field("log_file", c.log_file),
        archive::field("verbose", c.verbose)
    );
}

inline auto fields(inspect_config_t& c) {
    return std::make_tuple(
        archive::field("read", c.read),
        archive::field("write", c.write),
        archive::field("region", c.region),
        archive::field("chunk_scheme", c.chunk_scheme),
        archive::field("indent", c.indent),
        archive::field("output", c.output),
        archive::field("log_file", c.log_file),
        archive::field("verbose", c.verbose)
    );
}

static auto is_region_path(const std::string& path) -> bool {
    return parse_region_name(path).has_value();
}

static void usage(const char* program) {
    std::cerr << "Usage: " << program << " <file.dat|r.X.Z.mca> [key=value ...]\n"
              << "\n"
              << "Keys:\n"
              << "  read.order=big|little          read.compression=automatic|gzip|zlib|none\n"
              << "  read.detect_header=true|false  read.max_depth=N\n"
              << "  write.order=big|little         write.compression=gzip|zlib|none\n"
              << "  write.header=keep|drop         chunk_scheme=gzip|zlib|none\n"
              << "  region.skip_corrupt=true|false region.threads=N\n"
              << "  indent=STR  output=PATH  log_file=PATH  verbose=true|false\n";
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    auto path = std::string(argv[1]);
    auto config = inspect_config_t{};
    auto log = log_t{};

    try {
        for (int i = 2; i < argc; ++i) {
            auto arg = std::string(argv[i]);
            auto eq = arg.find('=');
            if (eq == std::string::npos) {
                throw std::runtime_error("expected key=value, got '" + arg + "'");
            }
            archive::set(config, arg.substr(0, eq), arg.substr(eq + 1));
        }

        if (!config.log_file.empty()) {
            log.open(config.log_file);
        } else {
            log.attach(std::cerr);
        }

        if (is_region_path(path)) {
            auto region = load_region_file(path, config.region, &log);
            log("loaded " + std::to_string(region.size()) + " chunks from " + path);
            std::cout << pretty(region, config.indent);

            for (const auto& failure : region.failures) {
                auto coord = chunk_coord(failure.index);
                std::cerr << "chunk (" << coord.x << ", " << coord.z << ") unreadable: "
                          << failure.message << "\n";
            }
            if (!config.output.empty()) {
                write_region_file(config.output, region, config.chunk_scheme);
                log("wrote " + config.output);
            }
        } else {
            auto doc = document_t::load_file(path, config.read, &log);
            std::cout << pretty(doc, config.indent);

            if (!config.output.empty()) {
                doc.save_file(config.output, config.write);
                log("wrote " + config.output);
            }
        }

        if (config.verbose) {
            std::cerr << "\nEffective configuration:\n"
                      << pretty(tag_t(std::string("config"), value_t(archive::to_compound(config))));
        }
    } catch (const nbt_error& e) {
        std::cerr << "Error (" << to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
