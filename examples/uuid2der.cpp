// uuid2der - generate UUIDv7 values and write their DER encoding
//
// Usage: uuid2der [--hex] [--fields] [--count N] [--timestamp MS] [--output FILE]
//
// Default: one raw DER value on standard output.

#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <uuid7der.hpp>
#include <uuid7der/time_generator.hpp>
#include <uuid7der/uuid7der_utils.hpp>

using namespace uuid7der;

namespace {

struct Options {
    bool hex = false;
    bool fields = false;
    uint64_t count = 1;
    std::optional<uint64_t> timestamp;
    std::optional<std::string> output;
};

void print_usage(const char* program) {
    std::cerr << "Usage: " << program
              << " [--hex] [--fields] [--count N] [--timestamp MS] [--output FILE]\n";
    std::cerr << "  --hex           Write lowercase hex, one value per line\n";
    std::cerr << "  --fields        Print the decoded fields of each value to stderr\n";
    std::cerr << "  --count N       Number of values to generate (default 1)\n";
    std::cerr << "  --timestamp MS  Use MS milliseconds since the Unix epoch instead of the clock\n";
    std::cerr << "  --output FILE   Write to FILE instead of standard output\n";
}

// Returns std::nullopt on a malformed command line
std::optional<Options> parse_options(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--hex") {
            opts.hex = true;
        } else if (arg == "--fields") {
            opts.fields = true;
        } else if (arg == "--count" && i + 1 < argc) {
            auto count = utils::parse_decimal_u64(argv[++i]);
            if (!count || *count == 0) {
                return std::nullopt;
            }
            opts.count = *count;
        } else if (arg == "--timestamp" && i + 1 < argc) {
            auto ts = utils::parse_decimal_u64(argv[++i]);
            if (!ts) {
                return std::nullopt;
            }
            opts.timestamp = *ts;
        } else if (arg == "--output" && i + 1 < argc) {
            opts.output = argv[++i];
        } else {
            return std::nullopt;
        }
    }
    return opts;
}

std::string to_hex_line(const std::vector<uint8_t>& bytes) {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t b : bytes) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    ss << "\n";
    return ss.str();
}

std::optional<IoError> run(const Options& opts, utils::DerOutput& out) {
    for (uint64_t i = 0; i < opts.count; ++i) {
        auto asn1 = opts.timestamp ? new_raw_uuid_v7_asn1(*opts.timestamp)
                                   : new_raw_uuid_v7_asn1_now();
        if (auto* err = std::get_if<IoError>(&asn1)) {
            return *err;
        }
        const auto& record = std::get<RawUuidV7Asn1>(asn1);

        auto der = record.to_der_bytes();
        if (auto* err = std::get_if<IoError>(&der)) {
            return *err;
        }
        const auto& bytes = std::get<std::vector<uint8_t>>(der);

        if (opts.fields) {
            std::cerr << "UUIDv7 " << (i + 1) << ":\n";
            describe(record.raw(), std::cerr);
        }

        bool written = false;
        if (opts.hex) {
            std::string line = to_hex_line(bytes);
            written = out.write(std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(line.data()), line.size()));
        } else {
            written = out.write(bytes);
        }
        if (!written) {
            return out.error();
        }
    }
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
    auto opts = parse_options(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return 1;
    }

    // Report EPIPE as a write failure instead of dying on SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);

    std::optional<IoError> err;
    try {
        utils::DerOutput out = opts->output ? utils::DerOutput(*opts->output)
                                            : utils::DerOutput();

        err = run(*opts, out);
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (err) {
        std::cerr << "Error: " << err->error_message() << "\n";
        return 1;
    }
    return 0;
}
