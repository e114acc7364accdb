// cli.hpp - Command-line parsing interface (cxxopts)
#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

#include "core/config.hpp"

namespace cli {

class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct Options {
    // SNAP edge list (e.g. facebook_combined.txt)
    std::string graph_path = "facebook_combined.txt";

    // Fixed origin; nullopt => random per run
    std::optional<core::node_id_t> origin;

    // Degrees of separation to explore, and nodes kept for display
    core::depth_t max_depth = 7;
    long long max_nodes = 2000;

    // Independent runs (different origins) and their master seed
    std::size_t iterations = 5;
    std::uint64_t seed = 42;

    // 0 => TBB default
    int threads = 0;

    // Outputs (empty => not written)
    std::string metrics_out;
    std::string summary_out;
    std::string frames_dir;
    bool plot = false;
};

// Parse CLI arguments with cxxopts.
// On --help sets want_help/help_text and returns defaults. Malformed or
// out-of-range values throw UsageError. A non-zero SEED environment variable
// overrides --seed.
Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text);

} // namespace cli
