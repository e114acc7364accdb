// cli.cpp - Command-line parsing implementation using cxxopts

#include "cli/cli.hpp"

#include <cxxopts.hpp>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>

namespace cli {

static inline std::optional<std::uint64_t> parse_u64(std::string_view s) {
    std::uint64_t v = 0;
    const char* b = s.data();
    const char* e = b + s.size();
    auto res = std::from_chars(b, e, v);
    if (res.ec != std::errc{} || res.ptr != e) return std::nullopt;
    return v;
}

Options parse_args(int argc, char** argv, bool& want_help, std::string& help_text) {
    Options opt;
    want_help = false;

    std::string origin_s;     // parsed by hand: must fit a node id
    long long max_depth_val = 7;
    long long iterations_val = 5;

    cxxopts::Options desc("degrees", "Degrees of separation on a social graph");
    desc.add_options()
        ("h,help", "Show this help")
        ("g,graph", "Edge-list file (one 'u v' pair per line)", cxxopts::value<std::string>(opt.graph_path)->default_value("facebook_combined.txt"))
        ("o,origin", "Origin node id (default: random per run)", cxxopts::value<std::string>(origin_s))
        ("d,max-depth", "Degrees of separation to explore", cxxopts::value<long long>(max_depth_val)->default_value("7"))
        ("n,max-nodes", "Maximum nodes kept in the displayed subgraph", cxxopts::value<long long>(opt.max_nodes)->default_value("2000"))
        ("i,iterations", "Number of runs (one origin each)", cxxopts::value<long long>(iterations_val)->default_value("5"))
        ("seed", "Master seed (SEED env overrides when non-zero)", cxxopts::value<std::uint64_t>(opt.seed)->default_value("42"))
        ("threads", "Worker threads (0: TBB default)", cxxopts::value<int>(opt.threads)->default_value("0"))
        ("metrics-out", "Write per-run metrics CSV", cxxopts::value<std::string>(opt.metrics_out))
        ("summary-out", "Write per-depth summary CSV", cxxopts::value<std::string>(opt.summary_out))
        ("frames-dir", "Write DOT frames of the first run", cxxopts::value<std::string>(opt.frames_dir))
        ("plot", "Live coverage plot via gnuplot", cxxopts::value<bool>(opt.plot))
    ;
    help_text = desc.help();

    try {
        auto result = desc.parse(argc, argv);
        if (result.count("help")) { want_help = true; return opt; }
    } catch (const std::exception& e) {
        throw UsageError(e.what());
    }

    if (!origin_s.empty()) {
        const auto v = parse_u64(origin_s);
        if (!v || *v > std::numeric_limits<core::node_id_t>::max())
            throw UsageError("invalid --origin '" + origin_s + "'; expected a non-negative node id");
        opt.origin = static_cast<core::node_id_t>(*v);
    }

    if (max_depth_val < 1 || max_depth_val > std::numeric_limits<int>::max())
        throw UsageError("--max-depth must be a positive integer");
    opt.max_depth = static_cast<core::depth_t>(max_depth_val);

    if (iterations_val < 1)
        throw UsageError("--iterations must be a positive integer");
    opt.iterations = static_cast<std::size_t>(iterations_val);

    if (opt.threads < 0)
        throw UsageError("--threads must be >= 0");

    // --max-nodes is validated by the core (InvalidCap).

    // SEED env var overrides --seed when non-zero
    if (const char* es = std::getenv("SEED")) {
        if (const auto v = parse_u64(es); v && *v != 0ULL) opt.seed = *v;
    }

    return opt;
}

} // namespace cli
