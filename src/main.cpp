// Main entry: load a social graph, run several origins, report coverage by degree
#include <cstdint>
#include <cstdio>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "cli/cli.hpp"
#include "core/errors.hpp"
#include "experiment/experiment.hpp"
#include "io/edge_list.hpp"
#include "io/live_plot.hpp"
#include "io/progress.hpp"
#include "io/writers.hpp"
#include "util/timing.hpp"

namespace {

void print_summary(const experiment::ExperimentResult& res) {
    std::printf("%-6s %-8s %-14s %-10s\n", "run", "origin", "stop_depth", "reached");
    for (const auto& r : res.runs) {
        std::printf("%-6zu %-8u %-14u %-10zu%s\n", r.run, static_cast<unsigned>(r.origin),
                    static_cast<unsigned>(r.stop_depth), r.reached,
                    r.exhausted ? "  (no more growth)" : "");
    }
    std::printf("\n%-6s %-6s %-12s %-10s\n", "degree", "runs", "mean_%", "sd_%");
    for (const auto& s : res.summary) {
        std::printf("%-6u %-6zu %-12.2f %-10.2f\n", static_cast<unsigned>(s.depth), s.runs,
                    100.0 * s.mean_fraction, 100.0 * s.sd_fraction);
    }
}

void plot_coverage(const std::vector<experiment::DepthSummary>& summary) {
    GnuplotLive plot("Network coverage by degrees of separation");
    if (!plot.valid()) {
        std::fprintf(stderr, "gnuplot not available; skipping plot\n");
        return;
    }
    plot.cmd("set xlabel 'Degrees of separation (hops between people)'");
    plot.cmd("set ylabel 'Share of the network reached (%)'");
    plot.cmd("set key left top");
    plot.cmd("set ytics 10");
    plot.set_yrange(0.0, 100.0);

    std::vector<double> x, mean, lo, hi;
    for (const auto& s : summary) {
        const double m = 100.0 * s.mean_fraction, sd = 100.0 * s.sd_fraction;
        x.push_back(static_cast<double>(s.depth));
        mean.push_back(m);
        lo.push_back(m - sd < 0.0 ? 0.0 : m - sd);
        hi.push_back(m + sd > 100.0 ? 100.0 : m + sd);
    }
    if (!x.empty()) plot.set_xrange(0.0, x.back());
    plot.plot_band(x, mean, lo, hi, "mean +/- sd", "mean");
}

} // namespace

int main(int argc, char** argv) {
    bool want_help = false; std::string help_text;
    cli::Options opt;
    try {
        opt = cli::parse_args(argc, argv, want_help, help_text);
    } catch (const cli::UsageError& e) {
        std::fprintf(stderr, "%s\n\n%s", e.what(), help_text.c_str());
        return 2;
    }
    if (want_help) { std::cout << help_text; return 0; }

    try {
        std::fprintf(stderr, "Loading graph %s ...\n", opt.graph_path.c_str());
        Stopwatch sw;
        const graphs::SocialGraph graph = io::load_edge_list(opt.graph_path);
        std::fprintf(stderr, "Graph loaded: %zu nodes, %zu edges (%.2fs)\n",
                     graph.num_nodes(), graph.num_edges(), sw.lap());
        if (graph.empty()) std::fprintf(stderr, "warning: graph has no nodes\n");

        experiment::ExperimentConfig cfg;
        cfg.iterations = opt.iterations;
        cfg.run.origin = opt.origin;
        cfg.run.max_depth = opt.max_depth;
        cfg.run.max_nodes_in_view = opt.max_nodes;
        cfg.seed = opt.seed;
        cfg.threads = opt.threads;
        cfg.keep_first_run = !opt.frames_dir.empty();

        experiment::ExperimentResult res;
        {
            io::RunProgress bar(cfg.iterations);
            res = experiment::run_experiment(graph, cfg, [&](std::size_t done, std::size_t total) {
                bar.update(done, total);
            });
        }
        std::fprintf(stderr, "%zu runs in %.2fs (seed %llu)\n", res.runs.size(), sw.lap(),
                     static_cast<unsigned long long>(opt.seed));

        if (!res.runs.empty() && res.runs.front().empty_graph) {
            std::fprintf(stderr, "graph is empty: nothing to explore\n");
            return 0;
        }

        print_summary(res);

        if (!opt.metrics_out.empty()) {
            io::write_metrics_csv(opt.metrics_out, res.runs);
            std::fprintf(stderr, "metrics written to %s\n", opt.metrics_out.c_str());
        }
        if (!opt.summary_out.empty()) {
            io::write_summary_csv(opt.summary_out, res.summary);
            std::fprintf(stderr, "summary written to %s\n", opt.summary_out.c_str());
        }
        if (!opt.frames_dir.empty() && res.first_run) {
            const auto n = io::write_frames_dot(opt.frames_dir, *res.first_run);
            std::fprintf(stderr, "%zu frames (origin %u, %zu nodes shown) written to %s\n", n,
                         static_cast<unsigned>(res.first_run->origin),
                         res.first_run->subgraph.num_nodes(), opt.frames_dir.c_str());
        }
        if (opt.plot) plot_coverage(res.summary);
    } catch (const core::InvalidCap& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 2;
    } catch (const core::InvalidOrigin& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 2;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
    return 0;
}
