// experiment.cpp - parallel multi-origin runs (TBB) and per-depth aggregation

#include "experiment/experiment.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <memory>
#include <mutex>

#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

#include "rng/splitmix64.hpp"

namespace experiment {

namespace {

// Deterministic per-run seeds (no RNG races)
std::vector<std::uint64_t> seed_runs(std::size_t n, std::uint64_t master_seed) {
    SplitMix64 master(master_seed);
    std::vector<std::uint64_t> seeds(n);
    for (std::size_t i = 0; i < n; ++i) seeds[i] = splitmix_hash(master.next_u64());
    return seeds;
}

RunSummary summarize_run(std::size_t idx, const sim::RunResult& r) {
    RunSummary s;
    s.run = idx;
    s.origin = r.origin;
    s.empty_graph = r.empty_graph();
    s.exhausted = r.reach.exhausted;
    s.stop_depth = r.reach.stop_depth();
    s.reached = r.reach.reached();
    s.view_nodes = r.subgraph.num_nodes();
    s.view_edges = r.subgraph.num_edges();
    s.metrics = r.metrics;
    return s;
}

} // namespace

ExperimentResult run_experiment(const graphs::SocialGraph& graph,
                                const ExperimentConfig& cfg,
                                const ProgressFn& progress) {
    const std::size_t J = (cfg.iterations == 0) ? 1 : cfg.iterations;
    const auto seeds = seed_runs(J, cfg.seed);

    std::unique_ptr<tbb::global_control> limit;
    if (cfg.threads > 0) {
        limit = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, static_cast<std::size_t>(cfg.threads));
    }

    ExperimentResult result;
    result.runs.resize(J);

    std::atomic<std::size_t> done{0};
    std::mutex progress_mu;

    tbb::parallel_for(tbb::blocked_range<std::size_t>(0, J), [&](const tbb::blocked_range<std::size_t>& r) {
        for (std::size_t j = r.begin(); j != r.end(); ++j) {
            SplitMix64 rng(seeds[j]);
            auto run = sim::run_degrees(graph, cfg.run, rng);
            result.runs[j] = summarize_run(j, run);
            if (j == 0 && cfg.keep_first_run) result.first_run = std::move(run);

            const std::size_t now = done.fetch_add(1, std::memory_order_relaxed) + 1;
            if (progress) {
                std::lock_guard<std::mutex> lk(progress_mu);
                progress(now, J);
            }
        }
    });

    result.summary = summarize(result.runs);
    return result;
}

std::vector<DepthSummary> summarize(const std::vector<RunSummary>& runs) {
    core::depth_t deepest = 0;
    std::size_t usable = 0;
    for (const auto& r : runs) {
        if (r.metrics.empty()) continue;
        ++usable;
        deepest = std::max(deepest, r.metrics.back().depth);
    }
    std::vector<DepthSummary> out;
    if (usable == 0) return out;

    out.reserve(static_cast<std::size_t>(deepest) + 1);
    for (core::depth_t d = 0; d <= deepest; ++d) {
        double sum = 0.0, sumsq = 0.0;
        std::size_t n = 0;
        for (const auto& r : runs) {
            if (r.metrics.empty()) continue;
            const std::size_t at = std::min<std::size_t>(d, r.metrics.size() - 1);
            const double f = r.metrics[at].fraction_of_graph;
            sum += f; sumsq += f * f; ++n;
        }
        DepthSummary s;
        s.depth = d;
        s.runs = n;
        s.mean_fraction = sum / static_cast<double>(n);
        if (n > 1) {
            const double var = (sumsq - sum * sum / static_cast<double>(n)) / static_cast<double>(n - 1);
            s.sd_fraction = std::sqrt(std::max(0.0, var));
        }
        out.push_back(s);
    }
    return out;
}

} // namespace experiment
