#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "graphs/social_graph.hpp"
#include "sim/metrics.hpp"
#include "sim/sim.hpp"

namespace experiment {

struct ExperimentConfig {
    std::size_t iterations{5};   // 0 -> 1
    sim::RunConfig run{};
    std::uint64_t seed{42};      // master seed; per-run seeds derive from it
    int threads{0};              // 0 -> tbb default
    bool keep_first_run{false};  // retain run 0 in full (subgraph + frame index)
};

// What survives of a run once its subgraph and index are dropped.
struct RunSummary {
    std::size_t run{0};
    core::node_id_t origin{0};
    bool empty_graph{false};
    bool exhausted{false};
    core::depth_t stop_depth{0};
    std::size_t reached{0};
    std::size_t view_nodes{0};
    std::size_t view_edges{0};
    std::vector<sim::MetricsRecord> metrics;
};

// Across-run statistics of fraction_of_graph at one depth.
struct DepthSummary {
    core::depth_t depth{0};
    std::size_t runs{0};
    double mean_fraction{0.0};
    double sd_fraction{0.0};     // sample standard deviation; 0 with fewer than 2 runs
};

struct ExperimentResult {
    std::vector<RunSummary> runs;
    std::vector<DepthSummary> summary;
    std::optional<sim::RunResult> first_run;
};

// Called from worker threads (serialized) after each finished run.
using ProgressFn = std::function<void(std::size_t done, std::size_t total)>;

/**
 * @brief Run cfg.iterations independent origins over one shared graph.
 * @details Seeds are drawn from the master seed before any run starts, so
 * results are identical for any thread count. Core errors raised by a run
 * (InvalidOrigin, InvalidCap) propagate to the caller.
 */
ExperimentResult run_experiment(const graphs::SocialGraph& graph,
                                const ExperimentConfig& cfg,
                                const ProgressFn& progress = {});

/**
 * @brief Per-depth mean and sd of fraction_of_graph.
 * @details Extends to the deepest stop depth of any run. A run that stopped
 * earlier carries its final fraction forward (its coverage no longer
 * changes). Runs on an empty graph are ignored.
 */
std::vector<DepthSummary> summarize(const std::vector<RunSummary>& runs);

} // namespace experiment
