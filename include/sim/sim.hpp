// sim.hpp - one degrees-of-separation run over any GraphLike graph
#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "graphs/graph_concepts.hpp"
#include "rng/splitmix64.hpp"
#include "sim/layer_index.hpp"
#include "sim/metrics.hpp"
#include "sim/reachability.hpp"
#include "sim/sampler.hpp"

namespace sim {

struct RunConfig {
    std::optional<node_id_t> origin;  // nullopt -> drawn by pick_origin
    depth_t max_depth{7};
    long long max_nodes_in_view{2000};
};

// Everything one run produces; owned by the run and never shared.
struct RunResult {
    node_id_t origin{0};
    Reach reach;
    std::vector<MetricsRecord> metrics;
    std::vector<node_id_t> selected;
    Subgraph subgraph;
    LayerIndex index;

    [[nodiscard]] bool empty_graph() const noexcept { return reach.status == ReachStatus::empty_graph; }
};

// Origin policy: a requested id is passed through untouched (the engine
// validates it); otherwise a node is drawn uniformly with the caller's rng.
// nullopt only for an empty graph with nothing requested.
template <graphs::GraphLike G>
std::optional<node_id_t> pick_origin(const G& graph, std::optional<node_id_t> requested, SplitMix64& rng) {
    if (requested) return requested;
    const auto nodes = graph.nodes();
    const std::size_t n = graph.num_nodes();
    if (n == 0) return std::nullopt;
    const auto pick = static_cast<std::ptrdiff_t>(rng.uniform_index(n));
    return *std::ranges::next(std::ranges::begin(nodes), pick);
}

/**
 * @brief Layers, metrics, bounded subgraph and frame index for one origin.
 * @throws core::InvalidCap before any work if max_nodes_in_view < 1.
 * @throws core::InvalidOrigin if the (requested or drawn) origin is not a node.
 * An empty graph yields a result with empty_graph() set and nothing else.
 */
template <graphs::GraphLike G>
RunResult run_degrees(const G& graph, const RunConfig& cfg, SplitMix64& rng) {
    if (cfg.max_nodes_in_view < 1) throw core::InvalidCap(cfg.max_nodes_in_view);

    RunResult out;
    const auto origin = pick_origin(graph, cfg.origin, rng);
    if (!origin) {
        out.reach.status = ReachStatus::empty_graph;
        return out;
    }
    out.origin = *origin;
    out.reach = compute_layers(graph, *origin, cfg.max_depth);
    if (out.reach.empty()) return out;

    out.metrics = coverage_series(out.reach, graph.num_nodes());
    out.selected = sample_nodes(graph, out.reach, cfg.max_nodes_in_view);
    out.subgraph = induce_subgraph(graph, out.reach, out.selected);
    out.index = LayerIndex(out.reach, out.subgraph);
    return out;
}

} // namespace sim
