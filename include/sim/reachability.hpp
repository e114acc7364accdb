// reachability.hpp - breadth-first layering by degree of separation
#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "graphs/graph_concepts.hpp"
#include "util/bitset_vector.hpp"

namespace sim {

using core::depth_t;
using core::node_id_t;

enum class ReachStatus {
    ok,
    empty_graph, // graph has zero nodes; no layers were produced
};

/**
 * @brief Shortest-path layers of one run (one origin).
 * @details layers[d] holds the nodes at exactly d hops from the origin,
 * ascending by id. Every reached node appears in exactly one layer. Trailing
 * empty layers are never emitted: when the frontier runs dry before
 * max_depth, exhausted is set and the run stops at depth layers.size().
 */
struct Reach {
    ReachStatus status{ReachStatus::ok};
    node_id_t origin{0};
    depth_t max_depth{0};
    bool exhausted{false};
    std::vector<std::vector<node_id_t>> layers;

    [[nodiscard]] bool empty() const noexcept { return layers.empty(); }

    [[nodiscard]] bool is_reached(node_id_t v) const noexcept {
        return static_cast<std::size_t>(v) < distance_.size() && distance_[v] != core::kUnreached;
    }

    // Defined only for reached nodes.
    [[nodiscard]] std::optional<depth_t> distance(node_id_t v) const noexcept {
        if (!is_reached(v)) return std::nullopt;
        return distance_[v];
    }

    // Precondition: is_reached(v).
    [[nodiscard]] depth_t distance_unchecked(node_id_t v) const noexcept { return distance_[v]; }

    [[nodiscard]] std::size_t reached() const noexcept { return reached_; }

    // Last depth with a non-empty layer.
    [[nodiscard]] depth_t last_depth() const noexcept {
        return layers.empty() ? 0 : static_cast<depth_t>(layers.size() - 1);
    }

    // Depth at which the run ends: the first empty frontier, or max_depth.
    [[nodiscard]] depth_t stop_depth() const noexcept {
        if (layers.empty()) return 0;
        return exhausted ? static_cast<depth_t>(layers.size()) : max_depth;
    }

    // People reached within depth t (cumulative layer sizes).
    [[nodiscard]] std::size_t reached_within(depth_t t) const noexcept {
        std::size_t n = 0;
        for (std::size_t d = 0; d < layers.size() && d <= t; ++d) n += layers[d].size();
        return n;
    }

    // Reached nodes in (distance, id) order.
    template <class F>
    void for_each_reached(F&& f) const {
        for (depth_t d = 0; d < layers.size(); ++d)
            for (node_id_t v : layers[d]) f(v, d);
    }

    template <graphs::GraphLike G>
    friend Reach compute_layers(const G& graph, node_id_t origin, depth_t max_depth);

private:
    std::vector<depth_t> distance_; // id-indexed; kUnreached outside the cutoff
    std::size_t reached_{0};
};

/**
 * @brief Layered BFS from origin up to max_depth hops.
 * @throws core::InvalidOrigin if origin is not a node of a non-empty graph.
 * @return Reach with status empty_graph (and no layers) when the graph has no nodes.
 *
 * Each node is assigned once, at the depth it is first discovered, so the
 * layer index is the unweighted shortest-path length. Neighbor visiting
 * order only affects order within a layer, and layers are sorted on exit.
 */
template <graphs::GraphLike G>
Reach compute_layers(const G& graph, node_id_t origin, depth_t max_depth) {
    Reach r;
    r.origin = origin;
    r.max_depth = max_depth;

    if (graph.num_nodes() == 0) {
        r.status = ReachStatus::empty_graph;
        return r;
    }
    if (!graph.contains(origin)) throw core::InvalidOrigin(origin);

    const std::size_t bound = graph.id_bound();
    r.distance_.assign(bound, core::kUnreached);
    BitsetVector discovered(bound);

    discovered.set(origin);
    r.distance_[origin] = 0;
    r.layers.push_back({origin});
    r.reached_ = 1;

    std::vector<node_id_t> next;
    for (depth_t d = 1; d <= max_depth; ++d) {
        const auto& frontier = r.layers.back();
        next.clear();
        for (node_id_t u : frontier) {
            for (node_id_t w : graph.neighbors(u)) {
                if (discovered.test_and_set(w)) {
                    r.distance_[w] = d;
                    next.push_back(w);
                }
            }
        }
        if (next.empty()) {
            r.exhausted = true; // no more growth
            break;
        }
        std::sort(next.begin(), next.end());
        r.reached_ += next.size();
        r.layers.push_back(next);
    }
    return r;
}

} // namespace sim
