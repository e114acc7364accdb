// sampler.hpp - size-capped node selection and induced subgraph
#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "graphs/graph_concepts.hpp"
#include "sim/reachability.hpp"
#include "util/bitset_vector.hpp"

namespace sim {

using core::Edge;

/**
 * @brief Induced subgraph over the nodes selected for display.
 * @details nodes keeps selection order (distance, -degree, id); distance is
 * parallel to nodes. edges holds every graph edge with both endpoints
 * selected, each once with u < v, sorted.
 */
struct Subgraph {
    std::vector<node_id_t> nodes;
    std::vector<depth_t> distance;
    std::vector<Edge> edges;

    [[nodiscard]] std::size_t num_nodes() const noexcept { return nodes.size(); }
    [[nodiscard]] std::size_t num_edges() const noexcept { return edges.size(); }

    [[nodiscard]] bool contains(node_id_t v) const noexcept {
        return static_cast<std::size_t>(v) < member_.size() && member_.get(v);
    }

    // Precondition: contains(v).
    [[nodiscard]] depth_t distance_of(node_id_t v) const noexcept { return dist_by_id_[v]; }

    template <graphs::GraphLike G>
    friend Subgraph induce_subgraph(const G& graph, const Reach& reach,
                                    const std::vector<node_id_t>& selected);

private:
    BitsetVector member_;
    std::vector<depth_t> dist_by_id_;
};

namespace detail {

struct SampleKey {
    depth_t dist;
    std::size_t degree;
    node_id_t id;
};

// Nearer first; within a depth, hubs first; id breaks the remaining ties.
inline bool sample_before(const SampleKey& a, const SampleKey& b) noexcept {
    if (a.dist != b.dist) return a.dist < b.dist;
    if (a.degree != b.degree) return a.degree > b.degree;
    return a.id < b.id;
}

} // namespace detail

/**
 * @brief Select at most cap reached nodes for display.
 * @param degree_of Callable node_id_t -> degree.
 * @throws core::InvalidCap if cap < 1.
 *
 * When everything fits, every reached node is returned. Otherwise the first
 * cap nodes under (distance asc, degree desc, id asc). The result is in that
 * order in both cases. Layers already come grouped by distance, so only the
 * layer where the cap falls needs a partial sort.
 */
template <class DegreeFn>
std::vector<node_id_t> sample_nodes(const Reach& reach, DegreeFn&& degree_of, long long cap) {
    if (cap < 1) throw core::InvalidCap(cap);

    const std::size_t limit = static_cast<std::size_t>(cap);
    const std::size_t take_total = std::min(reach.reached(), limit);

    std::vector<node_id_t> out;
    out.reserve(take_total);

    std::vector<detail::SampleKey> keys;
    for (depth_t d = 0; d < reach.layers.size() && out.size() < take_total; ++d) {
        const auto& layer = reach.layers[d];
        keys.clear();
        keys.reserve(layer.size());
        for (node_id_t v : layer)
            keys.push_back({d, static_cast<std::size_t>(degree_of(v)), v});

        const std::size_t room = take_total - out.size();
        if (keys.size() <= room) {
            std::sort(keys.begin(), keys.end(), detail::sample_before);
        } else {
            std::partial_sort(keys.begin(), keys.begin() + static_cast<std::ptrdiff_t>(room),
                              keys.end(), detail::sample_before);
            keys.resize(room);
        }
        for (const auto& k : keys) out.push_back(k.id);
    }
    return out;
}

// Degree lookup from the graph itself.
template <graphs::GraphLike G>
std::vector<node_id_t> sample_nodes(const G& graph, const Reach& reach, long long cap) {
    return sample_nodes(reach, [&graph](node_id_t v) { return graph.degree(v); }, cap);
}

/**
 * @brief Subgraph induced by selected (all of which must be reached).
 * @throws core::DegreesError if a selected node was not reached.
 * Computed once per run; frame queries never touch the full graph again.
 */
template <graphs::GraphLike G>
Subgraph induce_subgraph(const G& graph, const Reach& reach,
                         const std::vector<node_id_t>& selected) {
    Subgraph s;
    const std::size_t bound = graph.id_bound();
    s.member_.resize(bound);
    s.dist_by_id_.assign(bound, core::kUnreached);
    s.nodes.reserve(selected.size());
    s.distance.reserve(selected.size());

    for (node_id_t v : selected) {
        if (!reach.is_reached(v) || static_cast<std::size_t>(v) >= bound)
            throw core::DegreesError("induce_subgraph: node " + std::to_string(v) + " was not reached");
        if (!s.member_.test_and_set(v)) continue; // repeated id
        const depth_t d = reach.distance_unchecked(v);
        s.nodes.push_back(v);
        s.distance.push_back(d);
        s.dist_by_id_[v] = d;
    }

    for (node_id_t u : s.nodes) {
        for (node_id_t w : graph.neighbors(u)) {
            if (u < w && s.member_.get(w)) s.edges.push_back({u, w});
        }
    }
    std::sort(s.edges.begin(), s.edges.end());
    return s;
}

} // namespace sim
