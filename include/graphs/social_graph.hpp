// social_graph.hpp - immutable undirected graph over dense integer ids (CSR)
#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

#include "core/config.hpp"
#include "util/bitset_vector.hpp"

namespace graphs {

using core::node_id_t;

/**
 * @brief Read-only undirected graph in compressed-sparse-row form.
 * @details Neighbor lists are sorted and deduplicated; a node is never its
 * own neighbor. Ids need not be contiguous: ids in [0, id_bound()) that never
 * appeared are simply not nodes. Storage is O(id_bound() + edges), so ids
 * should be dense; io::parse_edge_list caps them at io::kMaxNodeId. Built once by GraphBuilder and then shared
 * by const reference.
 */
class SocialGraph {
public:
    SocialGraph() = default;

    [[nodiscard]] std::size_t num_nodes() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t num_edges() const noexcept { return adj_.size() / 2; }
    [[nodiscard]] std::size_t id_bound() const noexcept { return present_.size(); }
    [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

    // Node ids, ascending.
    [[nodiscard]] std::span<const node_id_t> nodes() const noexcept { return nodes_; }

    [[nodiscard]] bool contains(node_id_t v) const noexcept {
        return static_cast<std::size_t>(v) < present_.size() && present_.get(v);
    }

    // Precondition: contains(v).
    [[nodiscard]] std::span<const node_id_t> neighbors(node_id_t v) const noexcept {
        return {adj_.data() + offsets_[v], adj_.data() + offsets_[v + 1]};
    }

    [[nodiscard]] std::size_t degree(node_id_t v) const noexcept {
        return static_cast<std::size_t>(offsets_[v + 1] - offsets_[v]);
    }

    // True iff {u, v} is an edge. O(log degree(u)).
    [[nodiscard]] bool has_edge(node_id_t u, node_id_t v) const noexcept;

private:
    friend class GraphBuilder;

    BitsetVector present_;
    std::vector<node_id_t> nodes_;
    std::vector<std::size_t> offsets_{0}; // id_bound() + 1 entries
    std::vector<node_id_t> adj_;
};

/**
 * @brief Accumulates an undirected edge list and freezes it into a SocialGraph.
 * @details Duplicate edges collapse; a self-loop only registers its node.
 */
class GraphBuilder {
public:
    void add_node(node_id_t v);
    void add_edge(node_id_t u, node_id_t v);
    void reserve_edges(std::size_t n) { pairs_.reserve(2 * n); }

    [[nodiscard]] SocialGraph build() &&;

private:
    void grow_(node_id_t v);

    BitsetVector present_;
    std::vector<std::pair<node_id_t, node_id_t>> pairs_; // both directions
};

// Convenience for tests and synthetic inputs.
SocialGraph make_graph(std::initializer_list<std::pair<node_id_t, node_id_t>> edges);

} // namespace graphs
