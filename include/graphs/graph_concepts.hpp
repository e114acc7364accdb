// graph_concepts.hpp - minimal graph requirements for the reachability core
#pragma once

#include <concepts>
#include <cstddef>
#include <ranges>

#include "core/config.hpp"

namespace graphs {

/*
A graph type G models GraphLike if it provides the read-only adjacency API
consumed by sim/reachability.hpp and sim/sampler.hpp:

  nodes()        range of node ids present in the graph (ascending)
  neighbors(v)   range of neighbor ids of v (no self, no duplicates)
  degree(v)      number of neighbors of v
  contains(v)    v is a node of the graph
  id_bound()     one past the largest id; sizes id-indexed arrays
  num_nodes()    |V|

The core never mutates the graph, so one instance may be shared by any
number of concurrent runs.
*/
template <class G>
concept GraphLike = requires(const G& g, core::node_id_t v) {
    { g.nodes() } -> std::ranges::input_range;
    { g.neighbors(v) } -> std::ranges::input_range;
    { g.degree(v) } -> std::convertible_to<std::size_t>;
    { g.contains(v) } -> std::convertible_to<bool>;
    { g.id_bound() } -> std::convertible_to<std::size_t>;
    { g.num_nodes() } -> std::convertible_to<std::size_t>;
};

} // namespace graphs
