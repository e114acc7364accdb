#pragma once
/*
metrics.hpp - per-depth coverage records of one run

One record per depth from 0 to the run's stop depth:
    depth              hops from the origin
    people_reached     nodes at distance <= depth (whole graph, not the view)
    fraction_of_graph  people_reached / |V|, in [0,1]

When the frontier runs dry at depth s the run still emits the record for s,
which repeats the previous count: the step that found nothing new.
*/

#include <cstddef>
#include <vector>

#include "core/config.hpp"
#include "sim/reachability.hpp"

namespace sim {

struct MetricsRecord {
    depth_t depth{0};
    std::size_t people_reached{0};
    double fraction_of_graph{0.0};
};

// Empty when the run produced no layers (empty graph).
inline std::vector<MetricsRecord> coverage_series(const Reach& reach, std::size_t graph_size) {
    std::vector<MetricsRecord> out;
    if (reach.empty() || graph_size == 0) return out;

    const depth_t stop = reach.stop_depth();
    out.reserve(static_cast<std::size_t>(stop) + 1);
    std::size_t acc = 0;
    for (depth_t d = 0; d <= stop; ++d) {
        if (d < reach.layers.size()) acc += reach.layers[d].size();
        out.push_back({d, acc, static_cast<double>(acc) / static_cast<double>(graph_size)});
    }
    return out;
}

} // namespace sim
