// layer_index.hpp - O(1) per-depth frame projections over the bounded subgraph
#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "core/config.hpp"
#include "sim/reachability.hpp"
#include "sim/sampler.hpp"

namespace sim {

// Everything a renderer needs to draw depth t.
struct FrameState {
    depth_t depth{0};
    std::span<const node_id_t> discovered; // distance <= depth
    std::span<const node_id_t> frontier;   // distance == depth
    std::span<const Edge> visible_edges;   // both endpoints discovered
};

/**
 * @brief Per-depth discovered/frontier/visible-edge views, built once per run.
 *
 * Nodes of the subgraph are laid out once in depth order, and the end offset
 * of every depth is recorded while accumulating; discovered(t) is then the
 * prefix up to that offset and frontier(t) the slice of depth t. Edges are
 * bucketed by the depth at which their later endpoint appears, so
 * visible_edges(t) is a prefix too. All queries are O(1) views and may be
 * asked in any order.
 *
 * Node sets cover the bounded subgraph only. The sampler keeps nearer nodes
 * first, so these layers are a depth prefix of the run's full layers.
 */
class LayerIndex {
public:
    LayerIndex() = default;
    LayerIndex(const Reach& reach, const Subgraph& sub);

    [[nodiscard]] std::span<const node_id_t> discovered(depth_t t) const noexcept;
    [[nodiscard]] std::span<const node_id_t> frontier(depth_t t) const noexcept;
    [[nodiscard]] std::span<const Edge> visible_edges(depth_t t) const noexcept;
    [[nodiscard]] FrameState frame(depth_t t) const noexcept;

    // Number of non-empty depths in view.
    [[nodiscard]] std::size_t num_layers() const noexcept { return layer_end_.size(); }
    [[nodiscard]] bool empty() const noexcept { return layer_end_.empty(); }

    // Last depth with a non-empty frontier; 0 when empty().
    [[nodiscard]] depth_t last_depth() const noexcept {
        return layer_end_.empty() ? 0 : static_cast<depth_t>(layer_end_.size() - 1);
    }

    // t is the final depth at which anything new appears; drivers stop here.
    [[nodiscard]] bool is_last(depth_t t) const noexcept {
        return !layer_end_.empty() && t == last_depth();
    }

private:
    [[nodiscard]] std::size_t clamp_(depth_t t) const noexcept {
        return t < layer_end_.size() ? static_cast<std::size_t>(t) : layer_end_.size() - 1;
    }

    std::vector<node_id_t> order_;        // subgraph nodes grouped by depth
    std::vector<std::size_t> layer_end_;  // layer_end_[t] = end of depth t in order_
    std::vector<Edge> edges_;             // grouped by visibility depth
    std::vector<std::size_t> edge_end_;   // edge_end_[t] = edges visible at depth t
};

} // namespace sim
