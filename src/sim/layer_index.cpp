// layer_index.cpp - prefix accumulation for LayerIndex

#include "sim/layer_index.hpp"

#include <algorithm>

namespace sim {

LayerIndex::LayerIndex(const Reach& reach, const Subgraph& sub) {
    order_.reserve(sub.num_nodes());
    layer_end_.reserve(reach.layers.size());

    // Accumulate depth by depth; each depth's end offset is its discovered prefix.
    for (const auto& layer : reach.layers) {
        for (node_id_t v : layer)
            if (sub.contains(v)) order_.push_back(v);
        layer_end_.push_back(order_.size());
    }
    // Depths past the deepest sampled node hold nothing in view.
    while (!layer_end_.empty() &&
           layer_end_.back() == (layer_end_.size() > 1 ? layer_end_[layer_end_.size() - 2] : 0))
        layer_end_.pop_back();
    if (layer_end_.empty()) return;

    // Counting sort of edges by the depth their later endpoint is discovered.
    const std::size_t L = layer_end_.size();
    std::vector<std::size_t> count(L + 1, 0);
    auto edge_depth = [&](const Edge& e) {
        return static_cast<std::size_t>(std::max(sub.distance_of(e.u), sub.distance_of(e.v)));
    };
    for (const Edge& e : sub.edges) ++count[edge_depth(e) + 1];
    for (std::size_t t = 0; t < L; ++t) count[t + 1] += count[t];

    edges_.resize(sub.edges.size());
    std::vector<std::size_t> cursor(count.begin(), count.end() - 1);
    for (const Edge& e : sub.edges) edges_[cursor[edge_depth(e)]++] = e;

    edge_end_.assign(count.begin() + 1, count.end());
}

std::span<const node_id_t> LayerIndex::discovered(depth_t t) const noexcept {
    if (layer_end_.empty()) return {};
    return {order_.data(), layer_end_[clamp_(t)]};
}

std::span<const node_id_t> LayerIndex::frontier(depth_t t) const noexcept {
    if (t >= layer_end_.size()) return {};
    const std::size_t begin = (t == 0) ? 0 : layer_end_[t - 1];
    return {order_.data() + begin, layer_end_[t] - begin};
}

std::span<const Edge> LayerIndex::visible_edges(depth_t t) const noexcept {
    if (edge_end_.empty()) return {};
    return {edges_.data(), edge_end_[clamp_(t)]};
}

FrameState LayerIndex::frame(depth_t t) const noexcept {
    return FrameState{t, discovered(t), frontier(t), visible_edges(t)};
}

} // namespace sim
