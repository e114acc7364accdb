// social_graph.cpp - CSR construction for SocialGraph

#include "graphs/social_graph.hpp"

#include <algorithm>

namespace graphs {

bool SocialGraph::has_edge(node_id_t u, node_id_t v) const noexcept {
    if (!contains(u) || !contains(v)) return false;
    const auto nb = neighbors(u);
    return std::binary_search(nb.begin(), nb.end(), v);
}

void GraphBuilder::grow_(node_id_t v) {
    const std::size_t need = static_cast<std::size_t>(v) + 1;
    if (need <= present_.size()) return;
    // Amortized doubling; words beyond the old size start cleared.
    std::size_t cap = std::max<std::size_t>(present_.size() * 2, 64);
    while (cap < need) cap *= 2;
    BitsetVector grown(cap);
    std::copy(present_.words.begin(), present_.words.end(), grown.words.begin());
    present_ = std::move(grown);
}

void GraphBuilder::add_node(node_id_t v) {
    grow_(v);
    present_.set(v);
}

void GraphBuilder::add_edge(node_id_t u, node_id_t v) {
    add_node(u);
    add_node(v);
    if (u == v) return; // self-loop: node only
    pairs_.emplace_back(u, v);
    pairs_.emplace_back(v, u);
}

SocialGraph GraphBuilder::build() && {
    SocialGraph g;

    // Trim the id space to one past the largest present id.
    std::size_t bound = 0;
    present_.for_each_set([&](std::size_t i) { bound = i + 1; });

    g.present_.resize(bound);
    g.nodes_.reserve(present_.count());
    present_.for_each_set([&](std::size_t i) {
        g.present_.set(i);
        g.nodes_.push_back(static_cast<node_id_t>(i));
    });

    std::sort(pairs_.begin(), pairs_.end());
    pairs_.erase(std::unique(pairs_.begin(), pairs_.end()), pairs_.end());

    g.offsets_.assign(bound + 1, 0);
    for (const auto& [a, b] : pairs_) ++g.offsets_[static_cast<std::size_t>(a) + 1];
    for (std::size_t i = 0; i < bound; ++i) g.offsets_[i + 1] += g.offsets_[i];

    // pairs_ is sorted by (a, b), so each row comes out sorted.
    g.adj_.reserve(pairs_.size());
    for (const auto& [a, b] : pairs_) g.adj_.push_back(b);

    pairs_.clear();
    pairs_.shrink_to_fit();
    present_ = BitsetVector{};
    return g;
}

SocialGraph make_graph(std::initializer_list<std::pair<node_id_t, node_id_t>> edges) {
    GraphBuilder b;
    b.reserve_edges(edges.size());
    for (const auto& [u, v] : edges) b.add_edge(u, v);
    return std::move(b).build();
}

} // namespace graphs
