// Tests for sim::compute_layers / sim::Reach.

#include <doctest/doctest.h>

#include <algorithm>
#include <vector>

#include "core/errors.hpp"
#include "sim/reachability.hpp"
#include "test_helpers.hpp"

using core::node_id_t;
using NodeVec = std::vector<node_id_t>;

TEST_CASE("compute_layers: star graph from the hub") {
    const auto g = testutil::star_graph();
    const auto r = sim::compute_layers(g, 0, 7);

    CHECK(r.status == sim::ReachStatus::ok);
    REQUIRE(r.layers.size() == 3);
    CHECK(r.layers[0] == NodeVec{0});
    CHECK(r.layers[1] == NodeVec{1, 2, 3});
    CHECK(r.layers[2] == NodeVec{4});
    CHECK(r.exhausted);
    CHECK(r.reached() == 5);
    CHECK(r.last_depth() == 2);
    CHECK(r.stop_depth() == 3);

    CHECK(r.distance(0) == 0);
    CHECK(r.distance(3) == 1);
    CHECK(r.distance(4) == 2);
    CHECK(r.reached_within(0) == 1);
    CHECK(r.reached_within(1) == 4);
    CHECK(r.reached_within(5) == 5);
}

TEST_CASE("compute_layers: depth cutoff leaves the run unexhausted") {
    const auto g = graphs::make_graph({{0, 1}, {1, 2}, {2, 3}, {3, 4}});
    const auto r = sim::compute_layers(g, 0, 2);
    REQUIRE(r.layers.size() == 3);
    CHECK_FALSE(r.exhausted);
    CHECK(r.stop_depth() == 2);
    CHECK(r.reached() == 3);
    CHECK_FALSE(r.is_reached(3));
    CHECK_FALSE(r.distance(4).has_value());
}

TEST_CASE("compute_layers: component fully covered exactly at the cutoff") {
    const auto g = graphs::make_graph({{0, 1}, {1, 2}});
    const auto r = sim::compute_layers(g, 0, 2);
    CHECK(r.layers.size() == 3);
    CHECK_FALSE(r.exhausted);
    CHECK(r.stop_depth() == 2);
}

TEST_CASE("compute_layers: other components are never reached") {
    const auto g = graphs::make_graph({{0, 1}, {2, 3}, {3, 4}});
    const auto r = sim::compute_layers(g, 0, 7);
    REQUIRE(r.layers.size() == 2);
    CHECK(r.exhausted);
    CHECK(r.stop_depth() == 2);
    for (node_id_t v : {2u, 3u, 4u}) CHECK_FALSE(r.is_reached(v));
}

TEST_CASE("compute_layers: isolated origin") {
    const auto g = graphs::make_graph({{0, 1}, {5, 5}});
    const auto r = sim::compute_layers(g, 5, 7);
    REQUIRE(r.layers.size() == 1);
    CHECK(r.layers[0] == NodeVec{5});
    CHECK(r.exhausted);
    CHECK(r.stop_depth() == 1);
}

TEST_CASE("compute_layers: origin outside the graph throws InvalidOrigin") {
    const auto g = graphs::make_graph({{10, 20}});
    CHECK_THROWS_AS(sim::compute_layers(g, 15, 3), core::InvalidOrigin);
    CHECK_THROWS_AS(sim::compute_layers(g, 21, 3), core::InvalidOrigin);
    try {
        (void)sim::compute_layers(g, 99, 3);
        FAIL("expected InvalidOrigin");
    } catch (const core::InvalidOrigin& e) {
        CHECK(e.id() == 99);
    }
}

TEST_CASE("compute_layers: empty graph reports a status, not an error") {
    const graphs::SocialGraph g;
    const auto r = sim::compute_layers(g, 0, 7);
    CHECK(r.status == sim::ReachStatus::empty_graph);
    CHECK(r.empty());
    CHECK(r.reached() == 0);
    CHECK(r.stop_depth() == 0);
}

TEST_CASE("compute_layers: layer index equals shortest-path length (Floyd-Warshall)") {
    for (std::uint64_t seed = 1; seed <= 25; ++seed) {
        const auto g = testutil::random_graph(35, 0.07, seed);
        const auto d = testutil::all_pairs_hops(g);
        for (core::depth_t cutoff : {1u, 3u, 7u}) {
            const node_id_t origin = static_cast<node_id_t>(seed % 35);
            const auto r = sim::compute_layers(g, origin, cutoff);
            CAPTURE(seed); CAPTURE(cutoff);

            std::size_t expect_reached = 0;
            for (node_id_t v : g.nodes()) {
                const auto hops = d[origin][v];
                if (hops != testutil::kInf && hops <= cutoff) {
                    ++expect_reached;
                    REQUIRE(r.is_reached(v));
                    CHECK(*r.distance(v) == hops);
                } else {
                    CHECK_FALSE(r.is_reached(v));
                }
            }
            CHECK(r.reached() == expect_reached);

            // Partition: every reached node sits in exactly one layer, each sorted and non-empty.
            std::vector<node_id_t> all;
            for (std::size_t k = 0; k < r.layers.size(); ++k) {
                CHECK_FALSE(r.layers[k].empty());
                CHECK(std::is_sorted(r.layers[k].begin(), r.layers[k].end()));
                for (node_id_t v : r.layers[k]) CHECK(*r.distance(v) == k);
                all.insert(all.end(), r.layers[k].begin(), r.layers[k].end());
            }
            std::sort(all.begin(), all.end());
            CHECK(std::adjacent_find(all.begin(), all.end()) == all.end());
            CHECK(all.size() == expect_reached);
            CHECK(r.layers.size() <= static_cast<std::size_t>(cutoff) + 1);
        }
    }
}

TEST_CASE("compute_layers: repeated calls give identical layers") {
    const auto g = testutil::random_graph(50, 0.05, 7);
    const auto a = sim::compute_layers(g, 3, 7);
    const auto b = sim::compute_layers(g, 3, 7);
    CHECK(a.layers == b.layers);
    CHECK(a.exhausted == b.exhausted);
}

TEST_CASE("Reach::for_each_reached visits in (distance, id) order") {
    const auto g = testutil::star_graph();
    const auto r = sim::compute_layers(g, 4, 7);
    std::vector<std::pair<node_id_t, core::depth_t>> seen;
    r.for_each_reached([&](node_id_t v, core::depth_t d) { seen.emplace_back(v, d); });
    const std::vector<std::pair<node_id_t, core::depth_t>> expect{{4, 0}, {1, 1}, {0, 2}, {2, 3}, {3, 3}};
    CHECK(seen == expect);
}
