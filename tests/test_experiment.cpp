// Tests for sim::run_degrees, sim::coverage_series and experiment::run_experiment.

#include <doctest/doctest.h>

#include <cmath>
#include <vector>

#include "core/errors.hpp"
#include "experiment/experiment.hpp"
#include "sim/metrics.hpp"
#include "sim/sim.hpp"
#include "test_helpers.hpp"

using doctest::Approx;

TEST_CASE("coverage_series: star graph from the hub") {
    const auto g = testutil::star_graph();
    const auto r = sim::compute_layers(g, 0, 7);
    const auto m = sim::coverage_series(r, g.num_nodes());

    REQUIRE(m.size() == 4);
    CHECK(m[0].depth == 0);
    CHECK(m[0].people_reached == 1);
    CHECK(m[0].fraction_of_graph == Approx(0.2));
    CHECK(m[1].people_reached == 4);
    CHECK(m[1].fraction_of_graph == Approx(0.8));
    CHECK(m[2].people_reached == 5);
    CHECK(m[2].fraction_of_graph == Approx(1.0));
    // The step that found nothing new.
    CHECK(m[3].depth == 3);
    CHECK(m[3].people_reached == 5);
    CHECK(m[3].fraction_of_graph == Approx(1.0));
}

TEST_CASE("coverage_series: cutoff run emits depths 0..max_depth") {
    const auto g = graphs::make_graph({{0, 1}, {1, 2}, {2, 3}, {3, 4}});
    const auto r = sim::compute_layers(g, 0, 2);
    const auto m = sim::coverage_series(r, g.num_nodes());
    REQUIRE(m.size() == 3);
    CHECK(m.back().depth == 2);
    CHECK(m.back().people_reached == 3);
    CHECK(m.back().fraction_of_graph == Approx(0.6));
}

TEST_CASE("coverage_series: never decreases and stays in [0,1]") {
    for (std::uint64_t seed = 1; seed <= 10; ++seed) {
        const auto g = testutil::random_graph(60, 0.03, seed);
        const auto r = sim::compute_layers(g, 0, 7);
        const auto m = sim::coverage_series(r, g.num_nodes());
        for (std::size_t i = 0; i < m.size(); ++i) {
            CHECK(m[i].depth == i);
            CHECK(m[i].fraction_of_graph >= 0.0);
            CHECK(m[i].fraction_of_graph <= 1.0);
            if (i > 0) CHECK(m[i].people_reached >= m[i - 1].people_reached);
        }
    }
}

TEST_CASE("run_degrees: fixed origin on the star graph") {
    const auto g = testutil::star_graph();
    sim::RunConfig cfg;
    cfg.origin = 0;
    cfg.max_nodes_in_view = 3;
    SplitMix64 rng(1);
    const auto run = sim::run_degrees(g, cfg, rng);

    CHECK_FALSE(run.empty_graph());
    CHECK(run.origin == 0);
    CHECK(run.metrics.size() == 4);
    CHECK(run.selected == std::vector<core::node_id_t>{0, 1, 2});
    CHECK(run.subgraph.num_edges() == 2);
    CHECK(run.index.num_layers() == 2);
}

TEST_CASE("run_degrees: error checks") {
    const auto g = testutil::star_graph();
    SplitMix64 rng(1);
    sim::RunConfig cfg;

    SUBCASE("cap is checked before the origin") {
        cfg.origin = 77;
        cfg.max_nodes_in_view = 0;
        CHECK_THROWS_AS(sim::run_degrees(g, cfg, rng), core::InvalidCap);
    }
    SUBCASE("requested origin is not silently replaced") {
        cfg.origin = 77;
        CHECK_THROWS_AS(sim::run_degrees(g, cfg, rng), core::InvalidOrigin);
    }
    SUBCASE("empty graph yields an empty result") {
        const graphs::SocialGraph empty;
        const auto run = sim::run_degrees(empty, cfg, rng);
        CHECK(run.empty_graph());
        CHECK(run.metrics.empty());
        CHECK(run.index.empty());
    }
}

TEST_CASE("pick_origin: uniform draw lands on graph nodes") {
    const auto g = graphs::make_graph({{10, 20}, {30, 40}});
    SplitMix64 rng(5);
    bool hit[4] = {false, false, false, false};
    for (int i = 0; i < 200; ++i) {
        const auto o = sim::pick_origin(g, std::nullopt, rng);
        REQUIRE(o.has_value());
        REQUIRE(g.contains(*o));
        hit[*o / 10 - 1] = true;
    }
    CHECK((hit[0] && hit[1] && hit[2] && hit[3]));
    CHECK(sim::pick_origin(g, core::node_id_t{3}, rng) == core::node_id_t{3});
    CHECK_FALSE(sim::pick_origin(graphs::SocialGraph{}, std::nullopt, rng).has_value());
}

TEST_CASE("summarize: mean and sample sd with carry-forward") {
    auto run_with = [](std::vector<double> fr) {
        experiment::RunSummary r;
        for (std::size_t d = 0; d < fr.size(); ++d)
            r.metrics.push_back({static_cast<core::depth_t>(d), 0, fr[d]});
        return r;
    };
    std::vector<experiment::RunSummary> runs{run_with({0.2, 0.6}), run_with({0.4, 0.8, 1.0})};
    runs.push_back(experiment::RunSummary{}); // empty-graph run: ignored

    const auto s = experiment::summarize(runs);
    REQUIRE(s.size() == 3);
    CHECK(s[0].runs == 2);
    CHECK(s[0].mean_fraction == Approx(0.3));
    CHECK(s[0].sd_fraction == Approx(std::sqrt(0.02)));
    CHECK(s[1].mean_fraction == Approx(0.7));
    CHECK(s[2].mean_fraction == Approx(0.8));
    CHECK(s[2].sd_fraction == Approx(std::sqrt(0.08)));
}

TEST_CASE("summarize: single run has zero spread, no runs give nothing") {
    experiment::RunSummary r;
    r.metrics.push_back({0, 1, 0.5});
    const auto s = experiment::summarize({r});
    REQUIRE(s.size() == 1);
    CHECK(s[0].sd_fraction == 0.0);
    CHECK(experiment::summarize({}).empty());
}

TEST_CASE("run_experiment: fixed origin repeats the same run") {
    const auto g = testutil::star_graph();
    experiment::ExperimentConfig cfg;
    cfg.iterations = 3;
    cfg.run.origin = 0;
    cfg.keep_first_run = true;

    std::size_t calls = 0, last_total = 0;
    const auto res = experiment::run_experiment(g, cfg, [&](std::size_t, std::size_t total) {
        ++calls; last_total = total;
    });
    CHECK(calls == 3);
    CHECK(last_total == 3);
    REQUIRE(res.runs.size() == 3);
    for (const auto& r : res.runs) {
        CHECK(r.origin == 0);
        CHECK(r.exhausted);
        CHECK(r.stop_depth == 3);
        CHECK(r.reached == 5);
    }
    REQUIRE(res.summary.size() == 4);
    CHECK(res.summary[1].mean_fraction == Approx(0.8));
    CHECK(res.summary[1].sd_fraction == Approx(0.0));
    REQUIRE(res.first_run.has_value());
    CHECK(res.first_run->subgraph.num_nodes() == 5);
}

TEST_CASE("run_experiment: results do not depend on the thread count") {
    const auto g = testutil::random_graph(80, 0.04, 3);
    experiment::ExperimentConfig cfg;
    cfg.iterations = 12;
    cfg.seed = 1234;

    cfg.threads = 1;
    const auto a = experiment::run_experiment(g, cfg);
    cfg.threads = 4;
    const auto b = experiment::run_experiment(g, cfg);

    REQUIRE(a.runs.size() == b.runs.size());
    for (std::size_t i = 0; i < a.runs.size(); ++i) {
        CAPTURE(i);
        CHECK(a.runs[i].origin == b.runs[i].origin);
        CHECK(a.runs[i].reached == b.runs[i].reached);
        REQUIRE(a.runs[i].metrics.size() == b.runs[i].metrics.size());
        for (std::size_t d = 0; d < a.runs[i].metrics.size(); ++d)
            CHECK(a.runs[i].metrics[d].people_reached == b.runs[i].metrics[d].people_reached);
    }
    REQUIRE(a.summary.size() == b.summary.size());
    for (std::size_t d = 0; d < a.summary.size(); ++d)
        CHECK(a.summary[d].mean_fraction == Approx(b.summary[d].mean_fraction));
}

TEST_CASE("run_experiment: core errors reach the caller") {
    const auto g = testutil::star_graph();
    experiment::ExperimentConfig cfg;
    cfg.iterations = 2;

    SUBCASE("invalid origin") {
        cfg.run.origin = 42;
        CHECK_THROWS_AS(experiment::run_experiment(g, cfg), core::InvalidOrigin);
    }
    SUBCASE("invalid cap") {
        cfg.run.max_nodes_in_view = -3;
        CHECK_THROWS_AS(experiment::run_experiment(g, cfg), core::InvalidCap);
    }
}

TEST_CASE("run_experiment: empty graph") {
    const graphs::SocialGraph g;
    experiment::ExperimentConfig cfg;
    cfg.iterations = 2;
    const auto res = experiment::run_experiment(g, cfg);
    REQUIRE(res.runs.size() == 2);
    CHECK(res.runs[0].empty_graph);
    CHECK(res.summary.empty());
}
