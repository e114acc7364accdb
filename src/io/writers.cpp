// writers.cpp - CSV and DOT output

#include "io/writers.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <string>
#include <system_error>

#include "util/bitset_vector.hpp"

namespace io {

namespace {

std::ofstream open_or_throw(const std::filesystem::path& path) {
    std::ofstream out(path);
    if (!out) throw WriteError("cannot open for writing: " + path.string());
    return out;
}

void check_stream(const std::ostream& os, const std::filesystem::path& path) {
    if (!os) throw WriteError("write failed: " + path.string());
}

} // namespace

void write_metrics_csv(std::ostream& os, const std::vector<experiment::RunSummary>& runs) {
    os << "run,origin,depth,people_reached,fraction_of_graph\n";
    os << std::setprecision(10);
    for (const auto& r : runs) {
        for (const auto& m : r.metrics) {
            os << r.run << ',' << r.origin << ',' << m.depth << ','
               << m.people_reached << ',' << m.fraction_of_graph << '\n';
        }
    }
}

void write_metrics_csv(const std::filesystem::path& path, const std::vector<experiment::RunSummary>& runs) {
    auto out = open_or_throw(path);
    write_metrics_csv(out, runs);
    out.flush();
    check_stream(out, path);
}

void write_summary_csv(std::ostream& os, const std::vector<experiment::DepthSummary>& summary) {
    os << "depth,runs,mean_fraction,sd_fraction,mean_percent\n";
    os << std::setprecision(10);
    for (const auto& s : summary) {
        os << s.depth << ',' << s.runs << ',' << s.mean_fraction << ','
           << s.sd_fraction << ',' << 100.0 * s.mean_fraction << '\n';
    }
}

void write_summary_csv(const std::filesystem::path& path, const std::vector<experiment::DepthSummary>& summary) {
    auto out = open_or_throw(path);
    write_summary_csv(out, summary);
    out.flush();
    check_stream(out, path);
}

void write_frame_dot(std::ostream& os, const sim::RunResult& run, core::depth_t t) {
    const auto frame = run.index.frame(t);
    const auto& sub = run.subgraph;

    std::size_t bound = 0;
    for (auto v : sub.nodes) bound = std::max<std::size_t>(bound, static_cast<std::size_t>(v) + 1);
    BitsetVector seen(bound), front(bound);
    for (auto v : frame.discovered) seen.set(v);
    for (auto v : frame.frontier) front.set(v);

    const double pct = sub.num_nodes() == 0
        ? 0.0 : 100.0 * static_cast<double>(frame.discovered.size()) / static_cast<double>(sub.num_nodes());

    os << "graph degree_" << t << " {\n";
    os << "  label=\"Degree " << t << " - origin " << run.origin << " - nodes shown "
       << sub.num_nodes() << " - reached " << frame.discovered.size() << " ("
       << std::fixed << std::setprecision(1) << pct << std::defaultfloat
       << "%) - frontier " << frame.frontier.size() << "\";\n";
    os << "  node [shape=circle, style=filled, fontsize=8];\n";
    os << "  edge [color=\"#00000099\", penwidth=0.5];\n";

    for (std::size_t i = 0; i < sub.nodes.size(); ++i) {
        const auto v = sub.nodes[i];
        const char* color = kHiddenColor;
        const char* size = "0.10";
        if (front.get(v))      { color = kFrontierColor;   size = "0.30"; }
        else if (seen.get(v))  { color = kDiscoveredColor; size = "0.20"; }
        os << "  " << v << " [fillcolor=\"" << color << "\", width=" << size
           << ", tooltip=\"depth " << sub.distance[i] << "\"];\n";
    }
    for (const auto& e : frame.visible_edges) os << "  " << e.u << " -- " << e.v << ";\n";
    os << "}\n";
}

std::size_t write_frames_dot(const std::filesystem::path& dir, const sim::RunResult& run) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw WriteError("cannot create directory " + dir.string() + ": " + ec.message());
    if (run.index.empty()) return 0;

    const core::depth_t last = run.reach.stop_depth();
    std::size_t written = 0;
    for (core::depth_t t = 0; t <= last; ++t) {
        const auto path = dir / ("frame_" + std::to_string(t) + ".dot");
        auto out = open_or_throw(path);
        write_frame_dot(out, run, t);
        out.flush();
        check_stream(out, path);
        ++written;
    }
    return written;
}

} // namespace io
