// io/writers.hpp - CSV metrics and Graphviz frame export
#pragma once

#include <filesystem>
#include <ostream>
#include <stdexcept>
#include <vector>

#include "experiment/experiment.hpp"
#include "sim/layer_index.hpp"
#include "sim/sim.hpp"

namespace io {

class WriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Node colors of a frame.
inline constexpr const char* kFrontierColor   = "#ff8f00"; // distance == t
inline constexpr const char* kDiscoveredColor = "#2166f3"; // distance <  t
inline constexpr const char* kHiddenColor     = "#d0d0d0"; // not yet discovered

// run,origin,depth,people_reached,fraction_of_graph
void write_metrics_csv(std::ostream& os, const std::vector<experiment::RunSummary>& runs);
void write_metrics_csv(const std::filesystem::path& path, const std::vector<experiment::RunSummary>& runs);

// depth,runs,mean_fraction,sd_fraction,mean_percent
void write_summary_csv(std::ostream& os, const std::vector<experiment::DepthSummary>& summary);
void write_summary_csv(const std::filesystem::path& path, const std::vector<experiment::DepthSummary>& summary);

// One undirected DOT graph of the bounded subgraph at depth t.
void write_frame_dot(std::ostream& os, const sim::RunResult& run, core::depth_t t);

// frame_<t>.dot for t = 0..stop depth; creates dir. Returns files written.
std::size_t write_frames_dot(const std::filesystem::path& dir, const sim::RunResult& run);

} // namespace io
