// io/edge_list.hpp - SNAP-style undirected edge-list loader
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>

#include "core/config.hpp"
#include "graphs/social_graph.hpp"

namespace io {

class LoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Largest accepted node id. Graph storage is indexed by id, so memory grows
// with the largest id seen rather than with the node count.
inline constexpr core::node_id_t kMaxNodeId = (core::node_id_t{1} << 26) - 1;

// One edge per line: two whitespace-separated non-negative integer ids.
// Blank lines and lines starting with '#' or '%' are skipped. Duplicate
// edges are idempotent; a self-loop only registers its node.
// Throws LoadError on a malformed line or an id above kMaxNodeId (message
// names the line number).
graphs::SocialGraph parse_edge_list(std::istream& in, const std::string& source_name = "<stream>");

// Throws LoadError if the file cannot be opened or is malformed.
graphs::SocialGraph load_edge_list(const std::filesystem::path& path);

} // namespace io
