// edge_list.cpp - edge-list parsing with from_chars (no locale, no allocations per token)

#include "io/edge_list.hpp"

#include <charconv>
#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <string_view>

namespace io {

namespace {

inline bool is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f'; }

inline void skip_ws(std::string_view& s) {
    std::size_t i = 0;
    while (i < s.size() && is_space(s[i])) ++i;
    s.remove_prefix(i);
}

// Next token as a node id; nullopt if missing, not a number, or out of range.
std::optional<core::node_id_t> take_id(std::string_view& s) {
    skip_ws(s);
    std::uint64_t v = 0;
    const char* b = s.data();
    const char* e = b + s.size();
    auto res = std::from_chars(b, e, v);
    if (res.ec != std::errc{} || res.ptr == b) return std::nullopt;
    if (res.ptr != e && !is_space(*res.ptr)) return std::nullopt;
    if (v > std::numeric_limits<core::node_id_t>::max()) return std::nullopt;
    s.remove_prefix(static_cast<std::size_t>(res.ptr - b));
    return static_cast<core::node_id_t>(v);
}

[[noreturn]] void fail(const std::string& source, std::size_t line_no, std::string_view line) {
    throw LoadError(source + ":" + std::to_string(line_no) +
                    ": expected two non-negative integer node ids, got '" + std::string(line) + "'");
}

[[noreturn]] void fail_id(const std::string& source, std::size_t line_no, core::node_id_t id) {
    throw LoadError(source + ":" + std::to_string(line_no) + ": node id " + std::to_string(id) +
                    " exceeds the supported maximum " + std::to_string(kMaxNodeId));
}

} // namespace

graphs::SocialGraph parse_edge_list(std::istream& in, const std::string& source_name) {
    graphs::GraphBuilder builder;
    std::string line;
    std::size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        std::string_view rest(line);
        skip_ws(rest);
        if (rest.empty() || rest.front() == '#' || rest.front() == '%') continue;

        const auto u = take_id(rest);
        const auto v = u ? take_id(rest) : std::nullopt;
        if (!u || !v) fail(source_name, line_no, line);
        if (*u > kMaxNodeId) fail_id(source_name, line_no, *u);
        if (*v > kMaxNodeId) fail_id(source_name, line_no, *v);
        // Extra columns (e.g. weights or timestamps) are ignored.
        builder.add_edge(*u, *v);
    }
    if (in.bad()) throw LoadError(source_name + ": read error");
    return std::move(builder).build();
}

graphs::SocialGraph load_edge_list(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw LoadError("cannot open edge list: " + path.string());
    return parse_edge_list(in, path.string());
}

} // namespace io
