// config.hpp
#pragma once
#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>

// Compile-time configuration for core facilities.
//
// Node ids are dense non-negative integers (SNAP edge lists use 0..N-1).
// Widen CORE_NODE_ID_T for graphs with more than 4G ids.

#ifndef CORE_NODE_ID_T
#define CORE_NODE_ID_T std::uint32_t
#endif

#ifndef CORE_DEPTH_T
#define CORE_DEPTH_T std::uint32_t
#endif

// Global hardening switch for optional runtime assertions in debug/testing code.
// Set via compile flag: -DCORE_HARDENED=1
#ifndef CORE_HARDENED
#define CORE_HARDENED 0
#endif

#if CORE_HARDENED
#include <stdexcept>
#define CORE_ASSERT_H(cond, msg) do { if(!(cond)) throw std::logic_error(msg); } while(0)
#else
#define CORE_ASSERT_H(cond, msg) do { } while(0)
#endif

namespace core {

using node_id_t = CORE_NODE_ID_T;
using depth_t   = CORE_DEPTH_T;

// Sentinel for "not reached within the cutoff" in id-indexed distance arrays.
inline constexpr depth_t kUnreached = std::numeric_limits<depth_t>::max();

// Undirected edge, stored with u < v.
struct Edge {
    node_id_t u;
    node_id_t v;
    friend auto operator<=>(const Edge&, const Edge&) = default;
};

} // namespace core
