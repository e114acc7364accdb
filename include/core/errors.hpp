// errors.hpp - error taxonomy raised by the reachability core
#pragma once

#include <stdexcept>
#include <string>

#include "core/config.hpp"

namespace core {

// Base for every error the core raises synchronously at the offending call.
class DegreesError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Requested origin is not a node of the graph. Never auto-corrected here;
// a fallback policy belongs to the caller.
class InvalidOrigin : public DegreesError {
public:
    explicit InvalidOrigin(node_id_t id)
        : DegreesError("origin " + std::to_string(id) + " is not a node of the graph"), id_(id) {}
    node_id_t id() const noexcept { return id_; }
private:
    node_id_t id_;
};

// max_nodes_in_view < 1.
class InvalidCap : public DegreesError {
public:
    explicit InvalidCap(long long cap)
        : DegreesError("view cap must be >= 1 (got " + std::to_string(cap) + ")"), cap_(cap) {}
    long long cap() const noexcept { return cap_; }
private:
    long long cap_;
};

} // namespace core
