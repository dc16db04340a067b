#ifndef GFAESTUS_HANDLE_HPP_INCLUDED
#define GFAESTUS_HANDLE_HPP_INCLUDED

/** \file
 * One stop shop for libhandlegraph types and the read-only graph queries the
 * viewer core needs on top of them.
 */

#include <string>
#include <vector>
#include <utility>

#include <handlegraph/util.hpp>
#include <handlegraph/types.hpp>
#include <handlegraph/handle_graph.hpp>
#include <handlegraph/path_handle_graph.hpp>
#include <handlegraph/mutable_path_mutable_handle_graph.hpp>

#include "hash_map.hpp"

namespace gfaestus {

using namespace std;

// Import the handle stuff into the gfaestus namespace.
using handle_t = handlegraph::handle_t;
using nid_t = handlegraph::nid_t;
using path_handle_t = handlegraph::path_handle_t;
using step_handle_t = handlegraph::step_handle_t;
using edge_t = handlegraph::edge_t;

using HandleGraph = handlegraph::HandleGraph;
using PathHandleGraph = handlegraph::PathHandleGraph;
using MutablePathMutableHandleGraph = handlegraph::MutablePathMutableHandleGraph;

/**
 * Define wang hashes for handles.
 */
template<>
struct wang_hash<handle_t> {
    size_t operator()(const handlegraph::handle_t& handle) const {
        return wang_hash<std::int64_t>()(handlegraph::as_integer(handle));
    }
};

template<>
struct wang_hash<path_handle_t> {
    size_t operator()(const handlegraph::path_handle_t& handle) const {
        return wang_hash<std::int64_t>()(handlegraph::as_integer(handle));
    }
};

template<>
struct wang_hash<step_handle_t> {
    size_t operator()(const handlegraph::step_handle_t& step) const {
        const int64_t* words = handlegraph::as_integers(step);
        size_t hash_val = wang_hash<std::int64_t>()(words[0]);
        hash_val ^= wang_hash<std::int64_t>()(words[1]) + 0x9e3779b9 + (hash_val << 6) + (hash_val >> 2);
        return hash_val;
    }
};

/// Node IDs are dense and 1-based, so per-node arrays are indexed by ID - 1.
inline size_t node_index(nid_t node_id) {
    return (size_t) (node_id - 1);
}

/// Inverse of node_index().
inline nid_t index_node(size_t index) {
    return (nid_t) (index + 1);
}

/// Get the length of the node, or 0 if the graph doesn't have it.
size_t node_len(const HandleGraph& graph, nid_t node_id);

/// Get the sequence of the node in forward orientation, or an empty string if
/// the graph doesn't have it.
string node_sequence(const HandleGraph& graph, nid_t node_id);

/// Get the number of edges on the left (go_left = true) or right side of the
/// forward orientation of the node. Returns 0 for a missing node.
size_t node_degree(const HandleGraph& graph, nid_t node_id, bool go_left);

/// Count the path steps visiting the node, in either orientation.
size_t node_coverage(const PathHandleGraph& graph, const handle_t& handle);

/// Look up a path by name. Returns false and leaves path alone if there's no
/// such path.
bool find_path(const PathHandleGraph& graph, const string& name, path_handle_t& path);

/// Get every step along a path, in path order, with the handle it visits.
vector<pair<step_handle_t, handle_t>> path_steps(const PathHandleGraph& graph, const path_handle_t& path);

/**
 * Get the steps of a path with ranks from start_rank to end_rank, inclusive.
 * The end rank is clamped to the last step of the path; an empty range comes
 * back if start_rank is past the end or after end_rank.
 */
vector<pair<step_handle_t, handle_t>> path_steps_range(const PathHandleGraph& graph, const path_handle_t& path,
                                                       size_t start_rank, size_t end_rank);

/// Get all the (path, step) pairs on either orientation of a handle.
vector<pair<path_handle_t, step_handle_t>> steps_on_handle(const PathHandleGraph& graph, const handle_t& handle);

}

#endif
