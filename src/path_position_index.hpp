#ifndef GFAESTUS_PATH_POSITION_INDEX_HPP_INCLUDED
#define GFAESTUS_PATH_POSITION_INDEX_HPP_INCLUDED

/** \file
 * path_position_index.hpp: index from path steps to their base offsets along
 * every path in a graph, and back again.
 */

#include <vector>
#include <functional>

#include "handle.hpp"

namespace gfaestus {

using namespace std;

/**
 * A step along a path, the handle it visits, and the number of bases along the
 * path before it.
 */
struct StepPosition {
    handle_t handle;
    step_handle_t step;
    size_t offset;
};

/**
 * One place a node occurs on a path.
 */
struct PathOccurrence {
    path_handle_t path;
    step_handle_t step;
    size_t offset;
};

/**
 * Holds the cumulative base offset of every step of every path in a graph.
 * Built once up front; after that it is immutable and safe to share between
 * threads.
 *
 * For each path the steps are stored in path order, so offsets are
 * non-decreasing and each one is the sum of the lengths of the nodes before
 * it. Steps can be looked up by base with a binary search, and bases by step
 * in constant time.
 */
class PathPositionIndex {
public:

    /// Index all the paths in the given graph. The graph is only used during
    /// construction.
    PathPositionIndex(const PathHandleGraph& graph);

    /// Does the index have the path?
    bool has_path(const path_handle_t& path) const;

    /// How many paths are indexed?
    size_t path_count() const;

    /// Get all the steps of the path with their offsets, in path order. Empty
    /// if the path is not indexed.
    const vector<StepPosition>& path_steps(const path_handle_t& path) const;

    /// Get the number of bases along the path. 0 for a path not indexed.
    size_t path_base_len(const path_handle_t& path) const;

    /// Get the base offset of the given step on the given path. Returns false
    /// if the step is not on the path.
    bool path_step_position(const path_handle_t& path, const step_handle_t& step, size_t& position) const;

    /// Get the zero-based ordinal of the step along its path.
    bool path_step_rank(const path_handle_t& path, const step_handle_t& step, size_t& rank) const;

    /// Find the rank of the step whose bases [offset, offset + length) contain
    /// the given base. Returns false if the base is past the end of the path.
    bool find_rank_at_base(const path_handle_t& path, size_t base, size_t& rank) const;

    /// Find the step whose bases contain the given base.
    bool find_step_at_base(const path_handle_t& path, size_t base, step_handle_t& step) const;

    /// Get every place the node of the handle occurs on any path, in either
    /// orientation. Empty if the node is not on any path.
    vector<PathOccurrence> handle_positions(const handle_t& handle) const;

    /// Call the given function on every indexed path.
    void for_each_path(const function<void(const path_handle_t&)>& iteratee) const;

private:

    /// Everything we know about a single path
    struct IndexedPath {
        path_handle_t path;
        vector<StepPosition> steps;
        /// Total bases on the path
        size_t base_len = 0;
        /// Lets us find a step's rank in constant time
        hash_map<step_handle_t, size_t> step_ranks;
    };

    /// Where we keep each path's record
    hash_map<path_handle_t, size_t> path_indexes;

    vector<IndexedPath> paths;

    /// Occurrences of each node, as (path record index, rank) pairs
    vector<vector<pair<size_t, size_t>>> node_occurrences;

    /// Where to find the occurrences for each handle, in both orientations
    hash_map<handle_t, size_t> occurrence_slots;

    /// Find the record for a path, or null if we don't have it.
    const IndexedPath* get_indexed(const path_handle_t& path) const;
};

}

#endif
