#include "handle.hpp"

/** \file handle.cpp
 * Implement handle graph query helpers.
 */

namespace gfaestus {

using namespace std;

size_t node_len(const HandleGraph& graph, nid_t node_id) {
    if (!graph.has_node(node_id)) {
        return 0;
    }
    return graph.get_length(graph.get_handle(node_id, false));
}

string node_sequence(const HandleGraph& graph, nid_t node_id) {
    if (!graph.has_node(node_id)) {
        return string();
    }
    return graph.get_sequence(graph.get_handle(node_id, false));
}

size_t node_degree(const HandleGraph& graph, nid_t node_id, bool go_left) {
    if (!graph.has_node(node_id)) {
        return 0;
    }
    return graph.get_degree(graph.get_handle(node_id, false), go_left);
}

size_t node_coverage(const PathHandleGraph& graph, const handle_t& handle) {
    size_t count = 0;
    graph.for_each_step_on_handle(handle, [&](const step_handle_t& step) {
        count++;
    });
    return count;
}

bool find_path(const PathHandleGraph& graph, const string& name, path_handle_t& path) {
    if (!graph.has_path(name)) {
        return false;
    }
    path = graph.get_path_handle(name);
    return true;
}

vector<pair<step_handle_t, handle_t>> path_steps(const PathHandleGraph& graph, const path_handle_t& path) {
    vector<pair<step_handle_t, handle_t>> steps;
    steps.reserve(graph.get_step_count(path));
    graph.for_each_step_in_path(path, [&](const step_handle_t& step) {
        steps.emplace_back(step, graph.get_handle_of_step(step));
    });
    return steps;
}

vector<pair<step_handle_t, handle_t>> path_steps_range(const PathHandleGraph& graph, const path_handle_t& path,
                                                       size_t start_rank, size_t end_rank) {
    vector<pair<step_handle_t, handle_t>> steps;
    if (start_rank > end_rank) {
        return steps;
    }

    size_t rank = 0;
    graph.for_each_step_in_path(path, [&](const step_handle_t& step) {
        if (rank > end_rank) {
            // Stop iterating
            return false;
        }
        if (rank >= start_rank) {
            steps.emplace_back(step, graph.get_handle_of_step(step));
        }
        rank++;
        return true;
    });
    return steps;
}

vector<pair<path_handle_t, step_handle_t>> steps_on_handle(const PathHandleGraph& graph, const handle_t& handle) {
    vector<pair<path_handle_t, step_handle_t>> found;
    graph.for_each_step_on_handle(handle, [&](const step_handle_t& step) {
        found.emplace_back(graph.get_path_handle_of_step(step), step);
    });
    return found;
}

}
