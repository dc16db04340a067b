#include "path_position_index.hpp"
#include "log.hpp"

#include <algorithm>
#include <omp.h>

//#define debug

namespace gfaestus {

using namespace std;

static const Logger logger("path-index");

PathPositionIndex::PathPositionIndex(const PathHandleGraph& graph) {

    graph.for_each_path_handle([&](const path_handle_t& path) {
        path_indexes[path] = paths.size();
        paths.emplace_back();
        paths.back().path = path;
    });

    // Each path is independent, so we can walk them all at once.
#pragma omp parallel for schedule(dynamic, 1)
    for (size_t i = 0; i < paths.size(); i++) {
        auto& indexed = paths[i];
        indexed.steps.reserve(graph.get_step_count(indexed.path));

        size_t offset = 0;
        graph.for_each_step_in_path(indexed.path, [&](const step_handle_t& step) {
            handle_t handle = graph.get_handle_of_step(step);
            indexed.step_ranks[step] = indexed.steps.size();
            indexed.steps.push_back(StepPosition{handle, step, offset});
            offset += graph.get_length(handle);
        });
        indexed.base_len = offset;

#ifdef debug
#pragma omp critical (cerr)
        cerr << "Indexed path " << graph.get_path_name(indexed.path) << " with " << indexed.steps.size()
             << " steps over " << indexed.base_len << " bases" << endl;
#endif
    }

    // Collecting occurrences by node has to be serial.
    size_t total_steps = 0;
    for (size_t i = 0; i < paths.size(); i++) {
        for (size_t rank = 0; rank < paths[i].steps.size(); rank++) {
            handle_t forward = graph.forward(paths[i].steps[rank].handle);
            auto found = occurrence_slots.find(forward);
            size_t slot;
            if (found == occurrence_slots.end()) {
                slot = node_occurrences.size();
                node_occurrences.emplace_back();
                occurrence_slots[forward] = slot;
                occurrence_slots[graph.flip(forward)] = slot;
            } else {
                slot = found->second;
            }
            node_occurrences[slot].emplace_back(i, rank);
        }
        total_steps += paths[i].steps.size();
    }

    logger.info() << "indexed " << paths.size() << " paths with " << total_steps << " steps" << endl;
}

const PathPositionIndex::IndexedPath* PathPositionIndex::get_indexed(const path_handle_t& path) const {
    auto found = path_indexes.find(path);
    if (found == path_indexes.end()) {
        return nullptr;
    }
    return &paths[found->second];
}

bool PathPositionIndex::has_path(const path_handle_t& path) const {
    return get_indexed(path) != nullptr;
}

size_t PathPositionIndex::path_count() const {
    return paths.size();
}

const vector<StepPosition>& PathPositionIndex::path_steps(const path_handle_t& path) const {
    static const vector<StepPosition> no_steps;
    auto indexed = get_indexed(path);
    if (indexed == nullptr) {
        return no_steps;
    }
    return indexed->steps;
}

size_t PathPositionIndex::path_base_len(const path_handle_t& path) const {
    auto indexed = get_indexed(path);
    return indexed == nullptr ? 0 : indexed->base_len;
}

bool PathPositionIndex::path_step_rank(const path_handle_t& path, const step_handle_t& step, size_t& rank) const {
    auto indexed = get_indexed(path);
    if (indexed == nullptr) {
        return false;
    }
    auto found = indexed->step_ranks.find(step);
    if (found == indexed->step_ranks.end()) {
        return false;
    }
    rank = found->second;
    return true;
}

bool PathPositionIndex::path_step_position(const path_handle_t& path, const step_handle_t& step, size_t& position) const {
    size_t rank;
    if (!path_step_rank(path, step, rank)) {
        return false;
    }
    position = get_indexed(path)->steps[rank].offset;
    return true;
}

bool PathPositionIndex::find_rank_at_base(const path_handle_t& path, size_t base, size_t& rank) const {
    auto indexed = get_indexed(path);
    if (indexed == nullptr || base >= indexed->base_len) {
        return false;
    }
    auto& steps = indexed->steps;

    // Find the first step starting after the base; the one before it has the
    // base. Zero-length nodes share an offset with their successor, and
    // upper_bound skips past them.
    auto after = upper_bound(steps.begin(), steps.end(), base, [](size_t b, const StepPosition& s) {
        return b < s.offset;
    });
    // base < base_len means the first step starts at or before base, so after
    // can't be the first step.
    rank = (after - steps.begin()) - 1;
    return true;
}

bool PathPositionIndex::find_step_at_base(const path_handle_t& path, size_t base, step_handle_t& step) const {
    size_t rank;
    if (!find_rank_at_base(path, base, rank)) {
        return false;
    }
    step = get_indexed(path)->steps[rank].step;
    return true;
}

vector<PathOccurrence> PathPositionIndex::handle_positions(const handle_t& handle) const {
    vector<PathOccurrence> occurrences;
    auto found = occurrence_slots.find(handle);
    if (found == occurrence_slots.end()) {
        return occurrences;
    }
    for (auto& occurrence : node_occurrences[found->second]) {
        auto& indexed = paths[occurrence.first];
        auto& step = indexed.steps[occurrence.second];
        occurrences.push_back(PathOccurrence{indexed.path, step.step, step.offset});
    }
    return occurrences;
}

void PathPositionIndex::for_each_path(const function<void(const path_handle_t&)>& iteratee) const {
    for (auto& indexed : paths) {
        iteratee(indexed.path);
    }
}

}
