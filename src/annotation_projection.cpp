#include "annotation_projection.hpp"
#include "path_name.hpp"
#include "utility.hpp"

#include <algorithm>

//#define debug

namespace gfaestus {

using namespace std;

pair<size_t, size_t> find_step_range(const vector<StepPosition>& steps, size_t path_len, size_t start, size_t end) {

    // First step starting at or after each end of the interval
    auto start_after = upper_bound(steps.begin(), steps.end(), start, [](size_t base, const StepPosition& step) {
        return base < step.offset;
    });
    auto end_at = lower_bound(steps.begin(), steps.end(), end, [](const StepPosition& step, size_t base) {
        return step.offset < base;
    });
    size_t last = end_at - steps.begin();

    if (steps.empty() || start >= end || start >= path_len) {
        // Nothing overlaps; give back an empty range at the insertion point
        size_t at = min<size_t>(start_after - steps.begin(), steps.size());
        return make_pair(at, at);
    }

    // The first step starts at 0, so there's always one before start_after.
    size_t first = (start_after - steps.begin()) - 1;

#ifdef debug
    cerr << "Bases [" << start << ", " << end << ") are on steps [" << first << ", " << last << ")" << endl;
#endif

    return make_pair(first, max(first, last));
}

map<nid_t, LabelCluster> cluster_labels(const HandleGraph& graph, const vector<StepPosition>& steps,
                                        const pair<size_t, size_t>& range, const LabelSet& labels,
                                        const vector<Node>& nodes, const ViewTransform& view, float radius) {

    map<nid_t, LabelCluster> clusters;

    bool have_cluster = false;
    size_t cluster_start = 0;
    size_t cluster_end = 0;
    Point cluster_start_pos;
    vector<string> cluster_text;

    auto emit_cluster = [&]() {
        const Node& first_node = nodes.at(node_index(graph.get_id(steps[cluster_start].handle)));
        const Node& last_node = nodes.at(node_index(graph.get_id(steps[cluster_end].handle)));

        Point offset = (last_node.p1 - first_node.p0).perpendicular().normalized();
        nid_t anchor = graph.get_id(steps[cluster_start + (cluster_end - cluster_start) / 2].handle);

        LabelCluster& cluster = clusters[anchor];
        if (cluster.labels.empty()) {
            cluster.offset = offset;
        }
        cluster.labels.insert(cluster.labels.end(), cluster_text.begin(), cluster_text.end());
    };

    size_t stop = min(range.second, steps.size());
    for (size_t rank = range.first; rank < stop; rank++) {
        nid_t node_id = graph.get_id(steps[rank].handle);
        auto found = labels.find(node_id);
        if (found == labels.end() || found->second.empty()) {
            continue;
        }

        Point pos = view.to_screen(nodes.at(node_index(node_id)).center());

        if (have_cluster && pos.dist(cluster_start_pos) <= radius) {
            // Close enough (or right on top), so extend the cluster
            cluster_end = rank;
            cluster_text.insert(cluster_text.end(), found->second.begin(), found->second.end());
        } else {
            if (have_cluster) {
                emit_cluster();
            }
            have_cluster = true;
            cluster_start = rank;
            cluster_end = rank;
            cluster_start_pos = pos;
            cluster_text = found->second;
        }
    }
    if (have_cluster) {
        emit_cluster();
    }

    return clusters;
}

AnnotationProjector::AnnotationProjector(const shared_ptr<const GraphQuery>& query, const path_handle_t& path) :
    query(query), path(path) {

    string path_name = query->graph().get_path_name(path);
    size_t name_offset;
    if (path_name_offset(path_name, name_offset)) {
        offset = name_offset;
    }
    size_t start;
    size_t end;
    if (!path_name_chr_range(path_name, path_seq_id, start, end)) {
        path_seq_id.clear();
    }
}

size_t AnnotationProjector::coord_offset() const {
    return offset;
}

bool AnnotationProjector::on_path_sequence(const string& seq_id) const {
    if (path_seq_id.empty() || seq_id == path_seq_id) {
        return true;
    }
    // Names like "sample#1#chr1" carry a haplotype before the sequence
    return ends_with(path_seq_id, "#" + seq_id);
}

const vector<StepPosition>& AnnotationProjector::steps() const {
    return query->path_pos_steps(path);
}

pair<size_t, size_t> AnnotationProjector::record_step_range(size_t start, size_t end) const {
    // Shift onto the path, without going below its start
    size_t local_start = start > offset ? start - offset : 0;
    size_t local_end = end > offset ? end - offset : 0;
    return find_step_range(steps(), query->path_positions().path_base_len(path), local_start, local_end);
}

void AnnotationProjector::for_each_node(const pair<size_t, size_t>& range, const function<void(nid_t)>& iteratee) const {
    auto& path_steps = steps();
    for (size_t rank = range.first; rank < range.second && rank < path_steps.size(); rank++) {
        iteratee(query->graph().get_id(path_steps[rank].handle));
    }
}

}
