#ifndef GFAESTUS_ANNOTATION_PROJECTION_HPP_INCLUDED
#define GFAESTUS_ANNOTATION_PROJECTION_HPP_INCLUDED

/** \file
 * annotation_projection.hpp: put annotation records onto the graph by way of
 * a path, as sets of nodes, labels, and overlays.
 */

#include <string>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <utility>
#include <functional>

#include "handle.hpp"
#include "geometry.hpp"
#include "annotations.hpp"
#include "graph_query.hpp"
#include "overlays.hpp"

namespace gfaestus {

using namespace std;

/// Label text for each node
typedef map<nid_t, vector<string>> LabelSet;

/**
 * The labels of a run of nearby nodes on a path, gathered together at one
 * node, and the direction to draw them in from it.
 */
struct LabelCluster {
    /// Unit vector perpendicular to the run of nodes, or zero if the run has
    /// no length
    Point offset;
    vector<string> labels;
};

/**
 * Find the steps of a path that overlap the bases [start, end). Returns a
 * half-open range of step ranks: from the step containing start to the last
 * step starting before end. Empty if start is past the end of the path or the
 * interval is empty.
 *
 * A step that starts before start but runs into the interval is included, so
 * this is not the same as taking the steps whose offsets fall in
 * [start, end).
 */
pair<size_t, size_t> find_step_range(const vector<StepPosition>& steps, size_t path_len, size_t start, size_t end);

/**
 * Gather the labels on the given range of steps into clusters, walking along
 * the path. A labelled node joins the current cluster if its center is no
 * more than radius pixels from that of the node that started the cluster,
 * with positions taken through the view. Each cluster goes to the node in
 * the middle of its run of steps.
 *
 * Node positions are indexed by node ID - 1. Throws out_of_range if a
 * labelled node has no position.
 */
map<nid_t, LabelCluster> cluster_labels(const HandleGraph& graph, const vector<StepPosition>& steps,
                                        const pair<size_t, size_t>& range, const LabelSet& labels,
                                        const vector<Node>& nodes, const ViewTransform& view, float radius);

/**
 * Color a record by hashing the values in one of its columns. Returns false
 * if the record has nothing in that column.
 */
template<typename ColumnKey>
bool column_hash_color(const AnnotationRecord<ColumnKey>& record, const ColumnKey& column, RGBA& color);

/**
 * Projects annotation records onto the graph along one path.
 *
 * If the path's name carries a coordinate range (as in "sample#chr1:100-250")
 * record coordinates are taken to be on the named sequence, and the range
 * start is subtracted from them. Records on any other sequence don't land on
 * the path at all.
 */
class AnnotationProjector {
public:
    AnnotationProjector(const shared_ptr<const GraphQuery>& query, const path_handle_t& path);

    /// The amount subtracted from record coordinates.
    size_t coord_offset() const;

    /// Can records on the given sequence land on this path? Always true if
    /// the path name doesn't say which sequence it is on.
    bool on_path_sequence(const string& seq_id) const;

    const vector<StepPosition>& steps() const;

    /// Get the half-open range of step ranks overlapping [start, end) in
    /// record coordinates.
    pair<size_t, size_t> record_step_range(size_t start, size_t end) const;

    /// Get the step range a record covers, or an empty range if it is on
    /// another sequence.
    template<typename ColumnKey>
    pair<size_t, size_t> record_range(const AnnotationRecord<ColumnKey>& record) const;

    /// Get the IDs of the nodes the record covers on the path, in order.
    template<typename ColumnKey>
    vector<nid_t> record_nodes(const AnnotationRecord<ColumnKey>& record) const;

    /// Label the first node of each record on the path with the first value
    /// in the given column, for the records at the given indexes.
    template<typename Collection, typename ColumnKey>
    LabelSet record_labels(const Collection& records, const vector<size_t>& indexes, const ColumnKey& column) const;

    /// Make a color overlay painting the nodes of each record with the hash
    /// color of the given column. Other nodes get the background color.
    template<typename Collection, typename ColumnKey>
    OverlayData record_overlay(const Collection& records, const vector<size_t>& indexes, const ColumnKey& column,
                               const RGBA& background) const;

    /// Make a value overlay giving the nodes of each scored record its score.
    /// Other nodes get the background value.
    template<typename Collection>
    OverlayData record_score_overlay(const Collection& records, const vector<size_t>& indexes,
                                     float background) const;

private:

    /// Call the function on the ID of each node in the step range.
    void for_each_node(const pair<size_t, size_t>& range, const function<void(nid_t)>& iteratee) const;

    shared_ptr<const GraphQuery> query;
    path_handle_t path;
    size_t offset = 0;
    /// Sequence named in the path name, or empty if it names none
    string path_seq_id;
};

template<typename ColumnKey>
bool column_hash_color(const AnnotationRecord<ColumnKey>& record, const ColumnKey& column, RGBA& color) {
    vector<string> values = record.get_all(column);
    if (values.empty()) {
        return false;
    }
    string joined;
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) {
            joined.push_back(';');
        }
        joined += values[i];
    }
    color = hash_node_color(std::hash<string>()(joined));
    return true;
}

template<typename ColumnKey>
pair<size_t, size_t> AnnotationProjector::record_range(const AnnotationRecord<ColumnKey>& record) const {
    if (!on_path_sequence(record.seq_id())) {
        return make_pair((size_t) 0, (size_t) 0);
    }
    return record_step_range(record.start(), record.end());
}

template<typename ColumnKey>
vector<nid_t> AnnotationProjector::record_nodes(const AnnotationRecord<ColumnKey>& record) const {
    vector<nid_t> nodes;
    set<nid_t> seen;
    for_each_node(record_range(record), [&](nid_t node_id) {
        if (seen.insert(node_id).second) {
            nodes.push_back(node_id);
        }
    });
    return nodes;
}

template<typename Collection, typename ColumnKey>
LabelSet AnnotationProjector::record_labels(const Collection& records, const vector<size_t>& indexes,
                                            const ColumnKey& column) const {
    LabelSet labels;
    auto& path_steps = steps();
    for (auto& i : indexes) {
        auto& record = records.records().at(i);
        string label;
        if (!record.get_first(column, label)) {
            continue;
        }
        auto range = record_range(record);
        if (range.first >= range.second) {
            // Not on this path
            continue;
        }
        labels[query->graph().get_id(path_steps[range.first].handle)].push_back(label);
    }
    return labels;
}

template<typename Collection, typename ColumnKey>
OverlayData AnnotationProjector::record_overlay(const Collection& records, const vector<size_t>& indexes,
                                                const ColumnKey& column, const RGBA& background) const {
    vector<RGBA> colors(query->graph().get_node_count(), background);
    for (auto& i : indexes) {
        auto& record = records.records().at(i);
        RGBA color;
        if (!column_hash_color(record, column, color)) {
            continue;
        }
        for_each_node(record_range(record), [&](nid_t node_id) {
            if (node_index(node_id) < colors.size()) {
                colors[node_index(node_id)] = color;
            }
        });
    }
    return OverlayData(std::move(colors));
}

template<typename Collection>
OverlayData AnnotationProjector::record_score_overlay(const Collection& records, const vector<size_t>& indexes,
                                                      float background) const {
    vector<float> values(query->graph().get_node_count(), background);
    for (auto& i : indexes) {
        auto& record = records.records().at(i);
        double score;
        if (!record.score(score)) {
            continue;
        }
        for_each_node(record_range(record), [&](nid_t node_id) {
            if (node_index(node_id) < values.size()) {
                values[node_index(node_id)] = (float) score;
            }
        });
    }
    return OverlayData(std::move(values));
}

}

#endif
