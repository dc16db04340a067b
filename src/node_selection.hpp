#ifndef GFAESTUS_NODE_SELECTION_HPP_INCLUDED
#define GFAESTUS_NODE_SELECTION_HPP_INCLUDED

/** \file
 * node_selection.hpp: sets of selected nodes.
 */

#include <vector>
#include <unordered_set>

#include "handle.hpp"
#include "geometry.hpp"

namespace gfaestus {

using namespace std;

/**
 * A set of node IDs. Set operations make new selections and leave their
 * inputs alone.
 */
class NodeSelection {
public:
    NodeSelection() = default;
    NodeSelection(const vector<nid_t>& nodes);

    NodeSelection set_union(const NodeSelection& other) const;
    NodeSelection set_intersection(const NodeSelection& other) const;
    /// Get the nodes in this selection that aren't in the other one.
    NodeSelection set_difference(const NodeSelection& other) const;

    /// Add a node. If clear is set, it replaces everything else.
    void add_one(nid_t node_id, bool clear);
    /// Add some nodes. If clear is set, they replace everything else.
    void add_slice(const vector<nid_t>& nodes, bool clear);
    /// Remove a node. If clear is set, the whole selection goes.
    void remove_one(nid_t node_id, bool clear);
    /// Remove some nodes. If clear is set, the whole selection goes.
    void remove_slice(const vector<nid_t>& nodes, bool clear);

    void clear();

    bool contains(nid_t node_id) const;
    size_t size() const;
    bool empty() const;

    const unordered_set<nid_t>& nodes() const;

    /**
     * Get the smallest rectangle around all the selected nodes, given the
     * layout positions of every node in the graph, indexed by node ID - 1.
     * Comes out as the default Rect if nothing is selected. Throws
     * out_of_range if a selected node has no position.
     */
    Rect bounding_box(const vector<Node>& positions) const;

    bool operator==(const NodeSelection& other) const;
    bool operator!=(const NodeSelection& other) const;

private:
    unordered_set<nid_t> selected;
};

}

#endif
