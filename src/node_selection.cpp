#include "node_selection.hpp"

namespace gfaestus {

using namespace std;

NodeSelection::NodeSelection(const vector<nid_t>& nodes) : selected(nodes.begin(), nodes.end()) {
    // Nothing to do
}

NodeSelection NodeSelection::set_union(const NodeSelection& other) const {
    NodeSelection combined(*this);
    combined.selected.insert(other.selected.begin(), other.selected.end());
    return combined;
}

NodeSelection NodeSelection::set_intersection(const NodeSelection& other) const {
    // Walk the smaller one
    const NodeSelection& smaller = size() <= other.size() ? *this : other;
    const NodeSelection& larger = size() <= other.size() ? other : *this;
    NodeSelection shared;
    for (auto& node_id : smaller.selected) {
        if (larger.contains(node_id)) {
            shared.selected.insert(node_id);
        }
    }
    return shared;
}

NodeSelection NodeSelection::set_difference(const NodeSelection& other) const {
    NodeSelection remaining;
    for (auto& node_id : selected) {
        if (!other.contains(node_id)) {
            remaining.selected.insert(node_id);
        }
    }
    return remaining;
}

void NodeSelection::add_one(nid_t node_id, bool clear) {
    if (clear) {
        selected.clear();
    }
    selected.insert(node_id);
}

void NodeSelection::add_slice(const vector<nid_t>& nodes, bool clear) {
    if (clear) {
        selected.clear();
    }
    selected.insert(nodes.begin(), nodes.end());
}

void NodeSelection::remove_one(nid_t node_id, bool clear) {
    if (clear) {
        selected.clear();
    } else {
        selected.erase(node_id);
    }
}

void NodeSelection::remove_slice(const vector<nid_t>& nodes, bool clear) {
    if (clear) {
        selected.clear();
        return;
    }
    for (auto& node_id : nodes) {
        selected.erase(node_id);
    }
}

void NodeSelection::clear() {
    selected.clear();
}

bool NodeSelection::contains(nid_t node_id) const {
    return selected.count(node_id);
}

size_t NodeSelection::size() const {
    return selected.size();
}

bool NodeSelection::empty() const {
    return selected.empty();
}

const unordered_set<nid_t>& NodeSelection::nodes() const {
    return selected;
}

Rect NodeSelection::bounding_box(const vector<Node>& positions) const {
    if (selected.empty()) {
        return Rect();
    }
    Rect box = Rect::nowhere();
    for (auto& node_id : selected) {
        // A selected node has to be in the layout; at() throws if it isn't.
        box = box.rect_union(positions.at(node_index(node_id)).bounds());
    }
    return box;
}

bool NodeSelection::operator==(const NodeSelection& other) const {
    return selected == other.selected;
}

bool NodeSelection::operator!=(const NodeSelection& other) const {
    return !(*this == other);
}

}
