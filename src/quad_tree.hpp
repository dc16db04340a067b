#ifndef GFAESTUS_QUAD_TREE_HPP_INCLUDED
#define GFAESTUS_QUAD_TREE_HPP_INCLUDED

/** \file
 * quad_tree.hpp: a point quad-tree for finding node layout positions by
 * region.
 */

#include <vector>
#include <memory>
#include <utility>
#include <limits>
#include <cmath>
#include <iterator>
#include <algorithm>

#include "geometry.hpp"

//#define debug_quad_tree

namespace gfaestus {

using namespace std;

/**
 * Quad-tree of points with a value attached to each.
 *
 * Leaves hold up to NODE_CAPACITY entries. Inserting into a full leaf splits
 * it into four equal quadrants, in the order NW, NE, SW, SE (with y growing
 * downward, as on screen), and moves its entries down into them. Interior
 * nodes don't hold entries. Since rectangles contain their min edges but not
 * their max edges, each point in a node's boundary belongs to exactly one of
 * its children.
 *
 * Nodes at MAX_DEPTH are never split, so piles of identical points end up
 * in one over-full leaf.
 */
template<typename T>
class QuadTree {
public:

    static const size_t NODE_CAPACITY = 4;
    static const size_t MAX_DEPTH = 24;

    typedef pair<Point, T> entry_t;

    /// Make an empty tree covering the given area.
    QuadTree(const Rect& boundary);

    QuadTree(const QuadTree& other) = delete;
    QuadTree& operator=(const QuadTree& other) = delete;
    QuadTree(QuadTree&& other) = default;
    QuadTree& operator=(QuadTree&& other) = default;

    const Rect& boundary() const;

    bool is_leaf() const;

    /// Get the entries stored right at this node. Empty for interior nodes.
    const vector<entry_t>& entries() const;

    /// Get the children, in NW, NE, SW, SE order. Null for a leaf.
    const QuadTree<T>* child(size_t i) const;

    /// Add a value at a point. If the point is outside the tree's boundary,
    /// returns false and leaves the data alone, so the caller still has it.
    bool insert(const Point& point, T&& data);

    /// Add a copy of a value at a point. Returns false if the point is
    /// outside the tree's boundary.
    bool insert(const Point& point, const T& data);

    /// Get all the entries with points inside the given rectangle.
    vector<pair<Point, const T*>> query_range(const Rect& range) const;

    /// Get all the entries with points at most the given distance from the
    /// center.
    vector<pair<Point, const T*>> query_radius(const Point& center, float radius) const;

    /// Find the entry closest to the given point. Returns false if the tree is
    /// empty.
    bool nearest(const Point& target, Point& found, const T*& data) const;

    /// Remove the entry closest to the given point. Returns false if the tree
    /// is empty.
    bool delete_nearest(const Point& target);

    /// Get all the leaves, in depth-first order.
    vector<const QuadTree<T>*> leaves() const;

    /// Get the boundaries of all the nodes, breadth-first.
    vector<Rect> rects() const;

    /// Count the entries in the whole tree.
    size_t size() const;

    /// Get the number of levels in the tree; 1 for a lone leaf.
    size_t depth() const;

    /**
     * Iterator over every entry in the tree. Keeps a stack of nodes still to
     * visit, so it doesn't need parent pointers.
     */
    class const_iterator {
    public:
        typedef forward_iterator_tag iterator_category;
        typedef entry_t value_type;
        typedef ptrdiff_t difference_type;
        typedef const entry_t* pointer;
        typedef const entry_t& reference;

        const_iterator() = default;

        reference operator*() const;
        pointer operator->() const;
        const_iterator& operator++();
        const_iterator operator++(int);
        bool operator==(const const_iterator& other) const;
        bool operator!=(const const_iterator& other) const;

    private:
        friend class QuadTree<T>;

        const_iterator(const QuadTree<T>* root);

        /// Move on until we're at an entry, or out of nodes.
        void settle();

        vector<const QuadTree<T>*> stack;
        const QuadTree<T>* current = nullptr;
        size_t index = 0;
    };

    const_iterator begin() const;
    const_iterator end() const;

private:

    QuadTree(const Rect& boundary, size_t level);

    /// Split a leaf and push its entries down into the new children.
    void subdivide();

    /// Can this node be split any further?
    bool can_subdivide() const;

    /// Find the leaf holding the entry nearest to the target, and the index of
    /// the entry in it.
    bool nearest_entry(const Point& target, const QuadTree<T>*& leaf, size_t& index) const;

    /// Get the distance from a point to the nearest point of a rectangle.
    static float rect_dist(const Rect& rect, const Point& point);

    Rect bounds;
    size_t level;
    vector<entry_t> node_entries;
    /// NW, NE, SW, SE
    unique_ptr<QuadTree<T>> children[4];
};

template<typename T>
const size_t QuadTree<T>::NODE_CAPACITY;

template<typename T>
const size_t QuadTree<T>::MAX_DEPTH;

template<typename T>
QuadTree<T>::QuadTree(const Rect& boundary) : QuadTree(boundary, 1) {
    // Nothing to do
}

template<typename T>
QuadTree<T>::QuadTree(const Rect& boundary, size_t level) : bounds(boundary), level(level) {
    // Nothing to do
}

template<typename T>
const Rect& QuadTree<T>::boundary() const {
    return bounds;
}

template<typename T>
bool QuadTree<T>::is_leaf() const {
    return children[0].get() == nullptr;
}

template<typename T>
const vector<typename QuadTree<T>::entry_t>& QuadTree<T>::entries() const {
    return node_entries;
}

template<typename T>
const QuadTree<T>* QuadTree<T>::child(size_t i) const {
    return children[i].get();
}

template<typename T>
bool QuadTree<T>::can_subdivide() const {
    if (level >= MAX_DEPTH) {
        return false;
    }
    Point mid = bounds.center();
    // Make sure the halves are really smaller than the whole
    return mid.x > bounds.min().x && mid.x < bounds.max().x
        && mid.y > bounds.min().y && mid.y < bounds.max().y;
}

template<typename T>
void QuadTree<T>::subdivide() {
    Point min = bounds.min();
    Point max = bounds.max();
    Point mid = bounds.center();

#ifdef debug_quad_tree
    cerr << "Subdividing " << bounds << " at level " << level << endl;
#endif

    children[0].reset(new QuadTree<T>(Rect(Point(min.x, min.y), Point(mid.x, mid.y)), level + 1));
    children[1].reset(new QuadTree<T>(Rect(Point(mid.x, min.y), Point(max.x, mid.y)), level + 1));
    children[2].reset(new QuadTree<T>(Rect(Point(min.x, mid.y), Point(mid.x, max.y)), level + 1));
    children[3].reset(new QuadTree<T>(Rect(Point(mid.x, mid.y), Point(max.x, max.y)), level + 1));

    vector<entry_t> moving;
    swap(moving, node_entries);
    for (auto& entry : moving) {
        bool placed = false;
        for (auto& child : children) {
            if (child->insert(entry.first, std::move(entry.second))) {
                placed = true;
                break;
            }
        }
        if (!placed) {
            // The children cover our whole boundary, so this can't happen
            // unless the quadrant math loses a point to rounding.
            node_entries.push_back(std::move(entry));
        }
    }
}

template<typename T>
bool QuadTree<T>::insert(const Point& point, T&& data) {
    if (!bounds.contains(point)) {
#ifdef debug_quad_tree
        cerr << "Point " << point << " is outside " << bounds << endl;
#endif
        return false;
    }

    if (is_leaf()) {
        if (node_entries.size() < NODE_CAPACITY || !can_subdivide()) {
            node_entries.emplace_back(point, std::move(data));
            return true;
        }
        subdivide();
    }

    // The first child that takes it gets it
    for (auto& child : children) {
        if (child->insert(point, std::move(data))) {
            return true;
        }
    }
    // Insert only moves from the data on success, so it's still ours.
    node_entries.emplace_back(point, std::move(data));
    return true;
}

template<typename T>
bool QuadTree<T>::insert(const Point& point, const T& data) {
    if (!bounds.contains(point)) {
        return false;
    }
    T copy = data;
    return insert(point, std::move(copy));
}

template<typename T>
vector<pair<Point, const T*>> QuadTree<T>::query_range(const Rect& range) const {
    vector<pair<Point, const T*>> results;

    vector<const QuadTree<T>*> stack{this};
    while (!stack.empty()) {
        const QuadTree<T>* node = stack.back();
        stack.pop_back();
        if (!node->bounds.intersects(range)) {
            continue;
        }
        for (auto& entry : node->node_entries) {
            if (range.contains(entry.first)) {
                results.emplace_back(entry.first, &entry.second);
            }
        }
        if (!node->is_leaf()) {
            // Push in reverse so we visit NW first
            for (size_t i = 4; i > 0; i--) {
                stack.push_back(node->children[i - 1].get());
            }
        }
    }

    return results;
}

template<typename T>
vector<pair<Point, const T*>> QuadTree<T>::query_radius(const Point& center, float radius) const {
    vector<pair<Point, const T*>> results;
    float radius_sqr = radius * radius;

    vector<const QuadTree<T>*> stack{this};
    while (!stack.empty()) {
        const QuadTree<T>* node = stack.back();
        stack.pop_back();
        if (rect_dist(node->bounds, center) > radius) {
            continue;
        }
        for (auto& entry : node->node_entries) {
            if (entry.first.dist_sqr(center) <= radius_sqr) {
                results.emplace_back(entry.first, &entry.second);
            }
        }
        if (!node->is_leaf()) {
            for (size_t i = 4; i > 0; i--) {
                stack.push_back(node->children[i - 1].get());
            }
        }
    }

    return results;
}

template<typename T>
float QuadTree<T>::rect_dist(const Rect& rect, const Point& point) {
    float dx = std::max(std::max(rect.min().x - point.x, 0.0f), point.x - rect.max().x);
    float dy = std::max(std::max(rect.min().y - point.y, 0.0f), point.y - rect.max().y);
    return std::sqrt(dx * dx + dy * dy);
}

template<typename T>
bool QuadTree<T>::nearest_entry(const Point& target, const QuadTree<T>*& leaf, size_t& index) const {
    float best_dist = numeric_limits<float>::infinity();
    bool found = false;

    vector<const QuadTree<T>*> stack{this};
    while (!stack.empty()) {
        const QuadTree<T>* node = stack.back();
        stack.pop_back();
        if (found && rect_dist(node->bounds, target) >= best_dist) {
            // Nothing in here can beat what we have
            continue;
        }
        for (size_t i = 0; i < node->node_entries.size(); i++) {
            float dist = node->node_entries[i].first.dist(target);
            if (!found || dist < best_dist) {
                best_dist = dist;
                leaf = node;
                index = i;
                found = true;
            }
        }
        if (!node->is_leaf()) {
            // Visit the closest child first by pushing it last
            vector<const QuadTree<T>*> kids;
            for (auto& child : node->children) {
                kids.push_back(child.get());
            }
            stable_sort(kids.begin(), kids.end(), [&](const QuadTree<T>* a, const QuadTree<T>* b) {
                return rect_dist(a->bounds, target) > rect_dist(b->bounds, target);
            });
            for (auto kid : kids) {
                stack.push_back(kid);
            }
        }
    }

    return found;
}

template<typename T>
bool QuadTree<T>::nearest(const Point& target, Point& found, const T*& data) const {
    const QuadTree<T>* leaf;
    size_t index;
    if (!nearest_entry(target, leaf, index)) {
        return false;
    }
    found = leaf->node_entries[index].first;
    data = &leaf->node_entries[index].second;
    return true;
}

template<typename T>
bool QuadTree<T>::delete_nearest(const Point& target) {
    const QuadTree<T>* leaf;
    size_t index;
    if (!nearest_entry(target, leaf, index)) {
        return false;
    }
    // We only handed out const pointers into our own tree.
    auto& leaf_entries = const_cast<QuadTree<T>*>(leaf)->node_entries;
    leaf_entries.erase(leaf_entries.begin() + index);
    return true;
}

template<typename T>
vector<const QuadTree<T>*> QuadTree<T>::leaves() const {
    vector<const QuadTree<T>*> found;
    vector<const QuadTree<T>*> stack{this};
    while (!stack.empty()) {
        const QuadTree<T>* node = stack.back();
        stack.pop_back();
        if (node->is_leaf()) {
            found.push_back(node);
        } else {
            for (size_t i = 4; i > 0; i--) {
                stack.push_back(node->children[i - 1].get());
            }
        }
    }
    return found;
}

template<typename T>
vector<Rect> QuadTree<T>::rects() const {
    vector<Rect> found;
    vector<const QuadTree<T>*> queue{this};
    for (size_t i = 0; i < queue.size(); i++) {
        found.push_back(queue[i]->bounds);
        if (!queue[i]->is_leaf()) {
            for (auto& child : queue[i]->children) {
                queue.push_back(child.get());
            }
        }
    }
    return found;
}

template<typename T>
size_t QuadTree<T>::size() const {
    size_t total = node_entries.size();
    if (!is_leaf()) {
        for (auto& child : children) {
            total += child->size();
        }
    }
    return total;
}

template<typename T>
size_t QuadTree<T>::depth() const {
    size_t deepest = 0;
    if (!is_leaf()) {
        for (auto& child : children) {
            deepest = std::max(deepest, child->depth());
        }
    }
    return deepest + 1;
}

template<typename T>
typename QuadTree<T>::const_iterator QuadTree<T>::begin() const {
    return const_iterator(this);
}

template<typename T>
typename QuadTree<T>::const_iterator QuadTree<T>::end() const {
    return const_iterator();
}

template<typename T>
QuadTree<T>::const_iterator::const_iterator(const QuadTree<T>* root) : stack{root} {
    settle();
}

template<typename T>
void QuadTree<T>::const_iterator::settle() {
    while (current == nullptr || index >= current->node_entries.size()) {
        if (stack.empty()) {
            current = nullptr;
            index = 0;
            return;
        }
        current = stack.back();
        stack.pop_back();
        index = 0;
        if (!current->is_leaf()) {
            for (size_t i = 4; i > 0; i--) {
                stack.push_back(current->children[i - 1].get());
            }
        }
    }
}

template<typename T>
typename QuadTree<T>::const_iterator::reference QuadTree<T>::const_iterator::operator*() const {
    return current->node_entries[index];
}

template<typename T>
typename QuadTree<T>::const_iterator::pointer QuadTree<T>::const_iterator::operator->() const {
    return &current->node_entries[index];
}

template<typename T>
typename QuadTree<T>::const_iterator& QuadTree<T>::const_iterator::operator++() {
    index++;
    settle();
    return *this;
}

template<typename T>
typename QuadTree<T>::const_iterator QuadTree<T>::const_iterator::operator++(int) {
    const_iterator copy = *this;
    ++(*this);
    return copy;
}

template<typename T>
bool QuadTree<T>::const_iterator::operator==(const const_iterator& other) const {
    return current == other.current && index == other.index;
}

template<typename T>
bool QuadTree<T>::const_iterator::operator!=(const const_iterator& other) const {
    return !(*this == other);
}

}

#endif
