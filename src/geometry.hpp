#ifndef GFAESTUS_GEOMETRY_HPP_INCLUDED
#define GFAESTUS_GEOMETRY_HPP_INCLUDED

/** \file
 * geometry.hpp: 2D points and rectangles for node layouts and screen space,
 * plus the view transform used to go from one to the other.
 */

#include <iostream>
#include <limits>
#include <vector>

namespace gfaestus {

using namespace std;

struct Point {
    float x = 0.0;
    float y = 0.0;

    Point() = default;
    Point(float x, float y) : x(x), y(y) {}

    static Point zero() {
        return Point(0.0, 0.0);
    }

    /// Euclidean length of the point as a vector from the origin
    float length() const;

    /// Distance to another point
    float dist(const Point& other) const;

    /// Squared distance to another point; cheaper when only comparing
    float dist_sqr(const Point& other) const;

    /// Scale to unit length, or leave the zero vector as is
    Point normalized() const;

    /// Rotate 90 degrees counterclockwise (in a y-up frame)
    Point perpendicular() const;

    inline Point operator+(const Point& other) const {
        return Point(x + other.x, y + other.y);
    }
    inline Point operator-(const Point& other) const {
        return Point(x - other.x, y - other.y);
    }
    inline Point operator*(float factor) const {
        return Point(x * factor, y * factor);
    }
    inline Point operator/(float factor) const {
        return Point(x / factor, y / factor);
    }
    inline Point& operator+=(const Point& other) {
        x += other.x;
        y += other.y;
        return *this;
    }
    inline Point& operator-=(const Point& other) {
        x -= other.x;
        y -= other.y;
        return *this;
    }
    inline bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }
    inline bool operator!=(const Point& other) const {
        return !(*this == other);
    }
};

ostream& operator<<(ostream& out, const Point& point);

/**
 * An axis-aligned rectangle. The corners are normalized on construction so
 * that min is never greater than max on either axis.
 *
 * Containment is half-open: the min edges are inside and the max edges are
 * not. That way the four quadrants of a rectangle partition it exactly.
 */
class Rect {
public:
    /// The empty rectangle at the origin
    Rect() = default;

    /// Make the rectangle spanned by two corners, in any order
    Rect(const Point& p0, const Point& p1);

    /// A rectangle covering the whole plane
    static Rect everywhere();

    /// A rectangle that contains nothing, and is the identity for union()
    static Rect nowhere();

    inline const Point& min() const {
        return min_corner;
    }
    inline const Point& max() const {
        return max_corner;
    }

    inline float width() const {
        return max_corner.x - min_corner.x;
    }
    inline float height() const {
        return max_corner.y - min_corner.y;
    }

    Point center() const;

    /// Is the point in the rectangle? Max edges are exclusive.
    bool contains(const Point& p) const;

    /// Do the two rectangles touch or overlap? Edges are inclusive, so this
    /// is safe to use for pruning searches.
    bool intersects(const Rect& other) const;

    /// Smallest rectangle containing both
    Rect rect_union(const Rect& other) const;

    /// Overlap of the two rectangles
    Rect intersection(const Rect& other) const;

    /// Scale about the center
    Rect resize(float factor) const;

    inline bool operator==(const Rect& other) const {
        return min_corner == other.min_corner && max_corner == other.max_corner;
    }
    inline bool operator!=(const Rect& other) const {
        return !(*this == other);
    }

private:
    Point min_corner;
    Point max_corner;
};

ostream& operator<<(ostream& out, const Rect& rect);

/**
 * The layout position of a single node: a segment from p0 to p1.
 */
struct Node {
    Point p0;
    Point p1;

    Node() = default;
    Node(const Point& p0, const Point& p1) : p0(p0), p1(p1) {}

    inline Point center() const {
        return (p0 + p1) / 2.0;
    }

    inline Rect bounds() const {
        return Rect(p0, p1);
    }
};

/**
 * Maps world coordinates to screen pixels. The view is centered on a world
 * point, and scale is in world units per pixel. Screen y grows downwards
 * from the top left corner, same as world y.
 */
struct ViewTransform {
    Point center;
    float scale = 1.0;
    Point screen_dims = Point(800.0, 600.0);

    ViewTransform() = default;
    ViewTransform(const Point& center, float scale, const Point& screen_dims) :
        center(center), scale(scale), screen_dims(screen_dims) {}

    /// Project a world point to screen space
    Point to_screen(const Point& world) const;

    /// Project a screen point back into the world
    Point to_world(const Point& screen) const;

    /// The world rectangle visible on screen
    Rect visible_world() const;
};

/**
 * Read a layout TSV: a header line, then one "index x y" line per node end,
 * with index 2 * (ID - 1) for the start of a node and the next one for its
 * end. Extra columns are ignored. Gives one Node per ID from 1 to
 * node_count; nodes the file doesn't mention stay at the origin.
 *
 * Throws runtime_error on a line that doesn't parse or an index past
 * node_count.
 */
vector<Node> read_layout_tsv(istream& in, size_t node_count);

}

#endif
