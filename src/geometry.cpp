#include "geometry.hpp"

#include <cmath>
#include <algorithm>
#include <string>
#include <sstream>
#include <stdexcept>

namespace gfaestus {

using namespace std;

float Point::length() const {
    return hypot(x, y);
}

float Point::dist(const Point& other) const {
    return hypot(x - other.x, y - other.y);
}

float Point::dist_sqr(const Point& other) const {
    float x_diff = x - other.x;
    float y_diff = y - other.y;
    return x_diff * x_diff + y_diff * y_diff;
}

Point Point::normalized() const {
    float len = length();
    if (len == 0.0) {
        return *this;
    }
    return *this / len;
}

Point Point::perpendicular() const {
    return Point(-y, x);
}

ostream& operator<<(ostream& out, const Point& point) {
    return out << "(" << point.x << ", " << point.y << ")";
}

Rect::Rect(const Point& p0, const Point& p1) :
    min_corner(std::min(p0.x, p1.x), std::min(p0.y, p1.y)),
    max_corner(std::max(p0.x, p1.x), std::max(p0.y, p1.y)) {
    // Nothing to do
}

Rect Rect::everywhere() {
    Rect rect;
    rect.min_corner = Point(numeric_limits<float>::lowest(), numeric_limits<float>::lowest());
    rect.max_corner = Point(numeric_limits<float>::max(), numeric_limits<float>::max());
    return rect;
}

Rect Rect::nowhere() {
    // Inverted on purpose, so that union with anything gives the other thing
    Rect rect;
    rect.min_corner = Point(numeric_limits<float>::max(), numeric_limits<float>::max());
    rect.max_corner = Point(numeric_limits<float>::lowest(), numeric_limits<float>::lowest());
    return rect;
}

Point Rect::center() const {
    return Point(min_corner.x + width() / 2.0, min_corner.y + height() / 2.0);
}

bool Rect::contains(const Point& p) const {
    return min_corner.x <= p.x && p.x < max_corner.x
        && min_corner.y <= p.y && p.y < max_corner.y;
}

bool Rect::intersects(const Rect& other) const {
    return min_corner.x <= other.max_corner.x && other.min_corner.x <= max_corner.x
        && min_corner.y <= other.max_corner.y && other.min_corner.y <= max_corner.y;
}

Rect Rect::rect_union(const Rect& other) const {
    Rect combined;
    combined.min_corner = Point(std::min(min_corner.x, other.min_corner.x),
                                std::min(min_corner.y, other.min_corner.y));
    combined.max_corner = Point(std::max(max_corner.x, other.max_corner.x),
                                std::max(max_corner.y, other.max_corner.y));
    return combined;
}

Rect Rect::intersection(const Rect& other) const {
    Point low(std::max(min_corner.x, other.min_corner.x), std::max(min_corner.y, other.min_corner.y));
    Point high(std::min(max_corner.x, other.max_corner.x), std::min(max_corner.y, other.max_corner.y));
    return Rect(low, high);
}

Rect Rect::resize(float factor) const {
    Point mid = center();
    Point half(width() * factor / 2.0, height() * factor / 2.0);
    return Rect(mid - half, mid + half);
}

ostream& operator<<(ostream& out, const Rect& rect) {
    return out << "[" << rect.min() << " - " << rect.max() << "]";
}

Point ViewTransform::to_screen(const Point& world) const {
    return (world - center) / scale + screen_dims / 2.0;
}

Point ViewTransform::to_world(const Point& screen) const {
    return (screen - screen_dims / 2.0) * scale + center;
}

Rect ViewTransform::visible_world() const {
    return Rect(to_world(Point::zero()), to_world(screen_dims));
}

vector<Node> read_layout_tsv(istream& in, size_t node_count) {
    vector<Node> nodes(node_count);

    string line;
    // Throw away the header
    getline(in, line);
    size_t line_number = 1;

    while (getline(in, line)) {
        line_number++;
        if (line.find_first_not_of(" \t\r") == string::npos) {
            continue;
        }

        stringstream fields(line);
        size_t ix;
        float x;
        float y;
        if (!(fields >> ix >> x >> y)) {
            throw runtime_error("bad layout line " + to_string(line_number) + ": " + line);
        }
        if (ix / 2 >= node_count) {
            throw runtime_error("layout line " + to_string(line_number) + " is for node "
                                + to_string(ix / 2 + 1) + " but there are only " + to_string(node_count));
        }

        if (ix % 2 == 0) {
            nodes[ix / 2].p0 = Point(x, y);
        } else {
            nodes[ix / 2].p1 = Point(x, y);
        }
    }

    return nodes;
}

}
