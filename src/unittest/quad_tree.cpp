/// \file unittest/quad_tree.cpp
///
/// Unit tests for the QuadTree spatial index.
///

#include <iostream>
#include <string>
#include <vector>
#include <set>
#include <random>
#include <cmath>

#include "../quad_tree.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

/// Get the values of found entries, sorted.
static vector<char> found_values(const vector<pair<Point, const char*>>& found) {
    vector<char> values;
    for (auto& entry : found) {
        values.push_back(*entry.second);
    }
    sort(values.begin(), values.end());
    return values;
}

TEST_CASE("QuadTree splits a full leaf into quadrants", "[quadtree]") {

    QuadTree<char> tree(Rect(Point(0.0, 0.0), Point(1.0, 1.0)));

    REQUIRE(tree.insert(Point(0.1, 0.1), 'A'));
    REQUIRE(tree.insert(Point(0.9, 0.9), 'B'));
    REQUIRE(tree.insert(Point(0.2, 0.8), 'C'));
    REQUIRE(tree.insert(Point(0.8, 0.2), 'D'));
    REQUIRE(tree.is_leaf());
    REQUIRE(tree.entries().size() == 4);

    REQUIRE(tree.insert(Point(0.5, 0.5), 'E'));

    SECTION("The fifth point splits the root") {
        REQUIRE(!tree.is_leaf());
        REQUIRE(tree.entries().empty());
        REQUIRE(tree.size() == 5);
        REQUIRE(tree.depth() == 2);
        for (size_t i = 0; i < 4; i++) {
            REQUIRE(tree.child(i) != nullptr);
            REQUIRE(tree.child(i)->is_leaf());
        }
    }

    SECTION("Children are NW, NE, SW, SE with the center going to SE") {
        REQUIRE(tree.child(0)->boundary() == Rect(Point(0.0, 0.0), Point(0.5, 0.5)));
        REQUIRE(tree.child(0)->entries().size() == 1);
        REQUIRE(tree.child(0)->entries()[0].second == 'A');
        REQUIRE(tree.child(1)->entries().size() == 1);
        REQUIRE(tree.child(1)->entries()[0].second == 'D');
        REQUIRE(tree.child(2)->entries().size() == 1);
        REQUIRE(tree.child(2)->entries()[0].second == 'C');
        REQUIRE(tree.child(3)->entries().size() == 2);
    }

    SECTION("Range queries find exactly the points inside") {
        REQUIRE(found_values(tree.query_range(Rect(Point(0.0, 0.0), Point(0.5, 0.5)))) == vector<char>({'A'}));
        REQUIRE(found_values(tree.query_range(Rect(Point(0.4, 0.4), Point(0.6, 0.6)))) == vector<char>({'E'}));
        REQUIRE(found_values(tree.query_range(Rect(Point(0.0, 0.0), Point(1.0, 1.0)))).size() == 5);
        REQUIRE(tree.query_range(Rect(Point(0.3, 0.3), Point(0.4, 0.4))).empty());
    }

    SECTION("Radius queries find points within the distance") {
        REQUIRE(found_values(tree.query_radius(Point(0.15, 0.15), 0.1)) == vector<char>({'A'}));
        REQUIRE(found_values(tree.query_radius(Point(0.5, 0.5), 0.2)) == vector<char>({'E'}));
        REQUIRE(found_values(tree.query_radius(Point(0.5, 0.5), 0.6)) == vector<char>({'A', 'B', 'C', 'D', 'E'}));
    }

    SECTION("The nearest point can be found and removed") {
        Point found;
        const char* value = nullptr;
        REQUIRE(tree.nearest(Point(0.95, 0.99), found, value));
        REQUIRE(*value == 'B');
        REQUIRE(found == Point(0.9, 0.9));

        REQUIRE(tree.delete_nearest(Point(0.95, 0.99)));
        REQUIRE(tree.size() == 4);
        REQUIRE(tree.nearest(Point(0.95, 0.99), found, value));
        REQUIRE(*value == 'E');
    }

    SECTION("Points outside the boundary are refused") {
        REQUIRE(!tree.insert(Point(1.0, 0.5), 'F'));
        REQUIRE(!tree.insert(Point(-0.1, 0.5), 'F'));
        REQUIRE(tree.size() == 5);
    }

    SECTION("Node rectangles start with the root") {
        auto rects = tree.rects();
        REQUIRE(rects.size() == 5);
        REQUIRE(rects[0] == tree.boundary());
        REQUIRE(tree.leaves().size() == 4);
    }
}

TEST_CASE("QuadTree holds everything inserted", "[quadtree]") {

    QuadTree<size_t> tree(Rect(Point(0.0, 0.0), Point(1000.0, 1000.0)));

    default_random_engine generator(4242);
    uniform_real_distribution<float> coord(0.0, 999.9);

    vector<Point> points;
    for (size_t i = 0; i < 2000; i++) {
        points.emplace_back(coord(generator), coord(generator));
        REQUIRE(tree.insert(points.back(), i));
    }

    SECTION("Iteration visits every entry once") {
        set<size_t> seen;
        size_t count = 0;
        for (auto& entry : tree) {
            seen.insert(entry.second);
            REQUIRE(entry.first == points[entry.second]);
            count++;
        }
        REQUIRE(count == 2000);
        REQUIRE(seen.size() == 2000);
        REQUIRE(tree.size() == 2000);
    }

    SECTION("Range queries agree with a scan") {
        Rect range(Point(120.0, 300.0), Point(480.0, 910.0));
        auto found = tree.query_range(range);
        size_t expected = 0;
        for (auto& point : points) {
            if (range.contains(point)) {
                expected++;
            }
        }
        REQUIRE(found.size() == expected);
        for (auto& entry : found) {
            REQUIRE(range.contains(entry.first));
        }
    }

    SECTION("Radius queries agree with a scan") {
        Point center(500.0, 500.0);
        auto found = tree.query_radius(center, 150.0);
        size_t expected = 0;
        for (auto& point : points) {
            if (point.dist(center) <= 150.0) {
                expected++;
            }
        }
        REQUIRE(found.size() == expected);
    }

    SECTION("The tree stays shallow") {
        // log4(2000) is about 5.5, and random points don't pile up much
        REQUIRE(tree.depth() <= 10);
    }

    SECTION("Nearest agrees with a scan") {
        Point target(333.0, 777.0);
        size_t best = 0;
        for (size_t i = 1; i < points.size(); i++) {
            if (points[i].dist(target) < points[best].dist(target)) {
                best = i;
            }
        }
        Point found;
        const size_t* value;
        REQUIRE(tree.nearest(target, found, value));
        REQUIRE(found.dist(target) == points[best].dist(target));
    }
}

TEST_CASE("QuadTree copes with piles of identical points", "[quadtree]") {
    QuadTree<int> tree(Rect(Point(0.0, 0.0), Point(1.0, 1.0)));
    for (int i = 0; i < 50; i++) {
        REQUIRE(tree.insert(Point(0.25, 0.25), i));
    }
    REQUIRE(tree.size() == 50);
    REQUIRE(tree.depth() <= QuadTree<int>::MAX_DEPTH + 1);
    REQUIRE(tree.query_range(Rect(Point(0.2, 0.2), Point(0.3, 0.3))).size() == 50);

    SECTION("An empty tree has nothing nearest") {
        QuadTree<int> empty(Rect(Point(0.0, 0.0), Point(1.0, 1.0)));
        Point found;
        const int* value;
        REQUIRE(!empty.nearest(Point(0.5, 0.5), found, value));
        REQUIRE(!empty.delete_nearest(Point(0.5, 0.5)));
        REQUIRE(empty.begin() == empty.end());
    }
}

}
}
