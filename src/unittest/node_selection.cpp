/// \file unittest/node_selection.cpp
///
/// Unit tests for NodeSelection.
///

#include <iostream>
#include <vector>
#include <stdexcept>

#include "../node_selection.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("NodeSelection supports set operations", "[selection]") {

    NodeSelection a(vector<nid_t>{1, 2, 3});
    NodeSelection b(vector<nid_t>{3, 4});
    NodeSelection c(vector<nid_t>{5});
    NodeSelection none;

    SECTION("Union is commutative and associative with the empty selection as identity") {
        REQUIRE(a.set_union(b) == b.set_union(a));
        REQUIRE(a.set_union(b).set_union(c) == a.set_union(b.set_union(c)));
        REQUIRE(a.set_union(none) == a);
        REQUIRE(none.set_union(a) == a);
        REQUIRE(a.set_union(b).size() == 4);
    }

    SECTION("Intersection keeps shared nodes") {
        auto shared = a.set_intersection(b);
        REQUIRE(shared.size() == 1);
        REQUIRE(shared.contains(3));
        REQUIRE(a.set_intersection(none).empty());
    }

    SECTION("Difference undoes a union with a disjoint selection") {
        REQUIRE(a.set_union(c).set_difference(c) == a);
        auto left = a.set_difference(b);
        REQUIRE(left == NodeSelection(vector<nid_t>{1, 2}));
        REQUIRE(a.size() == 3);
    }
}

TEST_CASE("NodeSelection can be edited in place", "[selection]") {

    NodeSelection selection;
    REQUIRE(selection.empty());

    selection.add_one(4, false);
    selection.add_slice({5, 6}, false);
    REQUIRE(selection.size() == 3);

    SECTION("Adding with clear replaces the selection") {
        selection.add_one(9, true);
        REQUIRE(selection == NodeSelection(vector<nid_t>{9}));
        selection.add_slice({1, 2}, true);
        REQUIRE(selection == NodeSelection(vector<nid_t>{1, 2}));
    }

    SECTION("Removing takes nodes out") {
        selection.remove_one(5, false);
        REQUIRE(!selection.contains(5));
        REQUIRE(selection.size() == 2);
        selection.remove_slice({4, 6, 7}, false);
        REQUIRE(selection.empty());
    }

    SECTION("Removing with clear empties the selection") {
        selection.remove_one(5, true);
        REQUIRE(selection.empty());
    }

    SECTION("Adding a node twice keeps one copy") {
        selection.add_one(4, false);
        REQUIRE(selection.size() == 3);
        REQUIRE(selection.nodes().count(4) == 1);
    }

    SECTION("Clearing empties the selection") {
        selection.clear();
        REQUIRE(selection.empty());
        REQUIRE(selection != NodeSelection(vector<nid_t>{4}));
    }
}

TEST_CASE("NodeSelection knows where its nodes are", "[selection]") {

    vector<Node> layout {
        Node(Point(0.0, 0.0), Point(10.0, 0.0)),
        Node(Point(10.0, 0.0), Point(10.0, 5.0)),
        Node(Point(-3.0, 8.0), Point(2.0, 7.0))
    };

    NodeSelection selection(vector<nid_t>{2, 3});
    REQUIRE(selection.bounding_box(layout) == Rect(Point(-3.0, 0.0), Point(10.0, 8.0)));

    REQUIRE(NodeSelection().bounding_box(layout) == Rect());

    selection.add_one(4, false);
    REQUIRE_THROWS_AS(selection.bounding_box(layout), out_of_range);
}

}
}
