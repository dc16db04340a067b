/// \file unittest/overlays.cpp
///
/// Unit tests for overlays and the geometry they are drawn with.
///

#include <iostream>
#include <sstream>
#include <vector>

#include "../overlays.hpp"
#include "../geometry.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("Hashes become colors", "[overlays]") {

    SECTION("Channels are scaled so the brightest is full") {
        RGBA color = hash_node_color(0x0000000200010004ull);
        REQUIRE(color == RGBA(0.5, 0.25, 1.0));
    }

    SECTION("Bits past the low 48 don't matter") {
        REQUIRE(hash_node_color(0xFFFF000100010001ull) == hash_node_color(0x0000000100010001ull));
        REQUIRE(hash_node_color(0x0000000100010001ull) == RGBA(1.0, 1.0, 1.0));
    }

    SECTION("A hash with no bits in the windows is black") {
        REQUIRE(hash_node_color(0) == RGBA(0.0, 0.0, 0.0, 1.0));
        REQUIRE(hash_node_color(0xABCD000000000000ull) == RGBA(0.0, 0.0, 0.0, 1.0));
    }

    SECTION("Colors are always opaque") {
        for (uint64_t hash : {1ull, 12345678ull, 0xDEADBEEFCAFEull}) {
            RGBA color = hash_node_color(hash);
            REQUIRE(color.a == 1.0);
            REQUIRE(max(color.r, max(color.g, color.b)) == 1.0);
        }
    }
}

TEST_CASE("Overlays hold colors or values", "[overlays]") {

    OverlayData colors(vector<RGBA>{RGBA(1.0, 0.0, 0.0), RGBA(0.0, 1.0, 0.0)});
    REQUIRE(colors.kind() == OverlayData::RGB);
    REQUIRE(colors.size() == 2);
    REQUIRE(colors.values().empty());

    OverlayData values(vector<float>{0.5, 1.5, 2.5});
    REQUIRE(values.kind() == OverlayData::Value);
    REQUIRE(values.size() == 3);
    REQUIRE(values.values()[2] == 2.5);
    REQUIRE(values.colors().empty());

    stringstream text;
    text << RGBA(1.0, 0.5, 0.0, 1.0);
    REQUIRE(!text.str().empty());
}

TEST_CASE("Rectangles contain their min edges but not their max edges", "[geometry]") {

    Rect rect(Point(1.0, 1.0), Point(0.0, 0.0));
    REQUIRE(rect.min() == Point(0.0, 0.0));
    REQUIRE(rect.max() == Point(1.0, 1.0));

    REQUIRE(rect.contains(Point(0.0, 0.0)));
    REQUIRE(rect.contains(Point(0.5, 0.999)));
    REQUIRE(!rect.contains(Point(1.0, 0.5)));
    REQUIRE(!rect.contains(Point(0.5, 1.0)));

    SECTION("Intersection tests include edges") {
        REQUIRE(rect.intersects(Rect(Point(1.0, 1.0), Point(2.0, 2.0))));
        REQUIRE(!rect.intersects(Rect(Point(1.1, 1.0), Point(2.0, 2.0))));
    }

    SECTION("Unions and intersections") {
        Rect other(Point(0.5, -1.0), Point(3.0, 0.5));
        REQUIRE(rect.rect_union(other) == Rect(Point(0.0, -1.0), Point(3.0, 1.0)));
        REQUIRE(rect.intersection(other) == Rect(Point(0.5, 0.0), Point(1.0, 0.5)));
        REQUIRE(Rect::nowhere().rect_union(rect) == rect);
        REQUIRE(Rect::everywhere().contains(Point(-1e30, 1e30)));
    }

    SECTION("Resizing keeps the center") {
        Rect bigger = rect.resize(2.0);
        REQUIRE(bigger.center() == rect.center());
        REQUIRE(bigger.width() == 2.0);
    }
}

TEST_CASE("Views map between the world and the screen", "[geometry]") {

    ViewTransform view(Point(100.0, 50.0), 2.0, Point(800.0, 600.0));

    REQUIRE(view.to_screen(Point(100.0, 50.0)) == Point(400.0, 300.0));
    REQUIRE(view.to_screen(Point(102.0, 46.0)) == Point(401.0, 298.0));
    REQUIRE(view.to_world(Point(401.0, 298.0)) == Point(102.0, 46.0));
    REQUIRE(view.visible_world() == Rect(Point(-700.0, -550.0), Point(900.0, 650.0)));

    SECTION("Perpendiculars are normalized") {
        Point offset = Point(0.0, 5.0).perpendicular().normalized();
        REQUIRE(offset.length() == Approx(1.0));
        REQUIRE(offset.y == Approx(0.0));
        REQUIRE(Point::zero().normalized() == Point::zero());
    }
}

TEST_CASE("Layouts can be read from TSV", "[geometry]") {

    stringstream in("idx\tX\tY\tcomponent\n"
                    "0\t0.0\t0.0\t0\n"
                    "1\t10.0\t0.0\t0\n"
                    "\n"
                    "3\t10.0\t5.0\t0\n"
                    "2\t10.0\t0.0\t0\n");

    auto nodes = read_layout_tsv(in, 3);
    REQUIRE(nodes.size() == 3);
    REQUIRE(nodes[0].p1 == Point(10.0, 0.0));
    REQUIRE(nodes[1].p0 == Point(10.0, 0.0));
    REQUIRE(nodes[1].center() == Point(10.0, 2.5));
    REQUIRE(nodes[2].p0 == Point::zero());

    SECTION("Bad lines are errors") {
        stringstream bad("idx\tX\tY\n0\tzero\t0\n");
        REQUIRE_THROWS_AS(read_layout_tsv(bad, 3), runtime_error);
        stringstream too_far("idx\tX\tY\n6\t0\t0\n");
        REQUIRE_THROWS_AS(read_layout_tsv(too_far, 3), runtime_error);
    }
}

}
}
