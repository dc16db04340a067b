/// \file unittest/path_position_index.cpp
///
/// Unit tests for the PathPositionIndex, which finds steps by base offset.
///

#include <iostream>
#include <string>
#include <vector>

#include "../path_position_index.hpp"
#include "test_graphs.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("PathPositionIndex gives every step its base offset", "[pathpos]") {

    auto graph = make_chain_graph();
    PathPositionIndex index(*graph);
    path_handle_t path = graph->get_path_handle("P");

    REQUIRE(index.has_path(path));
    REQUIRE(index.path_count() == 1);
    REQUIRE(index.path_base_len(path) == 150);

    auto& steps = index.path_steps(path);
    REQUIRE(steps.size() == 5);

    SECTION("Offsets are cumulative node lengths") {
        vector<size_t> expected {0, 10, 30, 60, 100};
        for (size_t i = 0; i < steps.size(); i++) {
            REQUIRE(steps[i].offset == expected[i]);
            REQUIRE(graph->get_id(steps[i].handle) == i + 1);
        }
    }

    SECTION("Consecutive steps are one node length apart") {
        for (size_t i = 0; i + 1 < steps.size(); i++) {
            REQUIRE(steps[i + 1].offset - steps[i].offset == graph->get_length(steps[i].handle));
        }
    }

    SECTION("Steps can be looked up for their positions and ranks") {
        size_t rank = 0;
        size_t position = 0;
        REQUIRE(index.path_step_rank(path, steps[3].step, rank));
        REQUIRE(rank == 3);
        REQUIRE(index.path_step_position(path, steps[3].step, position));
        REQUIRE(position == 60);
    }

    SECTION("Bases find the step that contains them") {
        size_t rank = 100;
        REQUIRE(index.find_rank_at_base(path, 0, rank));
        REQUIRE(rank == 0);
        REQUIRE(index.find_rank_at_base(path, 9, rank));
        REQUIRE(rank == 0);
        REQUIRE(index.find_rank_at_base(path, 10, rank));
        REQUIRE(rank == 1);
        REQUIRE(index.find_rank_at_base(path, 149, rank));
        REQUIRE(rank == 4);

        step_handle_t step;
        REQUIRE(index.find_step_at_base(path, 75, step));
        REQUIRE(graph->get_id(graph->get_handle_of_step(step)) == 4);
    }

    SECTION("Bases past the end are not found") {
        size_t rank = 100;
        REQUIRE(!index.find_rank_at_base(path, 150, rank));
        REQUIRE(rank == 100);
    }

    SECTION("Nodes know where they are on paths in either orientation") {
        auto forward = index.handle_positions(graph->get_handle(3));
        auto reverse = index.handle_positions(graph->get_handle(3, true));
        REQUIRE(forward.size() == 1);
        REQUIRE(reverse.size() == 1);
        REQUIRE(forward[0].path == path);
        REQUIRE(forward[0].offset == 30);
        REQUIRE(reverse[0].offset == 30);
    }
}

TEST_CASE("PathPositionIndex handles several paths and revisits", "[pathpos]") {

    auto graph = make_chain_graph();
    auto second = graph->create_path_handle("Q");
    graph->append_step(second, graph->get_handle(5, true));
    graph->append_step(second, graph->get_handle(4, true));
    graph->append_step(second, graph->get_handle(5));
    auto empty = graph->create_path_handle("empty");

    PathPositionIndex index(*graph);

    REQUIRE(index.path_count() == 3);

    SECTION("Each path has its own offsets") {
        auto& steps = index.path_steps(second);
        REQUIRE(steps.size() == 3);
        REQUIRE(steps[0].offset == 0);
        REQUIRE(steps[1].offset == 50);
        REQUIRE(steps[2].offset == 90);
        REQUIRE(index.path_base_len(second) == 140);
        REQUIRE(graph->get_is_reverse(steps[0].handle));
    }

    SECTION("A node visited more than once has all its occurrences") {
        auto occurrences = index.handle_positions(graph->get_handle(5));
        REQUIRE(occurrences.size() == 3);
        size_t on_second = 0;
        for (auto& occurrence : occurrences) {
            if (occurrence.path == second) {
                on_second++;
            }
        }
        REQUIRE(on_second == 2);
    }

    SECTION("Empty paths have no steps and no bases") {
        REQUIRE(index.has_path(empty));
        REQUIRE(index.path_steps(empty).empty());
        size_t rank;
        REQUIRE(!index.find_rank_at_base(empty, 0, rank));
    }

    SECTION("Every path is visited") {
        size_t visited = 0;
        index.for_each_path([&](const path_handle_t& path) {
            visited++;
        });
        REQUIRE(visited == 3);
    }
}

}
}
