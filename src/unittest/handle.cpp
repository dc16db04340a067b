/// \file unittest/handle.cpp
///
/// Unit tests for the handle graph helpers.
///

#include <iostream>
#include <string>
#include <set>

#include "../handle.hpp"
#include "../hash_map.hpp"
#include "test_graphs.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("Node helpers report on nodes in the graph", "[handle]") {

    auto graph = make_chain_graph();

    SECTION("Node lengths and sequences are available by ID") {
        REQUIRE(node_len(*graph, 1) == 10);
        REQUIRE(node_len(*graph, 5) == 50);
        REQUIRE(node_sequence(*graph, 2) == string(20, 'C'));
    }

    SECTION("Degrees count edges on each side") {
        REQUIRE(node_degree(*graph, 3, true) == 2);
        REQUIRE(node_degree(*graph, 3, false) == 1);
        REQUIRE(node_degree(*graph, 1, true) == 0);
        REQUIRE(node_degree(*graph, 1, false) == 2);
    }

    SECTION("Missing nodes read as empty") {
        REQUIRE(node_len(*graph, 6) == 0);
        REQUIRE(node_sequence(*graph, 6).empty());
        REQUIRE(node_degree(*graph, 6, false) == 0);
    }

    SECTION("Coverage counts path steps in either orientation") {
        auto path = graph->get_path_handle("P");
        graph->append_step(path, graph->get_handle(3, true));
        REQUIRE(node_coverage(*graph, graph->get_handle(3)) == 2);
        REQUIRE(node_coverage(*graph, graph->get_handle(3, true)) == 2);
        REQUIRE(node_coverage(*graph, graph->get_handle(2)) == 1);
    }

    SECTION("Node indexes are IDs shifted down by one") {
        REQUIRE(node_index(1) == 0);
        REQUIRE(index_node(4) == 5);
    }
}

TEST_CASE("Path helpers walk paths", "[handle]") {

    auto graph = make_chain_graph();

    path_handle_t path;
    REQUIRE(find_path(*graph, "P", path));
    REQUIRE(graph->get_path_name(path) == "P");

    SECTION("Missing paths aren't found") {
        path_handle_t other = path;
        REQUIRE(!find_path(*graph, "Q", other));
        REQUIRE(other == path);
    }

    SECTION("All steps come back in order") {
        auto steps = path_steps(*graph, path);
        REQUIRE(steps.size() == 5);
        for (size_t i = 0; i < steps.size(); i++) {
            REQUIRE(graph->get_id(steps[i].second) == i + 1);
            REQUIRE(graph->get_handle_of_step(steps[i].first) == steps[i].second);
        }
    }

    SECTION("Step ranges are inclusive and clamped") {
        auto steps = path_steps_range(*graph, path, 1, 3);
        REQUIRE(steps.size() == 3);
        REQUIRE(graph->get_id(steps.front().second) == 2);
        REQUIRE(graph->get_id(steps.back().second) == 4);

        REQUIRE(path_steps_range(*graph, path, 3, 100).size() == 2);
        REQUIRE(path_steps_range(*graph, path, 5, 8).empty());
        REQUIRE(path_steps_range(*graph, path, 3, 2).empty());
    }

    SECTION("Steps on a handle know their paths") {
        auto found = steps_on_handle(*graph, graph->get_handle(4));
        REQUIRE(found.size() == 1);
        REQUIRE(found[0].first == path);
        REQUIRE(graph->get_id(graph->get_handle_of_step(found[0].second)) == 4);
    }
}

TEST_CASE("Hash maps can be keyed by graph handles", "[handle][hash]") {

    auto graph = make_chain_graph();

    SECTION("Consecutive IDs hash apart") {
        set<size_t> hashes;
        for (size_t i = 0; i < 100; i++) {
            hashes.insert(wang_hash_64(i));
        }
        REQUIRE(hashes.size() == 100);
        REQUIRE(wang_hash<nid_t>()(7) == wang_hash_64(7));
    }

    SECTION("Handles and steps find their values again") {
        hash_map<handle_t, size_t> lengths;
        hash_map<step_handle_t, nid_t> step_nodes;
        graph->for_each_handle([&](const handle_t& handle) {
            lengths[handle] = graph->get_length(handle);
        });
        path_handle_t path = graph->get_path_handle("P");
        graph->for_each_step_in_path(path, [&](const step_handle_t& step) {
            step_nodes[step] = graph->get_id(graph->get_handle_of_step(step));
        });

        REQUIRE(lengths.size() == 5);
        REQUIRE(lengths[graph->get_handle(3)] == 30);
        REQUIRE(step_nodes.size() == 5);
        REQUIRE(step_nodes[graph->path_begin(path)] == 1);
        REQUIRE(lengths.count(graph->get_handle(3, true)) == 0);
    }
}

}
}
