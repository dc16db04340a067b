/// \file unittest/graph_query.cpp
///
/// Unit tests for the GraphQuery service and GraphQueryWorker.
///

#include <iostream>
#include <string>
#include <vector>
#include <thread>
#include <atomic>

#include "../graph_query.hpp"
#include "test_graphs.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

/// Get the node IDs of some steps
static vector<nid_t> step_ids(const PathHandleGraph& graph, const vector<StepPosition>& steps) {
    vector<nid_t> ids;
    for (auto& step : steps) {
        ids.push_back(graph.get_id(step.handle));
    }
    return ids;
}

TEST_CASE("GraphQuery answers requests on its request thread", "[graphquery]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph();
    GraphQuery query(graph);
    path_handle_t path = graph->get_path_handle("P");

    SECTION("Graph stats describe the whole graph") {
        GraphQueryResponse response = query.query_request_blocking(GraphQueryRequest::graph_stats());
        REQUIRE(response.kind == GraphQueryKind::GraphStats);
        REQUIRE(response.node_count == 5);
        REQUIRE(response.edge_count == 5);
        REQUIRE(response.path_count == 1);
        REQUIRE(response.total_len == 150);
    }

    SECTION("Node stats describe one node") {
        GraphQueryResponse response = query.query_request_blocking(GraphQueryRequest::node_stats(3));
        REQUIRE(response.kind == GraphQueryKind::NodeStats);
        REQUIRE(response.found);
        REQUIRE(response.node_id == 3);
        REQUIRE(response.len == 30);
        REQUIRE(response.degree_left == 2);
        REQUIRE(response.degree_right == 1);
        REQUIRE(response.coverage == 1);
    }

    SECTION("Missing nodes are not found") {
        GraphQueryResponse response = query.query_request_blocking(GraphQueryRequest::node_stats(42));
        REQUIRE(!response.found);
        REQUIRE(response.node_id == 42);
        REQUIRE(response.len == 0);
    }

    SECTION("Path stats describe one path") {
        GraphQueryResponse response = query.query_request_blocking(GraphQueryRequest::path_stats(path));
        REQUIRE(response.found);
        REQUIRE(response.path_name == "P");
        REQUIRE(response.step_count == 5);
        REQUIRE(response.base_len == 150);
    }

    SECTION("Node sequences come back forward") {
        GraphQueryResponse response = query.query_request_blocking(GraphQueryRequest::node_seq(2));
        REQUIRE(response.found);
        REQUIRE(response.sequence == string(20, 'C'));
    }

    SECTION("Answers match whether or not they go through the thread") {
        GraphQueryResponse threaded = query.query_request_blocking(GraphQueryRequest::node_stats(1));
        GraphQueryResponse direct = query.answer(GraphQueryRequest::node_stats(1));
        REQUIRE(threaded.len == direct.len);
        REQUIRE(threaded.degree_left == direct.degree_left);
        REQUIRE(threaded.degree_right == direct.degree_right);
        REQUIRE(direct.degree_right == 2);
    }

    SECTION("Requests from many threads all get their own answers") {
        vector<thread> askers;
        vector<size_t> lengths(5, 0);
        for (size_t i = 0; i < 5; i++) {
            askers.emplace_back([&, i]() {
                lengths[i] = query.query_request_blocking(GraphQueryRequest::node_stats(i + 1)).len;
            });
        }
        for (auto& asker : askers) {
            asker.join();
        }
        for (size_t i = 0; i < 5; i++) {
            REQUIRE(lengths[i] == (i + 1) * 10);
        }
    }
}

TEST_CASE("GraphQuery can pull out ranges of a path", "[graphquery]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph();
    GraphQuery query(graph);
    path_handle_t path = graph->get_path_handle("P");

    SECTION("Steps come with their offsets") {
        auto& steps = query.path_pos_steps(path);
        REQUIRE(steps.size() == 5);
        REQUIRE(steps[3].offset == 60);
    }

    SECTION("Rank ranges are inclusive and clamped") {
        REQUIRE(step_ids(*graph, query.path_range(path, 1, 3)) == vector<nid_t>{2, 3, 4});
        REQUIRE(step_ids(*graph, query.path_range(path, 3, 100)) == vector<nid_t>{4, 5});
        REQUIRE(query.path_range(path, 5, 6).empty());
        REQUIRE(query.path_range(path, 3, 2).empty());
    }

    SECTION("Base ranges take every step they touch") {
        REQUIRE(step_ids(*graph, query.path_basepair_range(path, 15, 65)) == vector<nid_t>{2, 3, 4});
        REQUIRE(step_ids(*graph, query.path_basepair_range(path, 0, 10)) == vector<nid_t>{1});
        REQUIRE(step_ids(*graph, query.path_basepair_range(path, 10, 11)) == vector<nid_t>{2});
        REQUIRE(step_ids(*graph, query.path_basepair_range(path, 120, 500)) == vector<nid_t>{5});
        REQUIRE(query.path_basepair_range(path, 150, 200).empty());
    }
}

TEST_CASE("GraphQuery builds overlays in node ID order", "[graphquery][overlays]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph();
    GraphQuery query(graph);

    vector<float> lengths = query.build_overlay_values([](const PathHandleGraph& g, const handle_t& handle) {
        return (float) g.get_length(handle);
    });
    REQUIRE(lengths == vector<float>{10, 20, 30, 40, 50});

    vector<RGBA> colors = query.build_overlay_colors([](const PathHandleGraph& g, const handle_t& handle) {
        return g.get_id(handle) % 2 == 0 ? RGBA(1.0, 0.0, 0.0) : RGBA(0.0, 0.0, 1.0);
    });
    REQUIRE(colors.size() == 5);
    REQUIRE(colors[0] == RGBA(0.0, 0.0, 1.0));
    REQUIRE(colors[1] == RGBA(1.0, 0.0, 0.0));
}

TEST_CASE("GraphQueryWorker runs queries on its pool", "[graphquery][async]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph();
    auto query = make_shared<GraphQuery>(graph);
    GraphQueryWorker worker(query, 2);
    REQUIRE(worker.graph_query() == query);

    path_handle_t path = graph->get_path_handle("P");
    auto result = worker.run_query([path](shared_ptr<const GraphQuery> q) {
        return q->path_basepair_range(path, 30, 60).size();
    });

    unique_ptr<size_t> taken;
    while (!taken) {
        taken = result.take_result_if_ready();
        this_thread::yield();
    }
    REQUIRE(*taken == 1);
    REQUIRE(result.take_result_if_ready() == nullptr);
}

}
}
