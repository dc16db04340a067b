/// \file unittest/annotation_projection.cpp
///
/// Unit tests for putting annotation records onto a graph through a path.
///

#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <functional>

#include "../annotation_projection.hpp"
#include "../gff_reader.hpp"
#include "test_graphs.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

/// Parse GFF3 records from a string
static Gff3Records parse_gff(const string& text) {
    stringstream in(text);
    return Gff3Records::parse(in, "test.gff3");
}

/// Lay the chain graph's nodes out left to right, 100 units apart, each 50
/// units long.
static vector<Node> chain_layout() {
    vector<Node> nodes;
    for (size_t i = 0; i < 5; i++) {
        nodes.emplace_back(Point(i * 100.0, 0.0), Point(i * 100.0 + 50.0, 0.0));
    }
    return nodes;
}

TEST_CASE("Step ranges cover the steps overlapping an interval", "[projection]") {

    auto graph = make_chain_graph();
    PathPositionIndex index(*graph);
    auto& steps = index.path_steps(graph->get_path_handle("P"));

    // Steps start at 0, 10, 30, 60 and 100, and the path is 150 bases.

    SECTION("Intervals take every step they touch") {
        REQUIRE(find_step_range(steps, 150, 15, 70) == make_pair<size_t, size_t>(1, 4));
        REQUIRE(find_step_range(steps, 150, 0, 150) == make_pair<size_t, size_t>(0, 5));
        REQUIRE(find_step_range(steps, 150, 10, 30) == make_pair<size_t, size_t>(1, 2));
        REQUIRE(find_step_range(steps, 150, 9, 11) == make_pair<size_t, size_t>(0, 2));
    }

    SECTION("Intervals within one step give that step") {
        REQUIRE(find_step_range(steps, 150, 31, 32) == make_pair<size_t, size_t>(2, 3));
        REQUIRE(find_step_range(steps, 150, 149, 150) == make_pair<size_t, size_t>(4, 5));
    }

    SECTION("Intervals running off the end stop at the last step") {
        REQUIRE(find_step_range(steps, 150, 120, 1000) == make_pair<size_t, size_t>(4, 5));
    }

    SECTION("Empty intervals and intervals past the end give nothing") {
        auto range = find_step_range(steps, 150, 40, 40);
        REQUIRE(range.first == range.second);
        range = find_step_range(steps, 150, 50, 20);
        REQUIRE(range.first == range.second);
        range = find_step_range(steps, 150, 150, 160);
        REQUIRE(range.first == range.second);
        range = find_step_range(vector<StepPosition>(), 0, 0, 10);
        REQUIRE(range.first == range.second);
    }
}

TEST_CASE("Records project onto the nodes of a path", "[projection][annotations]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph();
    shared_ptr<const GraphQuery> query = make_shared<GraphQuery>(graph);
    AnnotationProjector projector(query, graph->get_path_handle("P"));
    REQUIRE(projector.coord_offset() == 0);

    auto records = parse_gff("P\tsrc\tgene\t16\t70\t.\t+\t.\tID=g1;Name=alpha\n"
                             "P\tsrc\texon\t1\t5\t2.5\t+\t.\tID=e1;Name=beta\n"
                             "P\tsrc\texon\t200\t300\t1\t+\t.\tID=e2;Name=gamma\n");
    REQUIRE(records.size() == 3);

    SECTION("A record covers every node it overlaps") {
        REQUIRE(projector.record_nodes(records.records()[0]) == vector<nid_t>{2, 3, 4});
        REQUIRE(projector.record_nodes(records.records()[1]) == vector<nid_t>{1});
    }

    SECTION("Records past the end of the path cover nothing") {
        REQUIRE(projector.record_nodes(records.records()[2]).empty());
    }

    SECTION("Labels go on the first node of each record") {
        LabelSet labels = projector.record_labels(records, {0, 1, 2}, Gff3Column("Name"));
        REQUIRE(labels.size() == 2);
        REQUIRE(labels[2] == vector<string>{"alpha"});
        REQUIRE(labels[1] == vector<string>{"beta"});
    }

    SECTION("Records without the labelling column get no label") {
        LabelSet labels = projector.record_labels(records, {0, 1}, Gff3Column("gene_name"));
        REQUIRE(labels.empty());
    }

    SECTION("Color overlays paint record nodes by the column hash") {
        RGBA background(0.5, 0.5, 0.5);
        OverlayData overlay = projector.record_overlay(records, {0}, Gff3Column("ID"), background);
        REQUIRE(overlay.kind() == OverlayData::RGB);
        REQUIRE(overlay.size() == 5);

        RGBA expected;
        REQUIRE(column_hash_color(records.records()[0], Gff3Column("ID"), expected));
        REQUIRE(overlay.colors()[0] == background);
        REQUIRE(overlay.colors()[1] == expected);
        REQUIRE(overlay.colors()[2] == expected);
        REQUIRE(overlay.colors()[3] == expected);
        REQUIRE(overlay.colors()[4] == background);
    }

    SECTION("Score overlays give record nodes the record score") {
        OverlayData overlay = projector.record_score_overlay(records, {0, 1}, 0.0);
        REQUIRE(overlay.kind() == OverlayData::Value);
        REQUIRE(overlay.values() == vector<float>{2.5, 0.0, 0.0, 0.0, 0.0});
    }
}

TEST_CASE("Records on a path with a coordinate range are shifted onto it", "[projection][annotations]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph("P#chr1:100-250");
    shared_ptr<const GraphQuery> query = make_shared<GraphQuery>(graph);
    AnnotationProjector projector(query, graph->get_path_handle("P#chr1:100-250"));
    REQUIRE(projector.coord_offset() == 100);

    auto records = parse_gff("chr1\tsrc\tgene\t111\t140\t.\t+\t.\tID=g1\n"
                             "chr1\tsrc\tgene\t111\t130\t.\t+\t.\tID=g2\n"
                             "chr1\tsrc\tgene\t50\t105\t.\t+\t.\tID=g3\n");

    REQUIRE(projector.record_nodes(records.records()[0]) == vector<nid_t>{2, 3});
    REQUIRE(projector.record_nodes(records.records()[1]) == vector<nid_t>{2});
    // Coordinates before the range clamp to its start
    REQUIRE(projector.record_nodes(records.records()[2]) == vector<nid_t>{1});
}

TEST_CASE("Records on other sequences stay off a path with a coordinate range", "[projection][annotations]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph("P#chr1:100-250");
    shared_ptr<const GraphQuery> query = make_shared<GraphQuery>(graph);
    AnnotationProjector projector(query, graph->get_path_handle("P#chr1:100-250"));
    REQUIRE(projector.on_path_sequence("chr1"));
    REQUIRE(!projector.on_path_sequence("chr2"));

    auto records = parse_gff("chr1\tsrc\tgene\t111\t140\t3\t+\t.\tID=g1;Name=here\n"
                             "chr2\tsrc\tgene\t111\t140\t7\t+\t.\tID=g2;Name=elsewhere\n");

    REQUIRE(projector.record_nodes(records.records()[0]) == vector<nid_t>{2, 3});
    REQUIRE(projector.record_nodes(records.records()[1]).empty());

    LabelSet labels = projector.record_labels(records, {0, 1}, Gff3Column("Name"));
    REQUIRE(labels.size() == 1);
    REQUIRE(labels[2] == vector<string>{"here"});

    OverlayData scores = projector.record_score_overlay(records, {0, 1}, 0.0);
    REQUIRE(scores.values() == vector<float>{0.0, 3.0, 3.0, 0.0, 0.0});

    RGBA background(0.5, 0.5, 0.5);
    OverlayData colors = projector.record_overlay(records, {1}, Gff3Column("ID"), background);
    for (auto& color : colors.colors()) {
        REQUIRE(color == background);
    }
}

TEST_CASE("Path sequence names can carry a haplotype", "[projection][annotations]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph("HG002#1#chr1:100-250");
    shared_ptr<const GraphQuery> query = make_shared<GraphQuery>(graph);
    AnnotationProjector projector(query, graph->get_path_handle("HG002#1#chr1:100-250"));
    REQUIRE(projector.coord_offset() == 100);
    REQUIRE(projector.on_path_sequence("chr1"));
    REQUIRE(projector.on_path_sequence("1#chr1"));
    REQUIRE(!projector.on_path_sequence("hr1"));
    REQUIRE(!projector.on_path_sequence("chr2"));
}

TEST_CASE("Paths without a coordinate range take records on any sequence", "[projection][annotations]") {

    shared_ptr<const PathHandleGraph> graph = make_chain_graph();
    shared_ptr<const GraphQuery> query = make_shared<GraphQuery>(graph);
    AnnotationProjector projector(query, graph->get_path_handle("P"));
    REQUIRE(projector.on_path_sequence("P"));
    REQUIRE(projector.on_path_sequence("chr9"));
}

TEST_CASE("Record colors hash the column values", "[projection][overlays]") {

    auto records = parse_gff("P\tsrc\tgene\t1\t10\t.\t+\t.\tID=g1;Name=alpha\n"
                             "P\tsrc\tgene\t1\t10\t.\t+\t.\tID=g2;Name=alpha\n"
                             "P\tsrc\tgene\t1\t10\t.\t+\t.\tID=g3;Name=beta;Name=delta\n");

    RGBA color;
    REQUIRE(column_hash_color(records.records()[0], Gff3Column("Name"), color));
    REQUIRE(color == hash_node_color(std::hash<string>()("alpha")));

    RGBA other;
    REQUIRE(column_hash_color(records.records()[1], Gff3Column("Name"), other));
    REQUIRE(other == color);

    REQUIRE(column_hash_color(records.records()[2], Gff3Column("Name"), other));
    REQUIRE(other == hash_node_color(std::hash<string>()("beta;delta")));

    REQUIRE(!column_hash_color(records.records()[0], Gff3Column("gene_name"), other));
}

TEST_CASE("Nearby labels are clustered along the path", "[projection][labels]") {

    auto graph = make_chain_graph();
    PathPositionIndex index(*graph);
    auto& steps = index.path_steps(graph->get_path_handle("P"));
    auto range = make_pair<size_t, size_t>(0, steps.size());
    vector<Node> nodes = chain_layout();

    // Screen coordinates equal world coordinates
    ViewTransform view(Point(0.0, 0.0), 1.0, Point(0.0, 0.0));

    LabelSet labels;
    labels[1] = {"one"};
    labels[2] = {"two"};
    labels[4] = {"four", "vier"};

    SECTION("Labels within the radius share a cluster") {
        auto clusters = cluster_labels(*graph, steps, range, labels, nodes, view, 150.0);
        REQUIRE(clusters.size() == 2);
        REQUIRE(clusters.count(1));
        REQUIRE(clusters[1].labels == vector<string>{"one", "two"});
        REQUIRE(clusters[1].offset.x == Approx(0.0));
        REQUIRE(clusters[1].offset.y == Approx(1.0));
        REQUIRE(clusters.count(4));
        REQUIRE(clusters[4].labels == vector<string>{"four", "vier"});
    }

    SECTION("Labels right at the radius join the cluster") {
        auto clusters = cluster_labels(*graph, steps, range, labels, nodes, view, 100.0);
        REQUIRE(clusters.size() == 2);
        REQUIRE(clusters[1].labels.size() == 2);
    }

    SECTION("Labels on top of each other make one cluster even with no radius") {
        nodes[1] = nodes[0];
        auto clusters = cluster_labels(*graph, steps, range, labels, nodes, view, 0.0);
        REQUIRE(clusters.size() == 2);
        REQUIRE(clusters[1].labels == vector<string>{"one", "two"});
        REQUIRE(clusters[4].labels == vector<string>{"four", "vier"});
    }

    SECTION("Labels past the radius stay apart") {
        auto clusters = cluster_labels(*graph, steps, range, labels, nodes, view, 99.0);
        REQUIRE(clusters.size() == 3);
        REQUIRE(clusters[2].labels == vector<string>{"two"});
    }

    SECTION("Clusters go to the middle of their run of steps") {
        labels[3] = {"three"};
        auto clusters = cluster_labels(*graph, steps, range, labels, nodes, view, 250.0);
        REQUIRE(clusters.size() == 2);
        REQUIRE(clusters.count(2));
        REQUIRE(clusters[2].labels == vector<string>{"one", "two", "three"});
        REQUIRE(clusters[4].labels == vector<string>{"four", "vier"});
    }

    SECTION("Zooming out pulls labels together") {
        ViewTransform zoomed(Point(0.0, 0.0), 4.0, Point(0.0, 0.0));
        auto clusters = cluster_labels(*graph, steps, range, labels, nodes, zoomed, 80.0);
        REQUIRE(clusters.size() == 1);
        REQUIRE(clusters.begin()->second.labels.size() == 4);
    }

    SECTION("Only steps in the range are looked at") {
        auto clusters = cluster_labels(*graph, steps, make_pair<size_t, size_t>(1, 3), labels, nodes, view, 150.0);
        REQUIRE(clusters.size() == 1);
        REQUIRE(clusters[2].labels == vector<string>{"two"});
    }

    SECTION("Labelled nodes need positions") {
        vector<Node> too_few(nodes.begin(), nodes.begin() + 2);
        REQUIRE_THROWS_AS(cluster_labels(*graph, steps, range, labels, too_few, view, 150.0), out_of_range);
    }
}

}
}
