/// \file test_graphs.cpp
///
/// Small graphs shared by the unit tests.
///

#include "test_graphs.hpp"

#include <vector>

namespace gfaestus {
namespace unittest {

using namespace std;

unique_ptr<bdsg::HashGraph> make_chain_graph(const string& path_name) {
    auto graph = make_unique<bdsg::HashGraph>();

    vector<handlegraph::handle_t> handles;
    string bases = "ACGTG";
    for (size_t i = 0; i < 5; i++) {
        handles.push_back(graph->create_handle(string((i + 1) * 10, bases[i]), i + 1));
    }
    for (size_t i = 0; i + 1 < handles.size(); i++) {
        graph->create_edge(handles[i], handles[i + 1]);
    }
    graph->create_edge(handles[0], handles[2]);

    auto path = graph->create_path_handle(path_name);
    for (auto& handle : handles) {
        graph->append_step(path, handle);
    }

    return graph;
}

}
}
