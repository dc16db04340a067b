#include "graph_io.hpp"
#include "utility.hpp"
#include "log.hpp"

#include <fstream>

#include <bdsg/hash_graph.hpp>
#include <bdsg/packed_graph.hpp>

namespace gfaestus {

using namespace std;

static const Logger logger("graph-io");

GraphLoadError::GraphLoadError(const string& file_name, const string& message) :
    runtime_error("could not load graph from " + file_name + ": " + message) {
    // Nothing to do
}

unique_ptr<MutablePathMutableHandleGraph> load_graph(const string& file_name) {
    string extension = split_ext(file_name).second;

    ifstream in(file_name, ios::binary);
    if (!in) {
        throw GraphLoadError(file_name, "could not open file");
    }

    unique_ptr<MutablePathMutableHandleGraph> graph;
    try {
        if (extension == "hg") {
            auto hash_graph = make_unique<bdsg::HashGraph>();
            hash_graph->deserialize(in);
            graph = std::move(hash_graph);
        } else if (extension == "pg") {
            auto packed_graph = make_unique<bdsg::PackedGraph>();
            packed_graph->deserialize(in);
            graph = std::move(packed_graph);
        } else {
            throw GraphLoadError(file_name, "unrecognized extension \"" + extension + "\", expected .hg or .pg");
        }
    } catch (GraphLoadError& e) {
        throw;
    } catch (exception& e) {
        // libbdsg complains about bad magic numbers and the like this way
        throw GraphLoadError(file_name, e.what());
    }

    logger.info() << "loaded " << graph->get_node_count() << " nodes and "
                  << graph->get_path_count() << " paths from " << file_name_only(file_name) << endl;

    return graph;
}

}
