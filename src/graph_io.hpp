#ifndef GFAESTUS_GRAPH_IO_HPP_INCLUDED
#define GFAESTUS_GRAPH_IO_HPP_INCLUDED

/** \file
 * graph_io.hpp: loading serialized libbdsg graphs.
 */

#include <string>
#include <memory>
#include <stdexcept>

#include "handle.hpp"

namespace gfaestus {

using namespace std;

/// Thrown when a graph file can't be read.
class GraphLoadError : public runtime_error {
public:
    GraphLoadError(const string& file_name, const string& message);
};

/**
 * Load a graph from a file, picking the implementation from the extension:
 * ".hg" for a bdsg::HashGraph and ".pg" for a bdsg::PackedGraph. Throws
 * GraphLoadError if the extension isn't one of those or the file doesn't
 * load.
 */
unique_ptr<MutablePathMutableHandleGraph> load_graph(const string& file_name);

}

#endif
