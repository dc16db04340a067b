#ifndef GFAESTUS_UNITTEST_TEST_GRAPHS_HPP_INCLUDED
#define GFAESTUS_UNITTEST_TEST_GRAPHS_HPP_INCLUDED

/// \file test_graphs.hpp
///
/// Small graphs shared by the unit tests.
///

#include <string>
#include <memory>

#include <bdsg/hash_graph.hpp>

namespace gfaestus {
namespace unittest {

using namespace std;

/// Make a graph of 5 nodes with lengths 10, 20, 30, 40 and 50, in a chain
/// with an extra edge from 1 to 3, and one path through all of them in order
/// with the given name.
unique_ptr<bdsg::HashGraph> make_chain_graph(const string& path_name = "P");

}
}

#endif
