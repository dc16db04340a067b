/** \file stats_main.cpp
 *
 * Defines the "gfaestus stats" subcommand, which answers questions about a
 * graph, its nodes and its paths.
 */

#include <getopt.h>

#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <thread>

#include "subcommand.hpp"

#include "../graph_io.hpp"
#include "../graph_query.hpp"
#include "../utility.hpp"
#include "../log.hpp"

using namespace std;
using namespace gfaestus;
using namespace gfaestus::subcommand;

void help_stats(char** argv) {
    cerr << "usage: " << argv[0] << " stats [options] GRAPH" << endl
         << "Report statistics about a .hg or .pg graph as tab-separated lines." << endl
         << endl
         << "options:" << endl
         << "    -n, --node ID       report length, degree and path coverage of node ID (may repeat)" << endl
         << "    -s, --sequence      also report the sequence of each node given with -n" << endl
         << "    -p, --path NAME     report step count and length of path NAME (may repeat)" << endl
         << "    -P, --all-paths     report on every path" << endl
         << "    -t, --threads N     number of threads for path reports [all available]" << endl
         << "    -q, --quiet         don't log progress" << endl
         << "    -h, --help          print this help message to stderr and exit" << endl;
}

int main_stats(int argc, char** argv) {

    Logger logger("gfaestus stats");

    if (argc == 2) {
        help_stats(argv);
        return 1;
    }

    vector<nid_t> node_ids;
    vector<string> path_names;
    bool all_paths = false;
    bool show_sequence = false;
    size_t thread_count = get_thread_count();

    int c;
    optind = 2; // force optind past command positional argument
    while (true) {
        static struct option long_options[] =
        {
            {"node", required_argument, 0, 'n'},
            {"sequence", no_argument, 0, 's'},
            {"path", required_argument, 0, 'p'},
            {"all-paths", no_argument, 0, 'P'},
            {"threads", required_argument, 0, 't'},
            {"quiet", no_argument, 0, 'q'},
            {"help", no_argument, 0, 'h'},
            {0, 0, 0, 0}
        };

        int option_index = 0;
        c = getopt_long (argc, argv, "n:sp:Pt:qh?",
                long_options, &option_index);

        // Detect the end of the options.
        if (c == -1)
            break;

        switch (c)
        {
        case 'n':
            node_ids.push_back(parse<nid_t>(optarg));
            break;

        case 's':
            show_sequence = true;
            break;

        case 'p':
            path_names.push_back(optarg);
            break;

        case 'P':
            all_paths = true;
            break;

        case 't':
            thread_count = parse<size_t>(optarg);
            if (thread_count == 0) {
                logger.error() << "thread count must be positive" << endl;
            }
            break;

        case 'q':
            logging::set_quiet(true);
            break;

        case 'h':
        case '?':
            help_stats(argv);
            exit(1);
            break;

        default:
            abort ();
        }
    }

    string graph_file = get_input_file_name(optind, argc, argv);

    shared_ptr<const PathHandleGraph> graph;
    try {
        graph = load_graph(graph_file);
    } catch (GraphLoadError& e) {
        logger.error() << e.what() << endl;
    }

    auto query = make_shared<GraphQuery>(graph);

    // Graph and node questions go through the request thread, one at a time.
    GraphQueryResponse graph_stats = query->query_request_blocking(GraphQueryRequest::graph_stats());
    cout << "graph" << "\t" << graph_stats.node_count << "\t" << graph_stats.edge_count
         << "\t" << graph_stats.path_count << "\t" << graph_stats.total_len << endl;

    for (auto& node_id : node_ids) {
        GraphQueryResponse node_stats = query->query_request_blocking(GraphQueryRequest::node_stats(node_id));
        if (!node_stats.found) {
            logger.warn() << "graph has no node " << node_id << endl;
            continue;
        }
        cout << "node" << "\t" << node_stats.node_id << "\t" << node_stats.len
             << "\t" << node_stats.degree_left << "\t" << node_stats.degree_right
             << "\t" << node_stats.coverage;
        if (show_sequence) {
            GraphQueryResponse node_seq = query->query_request_blocking(GraphQueryRequest::node_seq(node_id));
            cout << "\t" << node_seq.sequence;
        }
        cout << endl;
    }

    vector<path_handle_t> paths;
    if (all_paths) {
        query->path_positions().for_each_path([&](const path_handle_t& path) {
            paths.push_back(path);
        });
    }
    for (auto& name : path_names) {
        path_handle_t path;
        if (!find_path(query->graph(), name, path)) {
            logger.error() << "graph has no path " << name << endl;
        }
        paths.push_back(path);
    }

    if (!paths.empty()) {
        // Path questions run on the pool, and we collect them as they finish.
        GraphQueryWorker worker(query, thread_count);
        vector<AsyncResult<GraphQueryResponse>> pending;
        for (auto& path : paths) {
            pending.emplace_back(worker.run_query([path](shared_ptr<const GraphQuery> q) {
                return q->answer(GraphQueryRequest::path_stats(path));
            }));
        }

        vector<unique_ptr<GraphQueryResponse>> answers(pending.size());
        size_t outstanding = pending.size();
        while (outstanding > 0) {
            for (size_t i = 0; i < pending.size(); i++) {
                if (!answers[i]) {
                    answers[i] = pending[i].take_result_if_ready();
                    if (answers[i]) {
                        outstanding--;
                    }
                }
            }
            if (outstanding > 0) {
                this_thread::yield();
            }
        }

        // Report in the order asked for
        for (auto& answer : answers) {
            cout << "path" << "\t" << answer->path_name << "\t" << answer->step_count
                 << "\t" << answer->base_len << endl;
        }
    }

    return 0;
}

// Register subcommand
static Subcommand gfaestus_stats("stats", "summarize a graph, its nodes and its paths", QUERY, 0, main_stats);
