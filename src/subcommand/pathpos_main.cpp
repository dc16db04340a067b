/** \file pathpos_main.cpp
 *
 * Defines the "gfaestus pathpos" subcommand, which converts between base
 * positions and steps along paths.
 */

#include <getopt.h>

#include <iostream>
#include <string>
#include <vector>
#include <memory>

#include "subcommand.hpp"

#include "../graph_io.hpp"
#include "../graph_query.hpp"
#include "../utility.hpp"
#include "../log.hpp"

using namespace std;
using namespace gfaestus;
using namespace gfaestus::subcommand;

void help_pathpos(char** argv) {
    cerr << "usage: " << argv[0] << " pathpos [options] -p PATH GRAPH" << endl
         << "Look up steps and base positions along a path of a .hg or .pg graph." << endl
         << endl
         << "options:" << endl
         << "    -p, --path NAME        path to work on (required)" << endl
         << "    -b, --base N           report the step containing base N (may repeat)" << endl
         << "    -r, --rank N           report the base offset of the step with rank N (may repeat)" << endl
         << "    -R, --ranks A-B        list the steps with ranks A to B inclusive" << endl
         << "    -B, --bases A-B        list the steps covering bases [A, B)" << endl
         << "    -n, --node ID          list every path position of node ID (may repeat)" << endl
         << "    -q, --quiet            don't log progress" << endl
         << "    -h, --help             print this help message to stderr and exit" << endl;
}

/// Parse an "A-B" pair of numbers from the command line, or exit.
static pair<size_t, size_t> parse_pair(const Logger& logger, const string& arg) {
    vector<string> parts = split_delims(arg, "-");
    if (parts.size() != 2) {
        logger.error() << "expected a range like 10-20, not \"" << arg << "\"" << endl;
    }
    return make_pair(parse<size_t>(parts[0]), parse<size_t>(parts[1]));
}

/// Print a list of steps, one per line.
static void print_steps(const PathHandleGraph& graph, const string& path_name, size_t first_rank,
                        const vector<StepPosition>& steps) {
    for (size_t i = 0; i < steps.size(); i++) {
        cout << path_name << "\t" << (first_rank + i) << "\t" << graph.get_id(steps[i].handle)
             << "\t" << (graph.get_is_reverse(steps[i].handle) ? "-" : "+") << "\t" << steps[i].offset << endl;
    }
}

int main_pathpos(int argc, char** argv) {

    Logger logger("gfaestus pathpos");

    if (argc == 2) {
        help_pathpos(argv);
        return 1;
    }

    string path_name;
    vector<size_t> bases;
    vector<size_t> ranks;
    vector<pair<size_t, size_t>> rank_ranges;
    vector<pair<size_t, size_t>> base_ranges;
    vector<nid_t> node_ids;

    int c;
    optind = 2; // force optind past command positional argument
    while (true) {
        static struct option long_options[] =
        {
            {"path", required_argument, 0, 'p'},
            {"base", required_argument, 0, 'b'},
            {"rank", required_argument, 0, 'r'},
            {"ranks", required_argument, 0, 'R'},
            {"bases", required_argument, 0, 'B'},
            {"node", required_argument, 0, 'n'},
            {"quiet", no_argument, 0, 'q'},
            {"help", no_argument, 0, 'h'},
            {0, 0, 0, 0}
        };

        int option_index = 0;
        c = getopt_long (argc, argv, "p:b:r:R:B:n:qh?",
                long_options, &option_index);

        // Detect the end of the options.
        if (c == -1)
            break;

        switch (c)
        {
        case 'p':
            path_name = optarg;
            break;

        case 'b':
            bases.push_back(parse<size_t>(optarg));
            break;

        case 'r':
            ranks.push_back(parse<size_t>(optarg));
            break;

        case 'R':
            rank_ranges.push_back(parse_pair(logger, optarg));
            break;

        case 'B':
            base_ranges.push_back(parse_pair(logger, optarg));
            break;

        case 'n':
            node_ids.push_back(parse<nid_t>(optarg));
            break;

        case 'q':
            logging::set_quiet(true);
            break;

        case 'h':
        case '?':
            help_pathpos(argv);
            exit(1);
            break;

        default:
            abort ();
        }
    }

    if (path_name.empty() && node_ids.empty()) {
        logger.error() << "a path (-p) is required" << endl;
    }

    string graph_file = get_input_file_name(optind, argc, argv);

    shared_ptr<const PathHandleGraph> graph;
    try {
        graph = load_graph(graph_file);
    } catch (GraphLoadError& e) {
        logger.error() << e.what() << endl;
    }

    GraphQuery query(graph);
    const PathPositionIndex& index = query.path_positions();

    if (!path_name.empty()) {
        path_handle_t path;
        if (!find_path(*graph, path_name, path)) {
            logger.error() << "graph has no path " << path_name << endl;
        }
        auto& steps = index.path_steps(path);

        for (auto& base : bases) {
            size_t rank;
            if (!index.find_rank_at_base(path, base, rank)) {
                logger.warn() << "base " << base << " is past the end of " << path_name
                              << " at " << index.path_base_len(path) << endl;
                continue;
            }
            cout << "base" << "\t" << base << "\t" << rank << "\t" << graph->get_id(steps[rank].handle)
                 << "\t" << (base - steps[rank].offset) << endl;
        }

        for (auto& rank : ranks) {
            if (rank >= steps.size()) {
                logger.warn() << "rank " << rank << " is past the end of " << path_name
                              << " with " << steps.size() << " steps" << endl;
                continue;
            }
            cout << "rank" << "\t" << rank << "\t" << graph->get_id(steps[rank].handle)
                 << "\t" << steps[rank].offset << endl;
        }

        for (auto& range : rank_ranges) {
            print_steps(*graph, path_name, range.first, query.path_range(path, range.first, range.second));
        }

        for (auto& range : base_ranges) {
            auto covering = query.path_basepair_range(path, range.first, range.second);
            size_t first_rank = 0;
            if (!covering.empty()) {
                index.path_step_rank(path, covering.front().step, first_rank);
            }
            print_steps(*graph, path_name, first_rank, covering);
        }
    }

    for (auto& node_id : node_ids) {
        if (!graph->has_node(node_id)) {
            logger.warn() << "graph has no node " << node_id << endl;
            continue;
        }
        for (auto& occurrence : index.handle_positions(graph->get_handle(node_id))) {
            size_t rank = 0;
            index.path_step_rank(occurrence.path, occurrence.step, rank);
            cout << "node" << "\t" << node_id << "\t" << graph->get_path_name(occurrence.path)
                 << "\t" << rank << "\t" << occurrence.offset << endl;
        }
    }

    return 0;
}

// Register subcommand
static Subcommand gfaestus_pathpos("pathpos", "convert between bases and steps on paths", QUERY, 1, main_pathpos);
