/** \file layout_main.cpp
 *
 * Defines the "gfaestus layout" subcommand, which finds nodes by their place
 * in a 2D layout.
 */

#include <getopt.h>

#include <iostream>
#include <string>
#include <vector>
#include <memory>

#include "subcommand.hpp"

#include "../graph_io.hpp"
#include "../geometry.hpp"
#include "../quad_tree.hpp"
#include "../utility.hpp"
#include "../log.hpp"

using namespace std;
using namespace gfaestus;
using namespace gfaestus::subcommand;

void help_layout(char** argv) {
    cerr << "usage: " << argv[0] << " layout [options] -l LAYOUT GRAPH" << endl
         << "Find the nodes of a .hg or .pg graph by where their centers are in a layout." << endl
         << endl
         << "options:" << endl
         << "    -l, --layout FILE        node positions, as a layout TSV (required)" << endl
         << "    -n, --nearest X,Y        report the node closest to a point (may repeat)" << endl
         << "    -d, --disk X,Y,R         list the nodes within R of a point (may repeat)" << endl
         << "    -b, --box X0,Y0,X1,Y1    list the nodes in a rectangle (may repeat)" << endl
         << "    -t, --tree               report the shape of the spatial index" << endl
         << "    -q, --quiet              don't log progress" << endl
         << "    -h, --help               print this help message to stderr and exit" << endl;
}

/// Parse a comma-separated list of exactly count numbers, or exit.
static vector<float> parse_coords(const Logger& logger, const string& arg, size_t count) {
    vector<string> parts = split_delims(arg, ",");
    if (parts.size() != count) {
        logger.error() << "expected " << count << " comma-separated numbers, not \"" << arg << "\"" << endl;
    }
    vector<float> coords;
    for (auto& part : parts) {
        coords.push_back(parse<float>(part));
    }
    return coords;
}

/// Print found nodes, one per line.
static void print_found(const string& label, const vector<pair<Point, const nid_t*>>& found) {
    for (auto& entry : found) {
        cout << label << "\t" << *entry.second << "\t" << entry.first.x << "\t" << entry.first.y << endl;
    }
}

int main_layout(int argc, char** argv) {

    Logger logger("gfaestus layout");

    if (argc == 2) {
        help_layout(argv);
        return 1;
    }

    string layout_file;
    vector<Point> nearest_points;
    vector<pair<Point, float>> disks;
    vector<Rect> boxes;
    bool show_tree = false;

    int c;
    optind = 2; // force optind past command positional argument
    while (true) {
        static struct option long_options[] =
        {
            {"layout", required_argument, 0, 'l'},
            {"nearest", required_argument, 0, 'n'},
            {"disk", required_argument, 0, 'd'},
            {"box", required_argument, 0, 'b'},
            {"tree", no_argument, 0, 't'},
            {"quiet", no_argument, 0, 'q'},
            {"help", no_argument, 0, 'h'},
            {0, 0, 0, 0}
        };

        int option_index = 0;
        c = getopt_long (argc, argv, "l:n:d:b:tqh?",
                long_options, &option_index);

        // Detect the end of the options.
        if (c == -1)
            break;

        switch (c)
        {
        case 'l':
            layout_file = optarg;
            break;

        case 'n':
        {
            auto coords = parse_coords(logger, optarg, 2);
            nearest_points.emplace_back(coords[0], coords[1]);
        }
            break;

        case 'd':
        {
            auto coords = parse_coords(logger, optarg, 3);
            disks.emplace_back(Point(coords[0], coords[1]), coords[2]);
        }
            break;

        case 'b':
        {
            auto coords = parse_coords(logger, optarg, 4);
            boxes.emplace_back(Point(coords[0], coords[1]), Point(coords[2], coords[3]));
        }
            break;

        case 't':
            show_tree = true;
            break;

        case 'q':
            logging::set_quiet(true);
            break;

        case 'h':
        case '?':
            help_layout(argv);
            exit(1);
            break;

        default:
            abort ();
        }
    }

    if (layout_file.empty()) {
        logger.error() << "a layout (-l) is required" << endl;
    }

    string graph_file = get_input_file_name(optind, argc, argv);

    unique_ptr<MutablePathMutableHandleGraph> graph;
    try {
        graph = load_graph(graph_file);
    } catch (GraphLoadError& e) {
        logger.error() << e.what() << endl;
    }

    vector<Node> layout;
    try {
        get_input_file(layout_file, [&](istream& in) {
            layout = read_layout_tsv(in, graph->get_node_count());
        });
    } catch (runtime_error& e) {
        logger.error() << layout_file << ": " << e.what() << endl;
    }

    // Pad the bounds, since points on the max edges would fall outside.
    Rect bounds = Rect::nowhere();
    for (auto& node : layout) {
        bounds = bounds.rect_union(node.bounds());
    }
    QuadTree<nid_t> tree(Rect(bounds.min() - Point(1.0, 1.0), bounds.max() + Point(1.0, 1.0)));
    for (size_t i = 0; i < layout.size(); i++) {
        if (!tree.insert(layout[i].center(), index_node(i))) {
            logger.warn() << "node " << index_node(i) << " is outside the layout bounds" << endl;
        }
    }
    logger.info() << "indexed " << tree.size() << " node centers" << endl;

    for (auto& point : nearest_points) {
        Point found;
        const nid_t* node_id;
        if (tree.nearest(point, found, node_id)) {
            cout << "nearest" << "\t" << *node_id << "\t" << found.x << "\t" << found.y << endl;
        }
    }

    for (auto& disk : disks) {
        print_found("disk", tree.query_radius(disk.first, disk.second));
    }

    for (auto& box : boxes) {
        print_found("box", tree.query_range(box));
    }

    if (show_tree) {
        cout << "tree" << "\t" << tree.size() << "\t" << tree.leaves().size() << "\t" << tree.depth() << endl;
        for (auto& rect : tree.rects()) {
            cout << "rect" << "\t" << rect << endl;
        }
    }

    return 0;
}

// Register subcommand
static Subcommand gfaestus_layout("layout", "find nodes by their layout positions", QUERY, 2, main_layout);
