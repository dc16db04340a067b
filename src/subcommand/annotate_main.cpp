/** \file annotate_main.cpp
 *
 * Defines the "gfaestus annotate" subcommand, which puts GFF3 or BED
 * annotations onto the nodes of a graph along one of its paths.
 */

#include <getopt.h>

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <memory>

#include "subcommand.hpp"

#include "../graph_io.hpp"
#include "../graph_query.hpp"
#include "../gff_reader.hpp"
#include "../bed_reader.hpp"
#include "../annotation_filter.hpp"
#include "../annotation_projection.hpp"
#include "../node_selection.hpp"
#include "../geometry.hpp"
#include "../path_name.hpp"
#include "../utility.hpp"
#include "../log.hpp"

using namespace std;
using namespace gfaestus;
using namespace gfaestus::subcommand;

void help_annotate(char** argv) {
    cerr << "usage: " << argv[0] << " annotate [options] -p PATH (-g FILE | -b FILE) GRAPH" << endl
         << "Project annotation records onto the nodes of a .hg or .pg graph along a path." << endl
         << endl
         << "input:" << endl
         << "    -p, --path NAME         path the record coordinates are on (required)" << endl
         << "    -g, --gff FILE          read records from a GFF3 file" << endl
         << "    -b, --bed FILE          read records from a BED file" << endl
         << "    -l, --layout FILE       node positions, as a layout TSV" << endl
         << "filtering:" << endl
         << "    -f, --filter EXPR       keep records where COLUMN=TEXT, COLUMN~TEXT (contains)," << endl
         << "                            COLUMN!~TEXT (doesn't contain) or COLUMN^TEXT (is part of TEXT)" << endl
         << "    -Q, --quick TEXT        keep records with TEXT in any column" << endl
         << "    -s, --score OP:N[:M]    keep records with a score passing OP, one of lt, le, eq," << endl
         << "                            ge, gt or range (N to M inclusive)" << endl
         << "    -r, --range SEQ:A-B     keep records on SEQ that lie within bases A to B" << endl
         << "output:" << endl
         << "    -o, --output MODE       what to print, one of:" << endl
         << "                              nodes      the nodes of each record (default)" << endl
         << "                              selection  all the nodes together, with their bounds given -l" << endl
         << "                              labels     node labels from the -c column, clustered given -l" << endl
         << "                              colors     a color per node from hashing the -c column" << endl
         << "                              scores     a value per node from record scores" << endl
         << "    -c, --column NAME       column for labels and colors" << endl
         << "    -R, --radius N          label clustering radius in pixels [50]" << endl
         << "    -z, --scale N           world units per pixel for label clustering [1]" << endl
         << "other:" << endl
         << "    -q, --quiet             don't log progress" << endl
         << "    -h, --help              print this help message to stderr and exit" << endl;
}

/// Everything the command line says to do with the records.
struct AnnotateOptions {
    string path_name;
    string layout_file;
    vector<string> column_filters;
    string quick_text;
    string score_filter;
    string range;
    string output = "nodes";
    string column;
    float radius = 50.0;
    float scale = 1.0;
};

/// Parse a "COLUMN<op>TEXT" filter expression. Exits on a bad one.
static void parse_column_filter(const Logger& logger, const string& expr, string& column, FilterString& filter) {
    for (size_t i = 0; i < expr.size(); i++) {
        StringOp op = StringOp::None;
        size_t op_len = 1;
        if (expr.compare(i, 2, "!~") == 0) {
            op = StringOp::NotContained;
            op_len = 2;
        } else if (expr[i] == '~') {
            op = StringOp::Contains;
        } else if (expr[i] == '=') {
            op = StringOp::Equal;
        } else if (expr[i] == '^') {
            op = StringOp::ContainedIn;
        }
        if (op != StringOp::None) {
            if (i == 0) {
                break;
            }
            column = expr.substr(0, i);
            filter = FilterString(op, expr.substr(i + op_len));
            return;
        }
    }
    logger.error() << "could not understand filter \"" << expr << "\"" << endl;
}

/// Parse an "OP:N[:M]" score filter. Exits on an unknown operation; bad
/// numbers make a filter that passes everything.
static FilterNum<double> parse_score_filter(const Logger& logger, const string& expr) {
    vector<string> parts = split_delims(expr, ":");
    if (parts.size() < 2) {
        logger.error() << "could not understand score filter \"" << expr << "\"" << endl;
    }
    NumOp op = NumOp::None;
    if (parts[0] == "lt") {
        op = NumOp::LT;
    } else if (parts[0] == "le") {
        op = NumOp::LE;
    } else if (parts[0] == "eq") {
        op = NumOp::EQ;
    } else if (parts[0] == "ge") {
        op = NumOp::GE;
    } else if (parts[0] == "gt") {
        op = NumOp::GT;
    } else if (parts[0] == "range") {
        op = NumOp::InRange;
    } else {
        logger.error() << "unknown score comparison \"" << parts[0] << "\"" << endl;
    }
    auto filter = FilterNum<double>::from_strings(op, parts[1], parts.size() > 2 ? parts[2] : "");
    if (filter.op == NumOp::None) {
        logger.warn() << "ignoring score filter \"" << expr << "\" with arguments that aren't numbers" << endl;
    }
    return filter;
}

/// Find a column by name, or exit. BED files also answer to "name" for their
/// fourth field.
template<typename Collection, typename ColumnKey>
static ColumnKey lookup_column(const Logger& logger, const Collection& records, const string& column_name) {
    ColumnKey column;
    if (records.find_column(column_name, column)) {
        return column;
    }
    logger.error() << "no column named " << column_name << " in " << records.file_name() << endl;
    return column;
}

template<>
BedColumn lookup_column<BedRecords, BedColumn>(const Logger& logger, const BedRecords& records,
                                               const string& column_name) {
    if (column_name == "name") {
        return BedColumn(BedColumn::Name);
    }
    BedColumn column;
    if (records.find_column(column_name, column)) {
        return column;
    }
    logger.error() << "no column named " << column_name << " in " << records.file_name() << endl;
    return column;
}

/// Filter, project and print the records.
template<typename Collection, typename ColumnKey>
static void annotate(const Logger& logger, const AnnotateOptions& options, const Collection& records,
                     const shared_ptr<const GraphQuery>& query, const path_handle_t& path) {

    RecordFilter<ColumnKey> filter;
    for (auto& expr : options.column_filters) {
        string column_name;
        FilterString column_filter;
        parse_column_filter(logger, expr, column_name, column_filter);
        filter.set_column_filter(lookup_column<Collection, ColumnKey>(logger, records, column_name), column_filter);
    }
    if (!options.quick_text.empty()) {
        auto& columns = records.all_columns();
        filter.quick_filter = QuickFilter<ColumnKey>(FilterString(StringOp::Contains, options.quick_text),
                                                     set<ColumnKey>(columns.begin(), columns.end()));
    }
    if (!options.score_filter.empty()) {
        filter.score_filter = parse_score_filter(logger, options.score_filter);
    }
    if (!options.range.empty()) {
        size_t colon = options.range.rfind(':');
        size_t start;
        size_t end;
        if (colon == string::npos || !path_name_range(options.range, start, end)) {
            logger.error() << "could not understand range \"" << options.range << "\"" << endl;
        }
        filter.set_range(options.range.substr(0, colon), start, end);
    }

    vector<size_t> passing = filter_records(records, filter);
    logger.info() << passing.size() << " of " << records.size() << " records pass the filters" << endl;

    AnnotationProjector projector(query, path);
    const PathHandleGraph& graph = query->graph();

    vector<Node> layout;
    if (!options.layout_file.empty()) {
        try {
            get_input_file(options.layout_file, [&](istream& in) {
                layout = read_layout_tsv(in, graph.get_node_count());
            });
        } catch (runtime_error& e) {
            logger.error() << e.what() << endl;
        }
    }

    bool need_column = (options.output == "labels" || options.output == "colors");
    ColumnKey column;
    if (need_column) {
        if (options.column.empty()) {
            logger.error() << "output " << options.output << " needs a column (-c)" << endl;
        }
        column = lookup_column<Collection, ColumnKey>(logger, records, options.column);
    }

    if (options.output == "nodes") {
        for (auto& i : passing) {
            auto& record = records[i];
            cout << record.seq_id() << "\t" << record.start() << "\t" << record.end() << "\t";
            auto nodes = projector.record_nodes(record);
            for (size_t j = 0; j < nodes.size(); j++) {
                cout << (j > 0 ? "," : "") << nodes[j];
            }
            cout << endl;
        }
    } else if (options.output == "selection") {
        NodeSelection selection;
        for (auto& i : passing) {
            selection.add_slice(projector.record_nodes(records[i]), false);
        }
        cout << "selected" << "\t" << selection.size();
        if (!layout.empty() && !selection.empty()) {
            cout << "\t" << selection.bounding_box(layout);
        }
        cout << endl;
    } else if (options.output == "labels") {
        LabelSet labels = projector.record_labels(records, passing, column);
        if (layout.empty()) {
            for (auto& node_labels : labels) {
                cout << node_labels.first << "\t" << join(node_labels.second, ";") << endl;
            }
        } else {
            // Look at the whole layout at the requested scale
            Rect bounds = Rect::nowhere();
            for (auto& node : layout) {
                bounds = bounds.rect_union(node.bounds());
            }
            ViewTransform view(bounds.center(), options.scale, Point(bounds.width(), bounds.height()) / options.scale);

            auto& steps = projector.steps();
            auto clusters = cluster_labels(graph, steps, make_pair((size_t) 0, steps.size()), labels,
                                           layout, view, options.radius);
            for (auto& cluster : clusters) {
                cout << cluster.first << "\t" << cluster.second.offset.x << "\t" << cluster.second.offset.y
                     << "\t" << join(cluster.second.labels, ";") << endl;
            }
        }
    } else if (options.output == "colors") {
        OverlayData overlay = projector.record_overlay(records, passing, column, RGBA(0.0, 0.0, 0.0, 0.0));
        auto& colors = overlay.colors();
        for (size_t i = 0; i < colors.size(); i++) {
            cout << index_node(i) << "\t" << colors[i].r << "\t" << colors[i].g << "\t" << colors[i].b
                 << "\t" << colors[i].a << endl;
        }
    } else if (options.output == "scores") {
        OverlayData overlay = projector.record_score_overlay(records, passing, 0.0);
        auto& values = overlay.values();
        for (size_t i = 0; i < values.size(); i++) {
            cout << index_node(i) << "\t" << values[i] << endl;
        }
    } else {
        logger.error() << "unknown output mode " << options.output << endl;
    }
}

int main_annotate(int argc, char** argv) {

    Logger logger("gfaestus annotate");

    if (argc == 2) {
        help_annotate(argv);
        return 1;
    }

    AnnotateOptions options;
    string gff_file;
    string bed_file;

    int c;
    optind = 2; // force optind past command positional argument
    while (true) {
        static struct option long_options[] =
        {
            {"path", required_argument, 0, 'p'},
            {"gff", required_argument, 0, 'g'},
            {"bed", required_argument, 0, 'b'},
            {"layout", required_argument, 0, 'l'},
            {"filter", required_argument, 0, 'f'},
            {"quick", required_argument, 0, 'Q'},
            {"score", required_argument, 0, 's'},
            {"range", required_argument, 0, 'r'},
            {"output", required_argument, 0, 'o'},
            {"column", required_argument, 0, 'c'},
            {"radius", required_argument, 0, 'R'},
            {"scale", required_argument, 0, 'z'},
            {"quiet", no_argument, 0, 'q'},
            {"help", no_argument, 0, 'h'},
            {0, 0, 0, 0}
        };

        int option_index = 0;
        c = getopt_long (argc, argv, "p:g:b:l:f:Q:s:r:o:c:R:z:qh?",
                long_options, &option_index);

        // Detect the end of the options.
        if (c == -1)
            break;

        switch (c)
        {
        case 'p':
            options.path_name = optarg;
            break;

        case 'g':
            gff_file = optarg;
            break;

        case 'b':
            bed_file = optarg;
            break;

        case 'l':
            options.layout_file = optarg;
            break;

        case 'f':
            options.column_filters.push_back(optarg);
            break;

        case 'Q':
            options.quick_text = optarg;
            break;

        case 's':
            options.score_filter = optarg;
            break;

        case 'r':
            options.range = optarg;
            break;

        case 'o':
            options.output = optarg;
            break;

        case 'c':
            options.column = optarg;
            break;

        case 'R':
            options.radius = parse<float>(optarg);
            break;

        case 'z':
            options.scale = parse<float>(optarg);
            if (options.scale <= 0.0) {
                logger.error() << "scale must be positive" << endl;
            }
            break;

        case 'q':
            logging::set_quiet(true);
            break;

        case 'h':
        case '?':
            help_annotate(argv);
            exit(1);
            break;

        default:
            abort ();
        }
    }

    if (options.path_name.empty()) {
        logger.error() << "a path (-p) is required" << endl;
    }
    if (gff_file.empty() == bed_file.empty()) {
        logger.error() << "exactly one of a GFF3 file (-g) or a BED file (-b) is required" << endl;
    }

    string graph_file = get_input_file_name(optind, argc, argv);

    shared_ptr<const PathHandleGraph> graph;
    try {
        graph = load_graph(graph_file);
    } catch (GraphLoadError& e) {
        logger.error() << e.what() << endl;
    }

    path_handle_t path;
    if (!find_path(*graph, options.path_name, path)) {
        logger.error() << "graph has no path " << options.path_name << endl;
    }

    shared_ptr<const GraphQuery> query = make_shared<GraphQuery>(graph);

    if (!gff_file.empty()) {
        Gff3Records records;
        try {
            records = Gff3Records::parse_file(gff_file);
        } catch (GFFParseError& e) {
            logger.error() << gff_file << ": " << e.what() << endl;
        } catch (runtime_error& e) {
            logger.error() << e.what() << endl;
        }
        annotate<Gff3Records, Gff3Column>(logger, options, records, query, path);
    } else {
        BedRecords records;
        try {
            records = BedRecords::parse_file(bed_file);
        } catch (runtime_error& e) {
            logger.error() << e.what() << endl;
        }
        annotate<BedRecords, BedColumn>(logger, options, records, query, path);
    }

    return 0;
}

// Register subcommand
static Subcommand gfaestus_annotate("annotate", "project GFF3 or BED records onto a path", ANNOTATION, 0, main_annotate);
