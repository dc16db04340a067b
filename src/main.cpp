#include <iostream>
#include <string>

#include "utility.hpp"
#include "log.hpp"

// Subcommands register themselves; nothing here needs their headers
#include "subcommand/subcommand.hpp"

using namespace std;
using namespace gfaestus;

void gfaestus_help(char** argv) {
    cerr << "gfaestus: pangenome graph viewer core" << endl
         << endl
         << "usage: " << argv[0] << " <command> [options]" << endl
         << endl;

    gfaestus::subcommand::print_subcommands(cerr);
}

int main(int argc, char *argv[]) {

    // Determine a sensible default number of threads and apply it.
    choose_good_thread_count();

    if (argc == 1) {
        gfaestus_help(argv);
        return 1;
    }

    auto* subcommand = gfaestus::subcommand::Subcommand::get(argc, argv);
    if (subcommand == nullptr) {
        logging::warn("gfaestus") << "command " << argv[1] << " not found" << endl;
        gfaestus_help(argv);
        return 1;
    }

    return (*subcommand)(argc, argv);
}
