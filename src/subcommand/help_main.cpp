/** \file help_main.cpp
 *
 * Defines the "gfaestus help" subcommand, which lists the subcommands.
 */

#include <iostream>

#include "subcommand.hpp"

using namespace std;
using namespace gfaestus;
using namespace gfaestus::subcommand;

int main_help(int argc, char** argv) {

    cerr << "gfaestus: pangenome graph viewer core" << endl
         << endl
         << "usage: " << argv[0] << " <command> [options]" << endl
         << endl;

    print_subcommands(cerr);

    return 0;
}

// Register subcommand
static Subcommand gfaestus_help("help", "show all subcommands", DEVELOPMENT, 0, main_help);
