/** \file test_main.cpp
 *
 * Defines the "gfaestus test" subcommand, which runs unit tests.
 */

#include <iostream>
#include <string>

#include "subcommand.hpp"

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

using namespace std;
using namespace gfaestus;
using namespace gfaestus::subcommand;

// No help_test is necessary because Catch complains about bad options itself.

/**
 * Take the argc and argv from a `gfaestus test` command line and run the unit
 * tests with the remaining arguments. This is the only place Catch's runner
 * is compiled in.
 *
 * Returns exit code 0 on success, other codes on failure.
 */
static int run_unit_tests(int argc, char** argv) {
    // Catch wants a program name and then its own options, so fold the
    // command and subcommand into one program name.
    auto new_program_name = string(argv[0]) + " " + string(argv[1]);

    int fixed_argc = argc - 1;
    char** fixed_argv = argv + 1;
    fixed_argv[0] = &new_program_name[0];

    Catch::Session session;

    int return_code = session.applyCommandLine(fixed_argc, fixed_argv);
    if (return_code != 0) {
        return return_code;
    }

    return session.run();
}

int main_test(int argc, char** argv) {
    return run_unit_tests(argc, argv);
}

// Register subcommand
static Subcommand gfaestus_test("test", "run unit tests", DEVELOPMENT, 1, main_test);
