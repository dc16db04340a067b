#ifndef GFAESTUS_SUBCOMMAND_SUBCOMMAND_HPP_INCLUDED
#define GFAESTUS_SUBCOMMAND_SUBCOMMAND_HPP_INCLUDED

/** \file
 * subcommand.hpp: registry for the subcommands of the gfaestus command
 * (gfaestus stats, gfaestus annotate, etc.), filled in at static
 * initialization time.
 *
 * Each subcommand is a static global object in its own compilation unit in
 * this directory. Those have to be linked into the binary directly, since
 * nothing refers to their symbols and they won't be pulled out of a library.
 *
 * Subcommands print their own help, and get all of argv, so they have to
 * skip past their names when parsing options:
 *
 *     #include "subcommand.hpp"
 *     using namespace gfaestus::subcommand;
 *
 *     int main_frobnicate(int argc, char** argv) {
 *         return 0;
 *     }
 *
 *     static Subcommand gfaestus_frobnicate("frobnicate", "frobnicate nodes",
 *         QUERY, main_frobnicate);
 */

#include <map>
#include <functional>
#include <string>
#include <iostream>

namespace gfaestus {
namespace subcommand {

/**
 * What kind of command each subcommand is, for grouping in the help.
 */
enum CommandCategory {
    /// Questions about the graph and its paths
    QUERY,
    /// Working with annotation files against the graph
    ANNOTATION,
    /// Only useful for developers
    DEVELOPMENT
};

/// Print the title of a category
std::ostream& operator<<(std::ostream& out, const CommandCategory& category);

/**
 * A subcommand with a name, a description, a category and a main function.
 * Registers itself on construction.
 */
class Subcommand {

public:

    /**
     * Make and register a subcommand with the given name and description, in
     * the given category, with the given priority (lower comes first in the
     * help), which calls the given main function.
     */
    Subcommand(std::string name, std::string description,
        CommandCategory category, int priority,
        std::function<int(int, char**)> main_function);

    /**
     * Make and register a subcommand with the worst priority.
     */
    Subcommand(std::string name, std::string description,
        CommandCategory category,
        std::function<int(int, char**)> main_function);

    const std::string& get_name() const;

    const std::string& get_description() const;

    const CommandCategory& get_category() const;

    const int& get_priority() const;

    /**
     * Run the main function of a subcommand. Return the return code.
     */
    int operator()(int argc, char** argv) const;

    /**
     * Get the subcommand named by argv[1], or nullptr if there isn't one.
     */
    static const Subcommand* get(int argc, char** argv);

    /**
     * Call the given lambda with each subcommand in the given category, in
     * priority order, ties broken by name.
     */
    static void for_each(CommandCategory category, const std::function<void(const Subcommand&)>& lambda);

private:
    /**
     * The registry lives in a function-local static so that it exists before
     * any subcommand registers itself, whatever order the statics are built
     * in.
     */
    static std::map<std::string, Subcommand*>& get_registry();

    std::string name;
    std::string description;
    CommandCategory category;
    int priority;
    std::function<int(int, char**)> main_function;
};

/// Print the name and description of every subcommand, by category.
void print_subcommands(std::ostream& out);

}
}

#endif
