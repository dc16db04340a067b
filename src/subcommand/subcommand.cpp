// subcommand.cpp: subcommand registry implementation

#include "subcommand.hpp"

#include <algorithm>
#include <utility>
#include <vector>
#include <limits>

namespace gfaestus {
namespace subcommand {

std::ostream& operator<<(std::ostream& out, const CommandCategory& category) {
    switch(category) {
    case QUERY:
        out << "graph queries";
        break;
    case ANNOTATION:
        out << "annotations";
        break;
    case DEVELOPMENT:
        out << "developer commands";
        break;
    }

    return out;
}

Subcommand::Subcommand(std::string name, std::string description,
    CommandCategory category, int priority,
    std::function<int(int, char**)> main_function) : name(name),
    description(description), category(category), priority(priority),
    main_function(main_function) {

    Subcommand::get_registry()[name] = this;
}

Subcommand::Subcommand(std::string name, std::string description,
    CommandCategory category,
    std::function<int(int, char**)> main_function) : Subcommand(name,
    description, category, std::numeric_limits<int>::max(), main_function) {

    // Nothing to do!
}

const std::string& Subcommand::get_name() const {
    return name;
}

const std::string& Subcommand::get_description() const {
    return description;
}

const CommandCategory& Subcommand::get_category() const {
    return category;
}

const int& Subcommand::get_priority() const {
    return priority;
}

int Subcommand::operator()(int argc, char** argv) const {
    return main_function(argc, argv);
}

const Subcommand* Subcommand::get(int argc, char** argv) {
    if (argc < 2) {
        return nullptr;
    }

    auto& registry = Subcommand::get_registry();
    auto found = registry.find(argv[1]);
    if (found == registry.end()) {
        return nullptr;
    }
    return found->second;
}

void Subcommand::for_each(CommandCategory category, const std::function<void(const Subcommand&)>& lambda) {
    // The registry is by name, so a stable sort on priority keeps names in
    // order within a priority.
    std::vector<const Subcommand*> in_category;
    for (auto& kv : Subcommand::get_registry()) {
        if (kv.second->category == category) {
            in_category.push_back(kv.second);
        }
    }

    std::stable_sort(in_category.begin(), in_category.end(), [](const Subcommand* a, const Subcommand* b) {
        return a->priority < b->priority;
    });

    for (auto* command : in_category) {
        lambda(*command);
    }
}

std::map<std::string, Subcommand*>& Subcommand::get_registry() {
    static std::map<std::string, Subcommand*> registry;
    return registry;
}

void print_subcommands(std::ostream& out) {
    for (auto category : {QUERY, ANNOTATION, DEVELOPMENT}) {
        out << category << ":" << std::endl;

        Subcommand::for_each(category, [&](const Subcommand& command) {
            // Pad all the names so the descriptions line up
            std::string name = command.get_name();
            name.resize(14, ' ');
            out << "  -- " << name << command.get_description() << std::endl;
        });

        out << std::endl;
    }
}

}
}
