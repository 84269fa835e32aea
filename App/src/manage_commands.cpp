#include "manage_commands.hpp"
#include "finder.hpp"
#include "helpers.hpp"

#include <rang.hpp>

#include <iostream>

using namespace rang;
using namespace sifinder_app;

int sifinder_app::handleListCommand(const Arguments& args)
{
    try {
        sifinder::Finder finder(args.finderOptions());
        printIndexes(finder.listIndexes(), finder.options().dataDirectory);
    }
    catch (const std::exception& e) {
        std::cerr << fg::red << "Error: " << e.what() << fg::reset << '\n';
        return 1;
    }
    return 0;
}

int sifinder_app::handleDeleteCommand(const Arguments& args)
{
    try {
        sifinder::Finder finder(args.finderOptions());
        const auto handle = finder.openIndex(args.indexName);

        std::string prompt = "Delete index '" + handle.name + "'";
        if (!handle.sourceDirectory.empty()) prompt += " of " + handle.sourceDirectory.string();
        prompt += "? The images themselves are not touched.";

        if (!args.assumeYes && !queryYesNo(prompt)) {
            std::cout << "Deletion cancelled.\n";
            return 0;
        }

        finder.deleteIndex(handle.name);
        std::cout << fg::green << "Deleted index " << handle.name << fg::reset << '\n';
    }
    catch (const std::exception& e) {
        std::cerr << fg::red << "Error: " << e.what() << fg::reset << '\n';
        return 1;
    }
    return 0;
}

int sifinder_app::handlePruneCommand(const Arguments& args)
{
    try {
        sifinder::Finder finder(args.finderOptions());
        const auto handle = resolveIndex(finder, args);

        const auto removed = finder.pruneMissing(handle);
        std::cout << fg::green << "Removed " << withCommas(removed) << " record(s) of missing files from "
                  << handle.name << fg::reset << '\n';
    }
    catch (const std::exception& e) {
        std::cerr << fg::red << "Error: " << e.what() << fg::reset << '\n';
        return 1;
    }
    return 0;
}
