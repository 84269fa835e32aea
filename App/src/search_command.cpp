#include "search_command.hpp"
#include "coordinator.hpp"
#include "finder.hpp"
#include "helpers.hpp"
#include "save_results.hpp"

#include <rang.hpp>

#include <chrono>
#include <iostream>
#include <variant>

using namespace rang;
using namespace sifinder_app;

int sifinder_app::handleSearchCommand(const Arguments& args)
{
    try {
        auto start = std::chrono::steady_clock::now();

        sifinder::Finder finder(args.finderOptions());
        const auto handle = resolveIndex(finder, args);

        printConfiguration(handle.sourceDirectory.empty() ? handle.name : handle.sourceDirectory.string(), {
            { "Index", handle.name },
            { "Query", args.query.filename().string() },
            { "Threshold", std::to_string(args.threshold) },
            { "Limit", args.limit > 0 ? withCommas(args.limit) : std::string("all") }
        });

        sifinder::Coordinator coordinator(finder);
        coordinator.submitSearch(handle, args.query, args.threshold, static_cast<size_t>(args.limit));

        for (;;) {
            auto event = coordinator.nextEvent(std::chrono::milliseconds(100));
            if (!event) continue;

            if (const auto* done = std::get_if<sifinder::SearchCompletedEvent>(&*event)) {
                auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
                std::cout << fg::green << "Found " << withCommas(done->result.matches.size()) << " similar image(s) in "
                          << duration.count() / 1000.0 << " seconds\n\n" << fg::reset;

                const bool saved = !args.outputPath.empty()
                    && saveMatchesCSV(args.outputPath, args.query.string(), done->result.matches);
                printMatches(done->result, saved ? args.outputPath : std::string());
                return 0;
            }
            if (const auto* failed = std::get_if<sifinder::OperationFailedEvent>(&*event)) {
                std::cerr << fg::red << "Search failed: " << failed->message << fg::reset << '\n';
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        std::cerr << fg::red << "Error: " << e.what() << fg::reset << '\n';
        return 1;
    }
}
