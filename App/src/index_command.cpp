#include "index_command.hpp"
#include "coordinator.hpp"
#include "finder.hpp"
#include "helpers.hpp"

#include <rang.hpp>
#include <indicators/progress_bar.hpp>

#include <chrono>
#include <iostream>
#include <numeric>
#include <variant>

using namespace rang;
using namespace sifinder_app;

namespace {

std::string joinExtensions(const std::vector<std::string>& extensions)
{
    return std::accumulate(extensions.begin(), extensions.end(), std::string(),
        [](std::string acc, const std::string& ext) { return acc.empty() ? ext : acc + "," + ext; });
}

} // namespace

int sifinder_app::handleIndexCommand(const Arguments& args)
{
    try {
        sifinder::Finder finder(args.finderOptions());
        const auto handle = finder.createOrOpenIndex(args.directory);
        const auto files = sifinder::collectImagePaths(handle.sourceDirectory, args.extensions);

        printConfiguration(handle.sourceDirectory.string(), {
            { "Index", handle.name },
            { "Images", withCommas(files.size()) },
            { "Extensions", joinExtensions(args.extensions) },
            { "Batch", withCommas(args.batchSize) }
        });

        hideCursor();
        auto progress = bar("Indexing ", true, true);

        sifinder::Coordinator coordinator(finder);
        coordinator.submitIndex(handle);

        for (;;) {
            auto event = coordinator.nextEvent(std::chrono::milliseconds(100));
            if (!event) continue;

            if (const auto* update = std::get_if<sifinder::IndexProgressEvent>(&*event)) {
                progress.set_progress(update->progress.percentComplete());
                if (update->progress.failed > 0) {
                    progress.set_option(indicators::option::ForegroundColor{ indicators::Color::yellow });
                    progress.set_option(indicators::option::PostfixText{
                        "(" + std::to_string(update->progress.failed) + " failed image(s))" });
                }
            }
            else if (const auto* done = std::get_if<sifinder::IndexCompletedEvent>(&*event)) {
                progress.set_progress(100);
                showCursor();
                printIndexSummary(done->summary);
                return 0;
            }
            else if (const auto* failed = std::get_if<sifinder::OperationFailedEvent>(&*event)) {
                showCursor();
                std::cerr << fg::red << "\nIndexing failed: " << failed->message << fg::reset << '\n';
                return 1;
            }
        }
    }
    catch (const std::exception& e) {
        showCursor();
        std::cerr << fg::red << "Error: " << e.what() << fg::reset << '\n';
        return 1;
    }
}
