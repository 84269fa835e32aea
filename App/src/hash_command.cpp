#include "hash_command.hpp"
#include "errors.hpp"
#include "fingerprint_extractor.hpp"
#include "helpers.hpp"
#include "logger.hpp"
#include "save_results.hpp"

#include <rang.hpp>
#include <indicators/progress_bar.hpp>

#include <chrono>
#include <iostream>

namespace fs = std::filesystem;
using namespace rang;
using namespace sifinder_app;

int sifinder_app::handleHashCommand(const Arguments& args)
{
    try {
        auto start = std::chrono::steady_clock::now();

        sifinder::PhashExtractor extractor;
        std::vector<HashedImage> images;
        images.reserve(args.images.size());

        hideCursor();
        auto progress = bar("Hashing ", true);
        size_t failed = 0;

        for (const auto& path : args.images) {
            HashedImage image{ path, std::nullopt, {} };
            try {
                image.fingerprint = extractor.compute(path);
            }
            catch (const sifinder::DecodeError& e) {
                image.error = e.what();
                ++failed;
                SIFINDER_WARN("hash", e.what());
            }
            images.push_back(std::move(image));

            progress.set_progress(images.size() * 100 / args.images.size());
            if (failed > 0) {
                progress.set_option(indicators::option::ForegroundColor{ indicators::Color::yellow });
                progress.set_option(indicators::option::PostfixText{ "(" + std::to_string(failed) + " failed image(s))" });
            }
        }

        showCursor();

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        std::cout << fg::green << "\nCompleted " << withCommas(images.size() - failed) << " image(s) in "
                  << duration.count() / 1000.0 << " seconds\n\n" << fg::reset;

        if (failed > 0) {
            std::cout << fg::yellow << "Warning: " << withCommas(failed) << " image(s) failed to decode" << fg::reset << "\n";
        }

        const bool saved = !args.outputPath.empty() && saveHashesCSV(args.outputPath, images);
        printHashResults(images, saved ? args.outputPath : std::string());

        return failed == 0 ? 0 : 1;
    }
    catch (const std::exception& e) {
        showCursor();
        std::cerr << fg::red << "Error: " << e.what() << fg::reset << '\n';
        return 1;
    }
}
