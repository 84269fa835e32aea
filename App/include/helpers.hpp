//
// helpers.hpp
// Terminal output and utility functions for the sifinder CLI
//

#pragma once

#include <concepts>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iostream>
#include <locale>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <indicators/progress_bar.hpp>

#include "arguments.hpp"
#include "finder.hpp"
#include "fingerprint.hpp"
#include "index_catalog.hpp"
#include "indexer.hpp"
#include "search_engine.hpp"

namespace sifinder_app {

inline void hideCursor() { std::cout << "\033[?25l" << std::flush; }
inline void showCursor() { std::cout << "\033[?25h" << std::flush; }

// One row of the 'hash' command output. fingerprint is empty when the file
// could not be decoded; error then says why.
struct HashedImage {
    std::filesystem::path path;
    std::optional<sifinder::Fingerprint> fingerprint;
    std::string error;
};

// The index named by --name, or the one built for --directory.
// Throws NotFoundError with a hint when the directory was never indexed.
sifinder::IndexHandle resolveIndex(sifinder::Finder& finder, const Arguments& args);

// Progress bar creation
indicators::ProgressBar bar(std::string_view prefix, bool show_elapsed = false, bool show_remaining = false);

// Number formatting
template <std::integral T>
std::string withCommas(T number)
{
    static const auto loc = [] {
        try {
            return std::locale("");
        }
        catch (const std::runtime_error&) {
            return std::locale::classic();
        }
    }();
    return std::format(loc, "{:L}", number);
}

std::string formatFileSize(std::uintmax_t bytes);

// Share of identical bits, 100.0 for distance 0
double similarityPercent(int distance);

std::string centerText(std::string_view text, int width);

// User interaction
bool queryYesNo(const std::string& prompt);

// Result display functions
void printConfiguration(std::string_view heading,
                        const std::vector<std::pair<std::string, std::string>>& settings);

void printIndexSummary(const sifinder::IndexSummary& summary);

void printMatches(const sifinder::SearchResult& result, const std::string& outputPath,
                  size_t maxRows = 20);

void printIndexes(const std::vector<sifinder::IndexInfo>& indexes,
                  const std::filesystem::path& dataDirectory);

void printHashResults(const std::vector<HashedImage>& images, const std::string& outputPath,
                      size_t maxRows = 10);

} // namespace sifinder_app
