//
// save_results.cpp
// Functions for saving command results to CSV files
//

#include "save_results.hpp"

#include <format>
#include <fstream>
#include <iostream>

namespace sifinder_app {

namespace {

// Paths may contain quotes or commas
std::string quoted(const std::string& field)
{
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

bool saveHashesCSV(const std::string& path, const std::vector<HashedImage>& images)
{
    std::ofstream csv(path);
    if (!csv) {
        std::cerr << "Warning: Cannot create output file '" << path << "'\n";
        return false;
    }

    csv << "filepath,phash_hex\n";
    for (const auto& image : images) {
        csv << quoted(image.path.string()) << ',' << (image.fingerprint ? image.fingerprint->toHex() : "") << '\n';
    }
    return true;
}

bool saveMatchesCSV(const std::string& path,
                    const std::string& query,
                    const std::vector<sifinder::Match>& matches)
{
    std::ofstream csv(path);
    if (!csv) {
        std::cerr << "Warning: Cannot create output file '" << path << "'\n";
        return false;
    }

    csv << "query,match,distance,similarity\n";
    for (const auto& match : matches) {
        csv << quoted(query) << ',' << quoted(match.path) << ',' << match.distance << ','
            << std::format("{:.2f}", similarityPercent(match.distance)) << '\n';
    }
    return true;
}

} // namespace sifinder_app
