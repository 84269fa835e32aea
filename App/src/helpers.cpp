//
// helpers.cpp
// Terminal output and utility functions for the sifinder CLI
//

#include "helpers.hpp"
#include "errors.hpp"

#include <rang.hpp>
#include <tabulate/table.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ranges>

namespace sifinder_app {

namespace fs = std::filesystem;
using namespace rang;
using namespace tabulate;

namespace {

void printLogo()
{
    constexpr std::string_view asciiArt = R"(
  .d8888b.  88     88888888 88                  88
 d88P  Y8b  ""     88       ""                  88
 Y88b.      88     88       88 88d888b.  .d8888 88 .d88b.  88d888
  "Y888b.   88     888888   88 88P "88b d88" 888 d8P  Y8b 88P"
     "Y88b. 88     88       88 88   888 888  888 88888888 88
 Y88b  d88P 88     88       88 88   888 Y88b 888 Y8b.     88
  "Y8888P"  88     88       88 88   888  "Y88888  "Y8888  88

)";
    std::cout << asciiArt;
}

} // namespace

sifinder::IndexHandle resolveIndex(sifinder::Finder& finder, const Arguments& args)
{
    if (!args.indexName.empty()) {
        return finder.openIndex(args.indexName);
    }

    const auto name = sifinder::stableIndexName(args.directory);
    try {
        return finder.openIndex(name);
    }
    catch (const sifinder::NotFoundError&) {
        throw sifinder::NotFoundError(std::format(
            "Directory '{}' has not been indexed yet. Run 'sifinder index -d {}' first.",
            args.directory.string(), args.directory.string()));
    }
}

std::string centerText(std::string_view text, int width) {
    if (text.length() >= static_cast<size_t>(width)) return std::string(text);
    int leftPadding = (width - static_cast<int>(text.length())) / 2;
    return std::string(leftPadding, ' ') + std::string(text);
}

indicators::ProgressBar bar(std::string_view prefix, bool show_elapsed, bool show_remaining) {
    return indicators::ProgressBar{
        indicators::option::BarWidth{30},
        indicators::option::PrefixText{std::string(prefix)},
        indicators::option::Start{"["},
        indicators::option::Fill{"="},
        indicators::option::Lead{">"},
        indicators::option::Remainder{" "},
        indicators::option::End{"]"},
        indicators::option::ShowPercentage{true},
        indicators::option::ShowElapsedTime{show_elapsed},
        indicators::option::ShowRemainingTime{show_remaining},
        indicators::option::Stream{std::cout}
    };
}

std::string formatFileSize(std::uintmax_t bytes)
{
    const char* units[] = { "B", "KB", "MB", "GB", "TB" };
    if (bytes == 0) return "0.00 B";

    int unit = std::min(4, static_cast<int>(std::log(static_cast<double>(bytes)) / std::log(1024.0)));
    double size = static_cast<double>(bytes) / std::pow(1024.0, unit);

    return std::format("{:.2f} {}", size, units[unit]);
}

double similarityPercent(int distance)
{
    const int bits = sifinder::Fingerprint::kBits;
    const int clamped = std::clamp(distance, 0, bits);
    return 100.0 * static_cast<double>(bits - clamped) / static_cast<double>(bits);
}

bool queryYesNo(const std::string& prompt)
{
    std::cout << prompt << " [y/N] " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return false;

    auto first = std::ranges::find_if(line, [](unsigned char c) { return !std::isspace(c); });
    if (first == line.end()) return false;

    char c = static_cast<char>(std::tolower(static_cast<unsigned char>(*first)));
    return c == 'y' || *first == '1';
}

void printConfiguration(std::string_view heading, const std::vector<std::pair<std::string, std::string>>& settings)
{
    printLogo();

    constexpr int colWidth = 18;
    const int tableWidth = static_cast<int>(std::max<size_t>(settings.size(), 1)) * (colWidth + 1) + 1;

    std::cout << style::italic << centerText(heading, tableWidth) << style::reset << '\n';

    Table::Row_t headerRow;
    Table::Row_t dataRow;
    for (const auto& [name, value] : settings) {
        headerRow.push_back(name);
        dataRow.push_back(value);
    }

    Table configurations;
    configurations.add_row(headerRow).add_row(dataRow);
    configurations.format().width(colWidth).font_align(FontAlign::center);
    configurations[0].format().font_style({ FontStyle::bold });

    std::cout << configurations << std::endl << std::endl;
}

void printIndexSummary(const sifinder::IndexSummary& summary)
{
    std::cout << fg::green << "\nIndexed " << withCommas(summary.total) << " image(s) in "
              << summary.elapsed.count() / 1000.0 << " seconds\n" << fg::reset;

    Table table;
    table.add_row({ "Hashed", "Unchanged", "Failed" });
    table.add_row({ withCommas(summary.hashed), withCommas(summary.unchanged), withCommas(summary.failed) });
    table.format().width(16).font_align(FontAlign::center);
    table[0].format().font_style({ FontStyle::bold });

    std::cout << table << '\n';

    if (summary.failed > 0) {
        std::cout << fg::yellow << "Warning: " << withCommas(summary.failed)
                  << " image(s) could not be decoded and were skipped" << fg::reset << '\n';
    }
}

void printMatches(const sifinder::SearchResult& result, const std::string& outputPath, size_t maxRows)
{
    if (result.matches.empty()) {
        std::cout << fg::yellow << "No similar images found." << fg::reset << '\n';
    }
    else {
        Table table;
        table.add_row({ "#", "Distance", "Similarity", "File" });

        const size_t shown = std::min(maxRows, result.matches.size());
        for (size_t i : std::views::iota(size_t{ 0 }, shown)) {
            const auto& match = result.matches[i];
            table.add_row({ std::to_string(i + 1),
                            std::to_string(match.distance),
                            std::format("{:.1f}%", similarityPercent(match.distance)),
                            match.path });
        }

        table.format().font_align(FontAlign::left);
        table[0].format().font_style({ FontStyle::bold });
        for (size_t col = 0; col < 3; ++col) {
            table.column(col).format().font_align(FontAlign::center);
        }

        std::cout << table << '\n';

        if (shown < result.matches.size()) {
            std::cout << "... and " << withCommas(result.matches.size() - shown) << " more match(es)\n";
        }
    }

    std::cout << style::italic << "Compared " << withCommas(result.scanned) << " indexed image(s)";
    if (result.missing > 0) {
        std::cout << ", skipped " << withCommas(result.missing) << " missing file(s)";
    }
    std::cout << style::reset << '\n';

    if (!outputPath.empty()) {
        std::cout << fg::green << withCommas(result.matches.size()) << " match(es) saved to " << outputPath
                  << fg::reset << '\n';
    }
}

void printIndexes(const std::vector<sifinder::IndexInfo>& indexes, const fs::path& dataDirectory)
{
    std::cout << style::italic << "Indexes in " << dataDirectory.string() << style::reset << '\n';

    if (indexes.empty()) {
        std::cout << "No indexes yet. Create one with 'sifinder index -d <directory>'.\n";
        return;
    }

    Table table;
    table.add_row({ "Name", "Images", "Size", "Source directory" });

    for (const auto& info : indexes) {
        std::error_code ec;
        const auto storeFile = dataDirectory / (info.name + sifinder::kStoreExtension);
        const auto bytes = fs::file_size(storeFile, ec);

        table.add_row({ info.name,
                        withCommas(info.recordCount),
                        ec ? std::string("?") : formatFileSize(bytes),
                        info.sourceDirectory.empty() ? std::string("(incomplete)") : info.sourceDirectory });
    }

    table[0].format().font_style({ FontStyle::bold });
    table.column(1).format().font_align(FontAlign::right);
    table.column(2).format().font_align(FontAlign::right);

    std::cout << table << '\n';
}

void printHashResults(const std::vector<HashedImage>& images, const std::string& outputPath, size_t maxRows)
{
    constexpr int tableWidth = (4 * 16) + 2;

    std::cout << style::italic << centerText("Results", tableWidth) << style::reset << '\n';

    Table results;
    results.add_row({ "File", "Fingerprint (Hex)" });

    const size_t shown = std::min(maxRows, images.size());
    for (size_t i : std::views::iota(size_t{ 0 }, shown)) {
        const auto& image = images[i];
        results.add_row({ image.path.filename().string(),
                          image.fingerprint ? image.fingerprint->toHex() : "error: " + image.error });
    }

    results.format().font_align(FontAlign::center);
    results[0].format().font_style({ FontStyle::bold });

    std::cout << results << '\n';

    if (images.size() > shown && !outputPath.empty()) {
        std::cout << style::italic << fg::green << centerText(std::format("{} fingerprints saved to {}",
                withCommas(images.size()), outputPath), tableWidth) << style::reset << fg::reset << '\n';
    }
}

} // namespace sifinder_app
