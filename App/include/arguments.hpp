#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "options.hpp"

namespace sifinder_app {

namespace defaults {
    constexpr const char* DEFAULT_EXTENSIONS = sifinder::defaults::EXTENSIONS;
    constexpr const char* DEFAULT_OUTPUT = "";
    constexpr const char* DEFAULT_DATA_DIR = "";

    constexpr int BATCH_SIZE = sifinder::defaults::BATCH_SIZE;
    constexpr int LOG_LEVEL = 4;
    constexpr int THRESHOLD = sifinder::defaults::THRESHOLD;
    constexpr int MAX_THRESHOLD = sifinder::defaults::MAX_THRESHOLD;
    constexpr int LIMIT = 0;
    constexpr bool ASSUME_YES = false;
}

// Filled in by argparse
struct RawArguments {
    std::string directory;
    std::string indexName;
    std::string query;
    std::vector<std::string> images;
    std::string extensions = defaults::DEFAULT_EXTENSIONS;
    int batchSize = defaults::BATCH_SIZE;
    int logLevel = defaults::LOG_LEVEL;
    std::string dataDirectory = defaults::DEFAULT_DATA_DIR;
    std::string outputPath = defaults::DEFAULT_OUTPUT;

    int threshold = defaults::THRESHOLD;
    int limit = defaults::LIMIT;
    bool assumeYes = defaults::ASSUME_YES;
};

class Arguments {
public:
    enum class Command { Index, Search, Hash, List, Delete, Prune };

    Arguments(const RawArguments& raw, Command command);

    const Command command;
    const std::filesystem::path directory;
    const std::string indexName;
    const std::filesystem::path query;
    const std::vector<std::filesystem::path> images;
    const std::vector<std::string> extensions;
    const int batchSize;
    const int logLevel;
    const std::filesystem::path dataDirectory;
    const std::string outputPath;

    const int threshold;
    const int limit;
    const bool assumeYes;

    sifinder::FinderOptions finderOptions() const;
};

} // namespace sifinder_app
