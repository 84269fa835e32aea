#include "arguments.hpp"

#include <concepts>
#include <format>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace sifinder_app {

namespace fs = std::filesystem;

namespace {

template<std::integral T>
T validateInRange(std::string_view flag, T value, T min, T max)
{
    if (value < min || value > max) {
        throw std::invalid_argument(std::format("{} must be between {} and {} (received {}).", flag, min, max, value));
    }
    return value;
}

int validatePositive(std::string_view flag, int value)
{
    if (value <= 0) {
        throw std::invalid_argument(
            std::format("{} must be greater than zero (received {}).", flag, value));
    }
    return value;
}

bool needsDirectory(Arguments::Command command)
{
    return command == Arguments::Command::Index;
}

// search and prune address an index either by directory or by name
bool needsTarget(Arguments::Command command)
{
    return command == Arguments::Command::Search || command == Arguments::Command::Prune;
}

fs::path validateDirectory(const fs::path& input, Arguments::Command command)
{
    if (input.empty()) {
        if (needsDirectory(command)) {
            throw std::invalid_argument("A directory must be provided (--directory).");
        }
        return {};
    }

    std::error_code ec;
    if (!fs::exists(input, ec)) {
        throw std::invalid_argument("Directory '" + input.string() + "' does not exist.");
    }

    if (!fs::is_directory(input, ec)) {
        throw std::invalid_argument("Path '" + input.string() + "' is not a directory.");
    }

    const auto absolutePath = fs::weakly_canonical(input, ec);
    if (ec) {
        throw std::invalid_argument("Unable to resolve directory '" + input.string() + "': " + ec.message());
    }

    return absolutePath;
}

std::string validateIndexName(const RawArguments& raw, Arguments::Command command)
{
    if (command == Arguments::Command::Delete && raw.indexName.empty()) {
        throw std::invalid_argument("An index name must be provided.");
    }

    if (needsTarget(command)) {
        const bool hasDirectory = !raw.directory.empty();
        const bool hasName = !raw.indexName.empty();
        if (hasDirectory == hasName) {
            throw std::invalid_argument("Provide exactly one of --directory or --name.");
        }
    }

    if (raw.indexName.find('/') != std::string::npos) {
        throw std::invalid_argument("Index name '" + raw.indexName + "' must not contain '/'.");
    }

    return raw.indexName;
}

fs::path validateQuery(const fs::path& input, Arguments::Command command)
{
    if (command != Arguments::Command::Search) return input;

    if (input.empty()) {
        throw std::invalid_argument("A query image must be provided (--query).");
    }

    std::error_code ec;
    if (!fs::is_regular_file(input, ec)) {
        throw std::invalid_argument("Query image '" + input.string() + "' does not exist.");
    }
    return input;
}

std::vector<fs::path> validateImages(const std::vector<std::string>& images, Arguments::Command command)
{
    if (command == Arguments::Command::Hash && images.empty()) {
        throw std::invalid_argument("At least one image must be provided.");
    }
    return { images.begin(), images.end() };
}

std::vector<std::string> validateExtensions(const std::string& exts)
{
    auto extensions = sifinder::parseExtensionList(exts);
    if (extensions.empty()) {
        throw std::invalid_argument("--extensions must name at least one extension.");
    }
    return extensions;
}

fs::path resolveDataDirectory(const std::string& input)
{
    return input.empty() ? sifinder::defaultDataDirectory() : fs::path(input);
}

} // namespace

Arguments::Arguments(const RawArguments& raw, Command command)
    : command(command),
      directory(validateDirectory(raw.directory, command)),
      indexName(validateIndexName(raw, command)),
      query(validateQuery(raw.query, command)),
      images(validateImages(raw.images, command)),
      extensions(validateExtensions(raw.extensions)),
      batchSize(validatePositive("--batch-size", raw.batchSize)),
      logLevel(validateInRange("--log-level", raw.logLevel, 1, 4)),
      dataDirectory(resolveDataDirectory(raw.dataDirectory)),
      outputPath(raw.outputPath),
      threshold(command == Command::Search
                    ? validateInRange("--threshold", raw.threshold, 0, defaults::MAX_THRESHOLD)
                    : raw.threshold),
      limit(validateInRange("--limit", raw.limit, 0, std::numeric_limits<int>::max())),
      assumeYes(raw.assumeYes)
{
}

sifinder::FinderOptions Arguments::finderOptions() const
{
    sifinder::FinderOptions options;
    options.dataDirectory = sifinder::ensureDataDirectory(dataDirectory);
    options.extensions = extensions;
    options.batchSize = batchSize;
    return options;
}

} // namespace sifinder_app
