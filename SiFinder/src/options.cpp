#include "options.hpp"
#include "errors.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string_view>
#include <unordered_set>

namespace fs = std::filesystem;

namespace sifinder {

namespace {

std::string trimCopy(std::string_view value)
{
    const auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return {};

    const auto end = value.find_last_not_of(" \t\r\n");
    return std::string(value.substr(start, end - start + 1));
}

std::string toLowerCopy(std::string value)
{
    std::ranges::transform(value,
                           value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

fs::path envPath(const char* name)
{
    const char* value = std::getenv(name);
    return (value && *value) ? fs::path(value) : fs::path();
}

} // namespace

std::vector<std::string> parseExtensionList(const std::string& exts)
{
    std::vector<std::string> extensions;
    std::unordered_set<std::string> seen;

    std::string_view sv = exts;
    size_t start = 0;

    while (start < sv.size()) {
        const auto pos = sv.find_first_of(",;", start);
        const auto token = sv.substr(start, pos == std::string_view::npos ? sv.size() - start : pos - start);
        auto cleaned = trimCopy(token);

        if (!cleaned.empty() && cleaned.front() == '.') {
            cleaned.erase(0, 1);
        }

        cleaned = toLowerCopy(std::move(cleaned));
        if (!cleaned.empty() && seen.insert(cleaned).second) {
            extensions.emplace_back(std::move(cleaned));
        }

        if (pos == std::string_view::npos) break;

        start = pos + 1;
    }

    return extensions;
}

fs::path defaultDataDirectory()
{
    if (auto dir = envPath(defaults::DATA_DIR_ENV); !dir.empty()) return dir;
    if (auto xdg = envPath("XDG_DATA_HOME"); !xdg.empty()) return xdg / defaults::APP_DIR_NAME;
    if (auto home = envPath("HOME"); !home.empty()) return home / ".local" / "share" / defaults::APP_DIR_NAME;

    return fs::temp_directory_path() / defaults::FALLBACK_DIR_NAME;
}

fs::path ensureDataDirectory(const fs::path& dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (!ec && fs::is_directory(dir, ec)) return dir;

    SIFINDER_WARN("options", "cannot create data directory ", dir.string(), ": ", ec.message());

    auto tmp = envPath("TMPDIR");
    auto fallback = (tmp.empty() ? fs::path("/tmp") : tmp) / defaults::FALLBACK_DIR_NAME;

    fs::create_directories(fallback, ec);
    if (ec) {
        throw StoreError("Cannot create data directory '" + fallback.string() + "': " + ec.message());
    }
    return fallback;
}

FinderOptions defaultOptions()
{
    FinderOptions options;
    options.dataDirectory = defaultDataDirectory();
    options.extensions = parseExtensionList(defaults::EXTENSIONS);
    return options;
}

} // namespace sifinder
