#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace sifinder {

namespace defaults {
    constexpr const char* EXTENSIONS = "png,jpg,jpeg,webp";
    constexpr const char* APP_DIR_NAME = "SI-Finder";
    constexpr const char* FALLBACK_DIR_NAME = "SI-Finder_Data";
    constexpr const char* DATA_DIR_ENV = "SIFINDER_DATA_DIR";

    constexpr int BATCH_SIZE = 64;
    constexpr int THRESHOLD = 8;
    constexpr int MAX_THRESHOLD = 20;
    constexpr std::chrono::milliseconds BUSY_TIMEOUT{ 10000 };
    constexpr std::chrono::milliseconds PROGRESS_INTERVAL{ 500 };
}

struct FinderOptions {
    std::filesystem::path dataDirectory;
    std::vector<std::string> extensions;
    int batchSize = defaults::BATCH_SIZE;
    std::chrono::milliseconds busyTimeout = defaults::BUSY_TIMEOUT;
    std::chrono::milliseconds progressInterval = defaults::PROGRESS_INTERVAL;
};

// "png, .JPG;webp" -> {"png", "jpg", "webp"}: lower case, no dots, no duplicates
std::vector<std::string> parseExtensionList(const std::string& exts);

// $SIFINDER_DATA_DIR, then $XDG_DATA_HOME/SI-Finder, then
// ~/.local/share/SI-Finder. Not created here.
std::filesystem::path defaultDataDirectory();

// Creates dir if needed; falls back to $TMPDIR/SI-Finder_Data when it cannot
// be created. Returns the directory actually usable.
std::filesystem::path ensureDataDirectory(const std::filesystem::path& dir);

// Options with every field resolved from the defaults above
FinderOptions defaultOptions();

} // namespace sifinder
