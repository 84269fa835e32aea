//
// save_results.hpp
// Functions for saving command results to CSV files
//

#pragma once

#include <string>
#include <vector>

#include "helpers.hpp"
#include "search_engine.hpp"

namespace sifinder_app {

/**
 * Save computed fingerprints to a CSV file
 * @param path Output file path
 * @param images Hashed images; rows without a fingerprint are written with an empty hash
 * @return false if the file could not be created
 */
bool saveHashesCSV(const std::string& path, const std::vector<HashedImage>& images);

/**
 * Save search matches to a CSV file, best match first
 * @param path Output file path
 * @param query Query image the matches were found for
 * @param matches Matches as returned by the search
 * @return false if the file could not be created
 */
bool saveMatchesCSV(const std::string& path,
                    const std::string& query,
                    const std::vector<sifinder::Match>& matches);

} // namespace sifinder_app
