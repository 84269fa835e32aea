#pragma once

#include "arguments.hpp"

namespace sifinder_app {

/**
 * Handles the 'search' command: lists indexed images similar to a query image
 * @param args Command arguments containing the query, the index and the threshold
 * @return 0 on success (also when nothing matched), 1 on error
 */
int handleSearchCommand(const Arguments& args);

} // namespace sifinder_app
