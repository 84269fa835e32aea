#pragma once

#include "arguments.hpp"

namespace sifinder_app {

/**
 * Handles the 'index' command: creates or refreshes the index of a directory
 * @param args Command arguments containing the directory and batching options
 * @return 0 on success, 1 on error
 */
int handleIndexCommand(const Arguments& args);

} // namespace sifinder_app
