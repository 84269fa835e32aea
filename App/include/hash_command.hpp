#pragma once

#include "arguments.hpp"

namespace sifinder_app {

/**
 * Handles the 'hash' command: prints the fingerprints of the given images
 * @param args Command arguments containing the image list and output options
 * @return 0 if every image was hashed, 1 otherwise
 */
int handleHashCommand(const Arguments& args);

} // namespace sifinder_app
