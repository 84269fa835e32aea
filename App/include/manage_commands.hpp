#pragma once

#include "arguments.hpp"

namespace sifinder_app {

// 'list': table of the indexes in the data directory
int handleListCommand(const Arguments& args);

// 'delete': removes one index after confirmation (skipped with --yes)
int handleDeleteCommand(const Arguments& args);

// 'prune': drops records of files that no longer exist
int handlePruneCommand(const Arguments& args);

} // namespace sifinder_app
