#pragma once

#include "pending_url_store.hpp"

#include <string>
#include <vector>

// Buffers args[1] in the store if it is a deep link for `scheme`.
// Runs once at setup, before the UI can listen for events. Returns true
// if a URL was stored.
bool inspect_launch_args(const std::vector<std::string>& args, const std::string& scheme,
                         PendingUrlStore& store, bool verbose = false);
