#pragma once

#include "pending_url_store.hpp"

#include <optional>
#include <string>

// Called by the UI once its listener is attached. Drains the URL buffered
// at cold start; later calls return nothing.
std::optional<std::string> frontend_ready(PendingUrlStore& store, bool verbose = false);
