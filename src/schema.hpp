#pragma once

#include <string>
#include <vector>

#include <mw/database.hpp>

#include "error.hpp"

// Names of the tables the forum needs, in creation order.
const std::vector<std::string>& requiredTables();

// Create whichever of the required tables are missing. Existing
// tables are never dropped or altered, so this is safe to run on
// every start.
E<void> ensureSchema(mw::SQLite& db);
