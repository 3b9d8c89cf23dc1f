#pragma once
#include "config.hpp"

// Creates the expenses table if it is missing. Idempotent, never touches
// existing rows. Throws StorageError if the database cannot be opened or written.
void ensure_schema(const StoreConfig& cfg);
