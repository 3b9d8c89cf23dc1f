#pragma once
#include <string>
#include <vector>

// Static list of allowed category names, served to callers as-is.
// Nothing in the store checks categories against it.
std::string read_categories(const std::string& path);

// Names listed in a category document: either ["food", ...] or
// {"food": [...subcategories], ...}. Throws std::runtime_error on anything else.
std::vector<std::string> category_names(const std::string& document);
