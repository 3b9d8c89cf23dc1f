#pragma once
#include "store.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

// JSON shapes returned to callers.
nlohmann::json created_json(int64_t id);                            // {"status":"ok","id":N}
nlohmann::json expense_json(const Expense& e);
nlohmann::json expenses_json(const std::vector<Expense>& rows);
nlohmann::json totals_json(const std::vector<CategoryTotal>& totals);  // [{"category","total_amount"}]

// Serializes j. Stored text is not guaranteed to be UTF-8; invalid bytes are
// replaced with U+FFFD instead of failing the whole result.
std::string render(const nlohmann::json& j, int indent = -1);
