// LoadJson.hpp - JSON loading and safe access helpers for configuration files
#pragma once

#include <nlohmann/json_fwd.hpp>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

namespace pc::json {

/**
 * Parse a JSON file.
 * @throws std::runtime_error if the file is missing, unreadable or malformed
 */
nlohmann::json load_json_file(const std::filesystem::path& path);

// Write with 2-space indentation. Throws std::runtime_error if the file cannot be opened.
void save_json_file(const nlohmann::json& json, const std::filesystem::path& path);

// ============ VALIDATION ============

/**
 * Ensure all required fields exist in a JSON object.
 * @param json The JSON object to validate
 * @param fields List of required field names
 * @param context Description for error messages (e.g., file path)
 * @throws std::runtime_error listing the first missing field
 */
void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context);

// ============ SAFE ACCESS HELPERS ============

// Returns a number if present (float/int or string convertible), else def.
double number_or(const nlohmann::json* m, const char* key, double def);

// Like number_or, but the value must be integral and fit an int.
// Throws InputError otherwise.
int int_or(const nlohmann::json* m, const char* key, int def);

// Returns a bool if present and of bool type, else def.
bool bool_or(const nlohmann::json* m, const char* key, bool def);

// Returns the child object if present & object, else nullptr.
const nlohmann::json* object_or_null(const nlohmann::json* m, const char* key);

// Integer array under key. Throws std::runtime_error if present but not an array of integers.
std::vector<int> int_array_or(const nlohmann::json* m, const char* key, const std::vector<int>& def);

} // namespace pc::json
