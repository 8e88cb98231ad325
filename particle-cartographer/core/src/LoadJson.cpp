#include "pc/core/util/LoadJson.hpp"

#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>

#include "pc/core/util/Errors.hpp"

namespace pc::json {

nlohmann::json load_json_file(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("JSON file not found: " + path.string());
    }
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open JSON file: " + path.string());
    }
    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path.string() + ": " + e.what());
    }
}

void save_json_file(const nlohmann::json& json, const std::filesystem::path& path)
{
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write JSON file: " + path.string());
    }
    file << json.dump(2) << '\n';
}

void require_fields(
    const nlohmann::json& json,
    std::initializer_list<const char*> fields,
    const std::string& context)
{
    for (const char* field : fields) {
        if (!json.contains(field)) {
            throw std::runtime_error(context + " missing required field: " + field);
        }
    }
}

double number_or(const nlohmann::json* m, const char* key, double def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (it->is_number_float())   return it->get<double>();
    if (it->is_number_integer()) return static_cast<double>(it->get<int64_t>());
    if (it->is_string()) {
        try { return std::stod(it->get<std::string>()); } catch (const std::logic_error&) { return def; }
    }
    return def;
}

int int_or(const nlohmann::json* m, const char* key, int def) {
    const double v = number_or(m, key, def);
    if (!std::isfinite(v) || v != std::floor(v) ||
        v < static_cast<double>(std::numeric_limits<int>::min()) ||
        v > static_cast<double>(std::numeric_limits<int>::max())) {
        throw InputError(std::string("field '") + key + "' must be an integer in int range");
    }
    return static_cast<int>(v);
}

bool bool_or(const nlohmann::json* m, const char* key, bool def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it != m->end() && it->is_boolean()) return it->get<bool>();
    return def;
}

const nlohmann::json* object_or_null(const nlohmann::json* m, const char* key) {
    if (!m || !m->is_object()) return nullptr;
    auto it = m->find(key);
    if (it != m->end() && it->is_object()) return &*it;
    return nullptr;
}

std::vector<int> int_array_or(const nlohmann::json* m, const char* key, const std::vector<int>& def) {
    if (!m || !m->is_object()) return def;
    auto it = m->find(key);
    if (it == m->end()) return def;
    if (!it->is_array()) {
        throw std::runtime_error(std::string("field '") + key + "' must be an array");
    }
    std::vector<int> out;
    out.reserve(it->size());
    for (const auto& v : *it) {
        if (!v.is_number_integer()) {
            throw std::runtime_error(std::string("field '") + key + "' must contain integers only");
        }
        const int64_t i = v.get<int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
            throw std::runtime_error(std::string("field '") + key + "' holds an out-of-range integer");
        }
        out.push_back(static_cast<int>(i));
    }
    return out;
}

} // namespace pc::json
