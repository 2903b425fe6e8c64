#include "json.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>

// Whole-number view of a JSON number. Fractions are truncated; false when it does not fit.
static bool NumberToInt64(const nlohmann::json &v, int64_t &out) {
    if (v.is_number_unsigned()) {
        const uint64_t u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return false;
        }
        out = static_cast<int64_t>(u);
        return true;
    }
    if (v.is_number_integer()) {
        out = v.get<int64_t>();
        return true;
    }
    const double d = v.get<double>();
    // 2^63 is exact as a double; anything at or past it overflows.
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
        return false;
    }
    out = static_cast<int64_t>(d);
    return true;
}

// ─────────────────────────────────────
static bool NumberToInt(const nlohmann::json &v, int &out) {
    int64_t wide = 0;
    if (!NumberToInt64(v, wide) || wide < std::numeric_limits<int>::min() ||
        wide > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(wide);
    return true;
}

// ─────────────────────────────────────
int JsonParse::GetInt(const nlohmann::json &j, const std::string &key, int fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (!j.at(key).is_number()) {
        spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
        return fallback;
    }
    int val = 0;
    if (!NumberToInt(j.at(key), val)) {
        spdlog::warn("JsonParse: Key '{}' is out of range, using fallback {}", key, fallback);
        return fallback;
    }
    return val;
}

// ─────────────────────────────────────
std::optional<int> JsonParse::GetOptionalInt(const nlohmann::json &j, const std::string &key) {
    if (!j.is_object() || !j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    if (!j.at(key).is_number()) {
        spdlog::warn("JsonParse: Key '{}' is not a number, ignoring", key);
        return std::nullopt;
    }
    int val = 0;
    if (!NumberToInt(j.at(key), val)) {
        spdlog::warn("JsonParse: Key '{}' is out of range, ignoring", key);
        return std::nullopt;
    }
    return val;
}

// ─────────────────────────────────────
int64_t JsonParse::GetInt64(const nlohmann::json &j, const std::string &key, int64_t fallback) {
    if (!j.is_object() || !j.contains(key)) {
        return fallback;
    }
    if (!j.at(key).is_number()) {
        spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
        return fallback;
    }
    int64_t val = 0;
    if (!NumberToInt64(j.at(key), val)) {
        spdlog::warn("JsonParse: Key '{}' is out of range, using fallback {}", key, fallback);
        return fallback;
    }
    return val;
}

// ─────────────────────────────────────
double JsonParse::GetDouble(const nlohmann::json &j, const std::string &key, double fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback {}", key, fallback);
        return fallback;
    }
    if (j.at(key).is_number()) {
        return j.at(key).get<double>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a number, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
bool JsonParse::GetBool(const nlohmann::json &j, const std::string &key, bool fallback) {
    if (!j.is_object() || !j.contains(key)) {
        return fallback;
    }
    const auto &v = j.at(key);
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_number()) {
        return v.get<double>() != 0.0;
    }
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s == "true" || s == "1") {
            return true;
        }
        if (s == "false" || s == "0") {
            return false;
        }
    }
    spdlog::warn("JsonParse: Key '{}' is not a bool, using fallback {}", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::string JsonParse::GetString(const nlohmann::json &j, const std::string &key,
                                 const std::string &fallback) {
    if (!j.is_object() || !j.contains(key)) {
        spdlog::debug("JsonParse: Key '{}' not found, using fallback '{}'", key, fallback);
        return fallback;
    }
    if (j.at(key).is_string()) {
        return j.at(key).get<std::string>();
    }
    spdlog::warn("JsonParse: Key '{}' is not a string, using fallback '{}'", key, fallback);
    return fallback;
}

// ─────────────────────────────────────
std::vector<std::string> JsonParse::JsonArray2String(const nlohmann::json &arr) {
    std::vector<std::string> out;
    if (!arr.is_array()) {
        spdlog::warn("JsonParse: Expected array, got {}", arr.type_name());
        return out;
    }
    for (const auto &v : arr) {
        if (v.is_string()) {
            out.push_back(v.get<std::string>());
        } else {
            spdlog::warn("JsonParse: Array element is not string, skipping");
        }
    }
    return out;
}

// ─────────────────────────────────────
std::string JsonParse::Stringify(const nlohmann::json &value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    if (value.is_number_float()) {
        const double d = value.get<double>();
        int64_t whole = 0;
        if (NumberToInt64(value, whole) && static_cast<double>(whole) == d) {
            return std::to_string(whole);
        }
    }
    return value.dump();
}
