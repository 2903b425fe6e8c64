#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class JsonParse {
  public:
    int GetInt(const nlohmann::json &j, const std::string &key, int fallback);
    std::optional<int> GetOptionalInt(const nlohmann::json &j, const std::string &key);
    int64_t GetInt64(const nlohmann::json &j, const std::string &key, int64_t fallback);
    double GetDouble(const nlohmann::json &j, const std::string &key, double fallback);
    bool GetBool(const nlohmann::json &j, const std::string &key, bool fallback);
    std::string GetString(const nlohmann::json &j, const std::string &key,
                          const std::string &fallback);
    std::vector<std::string> JsonArray2String(const nlohmann::json &arr);

    // Settings travel as strings; numbers and bools sent as JSON literals are flattened.
    std::string Stringify(const nlohmann::json &value);
};
