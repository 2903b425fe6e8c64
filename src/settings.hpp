#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "json.hpp"
#include "sqlite.hpp"

// Typed view over the settings table. Every read goes to the store.
class Settings {
  public:
    explicit Settings(SQLite &db);

    static const std::vector<std::pair<std::string, std::string>> &Defaults();
    static bool IsKnownKey(const std::string &key);
    static bool Validate(const std::string &key, const std::string &value, std::string &error);

    bool EnsureDefaults(std::string &error);
    bool Update(const std::string &key, const std::string &value, std::string &error);

    std::string GetString(const std::string &key);
    int GetInt(const std::string &key);
    double GetDouble(const std::string &key);
    bool GetBool(const std::string &key);
    std::vector<std::string> GetList(const std::string &key);
    std::map<std::string, std::string> All();

  private:
    static std::string DefaultFor(const std::string &key);

    SQLite &m_Db;
    JsonParse m_JsonParse;
};
