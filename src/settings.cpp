#include "settings.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>

enum ValueKind { POSITIVE_INT, NON_NEGATIVE_INT, POSITIVE_NUMBER, BOOLEAN, TEXT, STRING_LIST };

struct SettingDef {
    const char *key;
    const char *value;
    ValueKind kind;
};

static const SettingDef kDefs[] = {
    {"water_goal", "2000", NON_NEGATIVE_INT},
    {"micro_break_interval", "1200", POSITIVE_INT},
    {"micro_break_duration", "20", NON_NEGATIVE_INT},
    {"macro_break_interval", "2700", POSITIVE_INT},
    {"macro_break_duration", "180", NON_NEGATIVE_INT},
    {"hydration_interval", "1800", POSITIVE_INT},
    {"idle_threshold", "180", POSITIVE_INT},
    {"idle_zero_threshold", "1", POSITIVE_NUMBER},
    {"timer_mode", "wall-clock", TEXT},
    {"auto_detect_fullscreen", "true", BOOLEAN},
    {"immersive_mode_enabled", "false", BOOLEAN},
    {"blocklist_processes",
     R"(["league_of_legends.exe","vlc.exe","obs64.exe","zoom.exe","discord.exe"])", STRING_LIST},
    {"sound_enabled", "true", BOOLEAN},
    {"auto_start", "false", BOOLEAN},
    {"close_to_tray", "true", BOOLEAN},
    {"theme", "dark", TEXT},
    {"schedule_mode", "same_every_day", TEXT},
};

static const SettingDef *FindDef(const std::string &key) {
    for (const auto &def : kDefs) {
        if (key == def.key) {
            return &def;
        }
    }
    return nullptr;
}

static bool ParseWholeNumber(const std::string &value, long long &out) {
    if (value.empty()) {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    out = std::strtoll(value.c_str(), &end, 10);
    return errno == 0 && end != nullptr && *end == '\0';
}

static bool ParseNumber(const std::string &value, double &out) {
    if (value.empty()) {
        return false;
    }
    char *end = nullptr;
    out = std::strtod(value.c_str(), &end);
    return end != nullptr && *end == '\0' && std::isfinite(out);
}

// ─────────────────────────────────────
Settings::Settings(SQLite &db) : m_Db(db) {}

// ─────────────────────────────────────
const std::vector<std::pair<std::string, std::string>> &Settings::Defaults() {
    static const std::vector<std::pair<std::string, std::string>> defaults = [] {
        std::vector<std::pair<std::string, std::string>> out;
        for (const auto &def : kDefs) {
            out.emplace_back(def.key, def.value);
        }
        return out;
    }();
    return defaults;
}

// ─────────────────────────────────────
bool Settings::IsKnownKey(const std::string &key) {
    return FindDef(key) != nullptr;
}

// ─────────────────────────────────────
bool Settings::Validate(const std::string &key, const std::string &value, std::string &error) {
    const SettingDef *def = FindDef(key);
    if (!def) {
        error = "Unknown setting: " + key;
        return false;
    }

    switch (def->kind) {
    case POSITIVE_INT: {
        long long n = 0;
        if (!ParseWholeNumber(value, n) || n <= 0 || n > 7 * 24 * 3600) {
            error = "Setting '" + key + "' must be a positive integer";
            return false;
        }
        break;
    }
    case NON_NEGATIVE_INT: {
        long long n = 0;
        if (!ParseWholeNumber(value, n) || n < 0 || n > 1000000) {
            error = "Setting '" + key + "' must be a non-negative integer";
            return false;
        }
        break;
    }
    case POSITIVE_NUMBER: {
        double d = 0.0;
        if (!ParseNumber(value, d) || d <= 0.0) {
            error = "Setting '" + key + "' must be a positive number";
            return false;
        }
        break;
    }
    case BOOLEAN:
        if (value != "true" && value != "false") {
            error = "Setting '" + key + "' must be 'true' or 'false'";
            return false;
        }
        break;
    case STRING_LIST: {
        nlohmann::json parsed;
        try {
            parsed = nlohmann::json::parse(value);
        } catch (const nlohmann::json::exception &e) {
            error = "Setting '" + key + "' must be a JSON array: " + e.what();
            return false;
        }
        if (!parsed.is_array()) {
            error = "Setting '" + key + "' must be a JSON array";
            return false;
        }
        for (const auto &item : parsed) {
            if (!item.is_string()) {
                error = "Setting '" + key + "' must only contain strings";
                return false;
            }
        }
        break;
    }
    case TEXT:
        if (value.empty()) {
            error = "Setting '" + key + "' must not be empty";
            return false;
        }
        if (key == "timer_mode" && !TimerModeFromString(value)) {
            error = "timer_mode must be 'active' or 'wall-clock'";
            return false;
        }
        if (key == "schedule_mode" && value != "same_every_day" && value != "custom") {
            error = "schedule_mode must be 'same_every_day' or 'custom'";
            return false;
        }
        break;
    }
    return true;
}

// ─────────────────────────────────────
bool Settings::EnsureDefaults(std::string &error) {
    return m_Db.SeedSettings(Defaults(), error);
}

// ─────────────────────────────────────
bool Settings::Update(const std::string &key, const std::string &value, std::string &error) {
    if (!Validate(key, value, error)) {
        spdlog::warn("Rejected setting {}={}: {}", key, value, error);
        return false;
    }
    if (!m_Db.SetSetting(key, value, error)) {
        return false;
    }
    spdlog::info("Setting updated: {}={}", key, value);
    return true;
}

// ─────────────────────────────────────
std::string Settings::DefaultFor(const std::string &key) {
    const SettingDef *def = FindDef(key);
    return def ? def->value : "";
}

// ─────────────────────────────────────
std::string Settings::GetString(const std::string &key) {
    auto value = m_Db.GetSetting(key);
    if (!value) {
        return DefaultFor(key);
    }
    std::string error;
    if (!Validate(key, *value, error)) {
        spdlog::warn("Stored setting {} is invalid ({}), using default", key, error);
        return DefaultFor(key);
    }
    return *value;
}

// ─────────────────────────────────────
int Settings::GetInt(const std::string &key) {
    return static_cast<int>(std::strtol(GetString(key).c_str(), nullptr, 10));
}

// ─────────────────────────────────────
double Settings::GetDouble(const std::string &key) {
    return std::strtod(GetString(key).c_str(), nullptr);
}

// ─────────────────────────────────────
bool Settings::GetBool(const std::string &key) {
    return GetString(key) == "true";
}

// ─────────────────────────────────────
std::vector<std::string> Settings::GetList(const std::string &key) {
    try {
        return m_JsonParse.JsonArray2String(nlohmann::json::parse(GetString(key)));
    } catch (const nlohmann::json::exception &e) {
        spdlog::warn("Setting {} is not a JSON list: {}", key, e.what());
        return {};
    }
}

// ─────────────────────────────────────
std::map<std::string, std::string> Settings::All() {
    return m_Db.GetAllSettings();
}
