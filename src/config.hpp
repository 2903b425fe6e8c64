#pragma once

#include <optional>
#include <string>

#include "common.hpp"

// Runtime options. Every field is optional so file values and flags can be layered.
struct AppConfig {
    std::optional<std::string> db_path; // --db
    std::optional<unsigned> port;       // --port, 0 disables HTTP
    std::optional<int> tick_ms;         // --tick-ms
    std::optional<LogLevel> log_level;  // --log-level
    std::optional<bool> input;          // --no-input
    std::optional<bool> notify;         // --notify
    std::optional<bool> stdin_enabled;  // --no-stdin
};

struct CliOptions {
    AppConfig overrides;
    std::optional<std::string> config_path; // --config
    bool show_help = false;
    bool show_version = false;
};

struct RuntimeConfig {
    std::string db_path;
    unsigned port = 0;
    int tick_ms = 1000;
    LogLevel log_level = LOG_INFO;
    bool input = true;
    bool notify = false;
    bool stdin_enabled = true;
};

// $XDG_CONFIG_HOME/aura/aura.conf or ~/.config/aura/aura.conf
std::string DefaultConfigPath();

// $XDG_DATA_HOME/aura/aura.sqlite or ~/.local/share/aura/aura.sqlite
std::string DefaultDBPath();

// Expand leading '~/' using $HOME.
std::string ExpandPath(const std::string &p);

bool EnsureParentDir(const std::string &path, std::string &error);

std::optional<LogLevel> LogLevelFromString(const std::string &s);

// key = value lines; '#' and ';' start comments; values may be quoted.
// A missing file yields an empty AppConfig.
AppConfig LoadConfigFile(const std::string &path);

bool ParseArgs(int argc, char **argv, CliOptions &out, std::string &error);

// Flags override the file; anything unset falls back to the defaults.
RuntimeConfig ResolveConfig(const AppConfig &file, const AppConfig &cli);

std::string Usage();
