#include "config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

static void TrimInplace(std::string &s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
}

// ─────────────────────────────────────
static std::string Unquote(const std::string &s) {
    if (s.size() >= 2 &&
        ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// ─────────────────────────────────────
static std::optional<long> AsLong(const std::string &s) {
    if (s.empty()) {
        return std::nullopt;
    }
    char *end = nullptr;
    errno = 0;
    const long v = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

// ─────────────────────────────────────
static std::optional<bool> AsBool(const std::string &s) {
    const std::string v = ToLower(s);
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        return true;
    }
    if (v == "false" || v == "no" || v == "off" || v == "0") {
        return false;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
static std::optional<unsigned> AsPort(const std::string &s) {
    auto v = AsLong(s);
    if (!v || *v < 0 || *v > 65535) {
        return std::nullopt;
    }
    return static_cast<unsigned>(*v);
}

// ─────────────────────────────────────
static std::optional<int> AsTickMs(const std::string &s) {
    auto v = AsLong(s);
    if (!v || *v <= 0 || *v > 60000) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

// ─────────────────────────────────────
std::string ExpandPath(const std::string &p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        const char *home = std::getenv("HOME");
        if (home && *home) {
            return std::string(home) + p.substr(1);
        }
    }
    return p;
}

// ─────────────────────────────────────
std::string DefaultConfigPath() {
    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/aura/aura.conf";
    }
    const char *home = std::getenv("HOME");
    const std::string base = home ? std::string(home) + "/.config" : std::string(".config");
    return base + "/aura/aura.conf";
}

// ─────────────────────────────────────
std::string DefaultDBPath() {
    const char *xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && *xdg) {
        return std::string(xdg) + "/aura/aura.sqlite";
    }
    const char *home = std::getenv("HOME");
    const std::string base =
        home ? std::string(home) + "/.local/share" : std::string(".local/share");
    return base + "/aura/aura.sqlite";
}

// ─────────────────────────────────────
bool EnsureParentDir(const std::string &path, std::string &error) {
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        error = "cannot create " + parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

// ─────────────────────────────────────
std::optional<LogLevel> LogLevelFromString(const std::string &s) {
    const std::string v = ToLower(s);
    if (v == "debug") {
        return LOG_DEBUG;
    }
    if (v == "info") {
        return LOG_INFO;
    }
    if (v == "off" || v == "none") {
        return LOG_OFF;
    }
    return std::nullopt;
}

// ─────────────────────────────────────
AppConfig LoadConfigFile(const std::string &path) {
    AppConfig cfg;
    std::ifstream f(path);
    if (!f.good()) {
        spdlog::debug("No config file at {}", path);
        return cfg;
    }

    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        lineNo++;
        const auto posHash = line.find('#');
        const auto posSemi = line.find(';');
        const auto posComment = std::min(posHash == std::string::npos ? line.size() : posHash,
                                         posSemi == std::string::npos ? line.size() : posSemi);
        line = line.substr(0, posComment);
        TrimInplace(line);
        if (line.empty()) {
            continue;
        }

        const std::size_t sep = line.find('=');
        if (sep == std::string::npos) {
            spdlog::warn("{}:{}: expected 'key = value'", path, lineNo);
            continue;
        }

        std::string key = line.substr(0, sep);
        std::string val = line.substr(sep + 1);
        TrimInplace(key);
        TrimInplace(val);
        key = ToLower(key);
        val = Unquote(val);
        if (key.empty() || val.empty()) {
            continue;
        }

        bool ok = true;
        if (key == "db_path") {
            cfg.db_path = ExpandPath(val);
        } else if (key == "port") {
            cfg.port = AsPort(val);
            ok = cfg.port.has_value();
        } else if (key == "tick_ms") {
            cfg.tick_ms = AsTickMs(val);
            ok = cfg.tick_ms.has_value();
        } else if (key == "log_level") {
            cfg.log_level = LogLevelFromString(val);
            ok = cfg.log_level.has_value();
        } else if (key == "input") {
            cfg.input = AsBool(val);
            ok = cfg.input.has_value();
        } else if (key == "notify") {
            cfg.notify = AsBool(val);
            ok = cfg.notify.has_value();
        } else if (key == "stdin") {
            cfg.stdin_enabled = AsBool(val);
            ok = cfg.stdin_enabled.has_value();
        } else {
            spdlog::warn("{}:{}: unknown key '{}'", path, lineNo, key);
            continue;
        }
        if (!ok) {
            spdlog::warn("{}:{}: invalid value '{}' for {}", path, lineNo, val, key);
        }
    }
    return cfg;
}

// ─────────────────────────────────────
bool ParseArgs(int argc, char **argv, CliOptions &out, std::string &error) {
    for (int i = 1; i < argc; ++i) {
        const std::string s = argv[i];
        auto needValue = [&](std::string &value) {
            if (i + 1 >= argc) {
                error = s + " needs a value";
                return false;
            }
            value = argv[++i];
            return true;
        };

        std::string value;
        if (s == "--help" || s == "-h") {
            out.show_help = true;
        } else if (s == "--version" || s == "-v") {
            out.show_version = true;
        } else if (s == "--db") {
            if (!needValue(value)) {
                return false;
            }
            out.overrides.db_path = ExpandPath(value);
        } else if (s == "--config") {
            if (!needValue(value)) {
                return false;
            }
            out.config_path = ExpandPath(value);
        } else if (s == "--port") {
            if (!needValue(value)) {
                return false;
            }
            out.overrides.port = AsPort(value);
            if (!out.overrides.port) {
                error = "invalid port: " + value;
                return false;
            }
        } else if (s == "--tick-ms") {
            if (!needValue(value)) {
                return false;
            }
            out.overrides.tick_ms = AsTickMs(value);
            if (!out.overrides.tick_ms) {
                error = "invalid tick period: " + value;
                return false;
            }
        } else if (s == "--log-level") {
            if (!needValue(value)) {
                return false;
            }
            out.overrides.log_level = LogLevelFromString(value);
            if (!out.overrides.log_level) {
                error = "invalid log level: " + value + " (debug, info, off)";
                return false;
            }
        } else if (s == "--no-input") {
            out.overrides.input = false;
        } else if (s == "--no-stdin") {
            out.overrides.stdin_enabled = false;
        } else if (s == "--notify") {
            out.overrides.notify = true;
        } else {
            error = "unknown option: " + s;
            return false;
        }
    }
    return true;
}

// ─────────────────────────────────────
RuntimeConfig ResolveConfig(const AppConfig &file, const AppConfig &cli) {
    RuntimeConfig rc;
    rc.db_path = cli.db_path.value_or(file.db_path.value_or(DefaultDBPath()));
    rc.port = cli.port.value_or(file.port.value_or(0));
    rc.tick_ms = cli.tick_ms.value_or(file.tick_ms.value_or(1000));
    rc.log_level = cli.log_level.value_or(file.log_level.value_or(LOG_INFO));
    rc.input = cli.input.value_or(file.input.value_or(true));
    rc.notify = cli.notify.value_or(file.notify.value_or(false));
    rc.stdin_enabled = cli.stdin_enabled.value_or(file.stdin_enabled.value_or(true));
    return rc;
}

// ─────────────────────────────────────
std::string Usage() {
    std::ostringstream os;
    os << "aura-engine " << AURA_VERSION << "\n"
       << "Activity and break scheduling engine. JSON commands on stdin, events on stdout.\n\n"
       << "      --db <path>          SQLite database (default $XDG_DATA_HOME/aura/aura.sqlite)\n"
       << "      --port <n>           Serve the command API on 127.0.0.1:<n> (0 = off)\n"
       << "      --tick-ms <ms>       Engine tick period (default 1000)\n"
       << "      --log-level <lvl>    debug, info or off (default info)\n"
       << "      --config <path>      Config file (default $XDG_CONFIG_HOME/aura/aura.conf)\n"
       << "      --no-input           Do not read /dev/input\n"
       << "      --no-stdin           Do not read commands from stdin\n"
       << "      --notify             Mirror break and schedule alerts as desktop notifications\n"
       << "  -h, --help               Show this help\n"
       << "  -v, --version            Print the version\n";
    return os.str();
}
