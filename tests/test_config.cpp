#include <doctest/doctest.h>

#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include "config.hpp"
#include "test_support.hpp"

namespace {

struct Argv {
    explicit Argv(std::vector<std::string> args) : m_Args(std::move(args)) {
        for (auto &a : m_Args) {
            m_Ptrs.push_back(a.data());
        }
    }
    int argc() { return static_cast<int>(m_Ptrs.size()); }
    char **argv() { return m_Ptrs.data(); }

    std::vector<std::string> m_Args;
    std::vector<char *> m_Ptrs;
};

} // namespace

TEST_CASE("ParseArgs: flags") {
    Argv args({"aura-engine", "--db", "/tmp/x.sqlite", "--port", "8787", "--tick-ms", "250",
               "--log-level", "debug", "--no-input", "--notify"});
    CliOptions cli;
    std::string error;
    REQUIRE(ParseArgs(args.argc(), args.argv(), cli, error));
    CHECK(*cli.overrides.db_path == "/tmp/x.sqlite");
    CHECK(*cli.overrides.port == 8787);
    CHECK(*cli.overrides.tick_ms == 250);
    CHECK(*cli.overrides.log_level == LOG_DEBUG);
    CHECK_FALSE(*cli.overrides.input);
    CHECK(*cli.overrides.notify);
    CHECK_FALSE(cli.overrides.stdin_enabled.has_value());
    CHECK_FALSE(cli.show_help);
}

TEST_CASE("ParseArgs: bad input is reported, not thrown") {
    CliOptions cli;
    std::string error;

    Argv badPort({"aura-engine", "--port", "eighty"});
    CHECK_FALSE(ParseArgs(badPort.argc(), badPort.argv(), cli, error));
    CHECK(error == "invalid port: eighty");

    Argv missing({"aura-engine", "--db"});
    CHECK_FALSE(ParseArgs(missing.argc(), missing.argv(), cli, error));
    CHECK(error == "--db needs a value");

    Argv unknown({"aura-engine", "--frobnicate"});
    CHECK_FALSE(ParseArgs(unknown.argc(), unknown.argv(), cli, error));
    CHECK(error == "unknown option: --frobnicate");

    Argv zeroTick({"aura-engine", "--tick-ms", "0"});
    CHECK_FALSE(ParseArgs(zeroTick.argc(), zeroTick.argv(), cli, error));

    Argv help({"aura-engine", "-h"});
    CliOptions helpCli;
    REQUIRE(ParseArgs(help.argc(), help.argv(), helpCli, error));
    CHECK(helpCli.show_help);
}

TEST_CASE("LoadConfigFile: key = value with comments") {
    ScratchDir dir("config_file");
    const std::string path = dir.File("aura.conf");
    {
        std::ofstream f(path);
        f << "# aura settings\n"
          << "port = 9000\n"
          << "log_level = \"off\"   ; quiet\n"
          << "notify = yes\n"
          << "tick_ms = -3\n"
          << "colour = blue\n"
          << "not a pair\n";
    }

    const AppConfig cfg = LoadConfigFile(path);
    CHECK(*cfg.port == 9000);
    CHECK(*cfg.log_level == LOG_OFF);
    CHECK(*cfg.notify);
    CHECK_FALSE(cfg.tick_ms.has_value());
    CHECK_FALSE(cfg.db_path.has_value());

    CHECK_FALSE(LoadConfigFile(dir.File("missing.conf")).port.has_value());
}

TEST_CASE("ResolveConfig: flags override the file, then defaults") {
    AppConfig file;
    file.port = 9000;
    file.tick_ms = 500;
    file.notify = true;

    AppConfig cli;
    cli.port = 0;
    cli.db_path = "/tmp/cli.sqlite";

    const RuntimeConfig rc = ResolveConfig(file, cli);
    CHECK(rc.port == 0);
    CHECK(rc.tick_ms == 500);
    CHECK(rc.notify);
    CHECK(rc.db_path == "/tmp/cli.sqlite");
    CHECK(rc.log_level == LOG_INFO);
    CHECK(rc.input);
    CHECK(rc.stdin_enabled);
}

TEST_CASE("Paths: XDG variables and ~ expansion") {
    ::setenv("XDG_DATA_HOME", "/data", 1);
    ::setenv("XDG_CONFIG_HOME", "/conf", 1);
    CHECK(DefaultDBPath() == "/data/aura/aura.sqlite");
    CHECK(DefaultConfigPath() == "/conf/aura/aura.conf");
    ::unsetenv("XDG_DATA_HOME");
    ::unsetenv("XDG_CONFIG_HOME");

    const char *home = std::getenv("HOME");
    const std::string savedHome = home ? home : "";
    ::setenv("HOME", "/home/tester", 1);
    CHECK(ExpandPath("~/aura.sqlite") == "/home/tester/aura.sqlite");
    CHECK(ExpandPath("/abs/path") == "/abs/path");
    CHECK(DefaultDBPath() == "/home/tester/.local/share/aura/aura.sqlite");
    ::setenv("HOME", savedHome.c_str(), 1);
}
