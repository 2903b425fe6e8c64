#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <signal.h>
#include <unistd.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "engine.hpp"
#include "gateway.hpp"
#include "input.hpp"
#include "notification.hpp"
#include "server.hpp"
#include "window.hpp"

static void SetLogLevel(LogLevel log_level) {
    if (log_level == LOG_DEBUG) {
        spdlog::set_level(spdlog::level::debug);
    } else if (log_level == LOG_INFO) {
        spdlog::set_level(spdlog::level::info);
    } else if (log_level == LOG_OFF) {
        spdlog::set_level(spdlog::level::off);
    }
}

// ─────────────────────────────────────
int main(int argc, char **argv) {
    // stdout carries the event stream, so logs go to stderr.
    spdlog::set_default_logger(spdlog::stderr_color_mt("aura"));

    CliOptions cli;
    std::string error;
    if (!ParseArgs(argc, argv, cli, error)) {
        std::fprintf(stderr, "aura-engine: %s\n\n%s", error.c_str(), Usage().c_str());
        return 2;
    }
    if (cli.show_help) {
        std::fputs(Usage().c_str(), stdout);
        return 0;
    }
    if (cli.show_version) {
        std::printf("aura-engine %s\n", AURA_VERSION);
        return 0;
    }

    const std::string configPath = cli.config_path.value_or(DefaultConfigPath());
    const RuntimeConfig config = ResolveConfig(LoadConfigFile(configPath), cli.overrides);
    SetLogLevel(config.log_level);

    if (!EnsureParentDir(config.db_path, error)) {
        spdlog::error("{}", error);
        return 1;
    }

    // Every thread started from here inherits the mask; the waiter below owns the signals.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::unique_ptr<Engine> engine;
    try {
        engine = std::make_unique<Engine>(config.db_path, NowUnix());
    } catch (const std::runtime_error &e) {
        spdlog::error("Failed to start engine: {}", e.what());
        return 1;
    }
    spdlog::info("DataBase path: {}", config.db_path);

    // Windows API (get AppID, Title)
    auto window = std::make_shared<Window>();
    if (window->IsAvailable()) {
        engine->SetForegroundProvider([window]() { return window->GetFocusedWindow(); });
        spdlog::info("Window API initialized");
    } else {
        spdlog::info("No supported compositor, foreground app tracking disabled");
    }

    // Notifications
    std::unique_ptr<Notification> notification;
    if (config.notify) {
        notification = std::make_unique<Notification>();
        if (!notification->IsConnected()) {
            spdlog::warn("Session bus unavailable, desktop notifications disabled");
            notification.reset();
        }
    }

    StdioGateway gateway(std::cout);
    Notification *notifier = notification.get();
    engine->SetEventSink([&gateway, notifier](const Event &ev) {
        gateway.Write(ev);
        if (notifier) {
            notifier->OnEvent(ev);
        }
    });

    InputListener input(engine->Input());
    if (config.input) {
        if (!input.Start()) {
            spdlog::warn("No readable input devices, activity metrics will stay idle");
        }
    }

    if (config.stdin_enabled) {
        Engine *e = engine.get();
        gateway.Start([e](const Command &cmd) { e->Post(cmd); },
                      [e]() {
                          spdlog::info("stdin closed, shutting down");
                          e->Post(Command{CommandType::SHUTDOWN, nlohmann::json::object()});
                      });
    }

    std::unique_ptr<Server> server;
    if (config.port != 0) {
        server = std::make_unique<Server>(*engine, config.port);
        if (!server->InitServer()) {
            spdlog::error("Failed to bind 127.0.0.1:{}", config.port);
            server.reset();
        } else {
            spdlog::info("Serving on: http://127.0.0.1:{}", config.port);
        }
    }

    std::thread signalThread([&signals, &engine]() {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0 && !engine->ShutdownRequested()) {
            spdlog::info("Received signal {}, shutting down", sig);
            engine->RequestShutdown();
        }
    });

    engine->SetTickInterval(std::chrono::milliseconds(config.tick_ms));
    engine->EmitReady();
    engine->Run();

    // Wake the signal waiter if the loop ended on its own.
    kill(getpid(), SIGTERM);
    signalThread.join();

    if (server) {
        server->Stop();
    }
    gateway.Stop();
    input.Stop();
    spdlog::info("Stopped");
    return 0;
}
