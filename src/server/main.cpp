// SPDX-License-Identifier: Apache-2.0
#include "common/logger.hpp"
#include "common/metrics.hpp"
#include "server/config.hpp"
#include "server/game/match.hpp"
#include "server/net/listener.hpp"
#include "server/server_context.hpp"

#include <coro/default_executor.hpp>
#include <coro/io_scheduler.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>

namespace {
std::atomic_bool g_signal{false};
}

static void handle_signal(int)
{
    g_signal.store(true);
}

// Entry point for the authoritative match server.
int main(int argc, char **argv)
{
    std::string config_path = "config/server.yaml";
    bool cli_port_override = false;
    uint16_t port_override = 0;
    int duration_override_sec = 0; // 0 means run until signal
    std::string map_override;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--port" && i + 1 < argc) {
            try {
                port_override = static_cast<uint16_t>(std::stoi(argv[++i]));
                cli_port_override = true;
            } catch (const std::exception &) {
                hax::log::warn("Invalid --port value '{}', ignoring", argv[i]);
            }
        } else if (a == "--duration" && i + 1 < argc) {
            try {
                duration_override_sec = std::stoi(argv[++i]);
            } catch (const std::exception &) {
                hax::log::warn("Invalid --duration value '{}', ignoring", argv[i]);
            }
        } else if (a == "--map" && i + 1 < argc) {
            map_override = argv[++i];
        } else if (!a.empty() && a[0] != '-') {
            config_path = a;
        }
    }
    hax::srv::ServerConfig cfg;
    try {
        cfg = hax::srv::load_server_config(config_path);
        if (!map_override.empty()) {
            (void)hax::sim::map_by_name(map_override); // throws on unknown names
            cfg.map_name = map_override;
        }
    } catch (const std::exception &ex) {
        hax::log::error("Failed to load config: {}", ex.what());
        return 1;
    }
    if (const char *env_port = std::getenv("HAX_PORT"); env_port && !cli_port_override) {
        try {
            port_override = static_cast<uint16_t>(std::stoi(env_port));
            cli_port_override = true;
        } catch (const std::exception &) {
            hax::log::warn("Invalid HAX_PORT value '{}', ignoring", env_port);
        }
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    // Do not override an explicit external setting.
    if (!cfg.log_level.empty() && std::getenv("HAX_LOG_LEVEL") == nullptr) {
        setenv("HAX_LOG_LEVEL", cfg.log_level.c_str(), 1);
    }
    if (cfg.log_json) {
        setenv("HAX_LOG_JSON", "1", 1);
    }
    hax::log::init();
    hax::log::info("haxlab server starting (version: {} sha:{})", HAX_VERSION, HAX_GIT_SHA);
    if (cli_port_override) {
        cfg.listen_port = port_override;
        hax::log::info("Override: listen_port set to {}", cfg.listen_port);
    }
    if (duration_override_sec > 0) {
        hax::log::info("CLI override: auto-shutdown after {} seconds", duration_override_sec);
    }
    hax::log::info("Tick rate: {} Hz", cfg.tick_rate);
    hax::log::info("Listening on port: {}", cfg.listen_port);
    hax::log::info("Map: {} kick_mode: {}", cfg.map_name, hax::sim::kick_mode_name(cfg.match.kick_mode));
    if (cfg.allow_remote_control) {
        hax::log::info("Remote match control enabled");
    }

    auto ctx = std::make_shared<hax::srv::ServerContext>(std::move(cfg));
    auto scheduler = coro::default_executor::io_executor();
    scheduler->spawn(hax::net::run_listener(scheduler, ctx));
    scheduler->spawn(hax::net::run_heartbeat_monitor(scheduler, ctx));
    scheduler->spawn(hax::game::run_match(scheduler, ctx));

    auto run_start = std::chrono::steady_clock::now();
    auto last_metrics = run_start;
    while (!ctx->shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (g_signal.load()) {
            hax::log::info("Signal received, shutting down...");
            ctx->shutdown.store(true);
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (duration_override_sec > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - run_start).count();
            if (elapsed >= duration_override_sec) {
                hax::log::info("Duration reached ({}s >= {}s); initiating shutdown", elapsed, duration_override_sec);
                ctx->shutdown.store(true);
            }
        }
        if (ctx->match_finished.load()) {
            hax::log::info("Match finished; shutting down");
            ctx->shutdown.store(true);
        }
        if (now - last_metrics >= std::chrono::seconds(60)) {
            last_metrics = now;
            hax::log::info(hax::metrics::summary_json("runtime"));
        }
    }
    // Give coroutines a moment to observe the flag and close sockets.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    hax::log::info(hax::metrics::summary_json("runtime_final"));
    hax::log::flush();
    return 0;
}
