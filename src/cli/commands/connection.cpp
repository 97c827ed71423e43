#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/config.hpp>
#include <core/log.hpp>

static void do_status(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::section("Status");

    if (config_exists()) {
        std::cout << theme::kv("Config", get_config_path().string());
    } else {
        std::cout << theme::kv("Config", "defaults (no " + get_config_path().string() + ")");
    }

    if (!cli.config.has_value()) {
        std::cout << theme::fail("Config invalid: " + cli.config_error);
        std::cout << "\n";
        return;
    }

    const auto& provider = cli.config->provider();
    const auto& pool_cfg = cli.config->pool();
    std::string host = provider.host.empty()
        ? "not set"
        : fmt::format("{}@{}:{}", provider.user, provider.host, provider.port);
    std::cout << theme::kv("Host", host);
    std::cout << theme::kv("Auth", provider.ssh_key_path ? "key " + *provider.ssh_key_path
                                 : provider.password.empty() ? "none" : "password");
    std::cout << theme::kv("Python", provider.python);
    std::cout << theme::kv("Idle", fmt::format("{}m", pool_cfg.idle_timeout_minutes));
    std::cout << theme::kv("Lifetime", fmt::format("{}m", pool_cfg.max_lifetime_minutes));
    std::cout << theme::kv("Sweep", fmt::format("every {}m", pool_cfg.sweep_interval_minutes));
    std::cout << theme::kv("Timeouts", fmt::format("create {}ms, run {}ms",
                                                   pool_cfg.sandbox_timeout_ms,
                                                   pool_cfg.execution_timeout_ms));
    std::cout << theme::kv("Images", cli.config->output_dir().string());
    std::cout << theme::kv("Log", sandcache_log_path());

    if (cli.pool) {
        std::cout << theme::kv("Cleanup", cli.pool->scheduler_running() ? "running" : "stopped");
        std::string cfg_err = cli.pool->provider().configuration_error();
        if (!cfg_err.empty()) {
            std::cout << theme::warn(cfg_err);
        }
    } else {
        std::cout << theme::kv("Pool", "not started");
    }
    std::cout << "\n";
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Show configuration and pool status");
}
