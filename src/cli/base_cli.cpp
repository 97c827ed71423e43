#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/log.hpp>
#include <provider/ssh_provider.hpp>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        if (config->log_file()) {
            set_sandcache_log_path(*config->log_file());
        }
    } else {
        config_error = config_result.error;
    }
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Configuration error: " + config_error);
        std::cout << theme::step("Fix " + get_config_path().string() + " or run 'sandcache init'.");
        return false;
    }
    return true;
}

bool BaseCLI::require_pool() {
    if (!require_config()) {
        return false;
    }
    if (!pool && !init_pool()) {
        return false;
    }
    return true;
}

bool BaseCLI::init_pool() {
    if (!config) return false;

    auto provider = std::make_shared<SshSandboxProvider>(config->provider());
    std::string cfg_err = provider->configuration_error();
    if (!cfg_err.empty()) {
        std::cout << theme::warn("Provider not configured: " + cfg_err);
        std::cout << theme::step("Executions will fail until this is fixed.");
    }

    pool = std::make_unique<SandboxPool>(provider, config->pool());
    pool->start();
    return true;
}

void BaseCLI::clear_pool() {
    if (pool) {
        pool->shutdown();
        pool.reset();
    }
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        sandcache_log(fmt::format("cli: command '{}' failed: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Execution", {"session", "exec", "load", "paste"}},
        {"Sandboxes", {"sessions", "stats", "terminate", "sweep"}},
        {"General",   {"status", "help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::SAND << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::SLATE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

int BaseCLI::next_image_index(const std::string& session_id) {
    return ++image_counters_[session_id];
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    return rl_esc(theme::color::SAND) + "sandcache"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::SLATE) + current_session
         + rl_esc(theme::color::RESET) + "> ";
}
