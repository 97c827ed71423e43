#include "sandcache_cli.hpp"
#include "theme.hpp"
#include "commands/exec_helpers.hpp"
#include <iostream>
#include <sstream>
#include <fstream>
#include <cstdlib>
#include <core/config.hpp>
#include <core/log.hpp>
#include <readline/readline.h>
#include <readline/history.h>

SandcacheCLI::SandcacheCLI() : BaseCLI() {
    register_all_commands();
}

SandcacheCLI::~SandcacheCLI() {
    clear_pool();
}

void SandcacheCLI::register_all_commands() {
    add_command("help", [this](BaseCLI& cli, const std::string& arg) {
        this->print_help();
    }, "Show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Release all sandboxes and exit");

    add_command("exit", [](BaseCLI& cli, const std::string& arg) {
        cli.quit_requested = true;
    }, "Release all sandboxes and exit");

    register_connection_commands(*this);
    register_execution_commands(*this);
    register_session_commands(*this);
}

void SandcacheCLI::run_repl() {
    std::cout << theme::banner(SANDCACHE_VERSION);

    std::cout << theme::section("Configuration");
    if (!require_config()) {
        std::cout << "\n";
        return;
    }
    std::cout << theme::ok(config->source().empty()
        ? "Using defaults (no config file)"
        : "Loaded " + config->source());

    if (!init_pool()) {
        return;
    }
    std::cout << theme::ok("Sandbox pool ready");
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    std::cout << theme::dim("    Releasing sandboxes...") << "\n";
    clear_pool();
}

int SandcacheCLI::run_init() {
    if (config_exists()) {
        std::cout << theme::info("Config already exists at " + get_config_path().string());
        return 0;
    }

    auto result = create_default_config();
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + get_config_path().string());
    std::cout << theme::step("Set provider.host and provider.user, then run 'sandcache'.");
    return 0;
}

int SandcacheCLI::run_file(const std::string& session_id, const std::string& path) {
    if (!require_config()) return 1;

    std::ifstream in(path);
    if (!in) {
        std::cout << theme::fail("Cannot read " + path);
        return 1;
    }
    std::stringstream ss;
    ss << in.rdbuf();

    if (!init_pool()) return 1;

    current_session = session_id;
    auto result = pool->execute(session_id, ss.str());
    print_execution_result(*this, session_id, result);

    clear_pool();
    return result.failed() ? 1 : 0;
}
