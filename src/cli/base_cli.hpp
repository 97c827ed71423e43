#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/sandbox_pool.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_config();
    bool require_pool();

    // Build the pool from config. Warns (does not fail) on a missing credential.
    bool init_pool();
    void clear_pool();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Next image index for a session (1-based)
    int next_image_index(const std::string& session_id);

    // Public state
    std::optional<Config> config;
    std::string config_error;
    std::unique_ptr<SandboxPool> pool;
    std::string current_session = "default";
    bool quit_requested = false;

    // Returns the prompt string for readline
    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::map<std::string, int> image_counters_;
};
