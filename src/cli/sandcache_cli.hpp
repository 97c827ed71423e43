#pragma once

#include "base_cli.hpp"
#include <string>

constexpr const char* SANDCACHE_VERSION = "0.1.0";

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_execution_commands(BaseCLI& cli);
void register_session_commands(BaseCLI& cli);

class SandcacheCLI : public BaseCLI {
public:
    SandcacheCLI();
    ~SandcacheCLI() override;

    void run_repl();
    int run_init();

    // One-shot: execute a file in a session, print, release everything.
    int run_file(const std::string& session_id, const std::string& path);

private:
    void register_all_commands();
};
