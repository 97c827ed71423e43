#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.sandcache/config.yaml (optional) and apply SANDCACHE_* overrides.
    static Result<Config> load();

    // Load a specific YAML file (must exist) and apply SANDCACHE_* overrides.
    static Result<Config> load_file(const fs::path& path);

    // Defaults + environment only, no file.
    static Config defaults();

    // Accessors
    const ProviderConfig& provider() const { return provider_; }
    const PoolConfig& pool() const { return pool_; }
    const fs::path& output_dir() const { return output_dir_; }
    const std::optional<std::string>& log_file() const { return log_file_; }

    // Where this config was read from ("" if defaults only)
    const std::string& source() const { return source_; }

public:
    Config();

private:
    ProviderConfig provider_;
    PoolConfig pool_;
    fs::path output_dir_;
    std::optional<std::string> log_file_;
    std::string source_;

    void apply_env_overrides();
};

// Helper to check if the config file exists
bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Create default config (never overwrites)
Result<void> create_default_config();
