#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

// Expand a leading "~/" against the home directory.
static std::string expand_home(const std::string& path) {
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

// Positive integer from the environment, or fallback when unset/unparseable.
static int env_int(const char* name, int fallback) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return fallback;
    int v = safe_stoi(raw, -1);
    return v > 0 ? v : fallback;
}

static const char* env_str(const char* name) {
    const char* raw = std::getenv(name);
    return (raw && *raw) ? raw : nullptr;
}

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# sandcache configuration
# Every key is optional. SANDCACHE_* environment variables override this file.

provider:
  host: ""                         # SSH host that runs the Python kernels (SANDCACHE_HOST)
  port: 22
  user: ""                         # SANDCACHE_USER
  # password: ""                   # prefer SANDCACHE_PASSWORD
  # ssh_key_path: "~/.ssh/id_ed25519"
  python: "python3"
  connect_timeout: 30

pool:
  idle_timeout_minutes: 30
  max_lifetime_minutes: 60
  sweep_interval_minutes: 5
  sandbox_timeout_ms: 120000       # SANDCACHE_TIMEOUT
  execution_timeout_ms: 120000     # SANDCACHE_EXEC_TIMEOUT

# Where the CLI writes images produced by executions
output_dir: "~/.sandcache/images"

# Optional: debug log location (default: <tmp>/sandcache_debug.log)
# log_file: "/tmp/sandcache_debug.log"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

static ProviderConfig parse_provider_config(const YAML::Node& node) {
    ProviderConfig provider;
    provider.host = node["host"].as<std::string>("");
    provider.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    provider.user = node["user"].as<std::string>("");
    provider.password = node["password"].as<std::string>("");
    provider.python = node["python"].as<std::string>(DEFAULT_PYTHON);
    provider.connect_timeout = node["connect_timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);

    if (node["ssh_key_path"]) {
        provider.ssh_key_path = expand_home(node["ssh_key_path"].as<std::string>());
    }

    return provider;
}

// Positive integer under pool.<key>, or fallback when absent. Zero and
// negative values fall back too, same as the environment overrides.
static int pool_int(const YAML::Node& node, const char* key, int fallback) {
    if (!node[key]) return fallback;
    int v = node[key].as<int>();
    if (v > 0) return v;
    sandcache_log(fmt::format("config: pool.{} = {} is not positive, using {}", key, v, fallback));
    return fallback;
}

static PoolConfig parse_pool_config(const YAML::Node& node) {
    PoolConfig pool;
    pool.idle_timeout_minutes = pool_int(node, "idle_timeout_minutes", DEFAULT_IDLE_TIMEOUT_MINUTES);
    pool.max_lifetime_minutes = pool_int(node, "max_lifetime_minutes", DEFAULT_MAX_LIFETIME_MINUTES);
    pool.sweep_interval_minutes = pool_int(node, "sweep_interval_minutes", DEFAULT_SWEEP_INTERVAL_MINUTES);
    pool.sandbox_timeout_ms = pool_int(node, "sandbox_timeout_ms", DEFAULT_SANDBOX_TIMEOUT_MS);
    pool.execution_timeout_ms = pool_int(node, "execution_timeout_ms", DEFAULT_EXECUTION_TIMEOUT_MS);
    return pool;
}

Config::Config()
    : output_dir_(get_config_dir() / "images") {}

Config Config::defaults() {
    Config config;
    config.apply_env_overrides();
    return config;
}

void Config::apply_env_overrides() {
    if (const char* v = env_str("SANDCACHE_HOST")) provider_.host = v;
    if (const char* v = env_str("SANDCACHE_USER")) provider_.user = v;
    if (const char* v = env_str("SANDCACHE_PASSWORD")) provider_.password = v;
    if (const char* v = env_str("SANDCACHE_SSH_KEY")) provider_.ssh_key_path = expand_home(v);

    pool_.sandbox_timeout_ms = env_int("SANDCACHE_TIMEOUT", pool_.sandbox_timeout_ms);
    pool_.execution_timeout_ms = env_int("SANDCACHE_EXEC_TIMEOUT", pool_.execution_timeout_ms);
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.provider_ = parse_provider_config(root["provider"] ? root["provider"] : YAML::Node());
        config.pool_ = parse_pool_config(root["pool"] ? root["pool"] : YAML::Node());

        if (root["output_dir"]) {
            config.output_dir_ = expand_home(root["output_dir"].as<std::string>());
        }
        if (root["log_file"]) {
            config.log_file_ = expand_home(root["log_file"].as<std::string>());
        }

        config.source_ = path.string();
        config.apply_env_overrides();
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load() {
    if (!config_exists()) {
        return Result<Config>::Ok(defaults());
    }
    return load_file(get_config_path());
}
