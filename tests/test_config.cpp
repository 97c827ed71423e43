#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <cstdlib>
#include <fstream>
#include <unistd.h>

static const char* ENV_VARS[] = {
    "SANDCACHE_HOST", "SANDCACHE_USER", "SANDCACHE_PASSWORD",
    "SANDCACHE_SSH_KEY", "SANDCACHE_TIMEOUT", "SANDCACHE_EXEC_TIMEOUT",
};

class ConfigTest : public ::testing::Test {
protected:
    fs::path dir;
    std::string saved_home;
    bool had_home = false;

    void SetUp() override {
        for (const char* name : ENV_VARS) unsetenv(name);
        if (const char* h = std::getenv("HOME")) {
            had_home = true;
            saved_home = h;
        }
        dir = platform::temp_dir() / ("sandcache_cfg_test_" + std::to_string(getpid()));
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        for (const char* name : ENV_VARS) unsetenv(name);
        if (had_home) setenv("HOME", saved_home.c_str(), 1);
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path write_yaml(const std::string& body) {
        fs::path p = dir / "config.yaml";
        std::ofstream(p) << body;
        return p;
    }
};

TEST_F(ConfigTest, Defaults) {
    Config c = Config::defaults();
    EXPECT_EQ(c.pool().idle_timeout_minutes, 30);
    EXPECT_EQ(c.pool().max_lifetime_minutes, 60);
    EXPECT_EQ(c.pool().sweep_interval_minutes, 5);
    EXPECT_EQ(c.pool().sandbox_timeout_ms, DEFAULT_SANDBOX_TIMEOUT_MS);
    EXPECT_EQ(c.pool().execution_timeout_ms, DEFAULT_EXECUTION_TIMEOUT_MS);
    EXPECT_EQ(c.provider().port, 22);
    EXPECT_EQ(c.provider().python, "python3");
    EXPECT_TRUE(c.provider().host.empty());
    EXPECT_FALSE(c.provider().ssh_key_path.has_value());
    EXPECT_EQ(c.source(), "");
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("SANDCACHE_HOST", "kernels.example.org", 1);
    setenv("SANDCACHE_USER", "ana", 1);
    setenv("SANDCACHE_PASSWORD", "s3cret", 1);
    setenv("SANDCACHE_TIMEOUT", "45000", 1);
    setenv("SANDCACHE_EXEC_TIMEOUT", "9000", 1);

    Config c = Config::defaults();
    EXPECT_EQ(c.provider().host, "kernels.example.org");
    EXPECT_EQ(c.provider().user, "ana");
    EXPECT_EQ(c.provider().password, "s3cret");
    EXPECT_EQ(c.pool().sandbox_timeout_ms, 45000);
    EXPECT_EQ(c.pool().execution_timeout_ms, 9000);
}

TEST_F(ConfigTest, InvalidTimeoutFallsBack) {
    setenv("SANDCACHE_TIMEOUT", "soon", 1);
    setenv("SANDCACHE_EXEC_TIMEOUT", "-5", 1);

    Config c = Config::defaults();
    EXPECT_EQ(c.pool().sandbox_timeout_ms, DEFAULT_SANDBOX_TIMEOUT_MS);
    EXPECT_EQ(c.pool().execution_timeout_ms, DEFAULT_EXECUTION_TIMEOUT_MS);
}

TEST_F(ConfigTest, LoadFile) {
    auto path = write_yaml(
        "provider:\n"
        "  host: box.internal\n"
        "  port: 2222\n"
        "  user: runner\n"
        "  ssh_key_path: /keys/id_ed25519\n"
        "  python: python3.11\n"
        "pool:\n"
        "  idle_timeout_minutes: 10\n"
        "  max_lifetime_minutes: 20\n"
        "  execution_timeout_ms: 5000\n"
        "output_dir: /tmp/sandcache-images\n"
        "log_file: /tmp/sandcache-test.log\n");

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.provider().host, "box.internal");
    EXPECT_EQ(c.provider().port, 2222);
    EXPECT_EQ(c.provider().user, "runner");
    ASSERT_TRUE(c.provider().ssh_key_path.has_value());
    EXPECT_EQ(*c.provider().ssh_key_path, "/keys/id_ed25519");
    EXPECT_EQ(c.provider().python, "python3.11");
    EXPECT_EQ(c.pool().idle_timeout_minutes, 10);
    EXPECT_EQ(c.pool().max_lifetime_minutes, 20);
    EXPECT_EQ(c.pool().sweep_interval_minutes, 5);
    EXPECT_EQ(c.pool().execution_timeout_ms, 5000);
    EXPECT_EQ(c.output_dir().string(), "/tmp/sandcache-images");
    ASSERT_TRUE(c.log_file().has_value());
    EXPECT_EQ(*c.log_file(), "/tmp/sandcache-test.log");
    EXPECT_EQ(c.source(), path.string());
}

TEST_F(ConfigTest, NonPositivePoolValuesFallBack) {
    auto path = write_yaml(
        "pool:\n"
        "  idle_timeout_minutes: -5\n"
        "  max_lifetime_minutes: 0\n"
        "  sweep_interval_minutes: 40000\n"
        "  sandbox_timeout_ms: -1\n"
        "  execution_timeout_ms: 0\n");

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const PoolConfig& pool = r.value.pool();
    EXPECT_EQ(pool.idle_timeout_minutes, DEFAULT_IDLE_TIMEOUT_MINUTES);
    EXPECT_EQ(pool.max_lifetime_minutes, DEFAULT_MAX_LIFETIME_MINUTES);
    EXPECT_EQ(pool.sweep_interval_minutes, 40000);
    EXPECT_EQ(pool.sandbox_timeout_ms, DEFAULT_SANDBOX_TIMEOUT_MS);
    EXPECT_EQ(pool.execution_timeout_ms, DEFAULT_EXECUTION_TIMEOUT_MS);
}

TEST_F(ConfigTest, NonNumericPoolValueIsError) {
    auto path = write_yaml("pool:\n  idle_timeout_minutes: soon\n");
    EXPECT_TRUE(Config::load_file(path).is_err());
}

TEST_F(ConfigTest, EnvironmentBeatsFile) {
    auto path = write_yaml("provider:\n  host: from-file\npool:\n  sandbox_timeout_ms: 1000\n");
    setenv("SANDCACHE_HOST", "from-env", 1);
    setenv("SANDCACHE_TIMEOUT", "2000", 1);

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.provider().host, "from-env");
    EXPECT_EQ(r.value.pool().sandbox_timeout_ms, 2000);
}

TEST_F(ConfigTest, HomeRelativeKeyPath) {
    setenv("HOME", dir.string().c_str(), 1);
    auto path = write_yaml("provider:\n  ssh_key_path: ~/.ssh/id_rsa\n");

    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_TRUE(r.value.provider().ssh_key_path.has_value());
    EXPECT_EQ(*r.value.provider().ssh_key_path, (dir / ".ssh/id_rsa").string());
}

TEST_F(ConfigTest, MalformedYamlIsError) {
    auto path = write_yaml("provider: [unclosed\n");
    auto r = Config::load_file(path);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Failed to parse config"), std::string::npos);
}

TEST_F(ConfigTest, MissingFileIsError) {
    auto r = Config::load_file(dir / "absent.yaml");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Config not found"), std::string::npos);
}

TEST_F(ConfigTest, LoadWithoutFileUsesDefaults) {
    setenv("HOME", dir.string().c_str(), 1);
    auto r = Config::load();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.source(), "");
    EXPECT_EQ(r.value.pool().idle_timeout_minutes, 30);
}

TEST_F(ConfigTest, CreateDefaultConfigNeverOverwrites) {
    setenv("HOME", dir.string().c_str(), 1);
    ASSERT_FALSE(config_exists());

    ASSERT_TRUE(create_default_config().is_ok());
    ASSERT_TRUE(config_exists());
    EXPECT_EQ(get_config_path().string(), (dir / ".sandcache" / "config.yaml").string());

    // The generated file parses back to the defaults
    auto loaded = Config::load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.pool().max_lifetime_minutes, 60);
    EXPECT_EQ(loaded.value.provider().port, 22);

    std::ofstream(get_config_path()) << "pool:\n  idle_timeout_minutes: 7\n";
    ASSERT_TRUE(create_default_config().is_ok());
    auto again = Config::load();
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value.pool().idle_timeout_minutes, 7);
}
