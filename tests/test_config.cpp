#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(PoolConfig, ParsesConnections) {
    auto result = PoolConfig::parse(R"(
request_timeout: 60
restart:
  max_restarts: 4
  initial_backoff_ms: 100
  max_backoff_ms: 800
connections:
  - name: hm_sftp
    host: example.com
    port: 2222
    user: u
    password: p
    timeout: 15
  - name: backup
    host: backup.example.com
    user: b
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& cfg = result.value;

    EXPECT_EQ(cfg.request_timeout(), 60);
    EXPECT_EQ(cfg.restart().max_restarts, 4);
    EXPECT_EQ(cfg.restart().initial_backoff_ms, 100);
    EXPECT_EQ(cfg.restart().max_backoff_ms, 800);

    ASSERT_EQ(cfg.endpoints().size(), 2u);
    const auto& ep = cfg.endpoints()[0];
    EXPECT_EQ(ep.name, "hm_sftp");
    EXPECT_EQ(ep.connection.host, "example.com");
    EXPECT_EQ(ep.connection.port, 2222);
    EXPECT_EQ(ep.connection.user, "u");
    EXPECT_EQ(ep.connection.password, "p");
    EXPECT_EQ(ep.connection.timeout, 15);
    EXPECT_EQ(ep.connection.sftp_version, 8);
}

TEST(PoolConfig, AppliesDefaults) {
    auto result = PoolConfig::parse(R"(
connections:
  - name: hm_sftp
    host: example.com
    user: u
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& cfg = result.value;

    EXPECT_EQ(cfg.request_timeout(), REQUEST_TIMEOUT_SECS);
    EXPECT_EQ(cfg.restart().max_restarts, 10);
    EXPECT_EQ(cfg.restart().initial_backoff_ms, 200);
    EXPECT_EQ(cfg.restart().max_backoff_ms, 5000);
    EXPECT_EQ(cfg.endpoints()[0].connection.port, 22);
    EXPECT_EQ(cfg.endpoints()[0].connection.timeout, 30);
}

TEST(PoolConfig, FindByName) {
    auto result = PoolConfig::parse(R"(
connections:
  - {name: a, host: a.example.com, user: u}
  - {name: b, host: b.example.com, user: u}
)");
    ASSERT_TRUE(result.is_ok());
    ASSERT_NE(result.value.find("b"), nullptr);
    EXPECT_EQ(result.value.find("b")->connection.host, "b.example.com");
    EXPECT_EQ(result.value.find("c"), nullptr);
}

TEST(PoolConfig, RejectsMissingConnections) {
    auto result = PoolConfig::parse("request_timeout: 10\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("'connections' must be a list"), std::string::npos);
}

TEST(PoolConfig, RejectsMissingName) {
    auto result = PoolConfig::parse(R"(
connections:
  - host: example.com
    user: u
)");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("missing 'name'"), std::string::npos);
}

TEST(PoolConfig, RejectsMissingHost) {
    auto result = PoolConfig::parse(R"(
connections:
  - name: hm_sftp
    user: u
)");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("missing 'host'"), std::string::npos);
}

TEST(PoolConfig, RejectsDuplicateNames) {
    auto result = PoolConfig::parse(R"(
connections:
  - {name: a, host: a.example.com, user: u}
  - {name: a, host: b.example.com, user: u}
)");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("duplicate connection name 'a'"), std::string::npos);
}

TEST(PoolConfig, RejectsOutOfRangePort) {
    for (const char* port : {"0", "65536", "-1"}) {
        auto result = PoolConfig::parse(std::string(R"(
connections:
  - name: a
    host: a.example.com
    user: u
    port: )") + port + "\n");
        ASSERT_TRUE(result.is_err()) << port;
        EXPECT_NE(result.error.find("invalid port"), std::string::npos) << port;
    }
}

TEST(PoolConfig, RejectsNonPositiveTimeouts) {
    EXPECT_TRUE(PoolConfig::parse("request_timeout: 0\nconnections: []\n").is_err());
    EXPECT_TRUE(PoolConfig::parse(R"(
restart:
  initial_backoff_ms: 500
  max_backoff_ms: 100
connections: []
)").is_err());
    EXPECT_TRUE(PoolConfig::parse(R"(
connections:
  - {name: a, host: a.example.com, user: u, timeout: 0}
)").is_err());
}

TEST(PoolConfig, RejectsOversizedConnectionTimeout) {
    auto result = PoolConfig::parse(R"(
connections:
  - {name: a, host: a.example.com, user: u, timeout: 3000000}
)");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("timeout exceeds"), std::string::npos);

    EXPECT_TRUE(PoolConfig::parse(R"(
connections:
  - {name: a, host: a.example.com, user: u, timeout: 86400}
)").is_ok());
}

TEST(PoolConfig, RejectsBadYaml) {
    auto result = PoolConfig::parse("connections: [unterminated\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Failed to parse config"), std::string::npos);
}

class PoolConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sftpool_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(PoolConfigFileTest, MissingFile) {
    auto result = PoolConfig::load(test_dir / "nope.yaml");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("Config not found"), std::string::npos);
}

TEST_F(PoolConfigFileTest, LoadsFromDisk) {
    std::ofstream(test_dir / "config.yaml")
        << "connections:\n  - {name: hm_sftp, host: example.com, user: u, password: p}\n";

    auto result = PoolConfig::load(test_dir / "config.yaml");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.endpoints()[0].name, "hm_sftp");
}

TEST_F(PoolConfigFileTest, DefaultConfigIsLoadable) {
    auto path = test_dir / "sub" / "config.yaml";
    ASSERT_TRUE(create_default_config(path).is_ok());
    ASSERT_TRUE(fs::exists(path));

    auto result = PoolConfig::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_TRUE(result.value.endpoints().empty());
    EXPECT_EQ(result.value.restart().max_restarts, 10);
}
