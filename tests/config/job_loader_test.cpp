#include "dsync/config/job_loader.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;
using dsync::ErrorKind;
using dsync::config::CliOverrides;
using dsync::config::parse_job;
using json = nlohmann::json;

class JobLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = dsync::testing::create_temp_dir("dsync_job_loader_test");
        local_ = root_ / "site";
        fs::create_directories(local_);

        document_ = {
            {"ssh", {{"hostname", "deploy.example.com"}, {"username", "deploy"}, {"password", "secret"}}},
            {"paths", {{"local", local_.string()}, {"remote", "/srv/app"}}},
        };
    }

    void TearDown() override { dsync::testing::remove_temp_dir(root_); }

    void expect_config_error(const CliOverrides& overrides = {}) {
        auto loaded = parse_job(document_, overrides);
        ASSERT_TRUE(loaded.is_error());
        EXPECT_EQ(loaded.error().kind, ErrorKind::ConfigError);
    }

    fs::path root_;
    fs::path local_;
    json document_;
};

TEST_F(JobLoaderTest, MinimalDocumentGetsDefaults) {
    auto loaded = parse_job(document_, {});
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();

    const auto& job = loaded.value().job;
    EXPECT_EQ(job.connection.hostname, "deploy.example.com");
    EXPECT_EQ(job.connection.port, 22);
    EXPECT_EQ(job.connection.username, "deploy");
    EXPECT_EQ(job.connection.credentials.password, std::optional<std::string>("secret"));
    EXPECT_FALSE(job.connection.credentials.key_file.has_value());
    EXPECT_FALSE(job.connection.proxy.has_value());
    EXPECT_EQ(job.connection.timeout, std::chrono::seconds(30));

    EXPECT_EQ(job.options.format, dsync::archive::ArchiveFormat::TarGz);
    EXPECT_TRUE(job.options.checksum_verify);
    EXPECT_FALSE(job.options.verify_after_extract);
    EXPECT_EQ(job.options.retry_attempts, 3u);
    EXPECT_EQ(job.options.retry_delay, std::chrono::milliseconds(5000));
    EXPECT_EQ(job.options.chunk_size, 8192u);
    EXPECT_FALSE(job.options.delete_before_sync);

    EXPECT_EQ(job.local_root, local_);
    EXPECT_EQ(job.remote_root, "/srv/app");
    EXPECT_EQ(loaded.value().logging.level, "INFO");
    EXPECT_FALSE(loaded.value().logging.file.has_value());
}

TEST_F(JobLoaderTest, ReadsEverySection) {
    document_["ssh"]["port"] = 2222;
    document_["ssh"]["timeout"] = 10;
    document_["ssh"]["key_file"] = "/keys/id_ed25519";
    document_["ssh"]["key_passphrase"] = "pp";
    document_["ssh"]["proxy"] = {{"hostname", "proxy.local"}, {"port", 1080}, {"type", "socks5"},
                                 {"username", "u"}, {"password", "p"}};
    document_["deploy"] = {{"compression_format", "zip"}, {"checksum_verify", false},
                           {"verify_after_extract", true}, {"retry_attempts", 5}, {"retry_delay", 1.5},
                           {"chunk_size", 65536}, {"delete_before_sync", true}};
    document_["logging"] = {{"level", "DEBUG"}, {"file", "/var/log/dsync.log"}};

    auto loaded = parse_job(document_, {});
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();

    const auto& job = loaded.value().job;
    EXPECT_EQ(job.connection.port, 2222);
    EXPECT_EQ(job.connection.timeout, std::chrono::seconds(10));
    EXPECT_EQ(job.connection.credentials.key_file, std::optional<fs::path>("/keys/id_ed25519"));
    EXPECT_EQ(job.connection.credentials.key_passphrase, std::optional<std::string>("pp"));
    ASSERT_TRUE(job.connection.proxy.has_value());
    EXPECT_EQ(job.connection.proxy->hostname, "proxy.local");
    EXPECT_EQ(job.connection.proxy->port, 1080);
    EXPECT_EQ(job.connection.proxy->kind, dsync::net::ProxyKind::Socks5);
    EXPECT_EQ(job.connection.proxy->username, std::optional<std::string>("u"));

    EXPECT_EQ(job.options.format, dsync::archive::ArchiveFormat::Zip);
    EXPECT_FALSE(job.options.checksum_verify);
    EXPECT_TRUE(job.options.verify_after_extract);
    EXPECT_EQ(job.options.retry_attempts, 5u);
    EXPECT_EQ(job.options.retry_delay, std::chrono::milliseconds(1500));
    EXPECT_EQ(job.options.chunk_size, 65536u);
    EXPECT_TRUE(job.options.delete_before_sync);

    EXPECT_EQ(loaded.value().logging.level, "DEBUG");
    EXPECT_EQ(loaded.value().logging.file, std::optional<fs::path>("/var/log/dsync.log"));
}

TEST_F(JobLoaderTest, ProxyWithoutHostnameIsIgnored) {
    document_["ssh"]["proxy"] = {{"hostname", ""}, {"port", 0}};
    auto loaded = parse_job(document_, {});
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_FALSE(loaded.value().job.connection.proxy.has_value());
}

TEST_F(JobLoaderTest, CliOverridesWin) {
    const fs::path other = root_ / "other";
    fs::create_directories(other);
    document_["deploy"] = {{"delete_before_sync", true}};

    CliOverrides overrides;
    overrides.local_path = other;
    overrides.remote_path = "/srv/other";
    overrides.delete_before_sync = false;

    auto loaded = parse_job(document_, overrides);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();
    EXPECT_EQ(loaded.value().job.local_root, other);
    EXPECT_EQ(loaded.value().job.remote_root, "/srv/other");
    EXPECT_FALSE(loaded.value().job.options.delete_before_sync);
}

TEST_F(JobLoaderTest, PathsMayComeOnlyFromCli) {
    document_.erase("paths");
    CliOverrides overrides;
    overrides.local_path = local_;
    overrides.remote_path = "/srv/app";
    EXPECT_TRUE(parse_job(document_, overrides).is_ok());

    expect_config_error();
}

TEST_F(JobLoaderTest, RejectsMissingIdentity) {
    document_["ssh"].erase("hostname");
    expect_config_error();

    document_["ssh"]["hostname"] = "deploy.example.com";
    document_["ssh"]["username"] = "";
    expect_config_error();
}

TEST_F(JobLoaderTest, RejectsOutOfRangeValues) {
    document_["ssh"]["port"] = 70000;
    expect_config_error();

    document_["ssh"]["port"] = 22;
    document_["deploy"] = {{"retry_attempts", 0}};
    expect_config_error();

    document_["deploy"] = {{"chunk_size", 0}};
    expect_config_error();

    document_["deploy"] = {{"compression_format", "rar"}};
    expect_config_error();

    document_["deploy"] = json::object();
    document_["ssh"]["proxy"] = {{"hostname", "proxy.local"}, {"port", 8080}, {"type", "ftp"}};
    expect_config_error();
}

TEST_F(JobLoaderTest, RejectsValuesAboveUpperBounds) {
    document_["deploy"] = {{"chunk_size", 1000000000000LL}};
    expect_config_error();

    document_["deploy"] = {{"chunk_size", dsync::config::kMaxChunkSize}};
    auto largest_chunk = parse_job(document_, {});
    ASSERT_TRUE(largest_chunk.is_ok()) << largest_chunk.error().describe();
    EXPECT_EQ(largest_chunk.value().job.options.chunk_size, dsync::config::kMaxChunkSize);

    document_["deploy"] = {{"retry_delay", 1e300}};
    expect_config_error();

    document_["deploy"] = {{"retry_delay", 3601}};
    expect_config_error();

    document_["deploy"] = {{"retry_attempts", 4000000000LL}};
    expect_config_error();

    document_["deploy"] = json::object();
    document_["ssh"]["timeout"] = 9000000000000000000LL;
    expect_config_error();

    document_["ssh"]["timeout"] = 3600;
    auto longest_timeout = parse_job(document_, {});
    ASSERT_TRUE(longest_timeout.is_ok()) << longest_timeout.error().describe();
    EXPECT_EQ(longest_timeout.value().job.connection.timeout, std::chrono::seconds(3600));
}

TEST_F(JobLoaderTest, RejectsWrongTypes) {
    document_["ssh"]["port"] = "twenty-two";
    expect_config_error();

    document_["ssh"]["port"] = 22;
    document_["deploy"] = {{"checksum_verify", "yes"}};
    expect_config_error();
}

TEST_F(JobLoaderTest, RejectsBadPaths) {
    document_["paths"]["remote"] = "relative/path";
    expect_config_error();

    document_["paths"]["remote"] = "/srv/app";
    document_["paths"]["local"] = (root_ / "missing").string();
    expect_config_error();

    dsync::testing::write_file(root_ / "file.txt", "x");
    document_["paths"]["local"] = (root_ / "file.txt").string();
    expect_config_error();
}

TEST(ExpandUserTest, ExpandsHomePrefixOnly) {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        GTEST_SKIP() << "HOME is not set";
    }
    EXPECT_EQ(dsync::config::expand_user("~"), fs::path(home));
    EXPECT_EQ(dsync::config::expand_user("~/.ssh/id_rsa"), fs::path(home) / ".ssh/id_rsa");
    EXPECT_EQ(dsync::config::expand_user("/abs/~/x"), fs::path("/abs/~/x"));
    EXPECT_EQ(dsync::config::expand_user("~other/x"), fs::path("~other/x"));
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override { root_ = dsync::testing::create_temp_dir("dsync_config_file_test"); }
    void TearDown() override { dsync::testing::remove_temp_dir(root_); }

    fs::path root_;
};

TEST_F(ConfigFileTest, ResolutionOrder) {
    auto none = dsync::config::resolve_config_path(std::nullopt, root_);
    ASSERT_TRUE(none.is_error());
    EXPECT_EQ(none.error().kind, ErrorKind::ConfigError);

    dsync::testing::write_file(root_ / "config.json", "{}");
    auto prod = dsync::config::resolve_config_path(std::nullopt, root_);
    ASSERT_TRUE(prod.is_ok());
    EXPECT_EQ(prod.value(), root_ / "config.json");

    dsync::testing::write_file(root_ / "config.yml", "{}");
    auto prod_yaml = dsync::config::resolve_config_path(std::nullopt, root_);
    ASSERT_TRUE(prod_yaml.is_ok());
    EXPECT_EQ(prod_yaml.value(), root_ / "config.yml");

    dsync::testing::write_file(root_ / "dev.config.json", "{}");
    auto dev = dsync::config::resolve_config_path(std::nullopt, root_);
    ASSERT_TRUE(dev.is_ok());
    EXPECT_EQ(dev.value(), root_ / "dev.config.json");

    dsync::testing::write_file(root_ / "dev.config.yml", "{}");
    auto dev_yaml = dsync::config::resolve_config_path(std::nullopt, root_);
    ASSERT_TRUE(dev_yaml.is_ok());
    EXPECT_EQ(dev_yaml.value(), root_ / "dev.config.yml");

    dsync::testing::write_file(root_ / "custom.json", "{}");
    auto explicit_path = dsync::config::resolve_config_path(root_ / "custom.json", root_);
    ASSERT_TRUE(explicit_path.is_ok());
    EXPECT_EQ(explicit_path.value(), root_ / "custom.json");

    auto missing = dsync::config::resolve_config_path(root_ / "nope.json", root_);
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::ConfigError);
}

TEST_F(ConfigFileTest, LoadsJobFile) {
    const fs::path site = root_ / "site";
    fs::create_directories(site);
    const json document = {
        {"ssh", {{"hostname", "h"}, {"username", "u"}, {"key_file", "/k"}}},
        {"deploy", {{"retry_delay", 2}}},
        {"paths", {{"local", site.string()}, {"remote", "/srv/x"}}},
    };
    dsync::testing::write_file(root_ / "config.json", document.dump(2));

    auto loaded = dsync::config::load_job_file(root_ / "config.json", {});
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();
    EXPECT_EQ(loaded.value().source, root_ / "config.json");
    EXPECT_EQ(loaded.value().job.options.retry_delay, std::chrono::milliseconds(2000));
}

TEST_F(ConfigFileTest, MalformedJsonIsConfigError) {
    dsync::testing::write_file(root_ / "config.json", "{ \"ssh\": ");
    auto loaded = dsync::config::load_job_file(root_ / "config.json", {});
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::ConfigError);
}

TEST_F(ConfigFileTest, LoadsYamlJobFile) {
    const fs::path site = root_ / "site";
    fs::create_directories(site);
    const std::string document =
        "ssh:\n"
        "  hostname: deploy.example.com\n"
        "  port: 2222\n"
        "  username: deploy\n"
        "  password: \"12345\"\n"
        "  proxy:\n"
        "    hostname: proxy.local\n"
        "    port: 1080\n"
        "    type: socks5\n"
        "deploy:\n"
        "  retry_attempts: 5\n"
        "  retry_delay: 2.5\n"
        "  compression_format: zip\n"
        "  delete_before_sync: true\n"
        "  chunk_size: 16384\n"
        "  checksum_verify: false\n"
        "paths:\n"
        "  local: " + site.string() + "\n"
        "  remote: /srv/app\n"
        "logging:\n"
        "  level: DEBUG\n";
    dsync::testing::write_file(root_ / "dev.config.yml", document);

    auto loaded = dsync::config::load_job_file(root_ / "dev.config.yml", {});
    ASSERT_TRUE(loaded.is_ok()) << loaded.error().describe();

    const auto& job = loaded.value().job;
    EXPECT_EQ(job.connection.hostname, "deploy.example.com");
    EXPECT_EQ(job.connection.port, 2222);
    EXPECT_EQ(job.connection.credentials.password, std::optional<std::string>("12345"));
    ASSERT_TRUE(job.connection.proxy.has_value());
    EXPECT_EQ(job.connection.proxy->port, 1080);
    EXPECT_EQ(job.options.retry_attempts, 5u);
    EXPECT_EQ(job.options.retry_delay, std::chrono::milliseconds(2500));
    EXPECT_EQ(job.options.format, dsync::archive::ArchiveFormat::Zip);
    EXPECT_TRUE(job.options.delete_before_sync);
    EXPECT_EQ(job.options.chunk_size, 16384u);
    EXPECT_FALSE(job.options.checksum_verify);
    EXPECT_EQ(job.remote_root, "/srv/app");
}

TEST_F(ConfigFileTest, YamlTypesAreCheckedLikeJson) {
    const fs::path site = root_ / "site";
    fs::create_directories(site);
    dsync::testing::write_file(root_ / "config.yaml",
                               "ssh:\n"
                               "  hostname: h\n"
                               "  username: u\n"
                               "  key_file: /k\n"
                               "  port: \"22\"\n"
                               "paths:\n"
                               "  local: " + site.string() + "\n"
                               "  remote: /srv/x\n");

    auto loaded = dsync::config::load_job_file(root_ / "config.yaml", {});
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::ConfigError);
}

TEST_F(ConfigFileTest, MalformedYamlIsConfigError) {
    dsync::testing::write_file(root_ / "config.yml", "ssh:\n  hostname: [unclosed\n");
    auto loaded = dsync::config::load_job_file(root_ / "config.yml", {});
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().kind, ErrorKind::ConfigError);

    dsync::testing::write_file(root_ / "empty.yml", "");
    auto empty = dsync::config::load_job_file(root_ / "empty.yml", {});
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().kind, ErrorKind::ConfigError);
}
