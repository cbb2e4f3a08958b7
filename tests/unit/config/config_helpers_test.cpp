#include <gtest/gtest.h>

#include <modelfetch/config/config_helpers.h>

#include "../../support/scoped_env.hpp"
#include "../../support/temp_dir_scope.hpp"


using namespace modelfetch::config;
using modelfetch::test_support::ScopedEnv;
using modelfetch::test_support::TempDirScope;
using modelfetch::test_support::write_file;

namespace {

constexpr const char* kConfig = R"(# modelfetch settings
[core]
concurrency = 99

[downloader]
concurrency = 8
chunk_size = 2_097_152   # 2 MiB
verify = false
max_retry = 5
checkpoint_interval_ms = 2500
checkpoint_bytes = 4096
connect_timeout_ms = 1000
stall_timeout_ms = 9000
endpoint = "https://mirror.example.com"
state_dir = "/var/lib/modelfetch"
)";

} // namespace

TEST(ConfigHelpers, ParseValueHonoursSectionsQuotesAndComments) {
    auto dir = TempDirScope::unique_under("mf-config");
    const auto path = dir.path() / "config.toml";
    write_file(path, kConfig);

    EXPECT_EQ(parse_config_value(path, "downloader", "concurrency"), "8");
    EXPECT_EQ(parse_config_value(path, "core", "concurrency"), "99");
    EXPECT_EQ(parse_config_value(path, "downloader", "chunk_size"), "2_097_152");
    EXPECT_EQ(parse_config_value(path, "downloader", "endpoint"), "https://mirror.example.com");
    EXPECT_EQ(parse_config_value(path, "downloader", "missing"), "");
    EXPECT_EQ(parse_config_value(dir.path() / "nope.toml", "downloader", "concurrency"), "");
}

TEST(ConfigHelpers, ScalarParsing) {
    EXPECT_EQ(parse_integer("42"), 42);
    EXPECT_EQ(parse_integer(" 1_000 "), 1000);
    EXPECT_FALSE(parse_integer("12abc").has_value());
    EXPECT_FALSE(parse_integer("").has_value());

    EXPECT_EQ(parse_bool("TRUE"), true);
    EXPECT_EQ(parse_bool("off"), false);
    EXPECT_FALSE(parse_bool("maybe").has_value());
}

TEST(ConfigHelpers, LoadDownloaderConfigAppliesSection) {
    ScopedEnv noState("MODELFETCH_STATE_DIR", nullptr);
    auto dir = TempDirScope::unique_under("mf-config");
    const auto path = dir.path() / "config.toml";
    write_file(path, kConfig);

    auto cfg = loadDownloaderConfig(path);
    EXPECT_EQ(cfg.concurrency, 8);
    EXPECT_EQ(cfg.chunkSizeBytes, 2097152u);
    EXPECT_FALSE(cfg.verifyChecksums);
    EXPECT_EQ(cfg.retry.maxAttempts, 5);
    EXPECT_EQ(cfg.checkpointInterval, std::chrono::milliseconds(2500));
    EXPECT_EQ(cfg.checkpointBytes, 4096u);
    EXPECT_EQ(cfg.connectTimeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(cfg.stallTimeout, std::chrono::milliseconds(9000));
    EXPECT_EQ(cfg.endpoint, "https://mirror.example.com");
    EXPECT_EQ(cfg.stateDir, std::filesystem::path("/var/lib/modelfetch"));
}

TEST(ConfigHelpers, InvalidValuesKeepDefaults) {
    ScopedEnv noState("MODELFETCH_STATE_DIR", nullptr);
    auto dir = TempDirScope::unique_under("mf-config");
    const auto path = dir.path() / "config.toml";
    write_file(path, "[downloader]\nconcurrency = 0\nchunk_size = lots\nverify = perhaps\n");

    auto cfg = loadDownloaderConfig(path);
    const modelfetch::downloader::DownloaderConfig defaults;
    EXPECT_EQ(cfg.concurrency, defaults.concurrency);
    EXPECT_EQ(cfg.chunkSizeBytes, defaults.chunkSizeBytes);
    EXPECT_EQ(cfg.verifyChecksums, defaults.verifyChecksums);
}

TEST(ConfigHelpers, MissingFileYieldsDefaults) {
    auto dir = TempDirScope::unique_under("mf-config");
    auto cfg = loadDownloaderConfig(dir.path() / "absent.toml");
    EXPECT_EQ(cfg.concurrency, 4);
    EXPECT_EQ(cfg.chunkSizeBytes, 1024u * 1024u);
    EXPECT_EQ(cfg.retry.maxAttempts, 3);
    EXPECT_EQ(cfg.endpoint, "https://modelscope.cn");
}

TEST(ConfigHelpers, StateDirPrecedence) {
    auto dir = TempDirScope::unique_under("mf-config");
    const auto path = dir.path() / "config.toml";
    write_file(path, "[downloader]\nstate_dir = \"/from/config\"\n");

    {
        ScopedEnv env("MODELFETCH_STATE_DIR", "/from/env");
        EXPECT_EQ(get_state_dir(path), std::filesystem::path("/from/env"));
    }
    {
        ScopedEnv env("MODELFETCH_STATE_DIR", nullptr);
        EXPECT_EQ(get_state_dir(path), std::filesystem::path("/from/config"));

        ScopedEnv home("HOME", "/home/tester");
        EXPECT_EQ(get_state_dir(dir.path() / "absent.toml"),
                  std::filesystem::path("/home/tester/.modelscope_downloads"));
    }
}

TEST(ConfigHelpers, ConfigPathResolution) {
    ScopedEnv cfg("MODELFETCH_CONFIG", nullptr);
    ScopedEnv xdg("XDG_CONFIG_HOME", "/xdg");
    EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/modelfetch/config.toml"));
    EXPECT_EQ(get_config_path("/explicit.toml"), std::filesystem::path("/explicit.toml"));
    {
        ScopedEnv env("MODELFETCH_CONFIG", "/env.toml");
        EXPECT_EQ(get_config_path(), std::filesystem::path("/env.toml"));
    }
}

TEST(ConfigHelpers, ExpandTilde) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~"), std::filesystem::path("/home/tester"));
    EXPECT_EQ(expand_tilde("~/models"), std::filesystem::path("/home/tester/models"));
    EXPECT_EQ(expand_tilde("/abs/~x"), std::filesystem::path("/abs/~x"));
    EXPECT_EQ(expand_tilde("~other/x"), std::filesystem::path("~other/x"));
}
