#include <gtest/gtest.h>

#include <modelfetch/cli/modelfetch_cli.h>
#include <modelfetch/downloader/status_store.hpp>

#include <nlohmann/json.hpp>

#include "../../support/downloader_fakes.hpp"
#include "../../support/scoped_env.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

using namespace modelfetch;
using modelfetch::test_support::ScopedEnv;
using modelfetch::test_support::TempDirScope;
using modelfetch::test_support::read_file;
using modelfetch::test_support::sha256_hex;
using modelfetch::test_support::write_file;

namespace {

class ModelfetchCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<TempDirScope>(TempDirScope::unique_under("mf-cli"));
    }

    // Runs a fresh CLI instance with argv[0] = "modelfetch".
    int run(std::initializer_list<std::string> args) {
        std::vector<std::string> storage{"modelfetch"};
        storage.insert(storage.end(), args.begin(), args.end());
        std::vector<char*> argv;
        for (auto& s : storage)
            argv.push_back(s.data());
        argv.push_back(nullptr);
        cli::ModelfetchCLI app;
        return app.run(static_cast<int>(storage.size()), argv.data());
    }

    std::filesystem::path root() const { return dir_->path(); }
    std::string stateDir() const { return (root() / "state").string(); }

    ScopedEnv noConfig_{"MODELFETCH_CONFIG", "/nonexistent/modelfetch/config.toml"};
    ScopedEnv noLevel_{"MODELFETCH_LOG_LEVEL", "off"};
    std::unique_ptr<TempDirScope> dir_;
};

} // namespace

TEST_F(ModelfetchCliTest, MissingSubcommandIsUsageError) {
    EXPECT_EQ(run({}), cli::kExitUsage);
}

TEST_F(ModelfetchCliTest, UnknownFlagIsUsageError) {
    EXPECT_EQ(run({"status", "org/model", "--bogus"}), cli::kExitUsage);
}

TEST_F(ModelfetchCliTest, DownloadRequiresSaveDir) {
    EXPECT_EQ(run({"download", "org/model"}), cli::kExitUsage);
}

TEST_F(ModelfetchCliTest, VersionFlagSucceeds) {
    EXPECT_EQ(run({"--version"}), cli::kExitOk);
}

TEST_F(ModelfetchCliTest, StatusWithoutRecordReportsIncomplete) {
    EXPECT_EQ(run({"status", "org/model", "--state-dir", stateDir()}), cli::kExitIncomplete);
}

TEST_F(ModelfetchCliTest, StatusPrintsSavedRecord) {
    downloader::StatusRecord record;
    record.manifestId = "org/model";
    downloader::FileProgress f;
    f.name = "a.bin";
    f.expectedSize = 10;
    f.downloadedBytes = 4;
    f.state = downloader::FileState::Stopped;
    record.files.push_back(f);
    auto store = downloader::makeJsonStatusStore(stateDir());
    ASSERT_TRUE(store->save(record).ok());

    EXPECT_EQ(run({"status", "org/model", "--state-dir", stateDir()}), cli::kExitOk);
    EXPECT_EQ(run({"status", "org/model", "--json", "--state-dir", stateDir()}), cli::kExitOk);
}

TEST_F(ModelfetchCliTest, DownloadWithBadManifestIsUsageError) {
    const auto manifest = root() / "manifest.json";
    write_file(manifest, "{\"files\": 3}");
    EXPECT_EQ(run({"download", "org/model", (root() / "out").string(), "--manifest",
                   manifest.string(), "--state-dir", stateDir()}),
              cli::kExitUsage);
}

TEST_F(ModelfetchCliTest, DownloadsLocalManifestEndToEnd) {
    const std::string alpha(3000, 'a');
    const std::string beta = "beta file contents\n";
    write_file(root() / "src" / "alpha.bin", alpha);
    write_file(root() / "src" / "beta.txt", beta);

    nlohmann::json manifest;
    manifest["files"] = nlohmann::json::array();
    manifest["files"].push_back({{"name", "alpha.bin"},
                                 {"size", alpha.size()},
                                 {"sha256", sha256_hex(alpha)},
                                 {"url", "file://" + (root() / "src" / "alpha.bin").string()}});
    manifest["files"].push_back({{"name", "nested/beta.txt"},
                                 {"size", beta.size()},
                                 {"sha256", sha256_hex(beta)},
                                 {"url", "file://" + (root() / "src" / "beta.txt").string()}});
    write_file(root() / "manifest.json", manifest.dump());

    const auto out = root() / "out";
    const int rc = run({"download", "org/model", out.string(), "--manifest",
                        (root() / "manifest.json").string(), "--state-dir", stateDir(),
                        "--max-workers", "2", "--chunk-size", "1024"});
    ASSERT_EQ(rc, cli::kExitOk);
    EXPECT_EQ(read_file(out / "alpha.bin"), alpha);
    EXPECT_EQ(read_file(out / "nested" / "beta.txt"), beta);

    auto store = downloader::makeJsonStatusStore(stateDir());
    auto loaded = store->load("org/model");
    ASSERT_TRUE(loaded.ok());
    ASSERT_TRUE(loaded.value().has_value());
    for (const auto& f : loaded.value()->files) {
        EXPECT_EQ(f.state, downloader::FileState::Completed) << f.name;
    }

    // Second run finds everything in place
    EXPECT_EQ(run({"download", "org/model", out.string(), "--manifest",
                   (root() / "manifest.json").string(), "--state-dir", stateDir()}),
              cli::kExitOk);
}

TEST_F(ModelfetchCliTest, DownloadResumesPartialFileFromLocalSource) {
    std::string alpha;
    for (int i = 0; i < 500; ++i)
        alpha += std::to_string(i) + ",";
    write_file(root() / "src" / "alpha.bin", alpha);

    // No sha256: the resumed bytes alone must reproduce the source
    nlohmann::json manifest;
    manifest["files"] = nlohmann::json::array();
    manifest["files"].push_back({{"name", "alpha.bin"},
                                 {"size", alpha.size()},
                                 {"url", "file://" + (root() / "src" / "alpha.bin").string()}});
    write_file(root() / "manifest.json", manifest.dump());

    const auto out = root() / "out";
    write_file(out / "alpha.bin.tmp", alpha.substr(0, 777));

    ASSERT_EQ(run({"download", "org/model", out.string(), "--manifest",
                   (root() / "manifest.json").string(), "--state-dir", stateDir()}),
              cli::kExitOk);
    EXPECT_EQ(read_file(out / "alpha.bin"), alpha);
    EXPECT_FALSE(std::filesystem::exists(out / "alpha.bin.tmp"));
}
