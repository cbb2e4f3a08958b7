#include <gtest/gtest.h>

#include <modelfetch/cli/status_render.h>

using namespace modelfetch;
using downloader::FileProgress;
using downloader::FileState;
using downloader::StatusRecord;

namespace {

StatusRecord sampleRecord() {
    StatusRecord r;
    r.manifestId = "org/model";
    FileProgress done;
    done.name = "config.json";
    done.expectedSize = 512;
    done.downloadedBytes = 512;
    done.state = FileState::Completed;
    FileProgress partial;
    partial.name = "weights.bin";
    partial.expectedSize = 1536;
    partial.downloadedBytes = 512;
    partial.state = FileState::Stopped;
    r.files = {done, partial};
    return r;
}

} // namespace

TEST(StatusRender, FormatBytesUnits) {
    EXPECT_EQ(cli::formatBytes(0), "0 B");
    EXPECT_EQ(cli::formatBytes(512), "512 B");
    EXPECT_EQ(cli::formatBytes(1536), "1.50 KB");
    EXPECT_EQ(cli::formatBytes(5ull * 1024 * 1024), "5.00 MB");
    EXPECT_EQ(cli::formatBytes(3ull * 1024 * 1024 * 1024), "3.00 GB");
}

TEST(StatusRender, TextListsSummaryAndFiles) {
    const auto text = cli::renderStatusText(sampleRecord());
    EXPECT_NE(text.find("Model: org/model"), std::string::npos);
    EXPECT_NE(text.find("Progress: 50.0% (1.00 KB / 2.00 KB)"), std::string::npos);
    EXPECT_NE(text.find("2 total, 1 completed"), std::string::npos);
    EXPECT_NE(text.find("config.json (512 B / 512 B)"), std::string::npos);
    EXPECT_NE(text.find("weights.bin (512 B / 1.50 KB)"), std::string::npos);
}

TEST(StatusRender, JsonCarriesRecordAndSummary) {
    const auto j = cli::statusToJson(sampleRecord());
    ASSERT_TRUE(j.contains("files"));
    EXPECT_EQ(j["files"].size(), 2u);
    ASSERT_TRUE(j.contains("summary"));
    const auto& s = j["summary"];
    EXPECT_EQ(s["total_bytes"].get<std::uint64_t>(), 2048u);
    EXPECT_EQ(s["downloaded_bytes"].get<std::uint64_t>(), 1024u);
    EXPECT_EQ(s["completed"].get<std::size_t>(), 1u);
    EXPECT_EQ(s["stopped"].get<std::size_t>(), 1u);
    EXPECT_DOUBLE_EQ(s["percent"].get<double>(), 50.0);
}
