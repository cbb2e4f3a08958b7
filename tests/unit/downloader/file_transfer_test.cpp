#include <gtest/gtest.h>

#include <modelfetch/downloader/file_transfer.hpp>

#include "../../support/downloader_fakes.hpp"
#include "../../support/temp_dir_scope.hpp"

#include <atomic>

namespace fs = std::filesystem;
using namespace modelfetch::downloader;
using namespace modelfetch::test_support;

namespace {

const std::string kBody =
    "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ-_=+"; // 66 bytes

class FileTransferTest : public ::testing::Test {
protected:
    FileTransferTest() : dir_(TempDirScope::unique_under("mf-transfer")) {
        cfg_.chunkSizeBytes = 16;
        cfg_.checkpointBytes = 1ull << 30;
        cfg_.checkpointInterval = std::chrono::hours(1);
    }

    FileDescriptor descriptor(std::string name = "model.bin", bool withHash = true) {
        FileDescriptor d;
        d.name = std::move(name);
        d.expectedSize = kBody.size();
        d.expectedHash = withHash ? sha256_hex(kBody) : "";
        d.sourceUrl = "http://fake/" + d.name;
        return d;
    }

    TransferOutcome run(const FileDescriptor& d, ManifestState& state,
                        const ShouldCancel& cancel = {}) {
        FileTransferWorker worker(cfg_, http_, nullptr, [this] { return now_; });
        return worker.transfer(d, dir_.path(), state, 0, [this] { ++checkpoints_; }, cancel);
    }

    fs::path local(const std::string& name = "model.bin") const { return dir_.path() / name; }
    fs::path temp(const std::string& name = "model.bin") const {
        return dir_.path() / (name + ".tmp");
    }

    TempDirScope dir_;
    DownloaderConfig cfg_;
    FakeHttpAdapter http_;
    std::chrono::steady_clock::time_point now_{};
    int checkpoints_{0};
};

} // namespace

TEST_F(FileTransferTest, FreshDownloadCompletesAndRenames) {
    auto d = descriptor();
    http_.add(d.sourceUrl, FakeResource{kBody});
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Completed);
    EXPECT_FALSE(out.error.has_value());
    EXPECT_EQ(read_file(local()), kBody);
    EXPECT_FALSE(fs::exists(temp()));

    auto fp = state.get(0);
    EXPECT_EQ(fp.state, FileState::Completed);
    EXPECT_EQ(fp.downloadedBytes, kBody.size());
    EXPECT_GE(checkpoints_, 1);
    EXPECT_EQ(http_.offsets(d.sourceUrl), std::vector<std::uint64_t>{0});
}

TEST_F(FileTransferTest, ResumesFromPartialTempFile) {
    auto d = descriptor();
    http_.add(d.sourceUrl, FakeResource{kBody});
    write_file(temp(), kBody.substr(0, 10));
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Completed);
    EXPECT_EQ(http_.offsets(d.sourceUrl), std::vector<std::uint64_t>{10});
    EXPECT_EQ(read_file(local()), kBody);
}

TEST_F(FileTransferTest, ServerIgnoringRangeRestartsFromZero) {
    auto d = descriptor();
    FakeResource res{kBody};
    res.honorRange = false;
    http_.add(d.sourceUrl, res);
    write_file(temp(), "XXXXX");
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Completed);
    EXPECT_EQ(read_file(local()), kBody);
}

TEST_F(FileTransferTest, RangeNotSatisfiableTreatsPartialAsComplete) {
    auto d = descriptor();
    http_.add(d.sourceUrl, FakeResource{kBody});
    write_file(temp(), kBody);
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Completed);
    EXPECT_EQ(read_file(local()), kBody);
    EXPECT_FALSE(fs::exists(temp()));
}

TEST_F(FileTransferTest, ChecksumMismatchDiscardsDataAndIsFinal) {
    auto d = descriptor();
    d.expectedHash = sha256_hex("something else");
    http_.add(d.sourceUrl, FakeResource{kBody});
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Failed);
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code, ErrorCode::ChecksumMismatch);
    EXPECT_FALSE(out.retryable);
    EXPECT_FALSE(fs::exists(temp()));
    EXPECT_FALSE(fs::exists(local()));
    EXPECT_EQ(state.get(0).state, FileState::Failed);
}

TEST_F(FileTransferTest, DisabledVerificationAcceptsAnyContent) {
    cfg_.verifyChecksums = false;
    auto d = descriptor();
    d.expectedHash = sha256_hex("something else");
    http_.add(d.sourceUrl, FakeResource{kBody});
    ManifestState state("m", {d});

    EXPECT_EQ(run(d, state).state, FileState::Completed);
    EXPECT_EQ(read_file(local()), kBody);
}

TEST_F(FileTransferTest, VerifiedExistingFileSkipsNetwork) {
    auto d = descriptor();
    write_file(local(), kBody);
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Completed);
    EXPECT_EQ(http_.totalRequests(), 0);
    EXPECT_EQ(state.get(0).downloadedBytes, kBody.size());
}

TEST_F(FileTransferTest, ExistingFileWithWrongHashIsReplaced) {
    auto d = descriptor();
    write_file(local(), "stale");
    http_.add(d.sourceUrl, FakeResource{kBody});
    ManifestState state("m", {d});

    EXPECT_EQ(run(d, state).state, FileState::Completed);
    EXPECT_EQ(read_file(local()), kBody);
}

TEST_F(FileTransferTest, ExistingFileWithWrongHashIsRemovedWhenDownloadAlsoMismatches) {
    auto d = descriptor();
    write_file(local(), "stale");
    http_.add(d.sourceUrl, FakeResource{"served bytes that do not match"});
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Failed);
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->code, ErrorCode::ChecksumMismatch);
    EXPECT_FALSE(fs::exists(local()));
    EXPECT_FALSE(fs::exists(temp()));
    EXPECT_EQ(state.get(0).state, FileState::Failed);
}

TEST_F(FileTransferTest, TransientErrorKeepsReceivedBytes) {
    auto d = descriptor();
    FakeResource res{kBody};
    res.transientFailures = 1;
    res.failAfterBytes = 20;
    http_.add(d.sourceUrl, res);
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Failed);
    EXPECT_TRUE(out.retryable);
    ASSERT_TRUE(fs::exists(temp()));
    EXPECT_EQ(read_file(temp()), kBody.substr(0, 20));
    EXPECT_EQ(state.get(0).downloadedBytes, 20u);
    EXPECT_FALSE(fs::exists(local()));

    // Next attempt resumes where the previous one stopped
    auto again = run(d, state);
    EXPECT_EQ(again.state, FileState::Completed);
    EXPECT_EQ(http_.offsets(d.sourceUrl), (std::vector<std::uint64_t>{0, 20}));
    EXPECT_EQ(read_file(local()), kBody);
}

TEST_F(FileTransferTest, ClientErrorIsNotRetryable) {
    auto d = descriptor();
    FakeResource res{kBody};
    res.errorStatus = 404;
    http_.add(d.sourceUrl, res);
    ManifestState state("m", {d});

    auto out = run(d, state);
    EXPECT_EQ(out.state, FileState::Failed);
    EXPECT_FALSE(out.retryable);
    EXPECT_EQ(out.error->code, ErrorCode::ClientError);
}

TEST_F(FileTransferTest, StopKeepsPartialFileAndMarksStopped) {
    auto d = descriptor();
    http_.add(d.sourceUrl, FakeResource{kBody});
    std::atomic<bool> stop{false};
    http_.setPieceHook([&](const std::string&, std::uint64_t delivered) {
        if (delivered >= 24)
            stop = true;
    });
    ManifestState state("m", {d});

    auto out = run(d, state, [&] { return stop.load(); });
    EXPECT_EQ(out.state, FileState::Stopped);
    EXPECT_EQ(state.get(0).state, FileState::Stopped);
    ASSERT_TRUE(fs::exists(temp()));
    EXPECT_EQ(read_file(temp()), kBody.substr(0, 24));
    EXPECT_EQ(state.get(0).downloadedBytes, 24u);
    EXPECT_FALSE(fs::exists(local()));
}

TEST_F(FileTransferTest, UnsafeNamesAreRejectedWithoutNetwork) {
    for (const char* name : {"../evil.bin", "/etc/passwd", "a/../../b", ""}) {
        auto d = descriptor(name);
        ManifestState state("m", {d});
        auto out = run(d, state);
        EXPECT_EQ(out.state, FileState::Failed) << name;
        EXPECT_FALSE(out.retryable) << name;
    }
    EXPECT_EQ(http_.totalRequests(), 0);
    EXPECT_TRUE(isSafeRelativeName("weights/model-00001.safetensors"));
}

TEST_F(FileTransferTest, NestedNamesCreateDirectories) {
    auto d = descriptor("weights/part/model.bin");
    http_.add(d.sourceUrl, FakeResource{kBody});
    ManifestState state("m", {d});

    EXPECT_EQ(run(d, state).state, FileState::Completed);
    EXPECT_EQ(read_file(local("weights/part/model.bin")), kBody);
}

TEST_F(FileTransferTest, CheckpointsByBytes) {
    cfg_.checkpointBytes = 16;
    auto d = descriptor();
    http_.add(d.sourceUrl, FakeResource{kBody});
    ManifestState state("m", {d});

    EXPECT_EQ(run(d, state).state, FileState::Completed);
    // 66 bytes in 16-byte chunks: four byte-triggered checkpoints plus the completion one
    EXPECT_GE(checkpoints_, 5);
}

TEST_F(FileTransferTest, CheckpointsByTime) {
    auto d = descriptor();
    http_.add(d.sourceUrl, FakeResource{kBody});
    http_.setPieceHook([this](const std::string&, std::uint64_t) {
        now_ += std::chrono::hours(2);
    });
    ManifestState state("m", {d});

    EXPECT_EQ(run(d, state).state, FileState::Completed);
    EXPECT_GE(checkpoints_, 5);
}

TEST_F(FileTransferTest, ContentLengthRefinesExpectedSize) {
    auto d = descriptor("model.bin", false);
    d.expectedSize = 0;
    http_.add(d.sourceUrl, FakeResource{kBody});
    write_file(temp(), kBody.substr(0, 6));
    ManifestState state("m", {d});

    EXPECT_EQ(run(d, state).state, FileState::Completed);
    EXPECT_EQ(state.get(0).expectedSize, kBody.size());
}
