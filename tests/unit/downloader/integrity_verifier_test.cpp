#include <gtest/gtest.h>

#include <modelfetch/downloader/downloader.hpp>

#include "../../support/downloader_fakes.hpp"
#include "../../support/temp_dir_scope.hpp"

using namespace modelfetch::downloader;
using modelfetch::test_support::sha256_hex;
using modelfetch::test_support::TempDirScope;
using modelfetch::test_support::write_file;

namespace {
constexpr const char* kAbcSha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
constexpr const char* kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
} // namespace

TEST(IntegrityVerifier, StreamingDigestMatchesKnownVectors) {
    EXPECT_EQ(sha256_hex("abc"), kAbcSha256);
    EXPECT_EQ(sha256_hex(""), kEmptySha256);

    auto v = makeIntegrityVerifier();
    const std::string a = "a", bc = "bc";
    v->update(std::as_bytes(std::span(a.data(), a.size())));
    v->update(std::as_bytes(std::span(bc.data(), bc.size())));
    EXPECT_EQ(v->finalize(), kAbcSha256);

    // finalize() leaves the verifier ready for reuse
    EXPECT_EQ(v->finalize(), kEmptySha256);
}

TEST(IntegrityVerifier, HashFileIndependentOfBlockSize) {
    auto dir = TempDirScope::unique_under("mf-verify");
    const auto p = dir.path() / "f.bin";
    write_file(p, "abc");

    auto h1 = hashFile(p, 1);
    auto h2 = hashFile(p);
    ASSERT_TRUE(h1.ok());
    ASSERT_TRUE(h2.ok());
    EXPECT_EQ(h1.value(), kAbcSha256);
    EXPECT_EQ(h2.value(), kAbcSha256);
}

TEST(IntegrityVerifier, VerifyFileRules) {
    auto dir = TempDirScope::unique_under("mf-verify");
    const auto p = dir.path() / "f.bin";
    write_file(p, "abc");

    EXPECT_TRUE(verifyFile(p, ""));
    EXPECT_TRUE(verifyFile(p, kAbcSha256));
    EXPECT_FALSE(verifyFile(p, kEmptySha256));
    EXPECT_FALSE(verifyFile(dir.path() / "missing.bin", kAbcSha256));
    EXPECT_FALSE(hashFile(dir.path() / "missing.bin").ok());
}
