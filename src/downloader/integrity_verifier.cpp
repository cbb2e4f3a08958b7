/*
 * modelfetch/src/downloader/integrity_verifier.cpp
 *
 * SHA-256 IntegrityVerifier via OpenSSL EVP
 *
 * - update() accepts byte spans and feeds them to the active digest context.
 * - finalize() returns the lower-case hex digest and re-initializes the context.
 * - hashFile()/verifyFile() stream a file in fixed-size blocks.
 */

#include <modelfetch/downloader/downloader.hpp>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <array>
#include <cstddef>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace modelfetch::downloader {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    EvpMdCtx(EvpMdCtx&& other) noexcept : ctx(other.ctx) { other.ctx = nullptr; }
    EvpMdCtx& operator=(EvpMdCtx&& other) noexcept {
        if (this != &other) {
            if (ctx)
                EVP_MD_CTX_free(ctx);
            ctx = other.ctx;
            other.ctx = nullptr;
        }
        return *this;
    }
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

class OpenSslSha256Verifier final : public IIntegrityVerifier {
public:
    OpenSslSha256Verifier() { reset(); }
    ~OpenSslSha256Verifier() override = default;

    void reset() override {
        _ctx = EvpMdCtx{};
        _failed = !_ctx || EVP_DigestInit_ex(_ctx.ctx, EVP_sha256(), nullptr) != 1;
    }

    void update(std::span<const std::byte> data) override {
        if (_failed || data.empty())
            return;
        if (EVP_DigestUpdate(_ctx.ctx, data.data(), data.size()) != 1) {
            _failed = true;
        }
    }

    std::string finalize() override {
        if (_failed) {
            reset();
            return {};
        }

        std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
        unsigned md_len = 0;
        std::string out;
        if (EVP_DigestFinal_ex(_ctx.ctx, md_buf.data(), &md_len) == 1) {
            out = to_hex_lower(md_buf.data(), md_len);
        }

        // Prepare for reuse
        reset();
        return out;
    }

private:
    EvpMdCtx _ctx{};
    bool _failed{false};
};

} // namespace

std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier() {
    return std::make_unique<OpenSslSha256Verifier>();
}

Expected<std::string> hashFile(const std::filesystem::path& path, std::size_t blockSize) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open for hashing: " + path.string()};
    }
    if (blockSize == 0)
        blockSize = kDefaultHashBlockSize;

    auto verifier = makeIntegrityVerifier();
    std::vector<char> buffer(blockSize);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0) {
            verifier->update(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(got)));
        }
    }
    if (!in.eof()) {
        return Error{ErrorCode::IoError, "Read failed while hashing: " + path.string()};
    }

    auto hex = verifier->finalize();
    if (hex.empty()) {
        return Error{ErrorCode::Unknown, "Failed to finalize sha256 for: " + path.string()};
    }
    return hex;
}

bool verifyFile(const std::filesystem::path& path, std::string_view expectedHash) {
    if (expectedHash.empty())
        return true;

    auto digest = hashFile(path);
    if (!digest.ok()) {
        spdlog::warn("verify: {}", digest.error().message);
        return false;
    }
    if (digest.value() != expectedHash) {
        spdlog::debug("verify: sha256 mismatch for {} (expected {}, got {})", path.string(),
                      expectedHash, digest.value());
        return false;
    }
    return true;
}

} // namespace modelfetch::downloader
