#pragma once

/*
 * modelfetch Downloader - Public Types and Component Interfaces (C++20)
 *
 * This header defines the public data types and abstract interfaces for the
 * manifest downloader. It intentionally contains no implementation details.
 *
 * Design principles:
 * - A manifest (ordered list of remote files) is materialized under a destination directory
 * - Partial files (<name>.tmp) are the ground truth for resume offsets
 * - One JSON status record per manifest, always replaced atomically
 * - Clear separation of concerns (HTTP adapter, integrity verification, status store,
 *   per-file transfer, engine)
 */

#include <spdlog/logger.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace modelfetch::downloader {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Per-file lifecycle. Completed, Failed and Stopped are terminal within one run.
 */
enum class FileState { Pending, Downloading, Completed, Failed, Stopped };

/**
 * Canonical error codes for downloader operations.
 */
enum class ErrorCode {
    None = 0,
    InvalidArgument,
    NetworkError,
    Timeout,
    TlsVerificationFailed,
    ServerError,         // 5xx and 429
    ClientError,         // other 4xx
    RangeNotSatisfiable, // 416 on a ranged request
    IoError,
    ChecksumMismatch,
    ManifestError,
    CorruptRecord,
    Cancelled,
    Unknown
};

inline constexpr std::size_t kDefaultHashBlockSize = 64 * 1024;

/**
 * Wire name of a state as stored in the status file ("pending", "downloading", ...).
 */
[[nodiscard]] const char* toString(FileState state) noexcept;

/**
 * Inverse of toString(FileState); nullopt for unknown strings.
 */
[[nodiscard]] std::optional<FileState> parseFileState(std::string_view s) noexcept;

[[nodiscard]] constexpr bool isTerminal(FileState state) noexcept {
    return state == FileState::Completed || state == FileState::Failed ||
           state == FileState::Stopped;
}

[[nodiscard]] const char* toString(ErrorCode code) noexcept;

/**
 * True for errors that a later attempt may recover from by resuming the partial file.
 */
[[nodiscard]] constexpr bool isTransient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::ServerError:
        case ErrorCode::IoError:
            return true;
        default:
            return false;
    }
}

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Remote file as described by a manifest provider. Identified by name within a manifest.
 */
struct FileDescriptor {
    std::string name;               // relative path, may contain '/'
    std::uint64_t expectedSize{0};  // 0 if unknown; advisory only
    std::string expectedHash;       // lower-case sha256 hex; empty = skip verification
    std::string sourceUrl;
};

/**
 * Mutable progress of one file.
 */
struct FileProgress {
    std::string name;
    std::uint64_t expectedSize{0};
    std::uint64_t downloadedBytes{0};
    FileState state{FileState::Pending};
};

/**
 * Durable form of a manifest's progress (one JSON file per manifest).
 */
struct StatusRecord {
    std::string manifestId;
    std::vector<FileProgress> files;
};

/**
 * Retry/backoff policy applied per file by the engine.
 */
struct RetryPolicy {
    int maxAttempts{3};
    std::chrono::milliseconds initialBackoff{500};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{15000};
};

/**
 * Downloader configuration. Plain value; no reconfiguration during a run.
 */
struct DownloaderConfig {
    int concurrency{4};
    std::size_t chunkSizeBytes{1024ull * 1024ull}; // 1 MiB
    bool verifyChecksums{true};
    RetryPolicy retry{};
    std::chrono::milliseconds checkpointInterval{10000};
    std::uint64_t checkpointBytes{10ull * 1024ull * 1024ull}; // 10 MiB
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds stallTimeout{60000};
    std::string tempSuffix{".tmp"};
    std::filesystem::path stateDir{};
    std::string endpoint{"https://modelscope.cn"};
};

/**
 * Canonical error object.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
};

/**
 * Response metadata delivered once, before the first body byte.
 */
struct ResponseInfo {
    long httpStatus{0}; // 0 for non-HTTP schemes (file://)
    std::optional<std::uint64_t> contentLength{};
    // Byte position of the first body byte: the requested offset when the range was honoured,
    // 0 when the full body is being sent.
    std::uint64_t startOffset{0};
};

// =========================
// Lightweight Expected<T>
// =========================

/**
 * Minimal Expected<T> for interfaces (header-only, no exceptions required).
 * - If ok() is true, value() is valid; otherwise error() is set.
 */
template <typename T> class Expected {
public:
    Expected() = default;
    Expected(const T& v) : _ok(true), _value(v) {}
    Expected(T&& v) noexcept : _ok(true), _value(std::move(v)) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const T& value() const& { return _value; }
    [[nodiscard]] T& value() & { return _value; }
    [[nodiscard]] T&& value() && { return std::move(_value); }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{false};
    T _value{};
    Error _error{};
};

// Specialization for Expected<void>
template <> class Expected<void> {
public:
    Expected() : _ok(true) {}
    Expected(const Error& e) : _ok(false), _error(e) {}
    Expected(Error&& e) noexcept : _ok(false), _error(std::move(e)) {}

    [[nodiscard]] bool ok() const noexcept { return _ok; }
    [[nodiscard]] const Error& error() const& { return _error; }

private:
    bool _ok{true};
    Error _error{};
};

// ===================
// Callback signatures
// ===================

using ShouldCancel = std::function<bool()>; // return true to cancel ASAP
using ByteSink = std::function<Expected<void>(std::span<const std::byte>)>;
using ResponseCallback = std::function<Expected<void>(const ResponseInfo&)>;
using Clock = std::function<std::chrono::steady_clock::time_point()>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation in http_adapter_curl.cpp).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * GET url starting at byte `offset` and stream the body to `sink` in arrival order. Whether
     * the offset was honoured is reported in ResponseInfo::startOffset. `onResponse` is called exactly once before the first body
     * byte (or after the transfer when the body is empty). Error responses (>= 400) are not
     * passed to the sink and are reported as ServerError/ClientError/RangeNotSatisfiable.
     */
    virtual Expected<ResponseInfo> fetch(std::string_view url, const std::vector<Header>& headers,
                                         std::uint64_t offset, const ResponseCallback& onResponse,
                                         const ByteSink& sink,
                                         const ShouldCancel& shouldCancel) = 0;
};

/**
 * Integrity verifier interface (streaming hash calculator).
 */
class IIntegrityVerifier {
public:
    virtual ~IIntegrityVerifier() = default;
    virtual void reset() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0; // lower-case hex, empty on failure
};

/**
 * Durable per-manifest progress records.
 */
class IStatusStore {
public:
    virtual ~IStatusStore() = default;

    /**
     * Replace the record atomically. Never leaves a truncated or partial file behind.
     */
    virtual Expected<void> save(const StatusRecord& record) = 0;

    /**
     * nullopt when no valid record exists. Invalid records are deleted, not reported.
     */
    virtual Expected<std::optional<StatusRecord>> load(std::string_view manifestId) = 0;

    virtual void remove(std::string_view manifestId) noexcept = 0;
};

/**
 * Resolves a manifest identifier into its file list.
 */
class IManifestProvider {
public:
    virtual ~IManifestProvider() = default;
    virtual Expected<std::vector<FileDescriptor>> listFiles(std::string_view manifestId) = 0;
};

// ==========
// Factories
// ==========

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(const DownloaderConfig& cfg,
                                                  std::shared_ptr<spdlog::logger> logger = {});
std::unique_ptr<IIntegrityVerifier> makeIntegrityVerifier();

/**
 * Hash a file in fixed-size blocks. Never loads the whole file.
 */
Expected<std::string> hashFile(const std::filesystem::path& path,
                               std::size_t blockSize = kDefaultHashBlockSize);

/**
 * True when expectedHash is empty, or when the file's sha256 equals it exactly.
 */
[[nodiscard]] bool verifyFile(const std::filesystem::path& path, std::string_view expectedHash);

} // namespace modelfetch::downloader
