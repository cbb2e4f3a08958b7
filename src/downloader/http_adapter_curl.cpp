/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Streaming GET from an offset via libcurl easy API: an open-ended Range header
 *   ("bytes=<offset>-") for http(s), CURLOPT_RESUME_FROM_LARGE for other schemes (file://).
 *   ResponseInfo::startOffset tells the caller whether the offset was honoured.
 * - Response metadata (status, Content-Length of the final response after redirects) is handed
 *   to the caller before the first body byte so it can decide how to open its output.
 * - Error bodies (status >= 400) are swallowed, never passed to the sink.
 * - Cooperative cancellation is polled from both the write and the transfer-info callbacks, so
 *   a stalled connection is abandoned promptly too.
 *
 * Build
 * - Linked via CURL::libcurl. Depends on spdlog for logging.
 */

#include <modelfetch/downloader/downloader.hpp>
#include <modelfetch/version.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <memory>
#include <mutex>
#include <string_view>

namespace modelfetch::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_BAD_DOWNLOAD_RESUME:
            err.code = ErrorCode::RangeNotSatisfiable;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

static Error makeHttpStatusError(long status) {
    Error err;
    err.message = "HTTP error " + std::to_string(status);
    if (status == 416) {
        err.code = ErrorCode::RangeNotSatisfiable;
    } else if (status == 429 || status >= 500) {
        err.code = ErrorCode::ServerError;
    } else {
        err.code = ErrorCode::ClientError;
    }
    return err;
}

static bool isHttpUrl(std::string_view url) {
    const auto scheme = to_lower(url.substr(0, std::min<std::size_t>(url.size(), 8)));
    return scheme.rfind("http://", 0) == 0 || scheme.rfind("https://", 0) == 0;
}

// Header parser context (reset on every status line so only the final response counts)
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    // We expect "Key: Value"
    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    if (key == "content-length") {
        auto val = trim(line.substr(colon + 1));
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    }
    return total;
}

// Write sink context for fetch
struct WriteContext {
    CURL* curl{nullptr};
    HeaderParseContext* headers{nullptr};
    const ResponseCallback* onResponse{nullptr};
    const ByteSink* sink{nullptr};
    const ShouldCancel* shouldCancel{nullptr};
    std::uint64_t requestedOffset{0};
    bool httpScheme{true};

    ResponseInfo info{};
    bool responseSeen{false};
    bool discardBody{false};
    bool cancelRequested{false};
    std::optional<Error> abortError{};
};

static Expected<void> deliverResponse(WriteContext& ctx) {
    ctx.responseSeen = true;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &ctx.info.httpStatus);
    ctx.info.contentLength = ctx.headers->contentLength;
    // http: only 206 carries the requested range. Other schemes either honour the resume
    // offset or fail the transfer.
    if (ctx.requestedOffset > 0 && (!ctx.httpScheme || ctx.info.httpStatus == 206)) {
        ctx.info.startOffset = ctx.requestedOffset;
    }
    if (ctx.info.httpStatus >= 400) {
        ctx.discardBody = true;
        return Expected<void>{};
    }
    if (*ctx.onResponse) {
        return (*ctx.onResponse)(ctx.info);
    }
    return Expected<void>{};
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (!ctx->responseSeen) {
        auto r = deliverResponse(*ctx);
        if (!r.ok()) {
            ctx->abortError = r.error();
            return 0;
        }
    }
    if (ctx->discardBody)
        return total;

    if (*ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r.ok()) {
        ctx->abortError = r.error();
        return 0;
    }
    return total;
}

// CURL transfer-info callback: lets cancellation interrupt a connection that is not sending
static int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

struct CurlEasyDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter(const DownloaderConfig& cfg, std::shared_ptr<spdlog::logger> logger)
        : connectTimeout_(cfg.connectTimeout), stallTimeout_(cfg.stallTimeout),
          bufferSize_(std::clamp<std::size_t>(cfg.chunkSizeBytes, 16 * 1024, 512 * 1024)),
          logger_(std::move(logger)) {
        if (!logger_)
            logger_ = spdlog::default_logger();
    }
    ~CurlHttpAdapter() override = default;

    Expected<ResponseInfo> fetch(std::string_view url, const std::vector<Header>& headers,
                                 std::uint64_t offset, const ResponseCallback& onResponse,
                                 const ByteSink& sink, const ShouldCancel& shouldCancel) override {
        if (url.empty()) {
            return Error{ErrorCode::InvalidArgument, "fetch: empty url"};
        }
        if (!sink) {
            return Error{ErrorCode::InvalidArgument, "fetch: no sink provided"};
        }

        std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const bool httpScheme = isHttpUrl(url);

        // Build headers including Range
        curl_slist* raw = nullptr;
        for (const auto& h : headers) {
            std::string line = h.name;
            line.append(": ");
            line.append(h.value);
            raw = curl_slist_append(raw, line.c_str());
        }
        if (offset > 0 && httpScheme) {
            const std::string range = "Range: bytes=" + std::to_string(offset) + "-";
            raw = curl_slist_append(raw, range.c_str());
        }
        std::unique_ptr<curl_slist, CurlSlistDeleter> list(raw);

        const std::string urlStr(url);
        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, urlStr.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        if (list) {
            curl_easy_setopt(h, CURLOPT_HTTPHEADER, list.get());
        }
        if (offset > 0 && !httpScheme) {
            curl_easy_setopt(h, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(offset));
        }

        HeaderParseContext hctx{};
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = h;
        wctx.headers = &hctx;
        wctx.onResponse = &onResponse;
        wctx.sink = &sink;
        wctx.shouldCancel = &shouldCancel;
        wctx.requestedOffset = offset;
        wctx.httpScheme = httpScheme;
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &wctx);

        configureCommon(h);

        CURLcode rc = curl_easy_perform(h);

        if (wctx.cancelRequested) {
            return Error{ErrorCode::Cancelled, "Transfer cancelled"};
        }
        if (wctx.abortError) {
            return *wctx.abortError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetch(GET " + urlStr + ")");
        }

        if (!wctx.responseSeen) {
            // Empty body: response metadata has not been delivered yet.
            auto r = deliverResponse(wctx);
            if (!r.ok())
                return r.error();
        }
        if (wctx.info.httpStatus >= 400) {
            return makeHttpStatusError(wctx.info.httpStatus);
        }

        logger_->debug("fetch {} (offset {}) -> status {}, body from {}", urlStr, offset,
                       wctx.info.httpStatus, wctx.info.startOffset);
        return wctx.info;
    }

private:
    void configureCommon(CURL* curl) const {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(connectTimeout_.count()));
        // Stall detection instead of a total timeout: large files may legitimately take hours.
        const long stallSeconds =
            std::max<long>(1, static_cast<long>(stallTimeout_.count() / 1000));
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallSeconds);

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(bufferSize_));
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "modelfetch/" MODELFETCH_VERSION_STRING);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        // Robustness
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    }

    std::chrono::milliseconds connectTimeout_;
    std::chrono::milliseconds stallTimeout_;
    std::size_t bufferSize_;
    std::shared_ptr<spdlog::logger> logger_;
};

std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter(const DownloaderConfig& cfg,
                                                  std::shared_ptr<spdlog::logger> logger) {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    return std::make_unique<CurlHttpAdapter>(cfg, std::move(logger));
}

} // namespace modelfetch::downloader
