/*
 * modelfetch/src/downloader/manifest_provider.cpp
 *
 * Manifest providers:
 * - ModelScope: GET <endpoint>/api/v1/models/<id>/repo/files?Revision=master&Recursive=true
 *   and map Data.Files[] to FileDescriptor (Path/Name, Size, Sha256)
 * - JSON file: {"files":[{"name","size","sha256","url"}]} for mirrors and offline use
 */

#include <modelfetch/downloader/manifest_provider.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

namespace modelfetch::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxListingBytes = 64ull * 1024ull * 1024ull;

Error manifestError(std::string what) {
    return Error{ErrorCode::ManifestError, std::move(what)};
}

std::string trimTrailingSlash(std::string_view s) {
    while (!s.empty() && s.back() == '/')
        s.remove_suffix(1);
    return std::string(s);
}

std::uint64_t sizeField(const json& entry, const char* key) {
    if (!entry.contains(key))
        return 0;
    const auto& v = entry[key];
    if (v.is_number_unsigned())
        return v.get<std::uint64_t>();
    if (v.is_number_integer() && v.get<std::int64_t>() > 0)
        return static_cast<std::uint64_t>(v.get<std::int64_t>());
    return 0;
}

std::string stringField(const json& entry, const char* key) {
    if (entry.contains(key) && entry[key].is_string())
        return entry[key].get<std::string>();
    return {};
}

std::string toLowerHex(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'F')
            c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

} // namespace

std::string modelScopeListUrl(std::string_view endpoint, std::string_view modelId) {
    return trimTrailingSlash(endpoint) + "/api/v1/models/" + std::string(modelId) +
           "/repo/files?Revision=master&Recursive=true";
}

std::string modelScopeFileUrl(std::string_view endpoint, std::string_view modelId,
                              std::string_view filename) {
    return trimTrailingSlash(endpoint) + "/models/" + std::string(modelId) + "/resolve/master/" +
           std::string(filename);
}

Expected<std::vector<FileDescriptor>>
parseModelScopeFileList(std::string_view body, std::string_view modelId, std::string_view endpoint,
                        std::shared_ptr<spdlog::logger> logger) {
    if (!logger)
        logger = spdlog::default_logger();
    json root;
    try {
        root = json::parse(body.begin(), body.end());
    } catch (const json::parse_error& ex) {
        return manifestError(std::string("file listing is not valid JSON: ") + ex.what());
    }
    if (!root.is_object())
        return manifestError("file listing is not a JSON object");

    if (root.contains("Code") && root["Code"].is_number_integer()) {
        const auto code = root["Code"].get<std::int64_t>();
        if (code != 0 && code != 200) {
            return manifestError("ModelScope returned code " + std::to_string(code) + ": " +
                                 stringField(root, "Message"));
        }
    }
    if (!root.contains("Data") || !root["Data"].is_object())
        return manifestError("file listing has no Data object");
    const auto& data = root["Data"];
    if (!data.contains("Files") || !data["Files"].is_array())
        return manifestError("file listing has no Data.Files array");

    std::vector<FileDescriptor> out;
    for (const auto& entry : data["Files"]) {
        if (!entry.is_object()) {
            logger->warn("Skipping malformed file entry in listing of {}", modelId);
            continue;
        }
        if (stringField(entry, "Type") == "tree")
            continue;

        std::string name = stringField(entry, "Path");
        if (name.empty())
            name = stringField(entry, "Name");
        if (name.empty()) {
            logger->warn("Skipping file entry without a name in listing of {}", modelId);
            continue;
        }
        if (entry.contains("Downloadable") && entry["Downloadable"].is_boolean() &&
            !entry["Downloadable"].get<bool>()) {
            logger->info("Skipping non-downloadable file {}", name);
            continue;
        }

        FileDescriptor fd;
        fd.expectedSize = sizeField(entry, "Size");
        fd.expectedHash = toLowerHex(stringField(entry, "Sha256"));
        fd.sourceUrl = modelScopeFileUrl(endpoint, modelId, name);
        fd.name = std::move(name);
        out.push_back(std::move(fd));
    }
    return out;
}

Expected<std::vector<FileDescriptor>> parseJsonManifest(std::string_view body) {
    json root;
    try {
        root = json::parse(body.begin(), body.end());
    } catch (const json::parse_error& ex) {
        return manifestError(std::string("manifest is not valid JSON: ") + ex.what());
    }
    if (!root.is_object() || !root.contains("files") || !root["files"].is_array())
        return manifestError("manifest has no files array");

    std::vector<FileDescriptor> out;
    for (const auto& entry : root["files"]) {
        if (!entry.is_object())
            return manifestError("manifest entry is not an object");
        FileDescriptor fd;
        fd.name = stringField(entry, "name");
        fd.sourceUrl = stringField(entry, "url");
        if (fd.name.empty() || fd.sourceUrl.empty())
            return manifestError("manifest entry needs both name and url");
        fd.expectedSize = sizeField(entry, "size");
        fd.expectedHash = toLowerHex(stringField(entry, "sha256"));
        out.push_back(std::move(fd));
    }
    return out;
}

class ModelScopeManifestProvider final : public IManifestProvider {
public:
    ModelScopeManifestProvider(std::string endpoint, std::shared_ptr<IHttpAdapter> http,
                               std::shared_ptr<spdlog::logger> logger)
        : endpoint_(std::move(endpoint)), http_(std::move(http)), logger_(std::move(logger)) {
        if (!logger_)
            logger_ = spdlog::default_logger();
    }

    Expected<std::vector<FileDescriptor>> listFiles(std::string_view manifestId) override {
        if (manifestId.empty())
            return Error{ErrorCode::InvalidArgument, "empty model id"};
        if (!http_)
            return Error{ErrorCode::InvalidArgument, "no HTTP adapter configured"};

        const auto url = modelScopeListUrl(endpoint_, manifestId);
        std::string body;
        auto sink = [&body](std::span<const std::byte> data) -> Expected<void> {
            if (body.size() + data.size() > kMaxListingBytes)
                return Error{ErrorCode::ManifestError, "file listing is too large"};
            body.append(reinterpret_cast<const char*>(data.data()), data.size());
            return Expected<void>{};
        };

        logger_->debug("Listing files of {} from {}", manifestId, url);
        const std::vector<Header> headers{Header{"Accept", "application/json"}};
        auto res = http_->fetch(url, headers, 0, {}, sink, {});
        if (!res.ok()) {
            return manifestError("failed to list files of " + std::string(manifestId) + ": " +
                                 res.error().message);
        }

        auto parsed = parseModelScopeFileList(body, manifestId, endpoint_, logger_);
        if (parsed.ok()) {
            logger_->info("Found {} files in {}", parsed.value().size(), manifestId);
        }
        return parsed;
    }

private:
    std::string endpoint_;
    std::shared_ptr<IHttpAdapter> http_;
    std::shared_ptr<spdlog::logger> logger_;
};

class JsonManifestProvider final : public IManifestProvider {
public:
    JsonManifestProvider(fs::path path, std::shared_ptr<spdlog::logger> logger)
        : path_(std::move(path)), logger_(std::move(logger)) {
        if (!logger_)
            logger_ = spdlog::default_logger();
    }

    Expected<std::vector<FileDescriptor>> listFiles(std::string_view manifestId) override {
        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            return manifestError("cannot open manifest " + path_.string());
        }
        std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        auto parsed = parseJsonManifest(body);
        if (parsed.ok()) {
            logger_->debug("Manifest {} for {}: {} files", path_.string(), manifestId,
                          parsed.value().size());
        }
        return parsed;
    }

private:
    fs::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

std::unique_ptr<IManifestProvider>
makeModelScopeManifestProvider(std::string endpoint, std::shared_ptr<IHttpAdapter> http,
                               std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<ModelScopeManifestProvider>(std::move(endpoint), std::move(http),
                                                        std::move(logger));
}

std::unique_ptr<IManifestProvider>
makeJsonManifestProvider(fs::path path, std::shared_ptr<spdlog::logger> logger) {
    return std::make_unique<JsonManifestProvider>(std::move(path), std::move(logger));
}

} // namespace modelfetch::downloader
