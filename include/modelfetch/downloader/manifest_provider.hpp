#pragma once

#include <modelfetch/downloader/downloader.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace modelfetch::downloader {

/**
 * ModelScope file listing endpoint for a model (master revision, recursive).
 */
[[nodiscard]] std::string modelScopeListUrl(std::string_view endpoint, std::string_view modelId);

/**
 * Direct download URL of one file of a model.
 */
[[nodiscard]] std::string modelScopeFileUrl(std::string_view endpoint, std::string_view modelId,
                                            std::string_view filename);

/**
 * Parse the body of a ModelScope file listing ({"Code":200,"Data":{"Files":[...]}}).
 * Directories, non-downloadable and nameless entries are skipped.
 */
Expected<std::vector<FileDescriptor>>
parseModelScopeFileList(std::string_view body, std::string_view modelId, std::string_view endpoint,
                        std::shared_ptr<spdlog::logger> logger = {});

/**
 * Parse a local manifest: {"files":[{"name","size","sha256","url"}]}.
 */
Expected<std::vector<FileDescriptor>> parseJsonManifest(std::string_view body);

/**
 * Lists a model through the ModelScope HTTP API using `http` as transport.
 */
std::unique_ptr<IManifestProvider>
makeModelScopeManifestProvider(std::string endpoint, std::shared_ptr<IHttpAdapter> http,
                               std::shared_ptr<spdlog::logger> logger = {});

/**
 * Reads the file list from a JSON manifest on disk; the manifest id is only used for logging.
 */
std::unique_ptr<IManifestProvider>
makeJsonManifestProvider(std::filesystem::path path, std::shared_ptr<spdlog::logger> logger = {});

} // namespace modelfetch::downloader
