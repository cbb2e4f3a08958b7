/*
 * modelfetch/src/downloader/status_store.cpp
 *
 * JSON status store (one file per manifest under the state directory)
 *
 * File layout:
 * {
 *   "model_id": "org/model",
 *   "files": [
 *     { "filename": "config.json", "file_size": 1024, "downloaded_size": 1024,
 *       "status": "completed" },
 *     ...
 *   ]
 * }
 *
 * - save() always goes through ScopedAtomicReplace; readers see the old or the new record
 * - load() fails closed: an unparsable or invalid record is deleted and reported as absent
 * - Leftover temporaries older than StatusStoreOptions::staleTempAge are swept after saves
 */

#include <modelfetch/downloader/atomic_file.hpp>
#include <modelfetch/downloader/status_store.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <mutex>
#include <system_error>

namespace modelfetch::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

constexpr const char* kStatusSuffix = "_status.json";

Error invalid(std::string what) {
    return Error{ErrorCode::CorruptRecord, "invalid status record: " + std::move(what)};
}

} // namespace

fs::path statusPathFor(const fs::path& stateDir, std::string_view manifestId) {
    std::string flat(manifestId);
    for (auto& c : flat) {
        if (c == '/' || c == '\\')
            c = '_';
    }
    return stateDir / (flat + kStatusSuffix);
}

std::string serializeStatusRecord(const StatusRecord& record) {
    json root = json::object();
    root["model_id"] = record.manifestId;
    root["files"] = json::array();
    for (const auto& f : record.files) {
        root["files"].push_back({{"filename", f.name},
                                 {"file_size", f.expectedSize},
                                 {"downloaded_size", f.downloadedBytes},
                                 {"status", toString(f.state)}});
    }
    return root.dump(2);
}

Expected<StatusRecord> parseStatusRecord(std::string_view text) {
    json root;
    try {
        root = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& ex) {
        return invalid(ex.what());
    }

    if (!root.is_object())
        return invalid("top level is not an object");
    if (!root.contains("model_id") || !root["model_id"].is_string())
        return invalid("missing model_id");
    if (!root.contains("files") || !root["files"].is_array())
        return invalid("missing files");

    StatusRecord record;
    record.manifestId = root["model_id"].get<std::string>();
    for (const auto& entry : root["files"]) {
        if (!entry.is_object())
            return invalid("file entry is not an object");
        if (!entry.contains("filename") || !entry["filename"].is_string())
            return invalid("file entry without filename");
        if (!entry.contains("file_size") || !entry["file_size"].is_number_unsigned())
            return invalid("file entry without file_size");
        if (!entry.contains("downloaded_size") || !entry["downloaded_size"].is_number_unsigned())
            return invalid("file entry without downloaded_size");
        if (!entry.contains("status") || !entry["status"].is_string())
            return invalid("file entry without status");

        auto state = parseFileState(entry["status"].get<std::string>());
        if (!state)
            return invalid("unknown status '" + entry["status"].get<std::string>() + "'");

        FileProgress fp;
        fp.name = entry["filename"].get<std::string>();
        fp.expectedSize = entry["file_size"].get<std::uint64_t>();
        fp.downloadedBytes = entry["downloaded_size"].get<std::uint64_t>();
        fp.state = *state;
        record.files.push_back(std::move(fp));
    }
    return record;
}

StatusSummary summarizeStatus(const StatusRecord& record) {
    StatusSummary s;
    s.fileCount = record.files.size();
    for (const auto& f : record.files) {
        s.totalBytes += f.expectedSize;
        s.downloadedBytes += f.downloadedBytes;
        switch (f.state) {
            case FileState::Completed:
                ++s.completed;
                break;
            case FileState::Failed:
                ++s.failed;
                break;
            case FileState::Stopped:
                ++s.stopped;
                break;
            case FileState::Downloading:
                ++s.downloading;
                break;
            case FileState::Pending:
                ++s.pending;
                break;
        }
    }
    return s;
}

class JsonStatusStore final : public IStatusStore {
public:
    JsonStatusStore(fs::path stateDir, std::shared_ptr<spdlog::logger> logger,
                    StatusStoreOptions options)
        : stateDir_(std::move(stateDir)), logger_(std::move(logger)), options_(options) {
        if (!logger_)
            logger_ = spdlog::default_logger();
    }

    Expected<void> save(const StatusRecord& record) override {
        if (record.manifestId.empty()) {
            return Error{ErrorCode::InvalidArgument, "StatusStore.save: empty manifest id"};
        }
        const auto text = serializeStatusRecord(record);
        const auto path = statusPathFor(stateDir_, record.manifestId);

        {
            std::lock_guard<std::mutex> lk(writeMutex_);
            ScopedAtomicReplace out(path);
            if (auto r = out.open(); !r.ok())
                return r;
            if (auto r = out.write(text); !r.ok())
                return r;
            if (auto r = out.commit(); !r.ok())
                return r;
        }
        logger_->debug("StatusStore: saved {} ({} files)", path.string(), record.files.size());

        // Runs after writeMutex_ is released so a slow directory scan never delays checkpoints.
        sweepStaleTemporaries();
        return Expected<void>{};
    }

    Expected<std::optional<StatusRecord>> load(std::string_view manifestId) override {
        if (manifestId.empty()) {
            return Error{ErrorCode::InvalidArgument, "StatusStore.load: empty manifest id"};
        }
        const auto path = statusPathFor(stateDir_, manifestId);

        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::optional<StatusRecord>{std::nullopt};
        }

        std::string text;
        {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return Error{ErrorCode::IoError, "Failed to open status record: " + path.string()};
            }
            text.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        auto parsed = parseStatusRecord(text);
        if (!parsed.ok()) {
            logger_->warn("Discarding status record {}: {}", path.string(),
                          parsed.error().message);
            std::lock_guard<std::mutex> lk(writeMutex_);
            fs::remove(path, ec);
            if (ec) {
                logger_->warn("Failed to delete invalid status record {}: {}", path.string(),
                              ec.message());
            }
            return std::optional<StatusRecord>{std::nullopt};
        }

        if (parsed.value().manifestId != manifestId) {
            logger_->warn("Status record {} belongs to '{}', not '{}'; ignoring", path.string(),
                          parsed.value().manifestId, manifestId);
            return std::optional<StatusRecord>{std::nullopt};
        }
        return std::optional<StatusRecord>{std::move(parsed).value()};
    }

    void remove(std::string_view manifestId) noexcept override {
        if (manifestId.empty())
            return;
        std::error_code ec;
        std::lock_guard<std::mutex> lk(writeMutex_);
        fs::remove(statusPathFor(stateDir_, manifestId), ec);
    }

private:
    // At most one sweep at a time; a save that finds one in progress skips its own.
    void sweepStaleTemporaries() noexcept {
        std::unique_lock<std::mutex> gc(gcMutex_, std::try_to_lock);
        if (!gc.owns_lock())
            return;
        const auto now = std::chrono::steady_clock::now();
        if (lastSweep_ && now - *lastSweep_ < options_.gcInterval)
            return;
        lastSweep_ = now;

        std::error_code ec;
        fs::directory_iterator it(stateDir_, ec);
        if (ec)
            return;

        const auto cutoff = fs::file_time_type::clock::now() - options_.staleTempAge;
        const std::string marker = std::string(kStatusSuffix) + ".tmp-";
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec)
                break;
            const auto& entry = *it;
            const auto name = entry.path().filename().string();
            if (name.find(marker) == std::string::npos)
                continue;
            std::error_code fec;
            const auto mtime = entry.last_write_time(fec);
            if (fec || mtime > cutoff)
                continue;
            if (fs::remove(entry.path(), fec)) {
                logger_->debug("StatusStore: removed stale temporary {}", entry.path().string());
            } else if (fec) {
                logger_->debug("StatusStore: failed to remove {}: {}", entry.path().string(),
                               fec.message());
            }
        }
    }

    fs::path stateDir_;
    std::shared_ptr<spdlog::logger> logger_;
    StatusStoreOptions options_;
    std::mutex writeMutex_;
    std::mutex gcMutex_; // guards lastSweep_
    std::optional<std::chrono::steady_clock::time_point> lastSweep_;
};

std::unique_ptr<IStatusStore> makeJsonStatusStore(fs::path stateDir,
                                                  std::shared_ptr<spdlog::logger> logger,
                                                  StatusStoreOptions options) {
    return std::make_unique<JsonStatusStore>(std::move(stateDir), std::move(logger), options);
}

} // namespace modelfetch::downloader
