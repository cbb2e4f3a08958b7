#include <modelfetch/downloader/manifest_state.hpp>

#include <unordered_map>

namespace modelfetch::downloader {

ManifestState::ManifestState(std::string manifestId, const std::vector<FileDescriptor>& files)
    : manifestId_(std::move(manifestId)), size_(files.size()) {
    files_.reserve(files.size());
    for (const auto& d : files) {
        FileProgress fp;
        fp.name = d.name;
        fp.expectedSize = d.expectedSize;
        files_.push_back(std::move(fp));
    }
}

std::size_t ManifestState::merge(const StatusRecord& prior) {
    std::unordered_map<std::string_view, const FileProgress*> byName;
    byName.reserve(prior.files.size());
    for (const auto& f : prior.files)
        byName.emplace(f.name, &f);

    std::lock_guard<std::mutex> lk(mutex_);
    std::size_t matched = 0;
    for (auto& f : files_) {
        auto it = byName.find(f.name);
        if (it == byName.end())
            continue;
        f.downloadedBytes = it->second->downloadedBytes;
        f.state = it->second->state;
        ++matched;
    }
    return matched;
}

StatusRecord ManifestState::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return StatusRecord{manifestId_, files_};
}

FileProgress ManifestState::get(std::size_t index) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return files_.at(index);
}

void ManifestState::setDownloaded(std::size_t index, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mutex_);
    files_.at(index).downloadedBytes = bytes;
}

void ManifestState::setState(std::size_t index, FileState state) {
    std::lock_guard<std::mutex> lk(mutex_);
    files_.at(index).state = state;
}

void ManifestState::setExpectedSize(std::size_t index, std::uint64_t bytes) {
    std::lock_guard<std::mutex> lk(mutex_);
    files_.at(index).expectedSize = bytes;
}

} // namespace modelfetch::downloader
