#include <modelfetch/downloader/downloader.hpp>

namespace modelfetch::downloader {

const char* toString(FileState state) noexcept {
    switch (state) {
        case FileState::Pending:
            return "pending";
        case FileState::Downloading:
            return "downloading";
        case FileState::Completed:
            return "completed";
        case FileState::Failed:
            return "failed";
        case FileState::Stopped:
            return "stopped";
    }
    return "pending";
}

std::optional<FileState> parseFileState(std::string_view s) noexcept {
    if (s == "pending")
        return FileState::Pending;
    if (s == "downloading")
        return FileState::Downloading;
    if (s == "completed")
        return FileState::Completed;
    if (s == "failed")
        return FileState::Failed;
    if (s == "stopped")
        return FileState::Stopped;
    return std::nullopt;
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:
            return "none";
        case ErrorCode::InvalidArgument:
            return "invalid argument";
        case ErrorCode::NetworkError:
            return "network error";
        case ErrorCode::Timeout:
            return "timeout";
        case ErrorCode::TlsVerificationFailed:
            return "TLS verification failed";
        case ErrorCode::ServerError:
            return "server error";
        case ErrorCode::ClientError:
            return "client error";
        case ErrorCode::RangeNotSatisfiable:
            return "range not satisfiable";
        case ErrorCode::IoError:
            return "I/O error";
        case ErrorCode::ChecksumMismatch:
            return "checksum mismatch";
        case ErrorCode::ManifestError:
            return "manifest error";
        case ErrorCode::CorruptRecord:
            return "corrupt status record";
        case ErrorCode::Cancelled:
            return "cancelled";
        case ErrorCode::Unknown:
            return "unknown error";
    }
    return "unknown error";
}

} // namespace modelfetch::downloader
