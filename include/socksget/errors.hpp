#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace socksget {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Malformed command line: missing flag, unknown option, non-numeric value.
class UsageError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

// Neither the HEAD request nor the 0-0 range request produced a usable size.
class UnknownSizeError : public DownloadError {
public:
    explicit UnknownSizeError(const std::string& url)
        : DownloadError("Cannot determine file size of " + url) {}
};

// Thrown by HttpClient implementations; never escapes the resolver or fetcher.
class TransportError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class ScratchError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class VerificationError : public DownloadError {
public:
    VerificationError(std::string message, std::vector<std::size_t> bad_chunks)
        : DownloadError(std::move(message)), bad_chunks_(std::move(bad_chunks)) {}

    [[nodiscard]] const std::vector<std::size_t>& badChunks() const noexcept { return bad_chunks_; }

private:
    std::vector<std::size_t> bad_chunks_;
};

} // namespace socksget
