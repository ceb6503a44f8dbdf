#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace socksget {

inline constexpr std::uint64_t kDefaultChunkSize = 1ULL << 20;
inline constexpr int kDefaultMaxAttempts = 5;
inline constexpr const char* kBrowserUserAgent =
    "Mozilla/5.0 (Macintosh; Intel Mac OS X 10.15; rv:109.0) Gecko/20100101 Firefox/116.0";

struct RetryPolicy {
    int max_attempts{kDefaultMaxAttempts};
    std::chrono::milliseconds delay{0};
};

struct Timeouts {
    std::chrono::seconds size_lookup{30};
    std::chrono::seconds chunk{60};
    std::chrono::seconds connect{15};
};

enum class DispatchMode {
    Parallel,   // submit every pending chunk, then join in range order
    Serial      // wait for each chunk before dispatching the next
};

struct DownloadConfig {
    std::string url;
    std::string output_path;
    int start_port{0};
    int threads{0};
    std::uint64_t chunk_size{kDefaultChunkSize};
    std::string scratch_dir;    // empty: system temp directory
    RetryPolicy retry{};
    Timeouts timeouts{};
    std::string user_agent{kBrowserUserAgent};
    DispatchMode dispatch{DispatchMode::Parallel};

    // Throws ConfigError.
    void validate() const;
};

struct CliOptions {
    DownloadConfig config;
    bool show_progress{true};
    bool show_help{false};
    std::string log_level{"info"};
};

// Parses the socksget command line. Throws UsageError when a required flag is
// missing or a value is malformed, ConfigError when the values are invalid.
CliOptions parseArgs(int argc, const char* const argv[]);

} // namespace socksget
