#include "socksget/config.hpp"

#include "socksget/errors.hpp"
#include "socksget/logging.hpp"

#include <algorithm>
#include <exception>
#include <optional>

#include <fmt/format.h>

namespace socksget {

namespace {

long long parseNumber(const std::string& option, const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        throw UsageError(fmt::format("Invalid value for {}: {}", option, value));
    }
    if (consumed != value.size() || parsed < 0) {
        throw UsageError(fmt::format("Invalid value for {}: {}", option, value));
    }
    return parsed;
}

} // namespace

void DownloadConfig::validate() const {
    if (url.empty()) {
        throw ConfigError("URL must not be empty");
    }
    if (output_path.empty()) {
        throw ConfigError("Output filename must not be empty");
    }
    if (threads <= 0) {
        throw ConfigError(fmt::format("Thread count must be positive, got {}", threads));
    }
    if (start_port <= 0 || start_port + threads - 1 > 65535) {
        throw ConfigError(fmt::format("Proxy ports {}..{} are outside 1..65535",
                                      start_port, start_port + threads - 1));
    }
    if (chunk_size == 0) {
        throw ConfigError("Chunk size must be positive");
    }
    if (retry.max_attempts <= 0) {
        throw ConfigError(fmt::format("Retry count must be positive, got {}", retry.max_attempts));
    }
    if (retry.delay.count() < 0) {
        throw ConfigError("Retry delay must not be negative");
    }
}

CliOptions parseArgs(int argc, const char* const argv[]) {
    CliOptions options;
    DownloadConfig& config = options.config;
    std::optional<long long> sport;
    std::optional<long long> threads;

    int arg_index = 1;
    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            options.show_help = true;
            return options;
        }
        if (option == "--serial") {
            config.dispatch = DispatchMode::Serial;
            ++arg_index;
            continue;
        }
        if (option == "--no-progress") {
            options.show_progress = false;
            ++arg_index;
            continue;
        }

        if (arg_index + 1 >= argc) {
            throw UsageError("Missing value for " + option);
        }
        const std::string value = argv[arg_index + 1];

        if (option == "--url") {
            config.url = value;
        } else if (option == "--filename") {
            config.output_path = value;
        } else if (option == "--sport") {
            sport = parseNumber(option, value);
        } else if (option == "--threads") {
            threads = parseNumber(option, value);
        } else if (option == "--scratch-dir") {
            config.scratch_dir = value;
        } else if (option == "--chunk-size") {
            config.chunk_size = static_cast<std::uint64_t>(parseNumber(option, value));
        } else if (option == "--retries") {
            config.retry.max_attempts = static_cast<int>(std::min(parseNumber(option, value), 1000LL));
        } else if (option == "--retry-delay") {
            config.retry.delay = std::chrono::milliseconds(parseNumber(option, value));
        } else if (option == "--log-level") {
            options.log_level = value;
        } else {
            throw UsageError("Unknown option: " + option);
        }
        arg_index += 2;
    }

    if (config.url.empty() || config.output_path.empty() || !sport || !threads) {
        throw UsageError("Invalid or missing arguments. Use --help for usage information.");
    }
    if (*sport > 65535 || *threads > 65535) {
        throw UsageError("Port range out of bounds");
    }
    config.start_port = static_cast<int>(*sport);
    config.threads = static_cast<int>(*threads);

    parseLogLevel(options.log_level);   // rejects unknown level names
    config.validate();
    return options;
}

} // namespace socksget
