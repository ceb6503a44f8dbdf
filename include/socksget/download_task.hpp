#pragma once

#include "progress.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

namespace socksget {

struct DownloadReport {
    std::uint64_t total_size{0};
    std::size_t chunks{0};
    std::size_t skipped{0};
    std::size_t fetched{0};
    std::uint64_t network_bytes{0};
    std::filesystem::path output;
};

class DownloadTask {
public:
    virtual ~DownloadTask() = default;

    // Throws DownloadError subclasses on fatal failure.
    virtual DownloadReport run() = 0;
    [[nodiscard]] virtual Progress getProgress() const = 0;
    [[nodiscard]] virtual bool isRunning() const = 0;
    [[nodiscard]] virtual bool hasError() const = 0;
};

using DownloadTaskPtr = std::shared_ptr<DownloadTask>;

} // namespace socksget
