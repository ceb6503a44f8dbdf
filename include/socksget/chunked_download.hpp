#pragma once

#include "config.hpp"
#include "download_task.hpp"
#include "http_client.hpp"

#include <memory>
#include <vector>

namespace socksget {

// Resolve size, plan, fetch missing chunks through the proxy pool, verify and
// reassemble. Re-running after a failure reuses every intact partial file.
class ChunkedDownload final : public DownloadTask {
public:
    // A null client selects CurlHttpClient.
    explicit ChunkedDownload(DownloadConfig config, HttpClientPtr client = nullptr);
    ~ChunkedDownload() override;

    DownloadReport run() override;
    [[nodiscard]] Progress getProgress() const override;
    [[nodiscard]] bool isRunning() const override;
    [[nodiscard]] bool hasError() const override;

    [[nodiscard]] std::vector<ChunkState> chunkStates() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace socksget
