#include "socksget/chunked_download.hpp"

#include "socksget/chunk_fetcher.hpp"
#include "socksget/chunk_planner.hpp"
#include "socksget/errors.hpp"
#include "socksget/logging.hpp"
#include "socksget/proxy_pool.hpp"
#include "socksget/scratch_store.hpp"
#include "socksget/size_resolver.hpp"
#include "socksget/worker_pool.hpp"

#include <future>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace socksget {

const char* toString(ChunkState state) noexcept {
    switch (state) {
    case ChunkState::Pending:
        return "pending";
    case ChunkState::Skipped:
        return "skipped";
    case ChunkState::Fetching:
        return "fetching";
    case ChunkState::Retrying:
        return "retrying";
    case ChunkState::Succeeded:
        return "succeeded";
    case ChunkState::Failed:
        return "failed";
    }
    return "unknown";
}

class ChunkedDownload::Impl {
public:
    Impl(DownloadConfig config, HttpClientPtr client)
        : config_(std::move(config)), client_(std::move(client)) {
        if (!client_) {
            client_ = std::make_shared<CurlHttpClient>();
        }
    }

    DownloadReport run() {
        resetState();
        try {
            config_.validate();
            DownloadReport report = execute();
            setRunning(false);
            return report;
        } catch (const DownloadError& ex) {
            registerError(ex.what());
            throw;
        }
    }

    [[nodiscard]] Progress getProgress() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return {
            config_.url,
            config_.output_path,
            total_bytes_,
            downloaded_bytes_,
            states_.size(),
            chunks_done_,
            chunks_skipped_,
            chunks_failed_,
            is_running_,
            has_error_,
            error_message_,
            states_
        };
    }

    [[nodiscard]] bool isRunning() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return is_running_;
    }

    [[nodiscard]] bool hasError() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return has_error_;
    }

    [[nodiscard]] std::vector<ChunkState> chunkStates() const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        return states_;
    }

private:
    DownloadReport execute() {
        ProxyPool pool(config_.start_port, config_.threads);

        SizeResolver resolver(*client_, pool, config_.timeouts.size_lookup, config_.user_agent);
        resolver.setConnectTimeout(config_.timeouts.connect);
        logger()->info("Resolving size of {} through {} proxies from port {}",
                       config_.url, config_.threads, config_.start_port);
        const auto size = resolver.resolve(config_.url);
        if (!size || *size == 0) {
            throw UnknownSizeError(config_.url);
        }

        const DownloadPlan plan = makePlan(*size, config_.chunk_size);
        const ScratchStore scratch(config_.scratch_dir, config_.output_path);
        logger()->info("{} bytes in {} chunks, progress files in {}",
                       plan.total_size, plan.ranges.size(), scratch.directory().string());
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            total_bytes_ = plan.total_size;
            states_.assign(plan.ranges.size(), ChunkState::Pending);
        }

        ChunkFetcher fetcher(*client_, pool, scratch, config_.retry, config_.timeouts, config_.user_agent);
        fetcher.setAttemptObserver([this](std::size_t index, int attempt) {
            setState(index, attempt == 1 ? ChunkState::Fetching : ChunkState::Retrying);
        });

        {
            WorkerPool workers(static_cast<std::size_t>(config_.threads));
            std::vector<std::future<void>> pending;
            const std::string& url = config_.url;

            for (const auto& range : plan.ranges) {
                if (scratch.isResumable(range)) {
                    logger()->debug("Chunk {} already on disk, skipping", range.index);
                    markSkipped(range);
                    continue;
                }

                // The chunk settles on the worker, so progress moves as soon as
                // its partial file is written and the body is dropped right away.
                auto settled = workers.submit([this, &fetcher, &url, range]() {
                    settle(range, fetcher.fetch(url, range));
                });
                if (config_.dispatch == DispatchMode::Serial) {
                    settled.get();
                } else {
                    pending.push_back(std::move(settled));
                }
            }

            for (auto& settled : pending) {
                settled.get();
            }
        }

        const auto bad = scratch.verify(plan);
        if (!bad.empty()) {
            throw VerificationError(
                fmt::format("{} of {} chunks missing or incomplete (chunks {}); progress files kept in {}",
                            bad.size(), plan.ranges.size(), fmt::join(bad, ", "), scratch.directory().string()),
                bad);
        }

        logger()->info("Assembling {}", config_.output_path);
        scratch.assemble(plan, config_.output_path);

        const DownloadReport report = makeReport(plan);
        logger()->info("Downloaded {} ({} bytes, {} chunks fetched, {} resumed)",
                       config_.output_path, plan.total_size, report.fetched, report.skipped);
        return report;
    }

    void settle(const ByteRange& range, const ChunkResult& result) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++chunks_done_;
        if (result.ok) {
            states_[range.index] = ChunkState::Succeeded;
            downloaded_bytes_ += range.length();
            network_bytes_ += result.bytes.size();
            ++chunks_fetched_;
        } else {
            states_[range.index] = ChunkState::Failed;
            ++chunks_failed_;
        }
    }

    DownloadReport makeReport(const DownloadPlan& plan) const {
        std::lock_guard<std::mutex> lock(state_mutex_);
        DownloadReport report;
        report.total_size = plan.total_size;
        report.chunks = plan.ranges.size();
        report.skipped = chunks_skipped_;
        report.fetched = chunks_fetched_;
        report.network_bytes = network_bytes_;
        report.output = config_.output_path;
        return report;
    }

    void markSkipped(const ByteRange& range) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        states_[range.index] = ChunkState::Skipped;
        downloaded_bytes_ += range.length();
        ++chunks_done_;
        ++chunks_skipped_;
    }

    void setState(std::size_t index, ChunkState state) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (index < states_.size()) {
            states_[index] = state;
        }
    }

    void resetState() {
        std::lock_guard<std::mutex> lock(state_mutex_);
        total_bytes_ = 0;
        downloaded_bytes_ = 0;
        chunks_done_ = 0;
        chunks_skipped_ = 0;
        chunks_failed_ = 0;
        chunks_fetched_ = 0;
        network_bytes_ = 0;
        states_.clear();
        has_error_ = false;
        error_message_.clear();
        is_running_ = true;
    }

    void registerError(std::string message) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        has_error_ = true;
        if (error_message_.empty()) {
            error_message_ = std::move(message);
        }
        is_running_ = false;
    }

    void setRunning(bool running) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        is_running_ = running;
    }

    DownloadConfig config_;
    HttpClientPtr client_;

    mutable std::mutex state_mutex_;

    std::uint64_t total_bytes_{0};
    std::uint64_t downloaded_bytes_{0};
    std::size_t chunks_done_{0};
    std::size_t chunks_skipped_{0};
    std::size_t chunks_failed_{0};
    std::size_t chunks_fetched_{0};
    std::uint64_t network_bytes_{0};
    std::vector<ChunkState> states_;
    bool is_running_{false};
    bool has_error_{false};
    std::string error_message_;
};

ChunkedDownload::ChunkedDownload(DownloadConfig config, HttpClientPtr client)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(client))) {}

ChunkedDownload::~ChunkedDownload() = default;

DownloadReport ChunkedDownload::run() { return impl_->run(); }

Progress ChunkedDownload::getProgress() const { return impl_->getProgress(); }

bool ChunkedDownload::isRunning() const { return impl_->isRunning(); }

bool ChunkedDownload::hasError() const { return impl_->hasError(); }

std::vector<ChunkState> ChunkedDownload::chunkStates() const { return impl_->chunkStates(); }

} // namespace socksget
