#include "socksget/progress_reporter.hpp"

#include "socksget/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <future>
#include <iterator>
#include <memory>
#include <ostream>

#include <fmt/format.h>
#include <spdlog/sinks/base_sink.h>

namespace socksget {

namespace {

constexpr std::size_t kChunkMapWidth = 60;

int urgency(ChunkState state) {
    switch (state) {
    case ChunkState::Failed:
        return 5;
    case ChunkState::Retrying:
        return 4;
    case ChunkState::Fetching:
        return 3;
    case ChunkState::Pending:
        return 2;
    case ChunkState::Succeeded:
        return 1;
    case ChunkState::Skipped:
        return 0;
    }
    return 0;
}

char cellFor(ChunkState state) {
    switch (state) {
    case ChunkState::Failed:
        return '!';
    case ChunkState::Retrying:
        return 'r';
    case ChunkState::Fetching:
        return '>';
    case ChunkState::Pending:
        return '.';
    case ChunkState::Succeeded:
        return '#';
    case ChunkState::Skipped:
        return 's';
    }
    return '?';
}

} // namespace

class ProgressReporter::LogSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit LogSink(ProgressReporter& reporter) : reporter_(reporter) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        reporter_.printAbove(fmt::to_string(formatted));
    }

    void flush_() override {}

private:
    ProgressReporter& reporter_;
};

ProgressReporter::ProgressReporter(std::ostream& out, std::chrono::milliseconds interval)
    : out_(out), interval_(interval) {}

DownloadReport ProgressReporter::run(DownloadTask& task) {
    auto log = logger();
    auto sink = std::make_shared<LogSink>(*this);
    sink->set_pattern(kLogPattern);

    // Swap sinks only while no task thread is logging.
    struct SinkSwap {
        std::shared_ptr<spdlog::logger> log;
        std::vector<spdlog::sink_ptr> saved;
        ~SinkSwap() { log->sinks() = std::move(saved); }
    } restore{log, log->sinks()};
    log->sinks() = {sink};

    auto result = std::async(std::launch::async, [&task]() { return task.run(); });
    while (result.wait_for(interval_) != std::future_status::ready) {
        draw(buildPanel(task.getProgress()));
    }
    draw(buildPanel(task.getProgress()));
    {
        std::lock_guard<std::mutex> lock(out_mutex_);
        out_ << std::flush;
        panel_lines_ = 0;
    }

    return result.get();
}

std::string ProgressReporter::buildPanel(const Progress& progress) {
    std::string name = std::filesystem::path{progress.filename}.filename().string();
    if (name.empty()) {
        name = "(unnamed)";
    }

    if (progress.total_bytes == 0) {
        if (progress.has_error) {
            return fmt::format("{}  failed: {}\n", name, progress.error_message);
        }
        return fmt::format("{}  resolving size...\n", name);
    }

    const auto percent = static_cast<int>(progress.downloaded_bytes * 100 / progress.total_bytes);
    std::string panel = fmt::format("{}  {:>3}%  {} of {}  chunks {}/{}",
                                    name,
                                    percent,
                                    formatSize(progress.downloaded_bytes),
                                    formatSize(progress.total_bytes),
                                    progress.chunks_done,
                                    progress.chunks_total);
    if (progress.chunks_skipped > 0) {
        panel += fmt::format(", {} resumed", progress.chunks_skipped);
    }
    if (progress.chunks_failed > 0) {
        panel += fmt::format(", {} failed", progress.chunks_failed);
    }
    if (progress.has_error) {
        panel += fmt::format("  ❌ {}", progress.error_message);
    } else if (!progress.is_running) {
        panel += "  ✅ Done";
    }
    panel.push_back('\n');

    if (!progress.chunk_states.empty()) {
        panel += fmt::format("  [{}]\n", chunkMap(progress.chunk_states, kChunkMapWidth));
    }
    return panel;
}

std::string ProgressReporter::chunkMap(const std::vector<ChunkState>& states, std::size_t width) {
    const std::size_t count = states.size();
    const std::size_t cells = std::min(count, std::max<std::size_t>(1, width));

    std::string map;
    map.reserve(cells);
    for (std::size_t cell = 0; cell < cells; ++cell) {
        const auto first = states.begin() + static_cast<std::ptrdiff_t>(cell * count / cells);
        const auto last = states.begin() + static_cast<std::ptrdiff_t>((cell + 1) * count / cells);
        const auto shown = std::max_element(first, last, [](ChunkState a, ChunkState b) {
            return urgency(a) < urgency(b);
        });
        map.push_back(cellFor(*shown));
    }
    return map;
}

std::string ProgressReporter::formatSize(std::uint64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    if (unit == 0) {
        return fmt::format("{} B", bytes);
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

void ProgressReporter::draw(const std::string& panel) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    erasePanel();
    panel_ = panel;
    out_ << panel_;
    panel_lines_ = static_cast<std::size_t>(std::count(panel_.begin(), panel_.end(), '\n'));
}

void ProgressReporter::printAbove(const std::string& text) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    erasePanel();
    out_ << text;
    if (!panel_.empty()) {
        out_ << panel_;
        panel_lines_ = static_cast<std::size_t>(std::count(panel_.begin(), panel_.end(), '\n'));
    }
}

// Caller holds out_mutex_.
void ProgressReporter::erasePanel() {
    if (panel_lines_ > 0) {
        out_ << "\033[" << panel_lines_ << "F\033[J";
        panel_lines_ = 0;
    }
}

} // namespace socksget
