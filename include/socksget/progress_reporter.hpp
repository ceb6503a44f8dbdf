#pragma once

#include "download_task.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace socksget {

// Runs a task on a background thread and keeps a two-line panel (totals and a
// chunk map) at the bottom of `out` until it settles. While it runs, records of
// the socksget logger are printed above the panel instead of over it.
// Exceptions from the task are rethrown by run().
class ProgressReporter {
public:
    explicit ProgressReporter(std::ostream& out,
                              std::chrono::milliseconds interval = std::chrono::milliseconds(200));

    DownloadReport run(DownloadTask& task);

    static std::string buildPanel(const Progress& progress);

    // One cell per chunk, or per group of chunks when there are more than
    // `width`; a group shows its least finished member.
    //   '#' fetched  's' resumed  '.' pending  '>' fetching  'r' retrying  '!' failed
    static std::string chunkMap(const std::vector<ChunkState>& states, std::size_t width);

    static std::string formatSize(std::uint64_t bytes);

private:
    class LogSink;

    void draw(const std::string& panel);
    void printAbove(const std::string& text);
    void erasePanel();

    std::ostream& out_;
    std::chrono::milliseconds interval_;

    std::mutex out_mutex_;
    std::string panel_;
    std::size_t panel_lines_{0};
};

} // namespace socksget
