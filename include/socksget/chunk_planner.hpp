#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

namespace socksget {

// Inclusive [start, end] slice of the remote object.
struct ByteRange {
    std::size_t index{0};
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start + 1; }

    friend bool operator==(const ByteRange& a, const ByteRange& b) {
        return a.index == b.index && a.start == b.start && a.end == b.end;
    }
};

struct DownloadPlan {
    std::uint64_t total_size{0};
    std::uint64_t chunk_size{0};
    std::vector<ByteRange> ranges;
};

// ceil(total_size / chunk_size) contiguous ranges covering [0, total_size - 1].
// Throws std::invalid_argument when chunk_size is 0.
std::vector<ByteRange> planChunks(std::uint64_t total_size, std::uint64_t chunk_size);

DownloadPlan makePlan(std::uint64_t total_size, std::uint64_t chunk_size);

std::uint64_t expectedChunkLength(std::uint64_t total_size, std::uint64_t chunk_size, std::size_t index);

// True iff the partial file exists and holds exactly range.length() bytes.
bool isResumable(const ByteRange& range, const std::filesystem::path& partial_file);

} // namespace socksget
