#include "socksget/chunk_planner.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace socksget {

std::vector<ByteRange> planChunks(std::uint64_t total_size, std::uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }

    const std::uint64_t count = (total_size + chunk_size - 1) / chunk_size;
    std::vector<ByteRange> ranges;
    ranges.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        const std::uint64_t start = i * chunk_size;
        const std::uint64_t end = std::min(start + chunk_size, total_size) - 1;
        ranges.push_back(ByteRange{static_cast<std::size_t>(i), start, end});
    }
    return ranges;
}

DownloadPlan makePlan(std::uint64_t total_size, std::uint64_t chunk_size) {
    return DownloadPlan{total_size, chunk_size, planChunks(total_size, chunk_size)};
}

std::uint64_t expectedChunkLength(std::uint64_t total_size, std::uint64_t chunk_size, std::size_t index) {
    const std::uint64_t start = static_cast<std::uint64_t>(index) * chunk_size;
    if (chunk_size == 0 || start >= total_size) {
        return 0;
    }
    return std::min(chunk_size, total_size - start);
}

bool isResumable(const ByteRange& range, const std::filesystem::path& partial_file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(partial_file, ec) || ec) {
        return false;
    }
    const auto size = std::filesystem::file_size(partial_file, ec);
    return !ec && size == range.length();
}

} // namespace socksget
