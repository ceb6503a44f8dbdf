#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace socksget {

enum class ChunkState {
    Pending,
    Skipped,
    Fetching,
    Retrying,
    Succeeded,
    Failed
};

const char* toString(ChunkState state) noexcept;

struct Progress {
    std::string url;
    std::string filename;
    std::uint64_t total_bytes{0};
    std::uint64_t downloaded_bytes{0};      // bytes of settled chunks, skipped ones included
    std::size_t chunks_total{0};
    std::size_t chunks_done{0};
    std::size_t chunks_skipped{0};
    std::size_t chunks_failed{0};
    bool is_running{false};
    bool has_error{false};
    std::string error_message;
    std::vector<ChunkState> chunk_states;   // indexed by chunk
};

} // namespace socksget
