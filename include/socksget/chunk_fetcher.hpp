#pragma once

#include "chunk_planner.hpp"
#include "config.hpp"
#include "http_client.hpp"
#include "proxy_pool.hpp"
#include "scratch_store.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>

namespace socksget {

struct ChunkResult {
    std::size_t index{0};
    std::uint64_t start{0};
    std::string bytes;          // exactly the range length on success
    int attempts{0};
    bool ok{false};
    std::string error;          // last failure cause when !ok
};

class ChunkFetcher {
public:
    ChunkFetcher(HttpClient& client, ProxyPool& pool, const ScratchStore& scratch,
                 RetryPolicy retry = {}, Timeouts timeouts = {},
                 std::string user_agent = kBrowserUserAgent);

    // Holds one lease for all attempts. Wrong length, HTTP error, transport
    // error and a failed partial-file write all count as one failed attempt.
    [[nodiscard]] ChunkResult fetch(const std::string& url, const ByteRange& range) const;

    // Called before every attempt with the chunk index and the 1-based attempt number.
    using AttemptObserver = std::function<void(std::size_t, int)>;
    void setAttemptObserver(AttemptObserver observer) { observer_ = std::move(observer); }

private:
    HttpClient& client_;
    ProxyPool& pool_;
    const ScratchStore& scratch_;
    RetryPolicy retry_;
    Timeouts timeouts_;
    std::string user_agent_;
    AttemptObserver observer_;
};

} // namespace socksget
