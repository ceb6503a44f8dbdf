#pragma once

#include "http_client.hpp"
#include "proxy_pool.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace socksget {

class SizeResolver {
public:
    SizeResolver(HttpClient& client, ProxyPool& pool,
                 std::chrono::seconds timeout = std::chrono::seconds{30},
                 std::string user_agent = kBrowserUserAgent);

    // HEAD first; on failure a "bytes=0-0" GET whose Content-Range carries the
    // total. A HEAD without Content-Length yields 0, which callers treat as
    // unknown. nullopt when both requests fail.
    [[nodiscard]] std::optional<std::uint64_t> resolve(const std::string& url);

    void setConnectTimeout(std::chrono::seconds timeout) { connect_timeout_ = timeout; }

private:
    std::optional<std::uint64_t> sizeFromHead(const std::string& url);
    std::optional<std::uint64_t> sizeFromRange(const std::string& url);
    HttpRequest makeRequest(const std::string& url, const ProxyIdentity& proxy) const;

    HttpClient& client_;
    ProxyPool& pool_;
    std::chrono::seconds timeout_;
    std::chrono::seconds connect_timeout_{15};
    std::string user_agent_;
};

} // namespace socksget
