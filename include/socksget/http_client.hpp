#pragma once

#include "config.hpp"
#include "proxy_pool.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace socksget {

struct HttpRequest {
    std::string url;
    ProxyIdentity proxy{};
    std::chrono::seconds timeout{30};
    std::chrono::seconds connect_timeout{15};
    std::string user_agent{kBrowserUserAgent};
    std::optional<std::pair<std::uint64_t, std::uint64_t>> range;   // inclusive
    // A longer body aborts the transfer with TransportError.
    std::optional<std::uint64_t> max_body;
};

struct HttpResponse {
    long status{0};
    // Keys are lower-cased.
    std::map<std::string, std::string> headers;
    std::string body;

    [[nodiscard]] bool isSuccess() const noexcept { return status >= 200 && status < 300; }
    [[nodiscard]] std::optional<std::string> header(const std::string& name) const;
};

// Transport seam. Implementations throw TransportError when no HTTP response
// was obtained; HTTP error statuses are returned, not thrown.
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse head(const HttpRequest& request) = 0;
    virtual HttpResponse get(const HttpRequest& request) = 0;
};

using HttpClientPtr = std::shared_ptr<HttpClient>;

// libcurl backed client, one easy handle per request.
class CurlHttpClient final : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    HttpResponse head(const HttpRequest& request) override;
    HttpResponse get(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// Appends data unless that would take body past limit; returns false then.
bool appendBody(std::string& body, std::string_view data, std::optional<std::uint64_t> limit);

// "bytes=<start>-<end>"
std::string formatRangeHeader(std::uint64_t start, std::uint64_t end);

// Total size from a Content-Range value such as "bytes 0-0/3145728".
std::optional<std::uint64_t> parseContentRangeTotal(const std::string& value);

// Content-Length value; nullopt when not a plain decimal number.
std::optional<std::uint64_t> parseContentLength(const std::string& value);

} // namespace socksget
