#include "socksget/size_resolver.hpp"

#include "socksget/errors.hpp"
#include "socksget/logging.hpp"

#include <utility>

namespace socksget {

SizeResolver::SizeResolver(HttpClient& client, ProxyPool& pool,
                           std::chrono::seconds timeout, std::string user_agent)
    : client_(client), pool_(pool), timeout_(timeout), user_agent_(std::move(user_agent)) {}

std::optional<std::uint64_t> SizeResolver::resolve(const std::string& url) {
    if (auto size = sizeFromHead(url)) {
        return size;
    }
    return sizeFromRange(url);
}

HttpRequest SizeResolver::makeRequest(const std::string& url, const ProxyIdentity& proxy) const {
    HttpRequest request;
    request.url = url;
    request.proxy = proxy;
    request.timeout = timeout_;
    request.connect_timeout = connect_timeout_;
    request.user_agent = user_agent_;
    return request;
}

std::optional<std::uint64_t> SizeResolver::sizeFromHead(const std::string& url) {
    // The lease covers the whole request.
    ProxyLease lease = pool_.acquire();
    try {
        const HttpResponse response = client_.head(makeRequest(url, lease.identity()));
        if (!response.isSuccess()) {
            logger()->warn("HEAD request failed with status {}. Attempting GET request", response.status);
            return std::nullopt;
        }

        const auto length = response.header("Content-Length");
        if (!length) {
            return 0;
        }
        return parseContentLength(*length).value_or(0);
    } catch (const TransportError& ex) {
        logger()->warn("HEAD request failed: {}. Attempting GET request", ex.what());
        return std::nullopt;
    }
}

std::optional<std::uint64_t> SizeResolver::sizeFromRange(const std::string& url) {
    ProxyLease lease = pool_.acquire();
    HttpRequest request = makeRequest(url, lease.identity());
    request.range = std::make_pair(std::uint64_t{0}, std::uint64_t{0});
    request.max_body = 1;

    try {
        const HttpResponse response = client_.get(request);
        if (!response.isSuccess()) {
            logger()->error("Range request for size failed with status {}", response.status);
            return std::nullopt;
        }

        const auto content_range = response.header("Content-Range");
        if (!content_range) {
            logger()->error("Content-Range header not found in the response");
            return std::nullopt;
        }

        const auto total = parseContentRangeTotal(*content_range);
        if (!total) {
            logger()->error("Unusable Content-Range header: {}", *content_range);
        }
        return total;
    } catch (const TransportError& ex) {
        logger()->error("Range request for size failed: {}", ex.what());
        return std::nullopt;
    }
}

} // namespace socksget
