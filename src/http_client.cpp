#include "socksget/http_client.hpp"

#include "socksget/detail/curl_runtime.hpp"
#include "socksget/errors.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <memory>
#include <string_view>
#include <system_error>

#include <curl/curl.h>
#include <fmt/format.h>

namespace socksget {

namespace {

std::string toLower(std::string_view text) {
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<std::uint64_t> parseDecimal(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<std::string> HttpResponse::header(const std::string& name) const {
    const auto it = headers.find(toLower(name));
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool appendBody(std::string& body, std::string_view data, std::optional<std::uint64_t> limit) {
    if (limit && body.size() + data.size() > *limit) {
        return false;
    }
    body.append(data.data(), data.size());
    return true;
}

std::string formatRangeHeader(std::uint64_t start, std::uint64_t end) {
    return fmt::format("bytes={}-{}", start, end);
}

std::optional<std::uint64_t> parseContentRangeTotal(const std::string& value) {
    const auto slash = value.rfind('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    return parseDecimal(std::string_view(value).substr(slash + 1));
}

std::optional<std::uint64_t> parseContentLength(const std::string& value) {
    return parseDecimal(value);
}

class CurlHttpClient::Impl {
public:
    HttpResponse perform(const HttpRequest& request, bool head_only) const {
        using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

        CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
        if (!curl) {
            throw TransportError("Failed to allocate curl handle");
        }

        HttpResponse response;
        const std::string proxy = request.proxy.proxyUrl();

        curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_PROXY, proxy.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, request.user_agent.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);

        std::string range;
        if (request.range) {
            // CURLOPT_RANGE takes the value without the "bytes=" unit.
            range = fmt::format("{}-{}", request.range->first, request.range->second);
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
        }

        BodyContext body{&response.body, request.max_body, false};
        if (head_only) {
            curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        } else {
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
        }

        const CURLcode res = curl_easy_perform(curl.get());
        if (res == CURLE_WRITE_ERROR && body.overflowed) {
            throw TransportError(fmt::format("Response via {} is longer than the {} bytes requested",
                                             proxy, *request.max_body));
        }
        if (res != CURLE_OK) {
            throw TransportError(fmt::format("curl error via {}: {}", proxy, curl_easy_strerror(res)));
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

private:
    struct BodyContext {
        std::string* body{nullptr};
        std::optional<std::uint64_t> limit;
        bool overflowed{false};
    };

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<BodyContext*>(userdata);
        if (!ctx || !ctx->body) {
            return 0;
        }
        // A short count makes curl stop with CURLE_WRITE_ERROR.
        if (!appendBody(*ctx->body, std::string_view(ptr, size * nmemb), ctx->limit)) {
            ctx->overflowed = true;
            return 0;
        }
        return size * nmemb;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* response = static_cast<HttpResponse*>(userdata);
        const size_t total = size * nitems;
        if (!response) {
            return 0;
        }

        const std::string_view line(buffer, total);
        // A new status line starts the headers of the next hop of a redirect.
        if (line.rfind("HTTP/", 0) == 0) {
            response->headers.clear();
            return total;
        }

        const auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            response->headers[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        }
        return total;
    }
};

CurlHttpClient::CurlHttpClient() : impl_(std::make_unique<Impl>()) {
    detail::CurlRuntime::instance();
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::head(const HttpRequest& request) { return impl_->perform(request, true); }

HttpResponse CurlHttpClient::get(const HttpRequest& request) { return impl_->perform(request, false); }

} // namespace socksget
