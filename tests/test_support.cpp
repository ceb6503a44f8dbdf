#include "test_support.hpp"

#include "socksget/errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

#include <fmt/format.h>
#include <unistd.h>

namespace socksget::testing {

FakeHttpClient::FakeHttpClient(Handler handler) : handler_(std::move(handler)) {}

std::shared_ptr<FakeHttpClient> FakeHttpClient::serving(std::string content) {
    return std::make_shared<FakeHttpClient>(
        [content = std::move(content)](const std::string& method, const HttpRequest& request) {
            if (method == "HEAD") {
                HttpResponse response;
                response.status = 200;
                response.headers["content-length"] = std::to_string(content.size());
                return response;
            }
            if (!request.range) {
                HttpResponse response;
                response.status = 200;
                response.body = content;
                return response;
            }
            return rangeResponse(content, request.range->first, request.range->second);
        });
}

HttpResponse FakeHttpClient::head(const HttpRequest& request) { return dispatch("HEAD", request); }

HttpResponse FakeHttpClient::get(const HttpRequest& request) { return dispatch("GET", request); }

void FakeHttpClient::setHandler(Handler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

std::vector<FakeHttpClient::Call> FakeHttpClient::calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

std::size_t FakeHttpClient::callCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

bool FakeHttpClient::sawPortReuse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return port_reused_;
}

HttpResponse FakeHttpClient::dispatch(const std::string& method, const HttpRequest& request) {
    Handler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(Call{method, request.proxy.port, request.range, request.max_body});
        if (!in_flight_.insert(request.proxy.port).second) {
            port_reused_ = true;
        }
        handler = handler_;
    }

    struct InFlightGuard {
        FakeHttpClient& self;
        int port;
        ~InFlightGuard() {
            std::lock_guard<std::mutex> lock(self.mutex_);
            self.in_flight_.erase(port);
        }
    } guard{*this, request.proxy.port};

    // Same outcome as CurlHttpClient aborting an oversized transfer.
    HttpResponse response = handler(method, request);
    if (!appendBody(response.body, {}, request.max_body)) {
        throw TransportError(fmt::format("Response is longer than the {} bytes requested", *request.max_body));
    }
    return response;
}

HttpResponse rangeResponse(const std::string& content, std::uint64_t start, std::uint64_t end) {
    HttpResponse response;
    if (start >= content.size()) {
        response.status = 416;
        response.headers["content-range"] = fmt::format("bytes */{}", content.size());
        return response;
    }
    const std::uint64_t last = std::min<std::uint64_t>(end, content.size() - 1);
    response.status = 206;
    response.headers["content-range"] = fmt::format("bytes {}-{}/{}", start, last, content.size());
    response.body = content.substr(static_cast<std::size_t>(start), static_cast<std::size_t>(last - start + 1));
    return response;
}

std::string makePayload(std::size_t size) {
    std::string payload(size, '\0');
    std::mt19937 rng(1234);
    for (auto& c : payload) {
        c = static_cast<char>(rng() & 0xFF);
    }
    return payload;
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            fmt::format("socksget-test-{}-{}-{}", ::getpid(), stamp, counter++);
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

} // namespace socksget::testing
