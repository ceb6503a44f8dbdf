#pragma once

#include "socksget/http_client.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace socksget::testing {

// Scripted HttpClient. Records every call and flags any moment where two
// requests were in flight through the same proxy port.
class FakeHttpClient : public HttpClient {
public:
    using Handler = std::function<HttpResponse(const std::string& method, const HttpRequest& request)>;

    struct Call {
        std::string method;
        int port{0};
        std::optional<std::pair<std::uint64_t, std::uint64_t>> range;
        std::optional<std::uint64_t> max_body;
    };

    explicit FakeHttpClient(Handler handler);

    // Serves `content` like a range-capable server: HEAD reports
    // Content-Length, ranged GET answers 206 with a Content-Range.
    static std::shared_ptr<FakeHttpClient> serving(std::string content);

    HttpResponse head(const HttpRequest& request) override;
    HttpResponse get(const HttpRequest& request) override;

    void setHandler(Handler handler);

    [[nodiscard]] std::vector<Call> calls() const;
    [[nodiscard]] std::size_t callCount() const;
    [[nodiscard]] bool sawPortReuse() const;

private:
    HttpResponse dispatch(const std::string& method, const HttpRequest& request);

    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<Call> calls_;
    std::set<int> in_flight_;
    bool port_reused_{false};
};

HttpResponse rangeResponse(const std::string& content, std::uint64_t start, std::uint64_t end);

// Deterministic, non-repeating-per-chunk test payload.
std::string makePayload(std::size_t size);

std::string readFile(const std::filesystem::path& path);
void writeFile(const std::filesystem::path& path, const std::string& content);

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace socksget::testing
