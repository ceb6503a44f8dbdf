#include "socksget/chunk_fetcher.hpp"

#include "socksget/errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <vector>

namespace socksget {
namespace {

using testing::FakeHttpClient;

class ChunkFetcherTest : public ::testing::Test {
protected:
    testing::TempDir dir_;
    ScratchStore scratch_{dir_.path(), "out.bin"};
    ProxyPool pool_{9000, 2};
    const std::string content_ = testing::makePayload(3000);
};

TEST_F(ChunkFetcherTest, SuccessfulFetchPersistsExactBytes) {
    auto client = FakeHttpClient::serving(content_);
    ChunkFetcher fetcher(*client, pool_, scratch_);
    const ByteRange range{1, 1000, 1999};

    const auto result = fetcher.fetch("http://example.test/file", range);

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.index, 1u);
    EXPECT_EQ(result.start, 1000u);
    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.bytes, content_.substr(1000, 1000));
    EXPECT_EQ(testing::readFile(scratch_.partialPath(1)), content_.substr(1000, 1000));
    EXPECT_EQ(pool_.available(), 2u);
}

TEST_F(ChunkFetcherTest, RequestCarriesInclusiveRangeAndChunkTimeout) {
    HttpRequest seen;
    FakeHttpClient client([&](const std::string&, const HttpRequest& request) {
        seen = request;
        return testing::rangeResponse(content_, request.range->first, request.range->second);
    });
    ChunkFetcher fetcher(client, pool_, scratch_);

    const auto result = fetcher.fetch("http://example.test/file", ByteRange{2, 2000, 2999});

    ASSERT_TRUE(result.ok);
    ASSERT_TRUE(seen.range.has_value());
    EXPECT_EQ(seen.range->first, 2000u);
    EXPECT_EQ(seen.range->second, 2999u);
    EXPECT_EQ(seen.max_body, std::optional<std::uint64_t>(1000));
    EXPECT_EQ(seen.timeout, std::chrono::seconds(60));
    EXPECT_EQ(seen.user_agent, kBrowserUserAgent);
}

TEST_F(ChunkFetcherTest, WrongLengthIsRetried) {
    std::atomic<int> attempts{0};
    FakeHttpClient client([&](const std::string&, const HttpRequest& request) {
        auto response = testing::rangeResponse(content_, request.range->first, request.range->second);
        if (++attempts < 3) {
            response.body.pop_back();
        }
        return response;
    });
    ChunkFetcher fetcher(client, pool_, scratch_);

    const auto result = fetcher.fetch("http://example.test/file", ByteRange{0, 0, 999});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.attempts, 3);
    EXPECT_EQ(result.bytes.size(), 1000u);
}

TEST_F(ChunkFetcherTest, WholeBodyInsteadOfRangeIsRejected) {
    FakeHttpClient client([&](const std::string&, const HttpRequest&) {
        HttpResponse response;
        response.status = 200;
        response.body = content_;
        return response;
    });
    ChunkFetcher fetcher(client, pool_, scratch_);

    const auto result = fetcher.fetch("http://example.test/file", ByteRange{0, 0, 999});

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.bytes.empty());
    EXPECT_NE(result.error.find("longer than the 1000 bytes"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(scratch_.partialPath(0)));
}

TEST_F(ChunkFetcherTest, TransportAndStatusErrorsAreRetried) {
    std::atomic<int> attempts{0};
    FakeHttpClient client([&](const std::string&, const HttpRequest& request) -> HttpResponse {
        const int n = ++attempts;
        if (n == 1) {
            throw TransportError("connection reset");
        }
        if (n == 2) {
            HttpResponse response;
            response.status = 503;
            return response;
        }
        return testing::rangeResponse(content_, request.range->first, request.range->second);
    });
    ChunkFetcher fetcher(client, pool_, scratch_);

    const auto result = fetcher.fetch("http://example.test/file", ByteRange{0, 0, 999});

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.attempts, 3);
}

TEST_F(ChunkFetcherTest, GivesUpAfterFiveAttempts) {
    FakeHttpClient client([](const std::string&, const HttpRequest&) -> HttpResponse {
        throw TransportError("proxy down");
    });
    ChunkFetcher fetcher(client, pool_, scratch_);

    const auto result = fetcher.fetch("http://example.test/file", ByteRange{0, 0, 999});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.attempts, 5);
    EXPECT_EQ(client.callCount(), 5u);
    EXPECT_EQ(result.error, "proxy down");
    EXPECT_FALSE(std::filesystem::exists(scratch_.partialPath(0)));
    EXPECT_EQ(pool_.available(), 2u);
}

TEST_F(ChunkFetcherTest, SameIdentityIsUsedForEveryAttempt) {
    FakeHttpClient client([](const std::string&, const HttpRequest&) -> HttpResponse {
        throw TransportError("proxy down");
    });
    RetryPolicy retry;
    retry.max_attempts = 3;
    ChunkFetcher fetcher(client, pool_, scratch_, retry);

    const auto result = fetcher.fetch("http://example.test/file", ByteRange{0, 0, 9});
    EXPECT_FALSE(result.ok);

    const auto calls = client.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0].port, calls[1].port);
    EXPECT_EQ(calls[1].port, calls[2].port);
}

TEST_F(ChunkFetcherTest, ObserverSeesEveryAttempt) {
    std::atomic<int> attempts{0};
    FakeHttpClient client([&](const std::string&, const HttpRequest& request) -> HttpResponse {
        if (++attempts == 1) {
            throw TransportError("timeout");
        }
        return testing::rangeResponse(content_, request.range->first, request.range->second);
    });
    ChunkFetcher fetcher(client, pool_, scratch_);
    std::vector<int> seen;
    fetcher.setAttemptObserver([&](std::size_t index, int attempt) {
        EXPECT_EQ(index, 4u);
        seen.push_back(attempt);
    });

    const auto result = fetcher.fetch("http://example.test/file", ByteRange{4, 0, 99});

    EXPECT_TRUE(result.ok);
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST_F(ChunkFetcherTest, UnwritableScratchDirectoryIsARetryableFailure) {
    const auto blocker = dir_.path() / "not-a-dir";
    testing::writeFile(blocker, "x");
    ScratchStore broken(blocker / "nested", "out.bin");
    auto client = FakeHttpClient::serving(content_);
    RetryPolicy retry;
    retry.max_attempts = 2;
    ChunkFetcher fetcher(*client, pool_, broken, retry);

    const auto result = fetcher.fetch("http://example.test/file", ByteRange{0, 0, 99});

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.attempts, 2);
}

} // namespace
} // namespace socksget
