#include "socksget/detail/curl_runtime.hpp"

#include "socksget/http_client.hpp"

#include <gtest/gtest.h>

namespace socksget {
namespace {

TEST(CurlRuntimeTest, InitializedOnceAndReportsVersion) {
    const auto& first = detail::CurlRuntime::instance();
    const auto& second = detail::CurlRuntime::instance();
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(first.version().rfind("libcurl/", 0), 0u);
    EXPECT_GT(first.version().size(), std::string("libcurl/").size());
}

TEST(CurlRuntimeTest, ClientsShareTheRuntime) {
    CurlHttpClient a;
    CurlHttpClient b;
    EXPECT_FALSE(detail::CurlRuntime::instance().version().empty());
}

} // namespace
} // namespace socksget
