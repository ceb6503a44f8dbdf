#pragma once

#include <string>

namespace socksget::detail {

// Process-wide libcurl state. The first call to instance() runs
// curl_global_init; curl_global_cleanup runs at static destruction.
class CurlRuntime {
public:
    static const CurlRuntime& instance();

    CurlRuntime(const CurlRuntime&) = delete;
    CurlRuntime& operator=(const CurlRuntime&) = delete;

    // e.g. "libcurl/8.5.0 OpenSSL/3.0.13"
    const std::string& version() const noexcept { return version_; }

private:
    CurlRuntime();
    ~CurlRuntime();

    std::string version_;
};

} // namespace socksget::detail
