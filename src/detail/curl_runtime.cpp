#include "socksget/detail/curl_runtime.hpp"

#include "socksget/errors.hpp"
#include "socksget/logging.hpp"

#include <curl/curl.h>
#include <fmt/format.h>

namespace socksget::detail {

const CurlRuntime& CurlRuntime::instance() {
    // A throwing constructor leaves the static uninitialized, so the next
    // caller tries again.
    static CurlRuntime runtime;
    return runtime;
}

CurlRuntime::CurlRuntime() {
    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (rc != CURLE_OK) {
        throw TransportError(fmt::format("Failed to initialize libcurl: {}", curl_easy_strerror(rc)));
    }

    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    version_ = fmt::format("libcurl/{}", info && info->version ? info->version : "unknown");
    if (info && info->ssl_version) {
        version_ += fmt::format(" {}", info->ssl_version);
    }
    logger()->debug("Using {}", version_);
}

CurlRuntime::~CurlRuntime() { curl_global_cleanup(); }

} // namespace socksget::detail
