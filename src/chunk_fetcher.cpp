#include "socksget/chunk_fetcher.hpp"

#include "socksget/errors.hpp"
#include "socksget/logging.hpp"

#include <thread>
#include <utility>

#include <fmt/format.h>

namespace socksget {

ChunkFetcher::ChunkFetcher(HttpClient& client, ProxyPool& pool, const ScratchStore& scratch,
                           RetryPolicy retry, Timeouts timeouts, std::string user_agent)
    : client_(client),
      pool_(pool),
      scratch_(scratch),
      retry_(retry),
      timeouts_(timeouts),
      user_agent_(std::move(user_agent)) {}

ChunkResult ChunkFetcher::fetch(const std::string& url, const ByteRange& range) const {
    ChunkResult result;
    result.index = range.index;
    result.start = range.start;

    ProxyLease lease = pool_.acquire();

    HttpRequest request;
    request.url = url;
    request.proxy = lease.identity();
    request.timeout = timeouts_.chunk;
    request.connect_timeout = timeouts_.connect;
    request.user_agent = user_agent_;
    request.range = std::make_pair(range.start, range.end);
    request.max_body = range.length();

    const std::uint64_t expected = range.length();
    while (result.attempts < retry_.max_attempts) {
        if (result.attempts > 0 && retry_.delay.count() > 0) {
            std::this_thread::sleep_for(retry_.delay);
        }
        ++result.attempts;
        if (observer_) {
            observer_(range.index, result.attempts);
        }

        try {
            HttpResponse response = client_.get(request);
            if (!response.isSuccess()) {
                result.error = fmt::format("HTTP status {}", response.status);
            } else if (response.body.size() != expected) {
                result.error = fmt::format("Retrieved the incorrect amount of bytes. Received: {}, expected {}",
                                           response.body.size(), expected);
            } else {
                scratch_.write(range.index, response.body);
                result.bytes = std::move(response.body);
                result.ok = true;
                result.error.clear();
                logger()->debug("Chunk {} fetched via port {} in {} attempt(s)",
                                range.index, lease.identity().port, result.attempts);
                return result;
            }
        } catch (const TransportError& ex) {
            result.error = ex.what();
        } catch (const ScratchError& ex) {
            result.error = ex.what();
        }

        logger()->warn("Error downloading chunk {} ({}) via port {} (attempt {}/{}): {}",
                       range.index, formatRangeHeader(range.start, range.end), lease.identity().port,
                       result.attempts, retry_.max_attempts, result.error);
    }

    logger()->error("Failed to download chunk {} after {} retries", range.index, retry_.max_attempts);
    return result;
}

} // namespace socksget
