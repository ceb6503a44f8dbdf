#include "socksget/proxy_pool.hpp"

#include "socksget/errors.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace socksget {

std::string ProxyIdentity::proxyUrl() const {
    return fmt::format("socks5h://127.0.0.1:{}", port);
}

ProxyLease::~ProxyLease() { release(); }

ProxyLease::ProxyLease(ProxyLease&& other) noexcept
    : pool_(other.pool_), identity_(other.identity_) {
    other.pool_ = nullptr;
}

ProxyLease& ProxyLease::operator=(ProxyLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        identity_ = other.identity_;
        other.pool_ = nullptr;
    }
    return *this;
}

void ProxyLease::release() {
    if (pool_) {
        ProxyPool* pool = pool_;
        pool_ = nullptr;
        pool->release(identity_);
    }
}

ProxyPool::ProxyPool(int start_port, int count)
    : start_port_(start_port), size_(count > 0 ? static_cast<std::size_t>(count) : 0) {
    if (count <= 0) {
        throw ConfigError(fmt::format("Proxy pool needs at least one port, got {}", count));
    }
    if (start_port <= 0 || start_port + count - 1 > 65535) {
        throw ConfigError(fmt::format("Proxy ports {}..{} are outside 1..65535",
                                      start_port, start_port + count - 1));
    }

    leased_.assign(size_, false);
    for (int i = 0; i < count; ++i) {
        free_.push_back(ProxyIdentity{start_port + i});
    }
}

ProxyLease ProxyPool::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    released_.wait(lock, [this] { return !free_.empty(); });

    const ProxyIdentity identity = free_.front();
    free_.pop_front();
    leased_[static_cast<std::size_t>(identity.port - start_port_)] = true;
    return ProxyLease(this, identity);
}

std::optional<ProxyLease> ProxyPool::tryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (free_.empty()) {
        return std::nullopt;
    }

    const ProxyIdentity identity = free_.front();
    free_.pop_front();
    leased_[static_cast<std::size_t>(identity.port - start_port_)] = true;
    return std::optional<ProxyLease>(std::in_place, this, identity);
}

void ProxyPool::release(const ProxyIdentity& identity) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isLeased(identity.port)) {
            throw std::logic_error(fmt::format("Port {} released without a lease", identity.port));
        }
        leased_[static_cast<std::size_t>(identity.port - start_port_)] = false;
        free_.push_back(identity);
    }
    released_.notify_one();
}

std::size_t ProxyPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return free_.size();
}

bool ProxyPool::isLeased(int port) const {
    if (port < start_port_ || port - start_port_ >= static_cast<int>(size_)) {
        return false;
    }
    return leased_[static_cast<std::size_t>(port - start_port_)];
}

} // namespace socksget
