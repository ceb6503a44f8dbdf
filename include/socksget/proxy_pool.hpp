#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace socksget {

// One egress route: a local SOCKS5 endpoint at 127.0.0.1:<port>.
struct ProxyIdentity {
    int port{0};

    // socks5h resolves host names on the proxy side.
    [[nodiscard]] std::string proxyUrl() const;

    friend bool operator==(const ProxyIdentity& a, const ProxyIdentity& b) { return a.port == b.port; }
    friend bool operator!=(const ProxyIdentity& a, const ProxyIdentity& b) { return !(a == b); }
};

class ProxyPool;

// Exclusive ownership of one identity. Returns it to the pool on destruction.
class ProxyLease {
public:
    ProxyLease() = default;
    ProxyLease(ProxyPool* pool, ProxyIdentity identity) noexcept : pool_(pool), identity_(identity) {}
    ~ProxyLease();

    ProxyLease(ProxyLease&& other) noexcept;
    ProxyLease& operator=(ProxyLease&& other) noexcept;
    ProxyLease(const ProxyLease&) = delete;
    ProxyLease& operator=(const ProxyLease&) = delete;

    [[nodiscard]] const ProxyIdentity& identity() const noexcept { return identity_; }
    [[nodiscard]] bool valid() const noexcept { return pool_ != nullptr; }

    void release();

private:
    ProxyPool* pool_{nullptr};
    ProxyIdentity identity_{};
};

// Fixed set of identities [start_port, start_port + count). acquire() blocks
// until one is free; an identity is never held by two leases at once.
class ProxyPool {
public:
    ProxyPool(int start_port, int count);

    ProxyPool(const ProxyPool&) = delete;
    ProxyPool& operator=(const ProxyPool&) = delete;

    [[nodiscard]] ProxyLease acquire();
    [[nodiscard]] std::optional<ProxyLease> tryAcquire();

    // Throws std::logic_error if the identity is not currently leased.
    void release(const ProxyIdentity& identity);

    [[nodiscard]] std::size_t size() const noexcept { return size_; }
    [[nodiscard]] std::size_t available() const;

private:
    bool isLeased(int port) const;

    int start_port_;
    std::size_t size_;

    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::deque<ProxyIdentity> free_;
    std::vector<bool> leased_;
};

} // namespace socksget
