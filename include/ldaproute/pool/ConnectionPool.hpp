#pragma once

#include "ldaproute/connection/Connection.hpp"
#include "ldaproute/pool/HealthCheck.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ldaproute::pool {

struct ConnectionPoolOptions {
    std::string name;
    unsigned int initialSize{1};
    unsigned int maxSize{10};
    // Zero disables the limit.
    std::chrono::milliseconds maxConnectionAge{0};
    // Zero waits for as long as it takes.
    std::chrono::milliseconds maxWait{0};
};

// Establishes one ready-to-use connection (connect, TLS, bind). Throws on failure.
using ConnectionCreator = std::function<std::unique_ptr<connection::Connection>()>;

// Bounded blocking pool. A checked-out connection goes back to the pool when
// the last copy of the returned shared_ptr is dropped; a connection that was
// closed by its user, outlived maxConnectionAge, or belongs to a closed pool
// is discarded instead.
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool> {
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    // Eagerly establishes `initialSize` connections; throws if any fails.
    static std::shared_ptr<ConnectionPool> create(ConnectionCreator creator,
                                                  ConnectionPoolOptions options,
                                                  std::shared_ptr<HealthCheck> healthCheck = nullptr);

    // Use create().
    ConnectionPool(ConstructionKey key,
                   ConnectionCreator creator,
                   ConnectionPoolOptions options,
                   std::shared_ptr<HealthCheck> healthCheck);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Blocks while maxSize connections are checked out. Throws
    // connection::PoolClosedError once closed, LdapException(timeout) when
    // maxWait elapses, or whatever the creator throws.
    std::shared_ptr<connection::Connection> acquire();

    void close();

    // Runs ensureValidForContinuedUse and the age limit over idle connections.
    void performHealthCheck();

    [[nodiscard]] bool isClosed() const;
    [[nodiscard]] std::size_t currentAvailableConnections() const;
    [[nodiscard]] std::size_t totalConnections() const;
    [[nodiscard]] unsigned int maxSize() const noexcept { return options_.maxSize; }
    [[nodiscard]] const ConnectionPoolOptions& options() const noexcept { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    struct IdleConnection {
        std::unique_ptr<connection::Connection> connection;
        Clock::time_point createdAt;
    };

    struct ConnectionDeleter {
        std::weak_ptr<ConnectionPool> pool;
        Clock::time_point createdAt;
        void operator()(connection::Connection* connection) const noexcept;
    };

    std::unique_ptr<connection::Connection> createConnection();
    std::shared_ptr<connection::Connection> checkOut(std::unique_ptr<connection::Connection> connection,
                                                     Clock::time_point createdAt);
    bool usableForCheckout(IdleConnection& idle) const;
    bool expired(Clock::time_point createdAt, Clock::time_point now) const;
    void release(std::unique_ptr<connection::Connection> connection, Clock::time_point createdAt);
    void discardSlot();

    ConnectionCreator creator_;
    ConnectionPoolOptions options_;
    std::shared_ptr<HealthCheck> healthCheck_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<IdleConnection> idle_;
    unsigned int currentSize_{};
    bool closed_{false};
};

} // namespace ldaproute::pool
