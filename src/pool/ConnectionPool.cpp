#include "ldaproute/pool/ConnectionPool.hpp"
#include "ldaproute/util/Logging.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace ldaproute::pool {

using connection::Connection;
using connection::LdapException;
using connection::ResultCode;

namespace {
void discard(std::unique_ptr<Connection> connection) noexcept {
    if (connection) {
        connection->close();
    }
}
} // namespace

std::shared_ptr<ConnectionPool> ConnectionPool::create(ConnectionCreator creator,
                                                       ConnectionPoolOptions options,
                                                       std::shared_ptr<HealthCheck> healthCheck) {
    auto pool = std::make_shared<ConnectionPool>(ConstructionKey{}, std::move(creator), std::move(options),
                                                 std::move(healthCheck));

    const auto now = Clock::now();
    for (unsigned int i = 0; i < pool->options_.initialSize; ++i) {
        auto connection = pool->createConnection();
        std::scoped_lock lock(pool->mutex_);
        pool->idle_.push_back(IdleConnection{std::move(connection), now});
        ++pool->currentSize_;
    }
    return pool;
}

ConnectionPool::ConnectionPool(ConstructionKey /*key*/,
                               ConnectionCreator creator,
                               ConnectionPoolOptions options,
                               std::shared_ptr<HealthCheck> healthCheck)
    : creator_(std::move(creator))
    , options_(std::move(options))
    , healthCheck_(std::move(healthCheck)) {
    if (!creator_) {
        throw std::invalid_argument("ConnectionPool requires a connection creator");
    }
    if (options_.maxSize == 0) {
        throw std::invalid_argument("ConnectionPool maxSize must be at least one");
    }
    if (options_.initialSize > options_.maxSize) {
        options_.initialSize = options_.maxSize;
    }
}

ConnectionPool::~ConnectionPool() {
    close();
}

std::unique_ptr<Connection> ConnectionPool::createConnection() {
    auto connection = creator_();
    if (!connection) {
        throw LdapException(ResultCode::localError, "connection creator returned no connection for " + options_.name);
    }
    if (healthCheck_) {
        try {
            healthCheck_->ensureNewConnectionValid(*connection);
        } catch (const LdapException&) {
            discard(std::move(connection));
            throw;
        }
    }
    return connection;
}

bool ConnectionPool::expired(Clock::time_point createdAt, Clock::time_point now) const {
    return options_.maxConnectionAge.count() > 0 && now - createdAt > options_.maxConnectionAge;
}

bool ConnectionPool::usableForCheckout(IdleConnection& idle) const {
    if (expired(idle.createdAt, Clock::now()) || !idle.connection->isConnected()) {
        return false;
    }
    if (!healthCheck_) {
        return true;
    }
    try {
        healthCheck_->ensureValidForCheckout(*idle.connection);
        return true;
    } catch (const LdapException& ex) {
        util::log(util::LogLevel::debug, options_.name + ": discarding connection failing checkout check: " + ex.what());
        return false;
    }
}

void ConnectionPool::discardSlot() {
    {
        std::scoped_lock lock(mutex_);
        if (currentSize_ > 0) {
            --currentSize_;
        }
    }
    cv_.notify_one();
}

std::shared_ptr<Connection> ConnectionPool::acquire() {
    const auto deadline = Clock::now() + options_.maxWait;
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this]() { return closed_ || !idle_.empty() || currentSize_ < options_.maxSize; };

    for (;;) {
        if (options_.maxWait.count() > 0) {
            if (!cv_.wait_until(lock, deadline, ready)) {
                throw LdapException(ResultCode::timeout,
                                    options_.name + ": no connection became available within " +
                                        std::to_string(options_.maxWait.count()) + "ms");
            }
        } else {
            cv_.wait(lock, ready);
        }
        if (closed_) {
            throw connection::PoolClosedError(options_.name + ": pool is closed");
        }

        if (!idle_.empty()) {
            IdleConnection idle = std::move(idle_.back());
            idle_.pop_back();
            lock.unlock();
            if (usableForCheckout(idle)) {
                return checkOut(std::move(idle.connection), idle.createdAt);
            }
            discard(std::move(idle.connection));
            discardSlot();
            lock.lock();
            continue;
        }

        ++currentSize_;
        lock.unlock();
        try {
            auto connection = createConnection();
            return checkOut(std::move(connection), Clock::now());
        } catch (const std::exception&) {
            discardSlot();
            throw;
        }
    }
}

std::shared_ptr<Connection> ConnectionPool::checkOut(std::unique_ptr<Connection> connection,
                                                     Clock::time_point createdAt) {
    return std::shared_ptr<Connection>(connection.release(), ConnectionDeleter{weak_from_this(), createdAt});
}

void ConnectionPool::ConnectionDeleter::operator()(Connection* connection) const noexcept {
    std::unique_ptr<Connection> holder(connection);
    if (auto owner = pool.lock()) {
        owner->release(std::move(holder), createdAt);
        return;
    }
    discard(std::move(holder));
}

void ConnectionPool::release(std::unique_ptr<Connection> connection, Clock::time_point createdAt) {
    const bool healthy = connection && connection->isConnected() && !expired(createdAt, Clock::now());

    std::unique_lock<std::mutex> lock(mutex_);
    if (healthy && !closed_) {
        idle_.push_back(IdleConnection{std::move(connection), createdAt});
    } else if (currentSize_ > 0) {
        --currentSize_;
    }
    lock.unlock();
    cv_.notify_one();
    discard(std::move(connection));
}

void ConnectionPool::close() {
    std::vector<IdleConnection> idle;
    {
        std::scoped_lock lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        idle.swap(idle_);
        currentSize_ -= std::min<unsigned int>(currentSize_, static_cast<unsigned int>(idle.size()));
    }
    cv_.notify_all();
    for (auto& entry : idle) {
        discard(std::move(entry.connection));
    }
}

void ConnectionPool::performHealthCheck() {
    std::vector<IdleConnection> candidates;
    {
        std::scoped_lock lock(mutex_);
        if (closed_) {
            return;
        }
        candidates.swap(idle_);
    }

    const auto now = Clock::now();
    std::vector<IdleConnection> keep;
    std::size_t dropped = 0;
    for (auto& entry : candidates) {
        bool valid = entry.connection->isConnected() && !expired(entry.createdAt, now);
        if (valid && healthCheck_) {
            try {
                healthCheck_->ensureValidForContinuedUse(*entry.connection);
            } catch (const LdapException& ex) {
                util::log(util::LogLevel::debug, options_.name + ": health check failed: " + ex.what());
                valid = false;
            }
        }
        if (valid) {
            keep.push_back(std::move(entry));
        } else {
            discard(std::move(entry.connection));
            ++dropped;
        }
    }

    std::vector<IdleConnection> orphans;
    {
        std::scoped_lock lock(mutex_);
        currentSize_ -= std::min<unsigned int>(currentSize_, static_cast<unsigned int>(dropped));
        if (closed_) {
            currentSize_ -= std::min<unsigned int>(currentSize_, static_cast<unsigned int>(keep.size()));
            orphans.swap(keep);
        } else {
            for (auto& entry : keep) {
                idle_.push_back(std::move(entry));
            }
        }
    }
    cv_.notify_all();
    for (auto& entry : orphans) {
        discard(std::move(entry.connection));
    }
}

bool ConnectionPool::isClosed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

std::size_t ConnectionPool::currentAvailableConnections() const {
    std::scoped_lock lock(mutex_);
    return idle_.size();
}

std::size_t ConnectionPool::totalConnections() const {
    std::scoped_lock lock(mutex_);
    return currentSize_;
}

} // namespace ldaproute::pool
