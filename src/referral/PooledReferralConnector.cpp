#include "ldaproute/referral/PooledReferralConnector.hpp"
#include "ldaproute/util/Logging.hpp"

#include <stdexcept>
#include <utility>

namespace ldaproute::referral {

using connection::Connection;
using connection::LdapException;
using connection::ResultCode;

namespace {
constexpr int kMaxCheckoutAttempts = 2;
} // namespace

std::string PoolKey::transportName() const {
    if (useLdaps) {
        return "ldaps";
    }
    return useStartTls ? "ldap+starttls" : "ldap";
}

std::string PoolKey::toString() const {
    std::string text = transportName() + "://" + endpoint.toString();
    if (!bindDn.empty()) {
        text += " as '" + bindDn + "'";
    }
    return text;
}

PooledReferralConnector::PooledReferralConnector(std::shared_ptr<connection::ConnectionFactory> factory,
                                                 PooledReferralConnectorProperties properties)
    : factory_(std::move(factory))
    , properties_(std::move(properties)) {
    if (!factory_) {
        throw std::invalid_argument("PooledReferralConnector requires a connection factory");
    }
    properties_.validate();
    janitor_ = std::make_unique<util::PeriodicTask>("referral pool janitor",
                                                    properties_.backgroundThreadCheckInterval,
                                                    [this]() { janitorPass(); });
}

PooledReferralConnector::~PooledReferralConnector() {
    close();
}

std::shared_ptr<Connection> PooledReferralConnector::getReferralConnection(const model::LdapUrl& url,
                                                                           const SourceSecurity& source) {
    if (!url.hostProvided()) {
        throw LdapException(ResultCode::localError, "referral URL " + url.toString() + " names no server");
    }
    auto target = resolveReferralTarget(url, source, properties_.ldapUrlSecurityType,
                                        properties_.alternateLdapsPorts);
    PoolKey key{target.endpoint, target.security.useLdaps, target.security.useStartTls,
                properties_.bindRequest ? properties_.bindRequest->bindDn : std::string{}};

    for (int attempt = 0; attempt < kMaxCheckoutAttempts; ++attempt) {
        auto pool = findOrCreatePool(key, target);
        try {
            return pool->acquire();
        } catch (const connection::PoolClosedError&) {
            // Evicted between lookup and checkout; the next lookup builds a fresh pool.
            forgetPool(key, pool);
        }
    }
    throw LdapException(ResultCode::connectError, "referral pool for " + key.toString() + " closed during checkout");
}

std::shared_ptr<pool::ConnectionPool> PooledReferralConnector::findOrCreatePool(const PoolKey& key,
                                                                                const ReferralTarget& target) {
    std::scoped_lock lock(mutex_);
    if (closed_) {
        throw LdapException(ResultCode::localError, "pooled referral connector is closed");
    }

    const auto now = Clock::now();
    if (auto it = registry_.find(key); it != registry_.end()) {
        it->second.lastCheckoutAt = now;
        return it->second.pool;
    }

    auto pool = createPool(key, target);
    registry_.emplace(key, PoolRecord{pool, now, now, now});
    util::log(util::LogLevel::info, "created referral connection pool for " + key.toString());
    return pool;
}

std::shared_ptr<pool::ConnectionPool> PooledReferralConnector::createPool(const PoolKey& key,
                                                                          const ReferralTarget& target) const {
    pool::ConnectionPoolOptions options;
    options.name = "referral pool " + key.toString();
    options.initialSize = properties_.initialConnectionsPerPool;
    options.maxSize = properties_.maximumConnectionsPerPool;
    options.maxConnectionAge = properties_.maximumConnectionAge;
    options.maxWait = properties_.connectTimeout;

    connection::TransportOptions transport;
    transport.sslContext = properties_.sslContext;
    transport.connectTimeout = properties_.connectTimeout;

    auto creator = [factory = factory_, target, transport, bindRequest = properties_.bindRequest]() {
        return openReferralConnection(*factory, target, transport, bindRequest);
    };
    return pool::ConnectionPool::create(std::move(creator), std::move(options), properties_.healthCheck);
}

void PooledReferralConnector::forgetPool(const PoolKey& key, const std::shared_ptr<pool::ConnectionPool>& pool) {
    std::scoped_lock lock(mutex_);
    if (auto it = registry_.find(key); it != registry_.end() && it->second.pool == pool) {
        registry_.erase(it);
    }
}

std::size_t PooledReferralConnector::evictExpiredPools() {
    const auto now = Clock::now();
    const auto maxAge = properties_.maximumPoolAge;
    const auto maxIdle = properties_.maximumPoolIdleDuration;

    std::vector<std::pair<PoolKey, std::shared_ptr<pool::ConnectionPool>>> evicted;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = registry_.begin(); it != registry_.end();) {
            const auto& record = it->second;
            const bool tooOld = maxAge.count() > 0 && now - record.createdAt > maxAge;
            const bool tooIdle = maxIdle.count() > 0 && now - record.lastCheckoutAt > maxIdle;
            if (tooOld || tooIdle) {
                evicted.emplace_back(it->first, record.pool);
                it = registry_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& [key, pool] : evicted) {
        util::log(util::LogLevel::info, "evicting referral connection pool for " + key.toString());
        pool->close();
    }
    return evicted.size();
}

void PooledReferralConnector::runHealthChecks() {
    const auto now = Clock::now();
    std::vector<std::shared_ptr<pool::ConnectionPool>> due;
    {
        std::scoped_lock lock(mutex_);
        for (auto& [key, record] : registry_) {
            if (now - record.lastHealthCheckAt >= properties_.healthCheckInterval) {
                record.lastHealthCheckAt = now;
                due.push_back(record.pool);
            }
        }
    }
    for (auto& pool : due) {
        pool->performHealthCheck();
    }
}

void PooledReferralConnector::janitorPass() {
    evictExpiredPools();
    runHealthChecks();
}

std::map<std::string, std::vector<PoolSnapshot>> PooledReferralConnector::getPoolsByHostPort() const {
    std::map<std::string, std::vector<PoolSnapshot>> pools;
    std::scoped_lock lock(mutex_);
    for (const auto& [key, record] : registry_) {
        PoolSnapshot snapshot;
        snapshot.key = key;
        snapshot.createdAt = record.createdAt;
        snapshot.lastCheckoutAt = record.lastCheckoutAt;
        snapshot.totalConnections = record.pool->totalConnections();
        snapshot.availableConnections = record.pool->currentAvailableConnections();
        snapshot.maximumConnections = record.pool->maxSize();
        pools[key.endpoint.toString()].push_back(std::move(snapshot));
    }
    return pools;
}

std::size_t PooledReferralConnector::poolCount() const {
    std::scoped_lock lock(mutex_);
    return registry_.size();
}

void PooledReferralConnector::close() {
    std::map<PoolKey, PoolRecord> remaining;
    {
        std::scoped_lock lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        remaining.swap(registry_);
    }
    // Outside mutex_: a running janitor pass needs it to finish.
    janitor_->stop();
    for (auto& [key, record] : remaining) {
        record.pool->close();
    }
    util::log(util::LogLevel::debug, "pooled referral connector closed; released " +
                                         std::to_string(remaining.size()) + " pool(s)");
}

bool PooledReferralConnector::isClosed() const {
    std::scoped_lock lock(mutex_);
    return closed_;
}

} // namespace ldaproute::referral
