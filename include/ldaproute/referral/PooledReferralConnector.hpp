#pragma once

#include "ldaproute/connection/Connection.hpp"
#include "ldaproute/model/Endpoint.hpp"
#include "ldaproute/model/LdapUrl.hpp"
#include "ldaproute/pool/ConnectionPool.hpp"
#include "ldaproute/referral/PooledReferralConnectorProperties.hpp"
#include "ldaproute/referral/ReferralConnector.hpp"
#include "ldaproute/util/PeriodicTask.hpp"

#include <chrono>
#include <compare>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ldaproute::referral {

// Identity of a referral pool: where it connects, how it secures the
// transport, and who it binds as.
struct PoolKey {
    model::Endpoint endpoint;
    bool useLdaps{false};
    bool useStartTls{false};
    std::string bindDn;

    // "ldap", "ldaps" or "ldap+starttls".
    [[nodiscard]] std::string transportName() const;
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const PoolKey&, const PoolKey&) = default;
    friend std::strong_ordering operator<=>(const PoolKey&, const PoolKey&) = default;
};

struct PoolSnapshot {
    PoolKey key;
    std::chrono::steady_clock::time_point createdAt;
    std::chrono::steady_clock::time_point lastCheckoutAt;
    std::size_t totalConnections{};
    std::size_t availableConnections{};
    unsigned int maximumConnections{};
};

// Follows referrals over cached connection pools, one pool per PoolKey,
// created on first use and evicted by a background janitor once older than
// maximumPoolAge or idle for longer than maximumPoolIdleDuration.
class PooledReferralConnector : public ReferralConnector {
public:
    explicit PooledReferralConnector(std::shared_ptr<connection::ConnectionFactory> factory,
                                     PooledReferralConnectorProperties properties = {});
    ~PooledReferralConnector() override;

    PooledReferralConnector(const PooledReferralConnector&) = delete;
    PooledReferralConnector& operator=(const PooledReferralConnector&) = delete;

    using ReferralConnector::getReferralConnection;
    // A full pool is waited on for at most connectTimeout.
    std::shared_ptr<connection::Connection> getReferralConnection(const model::LdapUrl& url,
                                                                  const SourceSecurity& source) override;

    [[nodiscard]] bool retryFailedOperationsDueToInvalidConnections() const override {
        return properties_.retryFailedOperationsDueToInvalidConnections;
    }

    // Registry contents keyed by "host:port".
    [[nodiscard]] std::map<std::string, std::vector<PoolSnapshot>> getPoolsByHostPort() const;
    [[nodiscard]] std::size_t poolCount() const;

    // Removes and closes every pool past its age or idle limit. Returns how many.
    std::size_t evictExpiredPools();

    // Stops the janitor and closes every pool. Idempotent.
    void close();
    [[nodiscard]] bool isClosed() const;

    [[nodiscard]] const PooledReferralConnectorProperties& properties() const noexcept { return properties_; }

private:
    using Clock = std::chrono::steady_clock;

    struct PoolRecord {
        std::shared_ptr<pool::ConnectionPool> pool;
        Clock::time_point createdAt;
        Clock::time_point lastCheckoutAt;
        Clock::time_point lastHealthCheckAt;
    };

    std::shared_ptr<pool::ConnectionPool> findOrCreatePool(const PoolKey& key, const ReferralTarget& target);
    std::shared_ptr<pool::ConnectionPool> createPool(const PoolKey& key, const ReferralTarget& target) const;
    void forgetPool(const PoolKey& key, const std::shared_ptr<pool::ConnectionPool>& pool);
    void runHealthChecks();
    void janitorPass();

    std::shared_ptr<connection::ConnectionFactory> factory_;
    PooledReferralConnectorProperties properties_;
    mutable std::mutex mutex_;
    std::map<PoolKey, PoolRecord> registry_;
    bool closed_{false};
    std::unique_ptr<util::PeriodicTask> janitor_;
};

} // namespace ldaproute::referral
