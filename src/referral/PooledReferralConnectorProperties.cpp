#include "ldaproute/referral/PooledReferralConnectorProperties.hpp"

#include <sstream>
#include <stdexcept>

namespace ldaproute::referral {

void PooledReferralConnectorProperties::validate() const {
    if (initialConnectionsPerPool < 1) {
        throw std::invalid_argument("initialConnectionsPerPool must be greater than or equal to one");
    }
    if (maximumConnectionsPerPool < initialConnectionsPerPool) {
        throw std::invalid_argument("maximumConnectionsPerPool must not be less than initialConnectionsPerPool");
    }
    if (healthCheckInterval.count() <= 0) {
        throw std::invalid_argument("healthCheckInterval must be greater than zero");
    }
    if (backgroundThreadCheckInterval.count() <= 0) {
        throw std::invalid_argument("backgroundThreadCheckInterval must be greater than zero");
    }
    if (connectTimeout.count() <= 0) {
        throw std::invalid_argument("connectTimeout must be greater than zero");
    }
    if (maximumConnectionAge.count() < 0 || maximumPoolAge.count() < 0 || maximumPoolIdleDuration.count() < 0) {
        throw std::invalid_argument("age and idle limits must not be negative");
    }
}

std::string PooledReferralConnectorProperties::toString() const {
    std::ostringstream oss;
    oss << "PooledReferralConnectorProperties(initialConnectionsPerPool=" << initialConnectionsPerPool
        << ", maximumConnectionsPerPool=" << maximumConnectionsPerPool
        << ", retryFailedOperationsDueToInvalidConnections=" << std::boolalpha
        << retryFailedOperationsDueToInvalidConnections
        << ", connectTimeoutMillis=" << connectTimeout.count()
        << ", maximumConnectionAgeMillis=" << maximumConnectionAge.count()
        << ", maximumPoolAgeMillis=" << maximumPoolAge.count()
        << ", maximumPoolIdleDurationMillis=" << maximumPoolIdleDuration.count()
        << ", healthCheck=" << (healthCheck ? "configured" : "none")
        << ", healthCheckIntervalMillis=" << healthCheckInterval.count()
        << ", backgroundThreadCheckIntervalMillis=" << backgroundThreadCheckInterval.count()
        << ", bindDN=" << (bindRequest ? "'" + bindRequest->bindDn + "'" : std::string("none"))
        << ", ldapURLSecurityType=" << securityTypeName(ldapUrlSecurityType)
        << ", sslContext=" << (sslContext ? "configured" : "default")
        << ')';
    return oss.str();
}

} // namespace ldaproute::referral
