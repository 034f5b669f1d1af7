#pragma once

#include "ldaproute/connection/Connection.hpp"
#include "ldaproute/model/Endpoint.hpp"
#include "ldaproute/pool/HealthCheck.hpp"
#include "ldaproute/referral/SecurityType.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ldaproute::referral {

struct PooledReferralConnectorProperties {
    // When set, every pooled connection is bound with it right after it is
    // established. When unset, pooled connections stay unauthenticated.
    std::optional<connection::BindRequest> bindRequest;

    bool retryFailedOperationsDueToInvalidConnections{true};

    unsigned int initialConnectionsPerPool{1};
    unsigned int maximumConnectionsPerPool{10};

    std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};

    std::shared_ptr<pool::HealthCheck> healthCheck;
    std::chrono::milliseconds healthCheckInterval{std::chrono::minutes(1)};

    std::chrono::milliseconds backgroundThreadCheckInterval{std::chrono::seconds(10)};

    // Zero disables the corresponding limit.
    std::chrono::milliseconds maximumConnectionAge{std::chrono::minutes(30)};
    std::chrono::milliseconds maximumPoolAge{0};
    std::chrono::milliseconds maximumPoolIdleDuration{std::chrono::hours(1)};

    LdapUrlSecurityType ldapUrlSecurityType{LdapUrlSecurityType::conditionallyLdapConditionallyStartTls};

    std::shared_ptr<boost::asio::ssl::context> sslContext;

    // LDAPS port to use for an ldap:// endpoint when the policy forces TLS.
    std::map<model::Endpoint, std::uint16_t> alternateLdapsPorts;

    // Throws std::invalid_argument.
    void validate() const;

    [[nodiscard]] std::string toString() const;
};

} // namespace ldaproute::referral
