#pragma once

#include "ldaproute/connection/Connection.hpp"
#include "ldaproute/model/LdapUrl.hpp"
#include "ldaproute/referral/SecurityType.hpp"

#include <memory>
#include <optional>

namespace ldaproute::referral {

// Supplies the connection used to follow a referral. The caller returns it by
// dropping the shared_ptr; what that does (close, or release to a pool) is up
// to the connector.
class ReferralConnector {
public:
    virtual ~ReferralConnector() = default;

    // Throws connection::LdapException when no connection can be obtained.
    virtual std::shared_ptr<connection::Connection> getReferralConnection(const model::LdapUrl& url,
                                                                          const SourceSecurity& source) = 0;

    std::shared_ptr<connection::Connection> getReferralConnection(const model::LdapUrl& url,
                                                                  const connection::Connection& source) {
        return getReferralConnection(url, sourceSecurityOf(source));
    }

    // Whether an operation that failed because its connection went bad may be
    // retried once on another connection from this connector.
    [[nodiscard]] virtual bool retryFailedOperationsDueToInvalidConnections() const { return false; }
};

// Connects to `target`, negotiates StartTLS when selected and binds when a
// bind request is given. Throws connection::LdapException.
std::unique_ptr<connection::Connection> openReferralConnection(connection::ConnectionFactory& factory,
                                                               const ReferralTarget& target,
                                                               connection::TransportOptions transport,
                                                               const std::optional<connection::BindRequest>& bindRequest);

// Opens a fresh connection per referral and closes it when released.
class DirectReferralConnector : public ReferralConnector {
public:
    DirectReferralConnector(std::shared_ptr<connection::ConnectionFactory> factory,
                            connection::TransportOptions transport = {},
                            std::optional<connection::BindRequest> bindRequest = std::nullopt,
                            LdapUrlSecurityType policy = LdapUrlSecurityType::alwaysLdapNeverStartTls);

    using ReferralConnector::getReferralConnection;
    std::shared_ptr<connection::Connection> getReferralConnection(const model::LdapUrl& url,
                                                                  const SourceSecurity& source) override;

private:
    std::shared_ptr<connection::ConnectionFactory> factory_;
    connection::TransportOptions transport_;
    std::optional<connection::BindRequest> bindRequest_;
    LdapUrlSecurityType policy_;
};

} // namespace ldaproute::referral
