#include "ldaproute/referral/ReferralConnector.hpp"
#include "ldaproute/util/Logging.hpp"

#include <stdexcept>
#include <utility>

namespace ldaproute::referral {

using connection::Connection;
using connection::LdapException;
using connection::ResultCode;

namespace {
// Closes, then destroys.
struct ClosingDeleter {
    void operator()(Connection* released) const noexcept {
        std::unique_ptr<Connection> holder(released);
        holder->close();
    }
};
} // namespace

std::unique_ptr<Connection> openReferralConnection(connection::ConnectionFactory& factory,
                                                   const ReferralTarget& target,
                                                   connection::TransportOptions transport,
                                                   const std::optional<connection::BindRequest>& bindRequest) {
    transport.useTls = target.security.useLdaps;
    auto connection = factory.connect(target.endpoint, transport);
    try {
        if (target.security.useStartTls) {
            connection->startTls();
        }
        if (bindRequest) {
            auto rc = connection->bind(*bindRequest);
            if (rc != ResultCode::success) {
                throw LdapException(rc, "bind as '" + bindRequest->bindDn + "' to " + target.endpoint.toString() +
                                            " failed: " + connection::resultCodeName(rc));
            }
        }
    } catch (const LdapException&) {
        connection->close();
        throw;
    }
    return connection;
}

DirectReferralConnector::DirectReferralConnector(std::shared_ptr<connection::ConnectionFactory> factory,
                                                 connection::TransportOptions transport,
                                                 std::optional<connection::BindRequest> bindRequest,
                                                 LdapUrlSecurityType policy)
    : factory_(std::move(factory))
    , transport_(std::move(transport))
    , bindRequest_(std::move(bindRequest))
    , policy_(policy) {
    if (!factory_) {
        throw std::invalid_argument("DirectReferralConnector requires a connection factory");
    }
}

std::shared_ptr<Connection> DirectReferralConnector::getReferralConnection(const model::LdapUrl& url,
                                                                           const SourceSecurity& source) {
    if (!url.hostProvided()) {
        throw LdapException(ResultCode::localError, "referral URL " + url.toString() + " names no server");
    }
    auto target = resolveReferralTarget(url, source, policy_, {});
    util::log(util::LogLevel::debug, "opening direct referral connection to " + target.endpoint.toString());
    auto connection = openReferralConnection(*factory_, target, transport_, bindRequest_);
    return std::shared_ptr<Connection>(connection.release(), ClosingDeleter{});
}

} // namespace ldaproute::referral
