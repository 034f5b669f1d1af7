#include "ldaproute/referral/ReferralFollower.hpp"
#include "ldaproute/model/LdapUrl.hpp"
#include "ldaproute/util/Logging.hpp"

#include <exception>
#include <memory>

namespace ldaproute::referral {

using connection::Connection;
using connection::LdapException;
using connection::ResultCode;

bool isReferralFollowFailure(ResultCode code) noexcept {
    switch (code) {
    case ResultCode::insufficientAccessRights:
    case ResultCode::invalidCredentials:
    case ResultCode::inappropriateAuthentication:
    case ResultCode::strongAuthRequired:
    case ResultCode::confidentialityRequired:
    case ResultCode::busy:
    case ResultCode::unavailable:
        return true;
    default:
        return !connection::isConnectionUsable(code);
    }
}

ReferralFollower::ReferralFollower(ReferralConnector& connector, unsigned int hopLimit)
    : connector_(connector)
    , hopLimit_(hopLimit) {}

OperationResult ReferralFollower::follow(const ReferralOperation& operation,
                                         const OperationResult& referralResult,
                                         const Connection& source,
                                         unsigned int depth) const {
    return followFrom(operation, referralResult, sourceSecurityOf(source), depth);
}

OperationResult ReferralFollower::followFrom(const ReferralOperation& operation,
                                             const OperationResult& referralResult,
                                             const SourceSecurity& source,
                                             unsigned int depth) const {
    if (depth >= hopLimit_) {
        OperationResult exceeded = referralResult;
        exceeded.resultCode = ResultCode::referralLimitExceeded;
        exceeded.diagnosticMessage = "referral hop limit of " + std::to_string(hopLimit_) + " exceeded";
        return exceeded;
    }

    for (const auto& text : referralResult.referralUrls) {
        std::optional<model::LdapUrl> url;
        try {
            url.emplace(text);
        } catch (const LdapException& ex) {
            util::log(util::LogLevel::debug, std::string{"ignoring referral URL: "} + ex.what());
            continue;
        }
        if (!url->hostProvided()) {
            continue;
        }
        std::optional<std::string> baseDn;
        if (url->baseDnProvided()) {
            baseDn = url->baseDn();
        }

        std::shared_ptr<Connection> connection;
        try {
            connection = connector_.getReferralConnection(*url, source);
            auto result = operation(*connection, baseDn);

            if (!connection::isConnectionUsable(result.resultCode) &&
                connector_.retryFailedOperationsDueToInvalidConnections()) {
                connection->close();
                connection.reset();
                connection = connector_.getReferralConnection(*url, source);
                result = operation(*connection, baseDn);
            }

            if (result.resultCode == ResultCode::referral) {
                const auto next = sourceSecurityOf(*connection);
                connection.reset();
                return followFrom(operation, result, next, depth + 1);
            }
            if (isReferralFollowFailure(result.resultCode)) {
                if (!connection::isConnectionUsable(result.resultCode)) {
                    connection->close();
                }
                util::log(util::LogLevel::debug, "referral to " + url->toString() + " returned " +
                                                     connection::resultCodeName(result.resultCode));
                continue;
            }
            return result;
        } catch (const LdapException& ex) {
            if (connection && !connection::isConnectionUsable(ex.resultCode())) {
                connection->close();
            }
            util::log(util::LogLevel::debug, "unable to follow referral to " + url->toString() + ": " + ex.what());
        } catch (const std::exception& ex) {
            // State of the connection is unknown after a foreign failure.
            if (connection) {
                connection->close();
            }
            util::log(util::LogLevel::debug, "unable to follow referral to " + url->toString() + ": " + ex.what());
        }
    }
    return referralResult;
}

} // namespace ldaproute::referral
