#pragma once

#include "ldaproute/connection/Connection.hpp"
#include "ldaproute/connection/LdapError.hpp"
#include "ldaproute/referral/ReferralConnector.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ldaproute::referral {

struct OperationResult {
    connection::ResultCode resultCode{connection::ResultCode::success};
    std::string diagnosticMessage;
    std::string matchedDn;
    std::vector<std::string> referralUrls;
};

// Re-issues an operation on `connection`. `baseDn` carries the entry named by
// the referral URL, when it names one, to replace the operation's target.
using ReferralOperation =
    std::function<OperationResult(connection::Connection& connection, const std::optional<std::string>& baseDn)>;

// Results meaning the referral target refused or could not serve the
// operation, so the next URL (or the original referral) is used instead.
bool isReferralFollowFailure(connection::ResultCode code) noexcept;

// Follows the URLs of a referral result in order until one of them yields a
// usable result. Nothing thrown by the connector or the operation escapes:
// when no URL works, the referral result is returned unchanged.
class ReferralFollower {
public:
    ReferralFollower(ReferralConnector& connector, unsigned int hopLimit);

    // `depth` counts referrals already followed for this operation; once it
    // reaches the hop limit the result is referralLimitExceeded.
    OperationResult follow(const ReferralOperation& operation,
                           const OperationResult& referralResult,
                           const connection::Connection& source,
                           unsigned int depth = 0) const;

    [[nodiscard]] unsigned int hopLimit() const noexcept { return hopLimit_; }

private:
    // The connection that returned a referral is released before the next hop,
    // so only its security state travels down the chain.
    OperationResult followFrom(const ReferralOperation& operation,
                               const OperationResult& referralResult,
                               const SourceSecurity& source,
                               unsigned int depth) const;

    ReferralConnector& connector_;
    unsigned int hopLimit_;
};

} // namespace ldaproute::referral
