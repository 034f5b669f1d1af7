#pragma once

#include "ldaproute/connection/Connection.hpp"
#include "ldaproute/model/Endpoint.hpp"
#include "ldaproute/model/LdapUrl.hpp"

#include <array>
#include <map>
#include <optional>
#include <string_view>

namespace ldaproute::referral {

// How a referral connection picks its transport. "Conditionally" means the
// choice mirrors how the connection that received the referral is secured:
// only an LDAPS source selects LDAPS, while a StartTLS source stays on LDAP.
enum class LdapUrlSecurityType {
    alwaysLdapNeverStartTls,
    alwaysLdapAlwaysStartTls,
    alwaysLdapConditionallyStartTls,
    conditionallyLdapNeverStartTls,
    conditionallyLdapAlwaysStartTls,
    conditionallyLdapConditionallyStartTls,
    alwaysLdaps,
};

inline constexpr std::array<LdapUrlSecurityType, 7> kAllSecurityTypes{
    LdapUrlSecurityType::alwaysLdapNeverStartTls,
    LdapUrlSecurityType::alwaysLdapAlwaysStartTls,
    LdapUrlSecurityType::alwaysLdapConditionallyStartTls,
    LdapUrlSecurityType::conditionallyLdapNeverStartTls,
    LdapUrlSecurityType::conditionallyLdapAlwaysStartTls,
    LdapUrlSecurityType::conditionallyLdapConditionallyStartTls,
    LdapUrlSecurityType::alwaysLdaps,
};

// Kebab-case, e.g. "always-ldap-conditionally-starttls".
const char* securityTypeName(LdapUrlSecurityType type) noexcept;
std::optional<LdapUrlSecurityType> parseSecurityType(std::string_view name);

struct SecurityDecision {
    bool useLdaps{false};
    bool useStartTls{false};

    friend bool operator==(const SecurityDecision&, const SecurityDecision&) = default;
};

// An "ldaps" scheme always yields {useLdaps, no StartTLS}. Never yields both
// flags. `sourceUsedStartTls` only matters when `sourceIsSecure` is set.
SecurityDecision resolveSecurity(LdapUrlSecurityType policy,
                                 std::string_view urlScheme,
                                 bool sourceIsSecure,
                                 bool sourceUsedStartTls = false) noexcept;

// Security state of the connection a referral arrived on, detached from it.
struct SourceSecurity {
    bool secure{false};
    bool startTls{false};
};

SourceSecurity sourceSecurityOf(const connection::Connection& source);

struct ReferralTarget {
    model::Endpoint endpoint;
    SecurityDecision security;
};

// Endpoint plus transport for a referral URL. When the policy forces TLS onto
// an ldap:// URL the port comes from `alternateLdapsPorts` (keyed by the URL's
// endpoint), else 636 if the URL named no port, else the URL's own port.
ReferralTarget resolveReferralTarget(const model::LdapUrl& url,
                                     const SourceSecurity& source,
                                     LdapUrlSecurityType policy,
                                     const std::map<model::Endpoint, std::uint16_t>& alternateLdapsPorts);

} // namespace ldaproute::referral
