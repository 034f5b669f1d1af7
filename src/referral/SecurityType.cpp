#include "ldaproute/referral/SecurityType.hpp"

namespace ldaproute::referral {

const char* securityTypeName(LdapUrlSecurityType type) noexcept {
    switch (type) {
    case LdapUrlSecurityType::alwaysLdapNeverStartTls: return "always-ldap-never-starttls";
    case LdapUrlSecurityType::alwaysLdapAlwaysStartTls: return "always-ldap-always-starttls";
    case LdapUrlSecurityType::alwaysLdapConditionallyStartTls: return "always-ldap-conditionally-starttls";
    case LdapUrlSecurityType::conditionallyLdapNeverStartTls: return "conditionally-ldap-never-starttls";
    case LdapUrlSecurityType::conditionallyLdapAlwaysStartTls: return "conditionally-ldap-always-starttls";
    case LdapUrlSecurityType::conditionallyLdapConditionallyStartTls: return "conditionally-ldap-conditionally-starttls";
    case LdapUrlSecurityType::alwaysLdaps: return "always-ldaps";
    }
    return "unknown";
}

std::optional<LdapUrlSecurityType> parseSecurityType(std::string_view name) {
    for (auto type : kAllSecurityTypes) {
        if (name == securityTypeName(type)) {
            return type;
        }
    }
    return std::nullopt;
}

SecurityDecision resolveSecurity(LdapUrlSecurityType policy,
                                 std::string_view urlScheme,
                                 bool sourceIsSecure,
                                 bool sourceUsedStartTls) noexcept {
    if (urlScheme == "ldaps") {
        return {true, false};
    }

    const bool ldapsSource = sourceIsSecure && !sourceUsedStartTls;
    switch (policy) {
    case LdapUrlSecurityType::alwaysLdapNeverStartTls:
        return {false, false};
    case LdapUrlSecurityType::alwaysLdapAlwaysStartTls:
        return {false, true};
    case LdapUrlSecurityType::alwaysLdapConditionallyStartTls:
        return {false, sourceIsSecure};
    case LdapUrlSecurityType::conditionallyLdapNeverStartTls:
        return {ldapsSource, false};
    case LdapUrlSecurityType::conditionallyLdapAlwaysStartTls:
        return ldapsSource ? SecurityDecision{true, false} : SecurityDecision{false, true};
    case LdapUrlSecurityType::conditionallyLdapConditionallyStartTls:
        return ldapsSource ? SecurityDecision{true, false} : SecurityDecision{false, sourceIsSecure};
    case LdapUrlSecurityType::alwaysLdaps:
        return {true, false};
    }
    return {false, false};
}

SourceSecurity sourceSecurityOf(const connection::Connection& source) {
    return SourceSecurity{source.isSecure(), source.isSecure() && source.usedStartTls()};
}

ReferralTarget resolveReferralTarget(const model::LdapUrl& url,
                                     const SourceSecurity& source,
                                     LdapUrlSecurityType policy,
                                     const std::map<model::Endpoint, std::uint16_t>& alternateLdapsPorts) {
    ReferralTarget target{url.endpoint(), resolveSecurity(policy, url.scheme(), source.secure, source.startTls)};
    if (target.security.useLdaps && !url.isSecure()) {
        if (auto it = alternateLdapsPorts.find(url.endpoint()); it != alternateLdapsPorts.end()) {
            target.endpoint.port = it->second;
        } else if (!url.portProvided()) {
            target.endpoint.port = model::kDefaultLdapsPort;
        }
    }
    return target;
}

} // namespace ldaproute::referral
