#include "ldaproute/referral/SecurityType.hpp"

#include <gtest/gtest.h>

#include <map>
#include <string>

namespace ldaproute::referral {
namespace {

using T = LdapUrlSecurityType;

struct Row {
    T policy;
    SecurityDecision insecureSource;
    SecurityDecision ldapsSource;
    SecurityDecision startTlsSource;
};

TEST(SecurityTypeTest, LdapSchemeFollowsPolicyTable) {
    const Row rows[] = {
        {T::alwaysLdapNeverStartTls, {false, false}, {false, false}, {false, false}},
        {T::alwaysLdapAlwaysStartTls, {false, true}, {false, true}, {false, true}},
        {T::alwaysLdapConditionallyStartTls, {false, false}, {false, true}, {false, true}},
        {T::conditionallyLdapNeverStartTls, {false, false}, {true, false}, {false, false}},
        {T::conditionallyLdapAlwaysStartTls, {false, true}, {true, false}, {false, true}},
        {T::conditionallyLdapConditionallyStartTls, {false, false}, {true, false}, {false, true}},
        {T::alwaysLdaps, {true, false}, {true, false}, {true, false}},
    };
    for (const auto& row : rows) {
        SCOPED_TRACE(securityTypeName(row.policy));
        EXPECT_EQ(resolveSecurity(row.policy, "ldap", false), row.insecureSource);
        EXPECT_EQ(resolveSecurity(row.policy, "ldap", true), row.ldapsSource);
        EXPECT_EQ(resolveSecurity(row.policy, "ldap", true, true), row.startTlsSource);
        // StartTLS without a secure transport is not a secure source.
        EXPECT_EQ(resolveSecurity(row.policy, "ldap", false, true), row.insecureSource);
    }
}

TEST(SecurityTypeTest, StartTlsSourceStaysOnTheLdapPortByDefault) {
    const SourceSecurity startTlsSource{true, true};
    auto target = resolveReferralTarget(model::LdapUrl{"ldap://ds1.example.com/"}, startTlsSource,
                                        T::conditionallyLdapConditionallyStartTls, {});
    EXPECT_EQ(target.endpoint, (model::Endpoint{"ds1.example.com", 389}));
    EXPECT_EQ(target.security, (SecurityDecision{false, true}));

    const SourceSecurity ldapsSource{true, false};
    auto secure = resolveReferralTarget(model::LdapUrl{"ldap://ds1.example.com/"}, ldapsSource,
                                        T::conditionallyLdapConditionallyStartTls, {});
    EXPECT_EQ(secure.endpoint, (model::Endpoint{"ds1.example.com", 636}));
    EXPECT_EQ(secure.security, (SecurityDecision{true, false}));
}

TEST(SecurityTypeTest, LdapsSchemeForcesLdapsWithoutStartTls) {
    for (auto policy : kAllSecurityTypes) {
        for (bool secure : {false, true}) {
            EXPECT_EQ(resolveSecurity(policy, "ldaps", secure), (SecurityDecision{true, false}));
        }
    }
}

TEST(SecurityTypeTest, NeverSelectsBothLdapsAndStartTls) {
    for (auto policy : kAllSecurityTypes) {
        for (const char* scheme : {"ldap", "ldaps"}) {
            for (bool secure : {false, true}) {
                for (bool startTls : {false, true}) {
                    auto decision = resolveSecurity(policy, scheme, secure, startTls);
                    EXPECT_FALSE(decision.useLdaps && decision.useStartTls);
                }
            }
        }
    }
}

TEST(SecurityTypeTest, NamesRoundTrip) {
    for (auto policy : kAllSecurityTypes) {
        auto parsed = parseSecurityType(securityTypeName(policy));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, policy);
    }
    EXPECT_EQ(securityTypeName(T::alwaysLdapConditionallyStartTls), std::string("always-ldap-conditionally-starttls"));
    EXPECT_FALSE(parseSecurityType("ALWAYS_LDAPS").has_value());
    EXPECT_FALSE(parseSecurityType("").has_value());
}

TEST(SecurityTypeTest, ForcedLdapsPicksTheAlternatePort) {
    const std::map<model::Endpoint, std::uint16_t> alternates{{{"ds2", 1389}, 1636}};
    const SourceSecurity plainSource{};

    auto noPort = resolveReferralTarget(model::LdapUrl{"ldap://ds1/"}, plainSource, T::alwaysLdaps, alternates);
    EXPECT_EQ(noPort.endpoint, (model::Endpoint{"ds1", 636}));
    EXPECT_TRUE(noPort.security.useLdaps);

    auto mapped = resolveReferralTarget(model::LdapUrl{"ldap://ds2:1389/"}, plainSource, T::alwaysLdaps, alternates);
    EXPECT_EQ(mapped.endpoint, (model::Endpoint{"ds2", 1636}));

    auto unmapped = resolveReferralTarget(model::LdapUrl{"ldap://ds3:1389/"}, plainSource, T::alwaysLdaps, alternates);
    EXPECT_EQ(unmapped.endpoint, (model::Endpoint{"ds3", 1389}));

    auto secureUrl = resolveReferralTarget(model::LdapUrl{"ldaps://ds2:2636/"}, plainSource, T::alwaysLdaps, alternates);
    EXPECT_EQ(secureUrl.endpoint, (model::Endpoint{"ds2", 2636}));

    auto plain = resolveReferralTarget(model::LdapUrl{"ldap://ds2:1389/"}, plainSource, T::alwaysLdapNeverStartTls, alternates);
    EXPECT_EQ(plain.endpoint, (model::Endpoint{"ds2", 1389}));
    EXPECT_FALSE(plain.security.useLdaps);
}

} // namespace
} // namespace ldaproute::referral
