#pragma once

#include "ldaproute/model/Endpoint.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ldaproute::model {

inline constexpr std::uint16_t kDefaultLdapPort = 389;
inline constexpr std::uint16_t kDefaultLdapsPort = 636;

// An `ldap://` or `ldaps://` URL as carried by a referral. Only the parts that
// select a server and a base entry are interpreted; attributes, scope and
// filter are retained verbatim.
class LdapUrl {
public:
    // Throws connection::LdapException(decodingError) on a malformed URL.
    explicit LdapUrl(std::string_view url);

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] bool isSecure() const noexcept { return scheme_ == "ldaps"; }

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] bool hostProvided() const noexcept { return !host_.empty(); }

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }
    [[nodiscard]] bool portProvided() const noexcept { return portProvided_; }

    [[nodiscard]] const std::string& baseDn() const noexcept { return baseDn_; }
    [[nodiscard]] bool baseDnProvided() const noexcept { return baseDnProvided_; }

    [[nodiscard]] const std::string& extensions() const noexcept { return extensions_; }

    [[nodiscard]] Endpoint endpoint() const { return Endpoint{host_, port_}; }

    [[nodiscard]] const std::string& toString() const noexcept { return original_; }

private:
    std::string original_;
    std::string scheme_;
    std::string host_;
    std::uint16_t port_{};
    bool portProvided_{false};
    std::string baseDn_;
    bool baseDnProvided_{false};
    std::string extensions_;
};

} // namespace ldaproute::model
