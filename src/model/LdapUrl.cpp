#include "ldaproute/model/LdapUrl.hpp"
#include "ldaproute/connection/LdapError.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ldaproute::model {
namespace {

using connection::LdapException;
using connection::ResultCode;

[[noreturn]] void malformed(std::string_view url, const std::string& reason) {
    throw LdapException(ResultCode::decodingError,
                        "malformed LDAP URL '" + std::string(url) + "': " + reason);
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(std::string_view url, std::string_view encoded) {
    std::string decoded;
    decoded.reserve(encoded.size());
    for (std::size_t i = 0; i < encoded.size(); ++i) {
        if (encoded[i] != '%') {
            decoded.push_back(encoded[i]);
            continue;
        }
        if (i + 2 >= encoded.size()) {
            malformed(url, "truncated percent escape");
        }
        int hi = hexValue(encoded[i + 1]);
        int lo = hexValue(encoded[i + 2]);
        if (hi < 0 || lo < 0) {
            malformed(url, "invalid percent escape");
        }
        decoded.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return decoded;
}

std::uint16_t parsePort(std::string_view url, std::string_view text) {
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || port == 0 || port > 65535) {
        malformed(url, "invalid port '" + std::string(text) + "'");
    }
    return static_cast<std::uint16_t>(port);
}

} // namespace

LdapUrl::LdapUrl(std::string_view url)
    : original_(url) {
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string_view::npos) {
        malformed(url, "missing scheme");
    }
    scheme_ = std::string(url.substr(0, schemeEnd));
    std::transform(scheme_.begin(), scheme_.end(), scheme_.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (scheme_ != "ldap" && scheme_ != "ldaps") {
        malformed(url, "unsupported scheme '" + scheme_ + "'");
    }
    port_ = isSecure() ? kDefaultLdapsPort : kDefaultLdapPort;

    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find('/', hostStart);
    auto hostPort = pathPos == std::string_view::npos ? url.substr(hostStart)
                                                      : url.substr(hostStart, pathPos - hostStart);

    std::string_view portText;
    bool hasPort = false;
    if (!hostPort.empty() && hostPort.front() == '[') {
        auto close = hostPort.find(']');
        if (close == std::string_view::npos) {
            malformed(url, "unterminated IPv6 literal");
        }
        host_ = std::string(hostPort.substr(1, close - 1));
        auto rest = hostPort.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                malformed(url, "unexpected text after IPv6 literal");
            }
            portText = rest.substr(1);
            hasPort = true;
        }
    } else {
        auto colon = hostPort.find(':');
        if (colon == std::string_view::npos) {
            host_ = std::string(hostPort);
        } else {
            host_ = std::string(hostPort.substr(0, colon));
            portText = hostPort.substr(colon + 1);
            hasPort = true;
        }
    }
    if (hasPort) {
        port_ = parsePort(url, portText);
        portProvided_ = true;
    }

    if (pathPos == std::string_view::npos) {
        return;
    }
    auto path = url.substr(pathPos + 1);
    auto question = path.find('?');
    auto dnPart = question == std::string_view::npos ? path : path.substr(0, question);
    if (question != std::string_view::npos) {
        extensions_ = std::string(path.substr(question + 1));
    }
    if (!dnPart.empty()) {
        baseDn_ = percentDecode(url, dnPart);
        baseDnProvided_ = true;
    }
}

} // namespace ldaproute::model
