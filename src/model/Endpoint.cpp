#include "ldaproute/model/Endpoint.hpp"

#include <charconv>
#include <functional>
#include <stdexcept>

namespace ldaproute::model {

std::string Endpoint::toString() const {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

std::size_t EndpointHash::operator()(const Endpoint& endpoint) const noexcept {
    std::size_t seed = std::hash<std::string>{}(endpoint.host);
    seed ^= std::hash<std::uint16_t>{}(endpoint.port) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

Endpoint parseEndpoint(std::string_view text) {
    std::string_view hostPart;
    std::string_view portPart;
    if (!text.empty() && text.front() == '[') {
        auto close = text.find(']');
        if (close == std::string_view::npos || close + 1 >= text.size() || text[close + 1] != ':') {
            throw std::invalid_argument("malformed endpoint: " + std::string(text));
        }
        hostPart = text.substr(1, close - 1);
        portPart = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string_view::npos) {
            throw std::invalid_argument("endpoint missing port: " + std::string(text));
        }
        hostPart = text.substr(0, colon);
        portPart = text.substr(colon + 1);
    }
    if (hostPart.empty()) {
        throw std::invalid_argument("endpoint missing host: " + std::string(text));
    }

    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(portPart.data(), portPart.data() + portPart.size(), port);
    if (ec != std::errc{} || ptr != portPart.data() + portPart.size() || port == 0 || port > 65535) {
        throw std::invalid_argument("invalid port in endpoint: " + std::string(text));
    }
    return Endpoint{std::string(hostPart), static_cast<std::uint16_t>(port)};
}

} // namespace ldaproute::model
