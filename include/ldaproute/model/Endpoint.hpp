#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace ldaproute::model {

struct Endpoint {
    std::string host;
    std::uint16_t port{};

    // `host:port`, with IPv6 literals in brackets.
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const Endpoint&, const Endpoint&) = default;
    friend std::strong_ordering operator<=>(const Endpoint&, const Endpoint&) = default;
};

struct EndpointHash {
    std::size_t operator()(const Endpoint& endpoint) const noexcept;
};

// Accepts `host:port` and `[v6addr]:port`; throws std::invalid_argument otherwise.
Endpoint parseEndpoint(std::string_view text);

} // namespace ldaproute::model
