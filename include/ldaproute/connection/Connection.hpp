#pragma once

#include "ldaproute/connection/LdapError.hpp"
#include "ldaproute/model/Endpoint.hpp"

#include <boost/asio/ssl/context.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace ldaproute::connection {

// Simple bind; SASL mechanisms are handled elsewhere.
struct BindRequest {
    std::string bindDn;
    std::string password;
};

struct TransportOptions {
    // Negotiate TLS immediately after the TCP connect (LDAPS).
    bool useTls{false};
    std::shared_ptr<boost::asio::ssl::context> sslContext;
    std::chrono::milliseconds connectTimeout{std::chrono::seconds(10)};
};

class Connection {
public:
    virtual ~Connection() = default;

    [[nodiscard]] virtual const model::Endpoint& endpoint() const = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    // True once the transport is TLS, either from connect time or after StartTLS.
    [[nodiscard]] virtual bool isSecure() const = 0;

    // True when the TLS layer was negotiated through StartTLS rather than at connect time.
    [[nodiscard]] virtual bool usedStartTls() const = 0;

    // Throws LdapException when the server refuses or the handshake fails.
    virtual void startTls() = 0;

    // Returns the server's result code; throws only on transport failure.
    virtual ResultCode bind(const BindRequest& request) = 0;

    virtual void close() noexcept = 0;

    [[nodiscard]] std::uint16_t connectedPort() const { return endpoint().port; }
};

class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    // Throws ConnectError when the endpoint cannot be reached.
    virtual std::unique_ptr<Connection> connect(const model::Endpoint& endpoint,
                                                const TransportOptions& options) = 0;
};

} // namespace ldaproute::connection
