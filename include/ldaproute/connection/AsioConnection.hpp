#pragma once

#include "ldaproute/connection/Connection.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace ldaproute::connection {

class AsioConnection;

// Speaks the LDAP exchanges a connection needs (StartTLS extended request,
// simple bind) over the raw byte stream of an AsioConnection.
class LdapProtocol {
public:
    virtual ~LdapProtocol() = default;

    virtual ResultCode requestStartTls(AsioConnection& connection) = 0;
    virtual ResultCode bind(AsioConnection& connection, const BindRequest& request) = 0;
};

// Blocking TCP/TLS connection. Every network step runs on a private
// io_context under the configured deadline.
class AsioConnection : public Connection {
public:
    AsioConnection(model::Endpoint endpoint,
                   std::shared_ptr<LdapProtocol> protocol,
                   std::shared_ptr<boost::asio::ssl::context> sslContext,
                   std::chrono::milliseconds timeout);
    ~AsioConnection() override;

    AsioConnection(const AsioConnection&) = delete;
    AsioConnection& operator=(const AsioConnection&) = delete;

    // Throws ConnectError.
    void open(bool useTls);

    [[nodiscard]] const model::Endpoint& endpoint() const override { return endpoint_; }
    [[nodiscard]] bool isConnected() const override;
    [[nodiscard]] bool isSecure() const override { return tls_ != nullptr; }
    [[nodiscard]] bool usedStartTls() const override { return startTlsDone_; }

    void startTls() override;
    ResultCode bind(const BindRequest& request) override;
    void close() noexcept override;

    // Raw stream access for the protocol handler.
    void write(std::string_view data);
    std::string readSome(std::size_t maxBytes = 4096);

private:
    using TlsStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    boost::beast::tcp_stream& lowest();
    void upgradeToTls();
    void drive();

    model::Endpoint endpoint_;
    std::shared_ptr<LdapProtocol> protocol_;
    std::shared_ptr<boost::asio::ssl::context> sslContext_;
    std::chrono::milliseconds timeout_;
    boost::asio::io_context io_;
    std::unique_ptr<boost::beast::tcp_stream> plain_;
    std::unique_ptr<TlsStream> tls_;
    bool startTlsDone_{false};
    bool closed_{false};
};

class AsioConnectionFactory : public ConnectionFactory {
public:
    explicit AsioConnectionFactory(std::shared_ptr<LdapProtocol> protocol = nullptr);

    std::unique_ptr<Connection> connect(const model::Endpoint& endpoint,
                                        const TransportOptions& options) override;

private:
    std::shared_ptr<LdapProtocol> protocol_;
    std::shared_ptr<boost::asio::ssl::context> defaultSslContext_;
};

} // namespace ldaproute::connection
