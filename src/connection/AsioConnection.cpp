#include "ldaproute/connection/AsioConnection.hpp"
#include "ldaproute/util/Logging.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <openssl/ssl.h>

#include <utility>

namespace ldaproute::connection {
namespace {

ResultCode classify(const boost::system::error_code& ec) {
    if (ec == boost::beast::error::timeout) {
        return ResultCode::timeout;
    }
    if (ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset ||
        ec == boost::asio::ssl::error::stream_truncated) {
        return ResultCode::serverDown;
    }
    return ResultCode::connectError;
}

} // namespace

AsioConnection::AsioConnection(model::Endpoint endpoint,
                               std::shared_ptr<LdapProtocol> protocol,
                               std::shared_ptr<boost::asio::ssl::context> sslContext,
                               std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint))
    , protocol_(std::move(protocol))
    , sslContext_(std::move(sslContext))
    , timeout_(timeout) {}

AsioConnection::~AsioConnection() {
    close();
}

void AsioConnection::drive() {
    io_.restart();
    io_.run();
}

boost::beast::tcp_stream& AsioConnection::lowest() {
    if (closed_) {
        throw LdapException(ResultCode::serverDown, "connection to " + endpoint_.toString() + " is closed");
    }
    if (tls_) {
        return boost::beast::get_lowest_layer(*tls_);
    }
    if (!plain_) {
        throw LdapException(ResultCode::serverDown, "connection to " + endpoint_.toString() + " is not open");
    }
    return *plain_;
}

void AsioConnection::open(bool useTls) {
    boost::system::error_code resolveEc;
    boost::asio::ip::tcp::resolver resolver(io_);
    auto results = resolver.resolve(endpoint_.host, std::to_string(endpoint_.port), resolveEc);
    if (resolveEc) {
        throw ConnectError(endpoint_, ResultCode::connectError,
                           "unable to resolve " + endpoint_.host + ": " + resolveEc.message());
    }

    plain_ = std::make_unique<boost::beast::tcp_stream>(io_);
    plain_->expires_after(timeout_);
    boost::system::error_code result = boost::asio::error::would_block;
    plain_->async_connect(results, [&result](const boost::system::error_code& ec,
                                             const boost::asio::ip::tcp::endpoint&) {
        result = ec;
    });
    drive();
    if (result) {
        plain_.reset();
        throw ConnectError(endpoint_, classify(result),
                           "unable to connect to " + endpoint_.toString() + ": " + result.message());
    }
    plain_->expires_never();

    if (useTls) {
        try {
            upgradeToTls();
        } catch (const LdapException& ex) {
            close();
            throw ConnectError(endpoint_, ex.resultCode(), ex.what());
        }
    }
    util::log(util::LogLevel::trace, "connected to " + endpoint_.toString() + (useTls ? " (TLS)" : ""));
}

void AsioConnection::upgradeToTls() {
    if (!sslContext_) {
        throw LdapException(ResultCode::localError, "no TLS context configured for " + endpoint_.toString());
    }
    if (!plain_) {
        throw LdapException(ResultCode::serverDown, "connection to " + endpoint_.toString() + " is not open");
    }
    auto stream = std::make_unique<TlsStream>(std::move(*plain_), *sslContext_);
    plain_.reset();

    if (!SSL_set_tlsext_host_name(stream->native_handle(), endpoint_.host.c_str())) {
        throw LdapException(ResultCode::localError, "failed to set SNI host name " + endpoint_.host);
    }
    stream->set_verify_callback(boost::asio::ssl::host_name_verification(endpoint_.host));

    boost::beast::get_lowest_layer(*stream).expires_after(timeout_);
    boost::system::error_code result = boost::asio::error::would_block;
    stream->async_handshake(boost::asio::ssl::stream_base::client,
                            [&result](const boost::system::error_code& ec) { result = ec; });
    drive();
    if (result) {
        boost::system::error_code ignored;
        boost::beast::get_lowest_layer(*stream).socket().close(ignored);
        closed_ = true;
        throw LdapException(ResultCode::connectError,
                            "TLS handshake with " + endpoint_.toString() + " failed: " + result.message());
    }
    boost::beast::get_lowest_layer(*stream).expires_never();
    tls_ = std::move(stream);
}

bool AsioConnection::isConnected() const {
    if (closed_) {
        return false;
    }
    if (tls_) {
        return boost::beast::get_lowest_layer(*tls_).socket().is_open();
    }
    return plain_ && plain_->socket().is_open();
}

void AsioConnection::startTls() {
    if (!protocol_) {
        throw LdapException(ResultCode::notSupported, "StartTLS requires an LDAP protocol handler");
    }
    if (isSecure()) {
        throw LdapException(ResultCode::operationsError,
                            "connection to " + endpoint_.toString() + " already uses TLS");
    }
    auto rc = protocol_->requestStartTls(*this);
    if (rc != ResultCode::success) {
        throw LdapException(rc, "StartTLS refused by " + endpoint_.toString() + ": " + resultCodeName(rc));
    }
    upgradeToTls();
    startTlsDone_ = true;
}

ResultCode AsioConnection::bind(const BindRequest& request) {
    if (!protocol_) {
        throw LdapException(ResultCode::notSupported, "bind requires an LDAP protocol handler");
    }
    return protocol_->bind(*this, request);
}

void AsioConnection::write(std::string_view data) {
    auto& layer = lowest();
    layer.expires_after(timeout_);
    boost::system::error_code result = boost::asio::error::would_block;
    auto handler = [&result](const boost::system::error_code& ec, std::size_t) { result = ec; };
    if (tls_) {
        boost::asio::async_write(*tls_, boost::asio::buffer(data.data(), data.size()), handler);
    } else {
        boost::asio::async_write(*plain_, boost::asio::buffer(data.data(), data.size()), handler);
    }
    drive();
    if (result) {
        close();
        throw LdapException(classify(result), "write to " + endpoint_.toString() + " failed: " + result.message());
    }
}

std::string AsioConnection::readSome(std::size_t maxBytes) {
    auto& layer = lowest();
    layer.expires_after(timeout_);
    std::string buffer(maxBytes, '\0');
    std::size_t received = 0;
    boost::system::error_code result = boost::asio::error::would_block;
    auto handler = [&result, &received](const boost::system::error_code& ec, std::size_t n) {
        result = ec;
        received = n;
    };
    if (tls_) {
        tls_->async_read_some(boost::asio::buffer(buffer), handler);
    } else {
        plain_->async_read_some(boost::asio::buffer(buffer), handler);
    }
    drive();
    if (result) {
        close();
        throw LdapException(classify(result), "read from " + endpoint_.toString() + " failed: " + result.message());
    }
    buffer.resize(received);
    return buffer;
}

void AsioConnection::close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;
    boost::system::error_code ec;
    if (tls_) {
        auto& socket = boost::beast::get_lowest_layer(*tls_).socket();
        socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        socket.close(ec);
    } else if (plain_) {
        plain_->socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        plain_->socket().close(ec);
    }
}

AsioConnectionFactory::AsioConnectionFactory(std::shared_ptr<LdapProtocol> protocol)
    : protocol_(std::move(protocol))
    , defaultSslContext_(std::make_shared<boost::asio::ssl::context>(boost::asio::ssl::context::tls_client)) {
    defaultSslContext_->set_default_verify_paths();
    defaultSslContext_->set_verify_mode(boost::asio::ssl::verify_peer);
}

std::unique_ptr<Connection> AsioConnectionFactory::connect(const model::Endpoint& endpoint,
                                                           const TransportOptions& options) {
    auto sslContext = options.sslContext ? options.sslContext : defaultSslContext_;
    auto connection = std::make_unique<AsioConnection>(endpoint, protocol_, std::move(sslContext),
                                                       options.connectTimeout);
    connection->open(options.useTls);
    return connection;
}

} // namespace ldaproute::connection
