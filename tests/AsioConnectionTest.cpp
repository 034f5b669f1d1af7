#include "ldaproute/connection/AsioConnection.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <string>
#include <thread>

namespace ldaproute::connection {
namespace {

using namespace std::chrono_literals;
using boost::asio::ip::tcp;

// Listens on an ephemeral loopback port; optionally serves one connection on
// a background thread.
class LoopbackServer {
public:
    LoopbackServer()
        : acceptor_(io_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0)) {}

    ~LoopbackServer() { join(); }

    void join() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    model::Endpoint endpoint() const { return {"127.0.0.1", acceptor_.local_endpoint().port()}; }

    void serveOne(std::function<void(tcp::socket&)> handler) {
        thread_ = std::thread([this, handler = std::move(handler)]() {
            tcp::socket socket(io_);
            boost::system::error_code ec;
            acceptor_.accept(socket, ec);
            if (!ec) {
                handler(socket);
            }
        });
    }

    void stopListening() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    }

private:
    boost::asio::io_context io_;
    tcp::acceptor acceptor_;
    std::thread thread_;
};

// Line-less toy exchange: "BIND <dn> <password>" answered by a decimal result code.
class FakeProtocol : public LdapProtocol {
public:
    ResultCode requestStartTls(AsioConnection&) override { return ResultCode::unavailable; }

    ResultCode bind(AsioConnection& connection, const BindRequest& request) override {
        connection.write("BIND " + request.bindDn + " " + request.password);
        auto reply = connection.readSome();
        return static_cast<ResultCode>(std::stoi(reply));
    }
};

TransportOptions quickTimeout() {
    TransportOptions options;
    options.connectTimeout = 2s;
    return options;
}

TEST(AsioConnectionTest, ConnectsToListeningServer) {
    LoopbackServer server;
    AsioConnectionFactory factory;

    auto connection = factory.connect(server.endpoint(), quickTimeout());
    EXPECT_TRUE(connection->isConnected());
    EXPECT_FALSE(connection->isSecure());
    EXPECT_EQ(connection->connectedPort(), server.endpoint().port);

    connection->close();
    connection->close();
    EXPECT_FALSE(connection->isConnected());
}

TEST(AsioConnectionTest, RefusedConnectionRaisesConnectError) {
    model::Endpoint endpoint;
    {
        LoopbackServer server;
        endpoint = server.endpoint();
        server.stopListening();
    }
    AsioConnectionFactory factory;
    try {
        factory.connect(endpoint, quickTimeout());
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& ex) {
        EXPECT_EQ(ex.resultCode(), ResultCode::connectError);
        EXPECT_EQ(ex.endpoint(), endpoint);
    }
}

TEST(AsioConnectionTest, UnresolvableHostRaisesConnectError) {
    AsioConnectionFactory factory;
    EXPECT_THROW(factory.connect({"host.invalid", 389}, quickTimeout()), ConnectError);
}

TEST(AsioConnectionTest, StartTlsAndBindNeedAProtocolHandler) {
    LoopbackServer server;
    AsioConnectionFactory factory;
    auto connection = factory.connect(server.endpoint(), quickTimeout());

    try {
        connection->startTls();
        FAIL() << "expected notSupported";
    } catch (const LdapException& ex) {
        EXPECT_EQ(ex.resultCode(), ResultCode::notSupported);
    }
    try {
        connection->bind({"cn=admin", "secret"});
        FAIL() << "expected notSupported";
    } catch (const LdapException& ex) {
        EXPECT_EQ(ex.resultCode(), ResultCode::notSupported);
    }
}

TEST(AsioConnectionTest, BindRunsThroughTheProtocolHandler) {
    LoopbackServer server;
    std::string received;
    server.serveOne([&received](tcp::socket& socket) {
        char buffer[256];
        boost::system::error_code ec;
        auto n = socket.read_some(boost::asio::buffer(buffer), ec);
        received.assign(buffer, n);
        boost::asio::write(socket, boost::asio::buffer(std::string("49")), ec);
    });

    AsioConnectionFactory factory{std::make_shared<FakeProtocol>()};
    auto connection = factory.connect(server.endpoint(), quickTimeout());
    EXPECT_EQ(connection->bind({"cn=admin", "wrong"}), ResultCode::invalidCredentials);
    connection->close();
    server.join();
    EXPECT_EQ(received, "BIND cn=admin wrong");
}

TEST(AsioConnectionTest, RefusedStartTlsKeepsThePlainConnection) {
    LoopbackServer server;
    AsioConnectionFactory factory{std::make_shared<FakeProtocol>()};
    auto connection = factory.connect(server.endpoint(), quickTimeout());

    try {
        connection->startTls();
        FAIL() << "expected the StartTLS request to be refused";
    } catch (const LdapException& ex) {
        EXPECT_EQ(ex.resultCode(), ResultCode::unavailable);
    }
    EXPECT_TRUE(connection->isConnected());
    EXPECT_FALSE(connection->isSecure());
}

TEST(AsioConnectionTest, PeerCloseIsReportedAsServerDown) {
    LoopbackServer server;
    server.serveOne([](tcp::socket& socket) {
        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    });

    AsioConnectionFactory factory{std::make_shared<FakeProtocol>()};
    auto connection = factory.connect(server.endpoint(), quickTimeout());
    auto* asio = dynamic_cast<AsioConnection*>(connection.get());
    ASSERT_NE(asio, nullptr);

    try {
        asio->readSome();
        FAIL() << "expected the read to fail";
    } catch (const LdapException& ex) {
        EXPECT_FALSE(isConnectionUsable(ex.resultCode()));
    }
    EXPECT_FALSE(connection->isConnected());
    EXPECT_THROW(asio->write("late"), LdapException);
}

TEST(AsioConnectionTest, TlsHandshakeFailureRaisesConnectError) {
    LoopbackServer server;
    server.serveOne([](tcp::socket& socket) {
        char buffer[512];
        boost::system::error_code ec;
        socket.read_some(boost::asio::buffer(buffer), ec);
        boost::asio::write(socket, boost::asio::buffer(std::string("this is not TLS\r\n")), ec);
        socket.close(ec);
    });

    AsioConnectionFactory factory;
    auto options = quickTimeout();
    options.useTls = true;
    EXPECT_THROW(factory.connect(server.endpoint(), options), ConnectError);
}

} // namespace
} // namespace ldaproute::connection
