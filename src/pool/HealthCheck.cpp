#include "ldaproute/pool/HealthCheck.hpp"

namespace ldaproute::pool {
namespace {
void ensureConnected(connection::Connection& connection) {
    if (!connection.isConnected()) {
        throw connection::LdapException(connection::ResultCode::serverDown,
                                        "connection to " + connection.endpoint().toString() + " is no longer established");
    }
}
} // namespace

void HealthCheck::ensureNewConnectionValid(connection::Connection& connection) {
    ensureConnected(connection);
}

void HealthCheck::ensureValidForCheckout(connection::Connection& connection) {
    ensureConnected(connection);
}

void HealthCheck::ensureValidForContinuedUse(connection::Connection& connection) {
    ensureConnected(connection);
}

} // namespace ldaproute::pool
