#pragma once

#include "ldaproute/connection/Connection.hpp"

namespace ldaproute::pool {

// Hooks a pool runs against its connections. Each throws
// connection::LdapException when the connection must be discarded. The base
// implementation only rejects connections whose transport has gone away.
class HealthCheck {
public:
    virtual ~HealthCheck() = default;

    virtual void ensureNewConnectionValid(connection::Connection& connection);
    virtual void ensureValidForCheckout(connection::Connection& connection);
    virtual void ensureValidForContinuedUse(connection::Connection& connection);
};

} // namespace ldaproute::pool
