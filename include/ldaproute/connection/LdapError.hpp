#pragma once

#include "ldaproute/model/Endpoint.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace ldaproute::connection {

// LDAP result codes (RFC 4511) plus the client-side codes used by this library.
enum class ResultCode {
    success = 0,
    operationsError = 1,
    protocolError = 2,
    timeLimitExceeded = 3,
    sizeLimitExceeded = 4,
    compareFalse = 5,
    compareTrue = 6,
    authMethodNotSupported = 7,
    strongAuthRequired = 8,
    referral = 10,
    adminLimitExceeded = 11,
    unavailableCriticalExtension = 12,
    confidentialityRequired = 13,
    noSuchObject = 32,
    invalidDnSyntax = 34,
    inappropriateAuthentication = 48,
    invalidCredentials = 49,
    insufficientAccessRights = 50,
    busy = 51,
    unavailable = 52,
    unwillingToPerform = 53,
    loopDetect = 54,
    other = 80,
    serverDown = 81,
    localError = 82,
    encodingError = 83,
    decodingError = 84,
    timeout = 85,
    connectError = 91,
    notSupported = 92,
    referralLimitExceeded = 97,
};

const char* resultCodeName(ResultCode code) noexcept;

// Codes meaning the connection that produced them can no longer be trusted.
bool isConnectionUsable(ResultCode code) noexcept;

class LdapException : public std::runtime_error {
public:
    LdapException(ResultCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {}

    [[nodiscard]] ResultCode resultCode() const noexcept { return code_; }

private:
    ResultCode code_;
};

class ConnectError : public LdapException {
public:
    ConnectError(model::Endpoint endpoint, ResultCode cause, const std::string& message)
        : LdapException(ResultCode::connectError, message)
        , endpoint_(std::move(endpoint))
        , cause_(cause) {}

    // Endpoint of the last attempt.
    [[nodiscard]] const model::Endpoint& endpoint() const noexcept { return endpoint_; }

    [[nodiscard]] ResultCode cause() const noexcept { return cause_; }

private:
    model::Endpoint endpoint_;
    ResultCode cause_;
};

class PoolClosedError : public LdapException {
public:
    explicit PoolClosedError(const std::string& message)
        : LdapException(ResultCode::connectError, message) {}
};

} // namespace ldaproute::connection
