#include "ldaproute/connection/LdapError.hpp"

namespace ldaproute::connection {

const char* resultCodeName(ResultCode code) noexcept {
    switch (code) {
    case ResultCode::success: return "success";
    case ResultCode::operationsError: return "operations error";
    case ResultCode::protocolError: return "protocol error";
    case ResultCode::timeLimitExceeded: return "time limit exceeded";
    case ResultCode::sizeLimitExceeded: return "size limit exceeded";
    case ResultCode::compareFalse: return "compare false";
    case ResultCode::compareTrue: return "compare true";
    case ResultCode::authMethodNotSupported: return "auth method not supported";
    case ResultCode::strongAuthRequired: return "strong auth required";
    case ResultCode::referral: return "referral";
    case ResultCode::adminLimitExceeded: return "admin limit exceeded";
    case ResultCode::unavailableCriticalExtension: return "unavailable critical extension";
    case ResultCode::confidentialityRequired: return "confidentiality required";
    case ResultCode::noSuchObject: return "no such object";
    case ResultCode::invalidDnSyntax: return "invalid DN syntax";
    case ResultCode::inappropriateAuthentication: return "inappropriate authentication";
    case ResultCode::invalidCredentials: return "invalid credentials";
    case ResultCode::insufficientAccessRights: return "insufficient access rights";
    case ResultCode::busy: return "busy";
    case ResultCode::unavailable: return "unavailable";
    case ResultCode::unwillingToPerform: return "unwilling to perform";
    case ResultCode::loopDetect: return "loop detected";
    case ResultCode::other: return "other";
    case ResultCode::serverDown: return "server down";
    case ResultCode::localError: return "local error";
    case ResultCode::encodingError: return "encoding error";
    case ResultCode::decodingError: return "decoding error";
    case ResultCode::timeout: return "timeout";
    case ResultCode::connectError: return "connect error";
    case ResultCode::notSupported: return "not supported";
    case ResultCode::referralLimitExceeded: return "referral limit exceeded";
    }
    return "unknown";
}

bool isConnectionUsable(ResultCode code) noexcept {
    switch (code) {
    case ResultCode::serverDown:
    case ResultCode::localError:
    case ResultCode::encodingError:
    case ResultCode::decodingError:
    case ResultCode::timeout:
    case ResultCode::connectError:
    case ResultCode::protocolError:
        return false;
    default:
        return true;
    }
}

} // namespace ldaproute::connection
