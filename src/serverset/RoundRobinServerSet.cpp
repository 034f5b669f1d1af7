#include "ldaproute/serverset/RoundRobinServerSet.hpp"
#include "ldaproute/util/Logging.hpp"

#include <cstdlib>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ldaproute::serverset {

using connection::BindRequest;
using connection::Connection;
using connection::ConnectError;
using connection::LdapException;
using connection::ResultCode;

namespace {

std::optional<std::string_view> intervalSetting(const ServerSetOptions& options) {
    if (options.blacklistCheckInterval) {
        return std::string_view(*options.blacklistCheckInterval);
    }
    if (const char* value = std::getenv(kBlacklistIntervalVariable)) {
        return std::string_view(value);
    }
    return std::nullopt;
}

void validate(const std::vector<model::Endpoint>& endpoints, const std::shared_ptr<connection::ConnectionFactory>& factory) {
    if (endpoints.empty()) {
        throw std::invalid_argument("RoundRobinServerSet requires at least one endpoint");
    }
    if (!factory) {
        throw std::invalid_argument("RoundRobinServerSet requires a connection factory");
    }
}

} // namespace

RoundRobinServerSet::RoundRobinServerSet(std::vector<model::Endpoint> endpoints,
                                         std::shared_ptr<connection::ConnectionFactory> factory,
                                         ServerSetOptions options)
    : endpoints_(std::move(endpoints))
    , factory_(std::move(factory))
    , options_(std::move(options)) {
    validate(endpoints_, factory_);
    if (auto interval = resolveBlacklistCheckInterval(intervalSetting(options_))) {
        blacklist_ = std::make_shared<BlacklistManager>(factory_, options_.transport, *interval);
        ownsBlacklist_ = true;
    }
}

RoundRobinServerSet::RoundRobinServerSet(std::vector<model::Endpoint> endpoints,
                                         std::shared_ptr<connection::ConnectionFactory> factory,
                                         ServerSetOptions options,
                                         std::shared_ptr<BlacklistManager> sharedBlacklist)
    : endpoints_(std::move(endpoints))
    , factory_(std::move(factory))
    , options_(std::move(options))
    , blacklist_(std::move(sharedBlacklist)) {
    validate(endpoints_, factory_);
}

RoundRobinServerSet::~RoundRobinServerSet() {
    close();
}

std::unique_ptr<Connection> RoundRobinServerSet::connectTo(const model::Endpoint& endpoint,
                                                           const BindRequest* bindRequest) {
    auto connection = factory_->connect(endpoint, options_.transport);
    if (bindRequest) {
        auto rc = connection->bind(*bindRequest);
        if (rc != ResultCode::success) {
            connection->close();
            throw LdapException(rc, "bind as '" + bindRequest->bindDn + "' to " + endpoint.toString() +
                                        " failed: " + connection::resultCodeName(rc));
        }
    }
    return connection;
}

std::unique_ptr<Connection> RoundRobinServerSet::getConnection(const BindRequest* bindRequest) {
    if (!bindRequest && options_.bindRequest) {
        bindRequest = &*options_.bindRequest;
    }

    const std::size_t count = endpoints_.size();
    const std::size_t start = static_cast<std::size_t>(counter_.fetch_add(1) % count);
    const bool skipBlacklisted = blacklist_ && !blacklist_->allBlacklisted(endpoints_);

    std::optional<ConnectError> lastFailure;
    std::vector<std::size_t> skipped;
    auto fail = [&](const model::Endpoint& endpoint, ResultCode cause, const char* what) {
        util::log(util::LogLevel::debug, "connection attempt to " + endpoint.toString() + " failed: " + what);
        if (blacklist_) {
            blacklist_->addToBlacklist(endpoint);
        }
        lastFailure.emplace(endpoint, cause, what);
    };
    auto attempt = [&](const model::Endpoint& endpoint) -> std::unique_ptr<Connection> {
        try {
            return connectTo(endpoint, bindRequest);
        } catch (const LdapException& ex) {
            auto cause = ex.resultCode();
            if (const auto* connectError = dynamic_cast<const ConnectError*>(&ex)) {
                cause = connectError->cause();
            }
            fail(endpoint, cause, ex.what());
        } catch (const std::exception& ex) {
            fail(endpoint, ResultCode::connectError, ex.what());
        }
        return nullptr;
    };

    for (std::size_t i = 0; i < count; ++i) {
        const std::size_t index = (start + i) % count;
        if (skipBlacklisted && blacklist_->isBlacklisted(endpoints_[index])) {
            skipped.push_back(index);
            continue;
        }
        if (auto connection = attempt(endpoints_[index])) {
            return connection;
        }
    }
    // Every non-blacklisted server failed; fall back to the listed ones in rotation order.
    for (auto index : skipped) {
        if (auto connection = attempt(endpoints_[index])) {
            return connection;
        }
    }

    throw ConnectError(lastFailure->endpoint(), lastFailure->cause(),
                       "unable to connect to any server in " + toString() + "; last failure: " + lastFailure->what());
}

std::string RoundRobinServerSet::toString() const {
    std::ostringstream oss;
    oss << "RoundRobinServerSet(servers={";
    for (std::size_t i = 0; i < endpoints_.size(); ++i) {
        if (i != 0) {
            oss << ", ";
        }
        oss << endpoints_[i].toString();
    }
    oss << "}, blacklist=";
    if (blacklist_) {
        oss << blacklist_->checkInterval().count() << "ms";
    } else {
        oss << "disabled";
    }
    oss << ')';
    return oss.str();
}

void RoundRobinServerSet::close() {
    if (blacklist_ && ownsBlacklist_) {
        blacklist_->close();
    }
}

} // namespace ldaproute::serverset
