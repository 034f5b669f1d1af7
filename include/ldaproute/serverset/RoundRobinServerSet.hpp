#pragma once

#include "ldaproute/connection/Connection.hpp"
#include "ldaproute/model/Endpoint.hpp"
#include "ldaproute/serverset/BlacklistManager.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ldaproute::serverset {

inline constexpr char kBlacklistIntervalVariable[] = "LDAPROUTE_BLACKLIST_CHECK_INTERVAL_MILLIS";

struct ServerSetOptions {
    connection::TransportOptions transport;
    std::optional<connection::BindRequest> bindRequest;
    // Raw blacklist interval setting; when unset the environment variable
    // LDAPROUTE_BLACKLIST_CHECK_INTERVAL_MILLIS is consulted instead.
    std::optional<std::string> blacklistCheckInterval;
};

// Spreads new connections over a fixed endpoint list. Each getConnection()
// call advances the rotation once and scans forward from there until an
// endpoint accepts. Blacklisted endpoints are tried only after every other
// endpoint has failed.
class RoundRobinServerSet {
public:
    // Creates an owned BlacklistManager according to the interval setting.
    RoundRobinServerSet(std::vector<model::Endpoint> endpoints,
                        std::shared_ptr<connection::ConnectionFactory> factory,
                        ServerSetOptions options = {});

    // Uses the given manager (may be null) instead; it is not closed by close().
    RoundRobinServerSet(std::vector<model::Endpoint> endpoints,
                        std::shared_ptr<connection::ConnectionFactory> factory,
                        ServerSetOptions options,
                        std::shared_ptr<BlacklistManager> sharedBlacklist);
    ~RoundRobinServerSet();

    RoundRobinServerSet(const RoundRobinServerSet&) = delete;
    RoundRobinServerSet& operator=(const RoundRobinServerSet&) = delete;

    // Binds with `bindRequest`, or the configured one, when either is present.
    // Throws connection::ConnectError once every endpoint has failed.
    std::unique_ptr<connection::Connection> getConnection(const connection::BindRequest* bindRequest = nullptr);

    // Null when blacklisting is disabled.
    [[nodiscard]] BlacklistManager* getBlacklistManager() const noexcept { return blacklist_.get(); }

    [[nodiscard]] const std::vector<model::Endpoint>& endpoints() const noexcept { return endpoints_; }
    [[nodiscard]] const ServerSetOptions& options() const noexcept { return options_; }
    [[nodiscard]] std::string toString() const;

    void close();

private:
    std::unique_ptr<connection::Connection> connectTo(const model::Endpoint& endpoint,
                                                      const connection::BindRequest* bindRequest);

    std::vector<model::Endpoint> endpoints_;
    std::shared_ptr<connection::ConnectionFactory> factory_;
    ServerSetOptions options_;
    std::shared_ptr<BlacklistManager> blacklist_;
    bool ownsBlacklist_{false};
    std::atomic<std::uint64_t> counter_{0};
};

} // namespace ldaproute::serverset
