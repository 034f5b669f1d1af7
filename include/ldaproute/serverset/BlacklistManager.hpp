#pragma once

#include "ldaproute/connection/Connection.hpp"
#include "ldaproute/model/Endpoint.hpp"
#include "ldaproute/util/PeriodicTask.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace ldaproute::serverset {

inline constexpr std::chrono::milliseconds kDefaultBlacklistCheckInterval{30000};

// Interprets the blacklist check interval setting: absent or "0" disables the
// manager, a positive integer is used as-is, anything else selects the default.
std::optional<std::chrono::milliseconds> resolveBlacklistCheckInterval(std::optional<std::string_view> setting);

// Endpoints believed unreachable. An endpoint stays listed until a probe
// connection to it succeeds, either from the background recheck or from an
// explicit checkBlacklistedServers() call.
class BlacklistManager {
public:
    BlacklistManager(std::shared_ptr<connection::ConnectionFactory> factory,
                     connection::TransportOptions probeOptions,
                     std::chrono::milliseconds checkInterval);
    ~BlacklistManager();

    BlacklistManager(const BlacklistManager&) = delete;
    BlacklistManager& operator=(const BlacklistManager&) = delete;

    void addToBlacklist(const model::Endpoint& endpoint);
    [[nodiscard]] bool isBlacklisted(const model::Endpoint& endpoint) const;
    [[nodiscard]] bool allBlacklisted(const std::vector<model::Endpoint>& endpoints) const;
    [[nodiscard]] bool isEmpty() const;
    [[nodiscard]] std::vector<model::Endpoint> getBlacklistedEndpoints() const;

    // Probes every listed endpoint and removes the ones that accept a connection.
    void checkBlacklistedServers();

    [[nodiscard]] std::chrono::milliseconds checkInterval() const noexcept { return checkInterval_; }

    // Stops the background recheck. Idempotent.
    void close();
    [[nodiscard]] bool isClosed() const;

private:
    bool probe(const model::Endpoint& endpoint);

    std::shared_ptr<connection::ConnectionFactory> factory_;
    connection::TransportOptions probeOptions_;
    std::chrono::milliseconds checkInterval_;
    mutable std::mutex mutex_;
    std::set<model::Endpoint> blacklisted_;
    std::mutex checkMutex_;
    std::unique_ptr<util::PeriodicTask> recheck_;
};

} // namespace ldaproute::serverset
