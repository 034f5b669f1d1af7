#include "ldaproute/serverset/BlacklistManager.hpp"
#include "ldaproute/util/Logging.hpp"

#include <algorithm>
#include <charconv>
#include <exception>
#include <stdexcept>
#include <utility>

namespace ldaproute::serverset {

std::optional<std::chrono::milliseconds> resolveBlacklistCheckInterval(std::optional<std::string_view> setting) {
    if (!setting) {
        return std::nullopt;
    }
    std::string_view text = *setting;
    while (!text.empty() && text.front() == ' ') text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ') text.remove_suffix(1);

    long long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        util::log(util::LogLevel::warn, "invalid blacklist check interval '" + std::string(*setting) +
                                            "', using " + std::to_string(kDefaultBlacklistCheckInterval.count()) + "ms");
        return kDefaultBlacklistCheckInterval;
    }
    if (value == 0) {
        return std::nullopt;
    }
    if (value < 0) {
        util::log(util::LogLevel::warn, "negative blacklist check interval " + std::to_string(value) +
                                            ", using " + std::to_string(kDefaultBlacklistCheckInterval.count()) + "ms");
        return kDefaultBlacklistCheckInterval;
    }
    return std::chrono::milliseconds(value);
}

BlacklistManager::BlacklistManager(std::shared_ptr<connection::ConnectionFactory> factory,
                                   connection::TransportOptions probeOptions,
                                   std::chrono::milliseconds checkInterval)
    : factory_(std::move(factory))
    , probeOptions_(std::move(probeOptions))
    , checkInterval_(checkInterval) {
    if (!factory_) {
        throw std::invalid_argument("BlacklistManager requires a connection factory");
    }
    if (checkInterval_.count() <= 0) {
        throw std::invalid_argument("BlacklistManager check interval must be positive");
    }
    recheck_ = std::make_unique<util::PeriodicTask>("blacklist recheck", checkInterval_,
                                                    [this]() { checkBlacklistedServers(); });
}

BlacklistManager::~BlacklistManager() {
    close();
}

void BlacklistManager::addToBlacklist(const model::Endpoint& endpoint) {
    bool inserted = false;
    {
        std::scoped_lock lock(mutex_);
        inserted = blacklisted_.insert(endpoint).second;
    }
    if (inserted) {
        util::log(util::LogLevel::warn, "blacklisting unreachable server " + endpoint.toString());
    }
}

bool BlacklistManager::isBlacklisted(const model::Endpoint& endpoint) const {
    std::scoped_lock lock(mutex_);
    return blacklisted_.count(endpoint) != 0;
}

bool BlacklistManager::allBlacklisted(const std::vector<model::Endpoint>& endpoints) const {
    std::scoped_lock lock(mutex_);
    return std::all_of(endpoints.begin(), endpoints.end(),
                       [this](const model::Endpoint& endpoint) { return blacklisted_.count(endpoint) != 0; });
}

bool BlacklistManager::isEmpty() const {
    std::scoped_lock lock(mutex_);
    return blacklisted_.empty();
}

std::vector<model::Endpoint> BlacklistManager::getBlacklistedEndpoints() const {
    std::scoped_lock lock(mutex_);
    return {blacklisted_.begin(), blacklisted_.end()};
}

bool BlacklistManager::probe(const model::Endpoint& endpoint) {
    try {
        auto connection = factory_->connect(endpoint, probeOptions_);
        connection->close();
        return true;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::debug, "blacklisted server " + endpoint.toString() + " still unreachable: " + ex.what());
        return false;
    }
}

void BlacklistManager::checkBlacklistedServers() {
    // Probes run without holding mutex_ so server-set lookups never wait on a connect.
    std::scoped_lock checkLock(checkMutex_);
    for (const auto& endpoint : getBlacklistedEndpoints()) {
        if (!probe(endpoint)) {
            continue;
        }
        {
            std::scoped_lock lock(mutex_);
            blacklisted_.erase(endpoint);
        }
        util::log(util::LogLevel::info, "server " + endpoint.toString() + " is reachable again");
    }
}

void BlacklistManager::close() {
    if (recheck_) {
        recheck_->stop();
    }
}

bool BlacklistManager::isClosed() const {
    return !recheck_ || !recheck_->running();
}

} // namespace ldaproute::serverset
