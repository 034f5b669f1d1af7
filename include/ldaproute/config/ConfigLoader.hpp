#pragma once

#include "ldaproute/model/Endpoint.hpp"
#include "ldaproute/referral/PooledReferralConnectorProperties.hpp"
#include "ldaproute/serverset/RoundRobinServerSet.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace ldaproute::config {

struct ClientConfig {
    std::vector<model::Endpoint> servers;
    serverset::ServerSetOptions serverSet;
    referral::PooledReferralConnectorProperties referrals;
};

boost::json::value parseJson(const std::string& payload);

// Throws std::invalid_argument on a wrongly typed or out-of-range field.
ClientConfig loadConfig(const boost::json::object& json);

// Applies LDAPROUTE_* environment overrides on top of `config`.
void applyEnvironment(ClientConfig& config);

// Missing or unreadable files yield the defaults; environment overrides are
// applied either way.
ClientConfig loadConfigFile(const std::filesystem::path& path);

} // namespace ldaproute::config
