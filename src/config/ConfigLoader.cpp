#include "ldaproute/config/ConfigLoader.hpp"
#include "ldaproute/util/Logging.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace ldaproute::config {
namespace {

std::int64_t readInt(const boost::json::value& value, std::string_view key) {
    try {
        return value.to_number<std::int64_t>();
    } catch (const std::exception&) {
        throw std::invalid_argument("configuration field '" + std::string(key) + "' must be an integer");
    }
}

std::string readString(const boost::json::value& value, std::string_view key) {
    if (!value.is_string()) {
        throw std::invalid_argument("configuration field '" + std::string(key) + "' must be a string");
    }
    return std::string(value.as_string());
}

bool readBool(const boost::json::value& value, std::string_view key) {
    if (!value.is_bool()) {
        throw std::invalid_argument("configuration field '" + std::string(key) + "' must be a boolean");
    }
    return value.as_bool();
}

std::chrono::milliseconds readMillis(const boost::json::value& value, std::string_view key) {
    auto millis = readInt(value, key);
    if (millis < 0) {
        throw std::invalid_argument("configuration field '" + std::string(key) + "' must not be negative");
    }
    return std::chrono::milliseconds(millis);
}

unsigned int readCount(const boost::json::value& value, std::string_view key) {
    auto count = readInt(value, key);
    if (count < 0 || count > 1000000) {
        throw std::invalid_argument("configuration field '" + std::string(key) + "' is out of range");
    }
    return static_cast<unsigned int>(count);
}

std::uint16_t readPort(const boost::json::value& value, std::string_view key) {
    auto port = readInt(value, key);
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("configuration field '" + std::string(key) + "' is not a valid port");
    }
    return static_cast<std::uint16_t>(port);
}

model::Endpoint readEndpoint(const boost::json::value& value) {
    if (value.is_string()) {
        return model::parseEndpoint(std::string(value.as_string()));
    }
    if (!value.is_object()) {
        throw std::invalid_argument("server entries must be \"host:port\" strings or {host, port} objects");
    }
    const auto& obj = value.as_object();
    model::Endpoint endpoint;
    if (auto it = obj.if_contains("host")) endpoint.host = readString(*it, "host");
    if (auto it = obj.if_contains("port")) endpoint.port = readPort(*it, "port");
    if (endpoint.host.empty() || endpoint.port == 0) {
        throw std::invalid_argument("server entries need both host and port");
    }
    return endpoint;
}

std::vector<model::Endpoint> parseServerList(std::string_view text) {
    std::vector<model::Endpoint> servers;
    while (!text.empty()) {
        auto comma = text.find(',');
        auto item = text.substr(0, comma);
        if (!item.empty()) {
            servers.push_back(model::parseEndpoint(item));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    return servers;
}

void loadReferrals(const boost::json::object& json, referral::PooledReferralConnectorProperties& props) {
    if (auto it = json.if_contains("bindDn")) {
        connection::BindRequest bind;
        bind.bindDn = readString(*it, "referrals.bindDn");
        if (auto pw = json.if_contains("bindPassword")) bind.password = readString(*pw, "referrals.bindPassword");
        props.bindRequest = std::move(bind);
    }
    if (auto it = json.if_contains("retryFailedOperationsDueToInvalidConnections")) {
        props.retryFailedOperationsDueToInvalidConnections =
            readBool(*it, "referrals.retryFailedOperationsDueToInvalidConnections");
    }
    if (auto it = json.if_contains("initialConnectionsPerPool")) {
        props.initialConnectionsPerPool = readCount(*it, "referrals.initialConnectionsPerPool");
    }
    if (auto it = json.if_contains("maximumConnectionsPerPool")) {
        props.maximumConnectionsPerPool = readCount(*it, "referrals.maximumConnectionsPerPool");
    }
    if (auto it = json.if_contains("connectTimeoutMillis")) {
        props.connectTimeout = readMillis(*it, "referrals.connectTimeoutMillis");
    }
    if (auto it = json.if_contains("healthCheckIntervalMillis")) {
        props.healthCheckInterval = readMillis(*it, "referrals.healthCheckIntervalMillis");
    }
    if (auto it = json.if_contains("backgroundThreadCheckIntervalMillis")) {
        props.backgroundThreadCheckInterval = readMillis(*it, "referrals.backgroundThreadCheckIntervalMillis");
    }
    if (auto it = json.if_contains("maximumConnectionAgeMillis")) {
        props.maximumConnectionAge = readMillis(*it, "referrals.maximumConnectionAgeMillis");
    }
    if (auto it = json.if_contains("maximumPoolAgeMillis")) {
        props.maximumPoolAge = readMillis(*it, "referrals.maximumPoolAgeMillis");
    }
    if (auto it = json.if_contains("maximumPoolIdleDurationMillis")) {
        props.maximumPoolIdleDuration = readMillis(*it, "referrals.maximumPoolIdleDurationMillis");
    }
    if (auto it = json.if_contains("ldapUrlSecurityType")) {
        auto name = readString(*it, "referrals.ldapUrlSecurityType");
        auto type = referral::parseSecurityType(name);
        if (!type) {
            throw std::invalid_argument("unknown ldapUrlSecurityType '" + name + "'");
        }
        props.ldapUrlSecurityType = *type;
    }
    if (auto it = json.if_contains("alternateLdapsPorts")) {
        if (!it->is_object()) {
            throw std::invalid_argument("referrals.alternateLdapsPorts must map \"host:port\" to a port");
        }
        for (const auto& entry : it->as_object()) {
            props.alternateLdapsPorts[model::parseEndpoint(std::string(entry.key()))] =
                readPort(entry.value(), "referrals.alternateLdapsPorts");
        }
    }
}

} // namespace

boost::json::value parseJson(const std::string& payload) {
    return boost::json::parse(payload);
}

ClientConfig loadConfig(const boost::json::object& json) {
    ClientConfig cfg;
    if (auto it = json.if_contains("servers")) {
        if (!it->is_array()) {
            throw std::invalid_argument("configuration field 'servers' must be an array");
        }
        for (const auto& item : it->as_array()) {
            cfg.servers.push_back(readEndpoint(item));
        }
    }
    if (auto it = json.if_contains("connectTimeoutMillis")) {
        cfg.serverSet.transport.connectTimeout = readMillis(*it, "connectTimeoutMillis");
        cfg.referrals.connectTimeout = cfg.serverSet.transport.connectTimeout;
    }
    if (auto it = json.if_contains("useTls")) cfg.serverSet.transport.useTls = readBool(*it, "useTls");
    if (auto it = json.if_contains("bindDn")) {
        connection::BindRequest bind;
        bind.bindDn = readString(*it, "bindDn");
        if (auto pw = json.if_contains("bindPassword")) bind.password = readString(*pw, "bindPassword");
        cfg.serverSet.bindRequest = std::move(bind);
    }
    if (auto it = json.if_contains("blacklistCheckIntervalMillis")) {
        cfg.serverSet.blacklistCheckInterval =
            it->is_string() ? std::string(it->as_string()) : std::to_string(readInt(*it, "blacklistCheckIntervalMillis"));
    }
    if (auto it = json.if_contains("referrals")) {
        if (!it->is_object()) {
            throw std::invalid_argument("configuration field 'referrals' must be an object");
        }
        loadReferrals(it->as_object(), cfg.referrals);
    }
    return cfg;
}

void applyEnvironment(ClientConfig& config) {
    if (const char* value = std::getenv("LDAPROUTE_SERVERS")) config.servers = parseServerList(value);
    if (const char* value = std::getenv("LDAPROUTE_CONNECT_TIMEOUT_MILLIS")) {
        auto millis = std::chrono::milliseconds(std::strtoll(value, nullptr, 10));
        if (millis.count() > 0) {
            config.serverSet.transport.connectTimeout = millis;
            config.referrals.connectTimeout = millis;
        }
    }
    if (const char* value = std::getenv("LDAPROUTE_BIND_DN")) {
        if (!config.serverSet.bindRequest) config.serverSet.bindRequest.emplace();
        config.serverSet.bindRequest->bindDn = value;
    }
    if (const char* value = std::getenv("LDAPROUTE_BIND_PASSWORD")) {
        if (!config.serverSet.bindRequest) config.serverSet.bindRequest.emplace();
        config.serverSet.bindRequest->password = value;
    }
    if (const char* value = std::getenv(serverset::kBlacklistIntervalVariable)) {
        config.serverSet.blacklistCheckInterval = std::string(value);
    }
}

ClientConfig loadConfigFile(const std::filesystem::path& path) {
    ClientConfig config;
    if (std::filesystem::exists(path)) {
        std::ifstream ifs(path);
        if (ifs.is_open()) {
            std::string content((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
            if (!content.empty()) {
                try {
                    auto json = parseJson(content);
                    if (json.is_object()) {
                        config = loadConfig(json.as_object());
                    } else {
                        util::log(util::LogLevel::warn, "ignoring " + path.string() + ": top level is not an object");
                    }
                } catch (const std::exception& ex) {
                    util::log(util::LogLevel::warn, "failed to load " + path.string() + ": " + ex.what());
                }
            }
        }
    }
    applyEnvironment(config);
    return config;
}

} // namespace ldaproute::config
