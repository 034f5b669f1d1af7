#include "ldaproute/config/ConfigLoader.hpp"
#include "ldaproute/connection/AsioConnection.hpp"
#include "ldaproute/model/LdapUrl.hpp"
#include "ldaproute/referral/PooledReferralConnector.hpp"
#include "ldaproute/serverset/RoundRobinServerSet.hpp"
#include "ldaproute/util/Logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace {
    using namespace ldaproute;

    void printBlacklist(const serverset::RoundRobinServerSet& serverSet) {
        auto* blacklist = serverSet.getBlacklistManager();
        if (blacklist == nullptr) {
            std::cout << "blacklist: disabled" << std::endl;
            return;
        }
        std::cout << "blacklist:";
        for (const auto& endpoint : blacklist->getBlacklistedEndpoints()) {
            std::cout << ' ' << endpoint.toString();
        }
        std::cout << std::endl;
    }

    void printRegistry(const referral::PooledReferralConnector& connector) {
        for (const auto& [hostPort, pools] : connector.getPoolsByHostPort()) {
            for (const auto& snapshot : pools) {
                std::cout << hostPort << ' ' << snapshot.key.transportName()
                          << " total=" << snapshot.totalConnections
                          << " available=" << snapshot.availableConnections
                          << " max=" << snapshot.maximumConnections << std::endl;
            }
        }
    }
} // namespace

int main(int argc, char** argv) {
    using namespace ldaproute;
    util::initLoggingFromEnvironment(util::LogLevel::info);

    std::filesystem::path configPath = argc > 1 ? argv[1] : "ldaproute.json";
    unsigned long count = argc > 2 ? std::strtoul(argv[2], nullptr, 10) : 1;
    std::string referralUrl = argc > 3 ? argv[3] : "";

    try {
        auto config = config::loadConfigFile(configPath);
        if (config.servers.empty()) {
            util::log(util::LogLevel::error, "no servers configured in " + configPath.string() + " or LDAPROUTE_SERVERS");
            return 2;
        }

        auto factory = std::make_shared<connection::AsioConnectionFactory>();
        serverset::RoundRobinServerSet serverSet{config.servers, factory, config.serverSet};
        util::log(util::LogLevel::info, serverSet.toString());

        std::unique_ptr<connection::Connection> last;
        for (unsigned long i = 0; i < count; ++i) {
            try {
                auto connection = serverSet.getConnection();
                std::cout << "connection " << i << ": " << connection->endpoint().toString() << std::endl;
                if (last) {
                    last->close();
                }
                last = std::move(connection);
            } catch (const connection::ConnectError& ex) {
                std::cout << "connection " << i << ": failed (" << ex.what() << ")" << std::endl;
            }
        }
        printBlacklist(serverSet);

        int status = 0;
        if (!referralUrl.empty()) {
            if (!last) {
                util::log(util::LogLevel::error, "no source connection available to follow " + referralUrl);
                status = 1;
            } else {
                referral::PooledReferralConnector connector{factory, config.referrals};
                try {
                    auto referral = connector.getReferralConnection(model::LdapUrl{referralUrl}, *last);
                    std::cout << "referral: " << referral->endpoint().toString()
                              << (referral->isSecure() ? " (secure)" : "") << std::endl;
                } catch (const connection::LdapException& ex) {
                    std::cout << "referral: failed (" << connection::resultCodeName(ex.resultCode()) << ": "
                              << ex.what() << ")" << std::endl;
                    status = 1;
                }
                printRegistry(connector);
                connector.close();
            }
        }

        if (last) {
            last->close();
        }
        serverSet.close();
        return status;
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"ldaproute-probe: "} + ex.what());
        return 2;
    }
}
