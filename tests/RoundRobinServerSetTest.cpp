#include "MockDirectory.hpp"

#include "ldaproute/serverset/RoundRobinServerSet.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace ldaproute::serverset {
namespace {

using namespace std::chrono_literals;
using connection::ConnectError;
using connection::ResultCode;
using mock::MockConnection;
using mock::MockConnectionFactory;
using mock::MockDirectory;

ServerSetOptions withBlacklistInterval(const char* setting) {
    ServerSetOptions options;
    options.blacklistCheckInterval = setting;
    return options;
}

class RoundRobinServerSetTest : public ::testing::Test {
protected:
    std::string endpointOf(RoundRobinServerSet& set) {
        return set.getConnection()->endpoint().toString();
    }

    std::shared_ptr<MockDirectory> directory_ = std::make_shared<MockDirectory>();
    std::shared_ptr<MockConnectionFactory> factory_ = std::make_shared<MockConnectionFactory>(directory_);
    model::Endpoint e0_{"ds0.example.com", 389};
    model::Endpoint e1_{"ds1.example.com", 1389};
    model::Endpoint e2_{"ds2.example.com", 389};
};

TEST_F(RoundRobinServerSetTest, RotatesThroughHealthyEndpoints) {
    RoundRobinServerSet set{{e0_, e1_}, factory_, withBlacklistInterval("0")};
    EXPECT_EQ(endpointOf(set), e0_.toString());
    EXPECT_EQ(endpointOf(set), e1_.toString());
    EXPECT_EQ(endpointOf(set), e0_.toString());
    EXPECT_EQ(endpointOf(set), e1_.toString());
}

TEST_F(RoundRobinServerSetTest, UnreachableEndpointIsSkippedWithoutBlacklist) {
    RoundRobinServerSet set{{e0_, e1_}, factory_, withBlacklistInterval("0")};
    ASSERT_EQ(set.getBlacklistManager(), nullptr);
    directory_->setDown(e0_);

    EXPECT_EQ(endpointOf(set), e1_.toString());
    EXPECT_EQ(endpointOf(set), e1_.toString());
    EXPECT_EQ(endpointOf(set), e1_.toString());
    EXPECT_EQ(directory_->attemptsTo(e0_), 2u);

    directory_->setDown(e0_, false);
    EXPECT_EQ(endpointOf(set), e1_.toString());
    EXPECT_EQ(endpointOf(set), e0_.toString());
}

TEST_F(RoundRobinServerSetTest, BlacklistedEndpointIsNotRetriedUntilRecheck) {
    RoundRobinServerSet set{{e0_, e1_, e2_}, factory_, withBlacklistInterval("3600000")};
    auto* blacklist = set.getBlacklistManager();
    ASSERT_NE(blacklist, nullptr);
    directory_->setDown(e1_);

    EXPECT_EQ(endpointOf(set), e0_.toString());
    EXPECT_EQ(endpointOf(set), e2_.toString());
    EXPECT_TRUE(blacklist->isBlacklisted(e1_));
    EXPECT_EQ(endpointOf(set), e2_.toString());
    EXPECT_EQ(endpointOf(set), e0_.toString());
    EXPECT_EQ(endpointOf(set), e2_.toString());
    EXPECT_EQ(directory_->attemptsTo(e1_), 1u);

    directory_->setDown(e1_, false);
    blacklist->checkBlacklistedServers();
    EXPECT_FALSE(blacklist->isBlacklisted(e1_));
    EXPECT_EQ(endpointOf(set), e2_.toString());
    EXPECT_EQ(endpointOf(set), e0_.toString());
    EXPECT_EQ(endpointOf(set), e1_.toString());
}

TEST_F(RoundRobinServerSetTest, BlacklistedEndpointsAreTriedWhenAllAreListed) {
    RoundRobinServerSet set{{e0_, e1_}, factory_, withBlacklistInterval("3600000")};
    directory_->setDown(e0_);
    directory_->setDown(e1_);
    EXPECT_THROW(set.getConnection(), ConnectError);
    EXPECT_TRUE(set.getBlacklistManager()->allBlacklisted(set.endpoints()));

    directory_->setDown(e1_, false);
    EXPECT_EQ(endpointOf(set), e1_.toString());
}

TEST_F(RoundRobinServerSetTest, ExhaustionCarriesTheLastFailure) {
    RoundRobinServerSet set{{e0_, e1_}, factory_, withBlacklistInterval("0")};
    directory_->setDown(e0_);
    directory_->setDown(e1_);
    try {
        set.getConnection();
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& ex) {
        EXPECT_EQ(ex.resultCode(), ResultCode::connectError);
        EXPECT_EQ(ex.cause(), ResultCode::connectError);
        EXPECT_EQ(ex.endpoint(), e1_);
    }
}

TEST_F(RoundRobinServerSetTest, FailedBindCountsAsEndpointFailure) {
    directory_->addCredentials("cn=app,dc=example,dc=com", "secret");
    ServerSetOptions options = withBlacklistInterval("3600000");
    options.bindRequest = connection::BindRequest{"cn=app,dc=example,dc=com", "secret"};
    RoundRobinServerSet set{{e0_, e1_}, factory_, options};

    auto bound = set.getConnection();
    auto* mock = dynamic_cast<MockConnection*>(bound.get());
    ASSERT_NE(mock, nullptr);
    EXPECT_EQ(mock->boundAs(), "cn=app,dc=example,dc=com");

    connection::BindRequest wrong{"cn=app,dc=example,dc=com", "nope"};
    try {
        set.getConnection(&wrong);
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& ex) {
        EXPECT_EQ(ex.cause(), ResultCode::invalidCredentials);
    }
    EXPECT_TRUE(set.getBlacklistManager()->allBlacklisted(set.endpoints()));
    EXPECT_EQ(directory_->liveCount(), 1);
}

TEST_F(RoundRobinServerSetTest, UnexpectedFactoryErrorCountsAsEndpointFailure) {
    RoundRobinServerSet set{{e0_, e1_}, factory_, withBlacklistInterval("3600000")};
    directory_->setFaulty(e0_);

    EXPECT_EQ(endpointOf(set), e1_.toString());
    EXPECT_TRUE(set.getBlacklistManager()->isBlacklisted(e0_));

    directory_->setFaulty(e1_);
    try {
        set.getConnection();
        FAIL() << "expected ConnectError";
    } catch (const ConnectError& ex) {
        EXPECT_EQ(ex.cause(), ResultCode::connectError);
        EXPECT_EQ(ex.endpoint(), e0_);
    }
    EXPECT_TRUE(set.getBlacklistManager()->allBlacklisted(set.endpoints()));
}

TEST_F(RoundRobinServerSetTest, IntervalSettingControlsBlacklistManager) {
    RoundRobinServerSet disabled{{e0_}, factory_, withBlacklistInterval("0")};
    EXPECT_EQ(disabled.getBlacklistManager(), nullptr);
    EXPECT_NE(disabled.toString().find("disabled"), std::string::npos);

    RoundRobinServerSet fallback{{e0_}, factory_, withBlacklistInterval("abc")};
    ASSERT_NE(fallback.getBlacklistManager(), nullptr);
    EXPECT_EQ(fallback.getBlacklistManager()->checkInterval(), kDefaultBlacklistCheckInterval);

    RoundRobinServerSet explicitInterval{{e0_}, factory_, withBlacklistInterval("1234")};
    ASSERT_NE(explicitInterval.getBlacklistManager(), nullptr);
    EXPECT_EQ(explicitInterval.getBlacklistManager()->checkInterval(), 1234ms);
}

TEST_F(RoundRobinServerSetTest, IntervalFallsBackToEnvironment) {
    ::setenv(kBlacklistIntervalVariable, "0", 1);
    RoundRobinServerSet disabled{{e0_}, factory_};
    EXPECT_EQ(disabled.getBlacklistManager(), nullptr);

    ::setenv(kBlacklistIntervalVariable, "4321", 1);
    RoundRobinServerSet enabled{{e0_}, factory_};
    ::unsetenv(kBlacklistIntervalVariable);
    ASSERT_NE(enabled.getBlacklistManager(), nullptr);
    EXPECT_EQ(enabled.getBlacklistManager()->checkInterval(), 4321ms);

    RoundRobinServerSet unset{{e0_}, factory_};
    EXPECT_EQ(unset.getBlacklistManager(), nullptr);
}

TEST_F(RoundRobinServerSetTest, SharedBlacklistSurvivesClose) {
    auto shared = std::make_shared<BlacklistManager>(factory_, connection::TransportOptions{}, 1h);
    {
        RoundRobinServerSet set{{e0_, e1_}, factory_, ServerSetOptions{}, shared};
        EXPECT_EQ(set.getBlacklistManager(), shared.get());
        set.close();
    }
    EXPECT_FALSE(shared->isClosed());

    RoundRobinServerSet owner{{e0_}, factory_, withBlacklistInterval("60000")};
    auto* owned = owner.getBlacklistManager();
    owner.close();
    owner.close();
    EXPECT_TRUE(owned->isClosed());
}

TEST_F(RoundRobinServerSetTest, RejectsInvalidConstruction) {
    EXPECT_THROW(RoundRobinServerSet({}, factory_, withBlacklistInterval("0")), std::invalid_argument);
    EXPECT_THROW(RoundRobinServerSet({e0_}, nullptr, withBlacklistInterval("0")), std::invalid_argument);
}

TEST_F(RoundRobinServerSetTest, FollowsServersGoingDownAndComingBack) {
    model::Endpoint h1{"h1.example.com", 389};
    model::Endpoint h2{"h2.example.com", 1389};
    for (const char* interval : {"0", "3600000"}) {
        SCOPED_TRACE(interval);
        auto directory = std::make_shared<MockDirectory>();
        RoundRobinServerSet set{{h1, h2}, std::make_shared<MockConnectionFactory>(directory),
                                withBlacklistInterval(interval)};

        directory->setDown(h1);
        EXPECT_EQ(endpointOf(set), h2.toString());
        EXPECT_EQ(endpointOf(set), h2.toString());

        directory->setDown(h1, false);
        directory->setDown(h2);
        EXPECT_EQ(endpointOf(set), h1.toString());

        directory->setDown(h1);
        EXPECT_THROW(set.getConnection(), ConnectError);
    }
}

TEST_F(RoundRobinServerSetTest, ConcurrentCallersShareTheRotation) {
    RoundRobinServerSet set{{e0_, e1_}, factory_, withBlacklistInterval("0")};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&set]() {
            for (int i = 0; i < 50; ++i) {
                set.getConnection();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(directory_->attemptsTo(e0_), 100u);
    EXPECT_EQ(directory_->attemptsTo(e1_), 100u);
}

} // namespace
} // namespace ldaproute::serverset
