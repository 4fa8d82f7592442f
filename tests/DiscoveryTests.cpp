// DiscoveryTests.cpp
// Search round trips against a loopback advertiser under both stop policies.

#include <gtest/gtest.h>

#include <QElapsedTimer>

#include "fake_bulb.h"
#include "yee_address.h"
#include "yee_discovery.h"

using namespace yeectl;
using namespace yeectl::fakes;

class DiscoveryTest : public ::testing::Test {
protected:
    DiscoveryTarget target() const { return {advertiser_.address(), advertiser_.port()}; }

    QByteArray reply(const QString &id) const
    {
        return advertisement(id, QHostAddress(QHostAddress::LocalHost), 55443);
    }

    FixedAddressResolver resolver_{QHostAddress(QHostAddress::LocalHost)};
    FakeAdvertiser advertiser_;
};

TEST(DiscoveryMessageTest, SearchMessageIsExact)
{
    EXPECT_EQ(DiscoveryEngine::searchMessage(),
              QByteArrayLiteral("M-SEARCH * HTTP/1.1\r\nHOST: 239.255.255.250:1982\r\nMAN: \"ssdp:discover\"\r\n"
                                "ST: wifi_bulb"));
}

TEST(DiscoveryMessageTest, DefaultTargetIsMulticastGroup)
{
    const DiscoveryTarget target;
    EXPECT_EQ(target.group, QHostAddress(QStringLiteral("239.255.255.250")));
    EXPECT_EQ(target.port, 1982);
}

TEST_F(DiscoveryTest, MissingLocalAddressIsSetupFailure)
{
    const FixedAddressResolver none(std::nullopt);
    const DiscoveryEngine engine(none, target());

    const DiscoveryResult result = engine.search(DiscoveryPolicy::collectForDuration(100));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::SetupFailure);
    EXPECT_TRUE(result.payloads.isEmpty());
}

TEST_F(DiscoveryTest, UnbindableAddressIsSetupFailure)
{
    // TEST-NET-1 is never assigned to a local interface.
    const FixedAddressResolver foreign(QHostAddress(QStringLiteral("192.0.2.1")));
    const DiscoveryEngine engine(foreign, target());

    const DiscoveryResult result = engine.search(DiscoveryPolicy::collectExactly(1, 100));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::SetupFailure);
}

TEST_F(DiscoveryTest, SearchReachesTarget)
{
    const DiscoveryEngine engine(resolver_, target());
    const DiscoveryResult result = engine.search(DiscoveryPolicy::collectForDuration(150));

    ASSERT_TRUE(result.ok);
    ASSERT_EQ(advertiser_.searches().size(), 1);
    EXPECT_EQ(advertiser_.searches().first(), DiscoveryEngine::searchMessage());
    EXPECT_TRUE(result.payloads.isEmpty());
}

TEST_F(DiscoveryTest, CollectExactlyStopsAtQuota)
{
    advertiser_.addReply(reply(QStringLiteral("0x01")));
    advertiser_.addReply(reply(QStringLiteral("0x02")));
    advertiser_.addReply(reply(QStringLiteral("0x03")));

    const DiscoveryEngine engine(resolver_, target());
    QElapsedTimer clock;
    clock.start();
    const DiscoveryResult result = engine.search(DiscoveryPolicy::collectExactly(2, 3000));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payloads.size(), 2);
    EXPECT_TRUE(result.quotaReached);
    EXPECT_LT(clock.elapsed(), 2000);
}

TEST_F(DiscoveryTest, CollectExactlyKeepsPartialResultsAtCeiling)
{
    advertiser_.addReply(reply(QStringLiteral("0x01")));
    advertiser_.addReply(reply(QStringLiteral("0x02")), 50);

    const DiscoveryEngine engine(resolver_, target());
    const DiscoveryResult result = engine.search(DiscoveryPolicy::collectExactly(5, 300));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payloads.size(), 2);
    EXPECT_FALSE(result.quotaReached);
}

TEST_F(DiscoveryTest, CollectExactlyZeroReturnsImmediately)
{
    advertiser_.addReply(reply(QStringLiteral("0x01")));

    const DiscoveryEngine engine(resolver_, target());
    const DiscoveryResult result = engine.search(DiscoveryPolicy::collectExactly(0, 3000));

    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.payloads.isEmpty());
    EXPECT_TRUE(advertiser_.searches().isEmpty());
}

TEST_F(DiscoveryTest, CollectForDurationKeepsEveryReplyInWindow)
{
    advertiser_.addReply(reply(QStringLiteral("0x01")));
    advertiser_.addReply(reply(QStringLiteral("0x02")), 40);
    advertiser_.addReply(reply(QStringLiteral("0x03")), 80);
    advertiser_.addReply(reply(QStringLiteral("0x04")), 120);

    const DiscoveryEngine engine(resolver_, target());
    QElapsedTimer clock;
    clock.start();
    const DiscoveryResult result = engine.search(DiscoveryPolicy::collectForDuration(400));

    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.payloads.size(), 4);
    EXPECT_EQ(result.dropped, 0);
    EXPECT_GE(clock.elapsed(), 350);
}

TEST_F(DiscoveryTest, RepliesAfterWindowAreNotCollected)
{
    advertiser_.addReply(reply(QStringLiteral("0x01")));
    advertiser_.addReply(reply(QStringLiteral("0x02")), 600);

    const DiscoveryEngine engine(resolver_, target());
    const DiscoveryResult result = engine.search(DiscoveryPolicy::collectForDuration(200));

    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.payloads.size(), 1);
    EXPECT_TRUE(result.payloads.first().contains("id: 0x01"));
}
