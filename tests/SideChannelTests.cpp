// SideChannelTests.cpp
// Rendezvous negotiation: matching callback, wrong peer, timeout and teardown.

#include <gtest/gtest.h>

#include <memory>

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QTcpServer>

#include "fake_bulb.h"
#include "yee_channel.h"
#include "yee_device.h"
#include "yee_sidechannel.h"

using namespace yeectl;
using namespace yeectl::fakes;

class SideChannelTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        DeviceRecord record;
        record.info.id = QStringLiteral("0x1a2b");
        record.address = {bulb_.address(), bulb_.port()};
        device_ = std::make_unique<Device>(record);
        ASSERT_TRUE(device_->primaryChannel()->waitForReady(2000));
    }

    NegotiationResult activate(int timeoutMs = 1000)
    {
        SideChannelNegotiator negotiator(timeoutMs);
        const NegotiationResult result = negotiator.activate(*device_);
        lastState_ = negotiator.state();
        return result;
    }

    FakeBulb bulb_;
    std::unique_ptr<Device> device_;
    SideChannelNegotiator::State lastState_ = SideChannelNegotiator::State::Idle;
};

TEST_F(SideChannelTest, MatchingCallbackBecomesSideChannel)
{
    const NegotiationResult result = activate();
    ASSERT_TRUE(result.ok) << result.error.toStdString();
    EXPECT_EQ(lastState_, SideChannelNegotiator::State::Matched);
    EXPECT_EQ(result.rejectedPeers, 0);

    ASSERT_TRUE(device_->hasSideChannel());
    EXPECT_EQ(device_->sideChannel()->status(), ControlChannel::Status::Ready);
    EXPECT_FALSE(device_->sideChannel()->receiveLoopActive());

    ASSERT_EQ(bulb_.methods(), QStringList{QStringLiteral("set_music")});
    const QJsonArray params = bulb_.requests().first().value(QStringLiteral("params")).toArray();
    EXPECT_EQ(params, (QJsonArray{1, QStringLiteral("127.0.0.1"), result.listenerPort}));
}

TEST_F(SideChannelTest, CommandsTravelOnSideChannelOnceMatched)
{
    ASSERT_TRUE(activate().ok);

    device_->communicate(setBrightness(30, Effect::Sudden, 30));
    ASSERT_TRUE(spinUntil([this]() { return bulb_.sideRequests().size() == 1; }, 2000));
    EXPECT_EQ(bulb_.sideRequests().first().value(QStringLiteral("method")).toString(), QStringLiteral("set_bright"));
    EXPECT_EQ(bulb_.requests().size(), 1);
    EXPECT_EQ(device_->sideChannel()->pendingRequestCount(), 0);
}

TEST_F(SideChannelTest, DeactivationTravelsOnPrimary)
{
    ASSERT_TRUE(activate().ok);

    SideChannelNegotiator negotiator;
    EXPECT_NE(negotiator.deactivate(*device_), 0);
    ASSERT_TRUE(spinUntil([this]() { return bulb_.requests().size() == 2; }, 2000));
    EXPECT_EQ(bulb_.requests().last().value(QStringLiteral("params")).toArray(), QJsonArray{0});
    EXPECT_TRUE(bulb_.sideRequests().isEmpty());
}

TEST_F(SideChannelTest, SideModeOffPushDiscardsChannel)
{
    ASSERT_TRUE(activate().ok);

    QJsonObject push;
    push.insert(QStringLiteral("music_on"), 0);
    bulb_.push(push);
    ASSERT_TRUE(spinUntil([this]() { return !device_->hasSideChannel(); }, 2000));

    device_->communicate(stopColorFlow());
    ASSERT_TRUE(spinUntil([this]() { return bulb_.requests().size() == 2; }, 2000));
    EXPECT_EQ(bulb_.requests().last().value(QStringLiteral("method")).toString(), QStringLiteral("stop_cf"));
}

TEST_F(SideChannelTest, FailedSideChannelIsDiscarded)
{
    QList<bool> presence;
    QObject::connect(device_.get(), &Device::sideChannelChanged,
                     [&presence](bool present) { presence.append(present); });
    ASSERT_TRUE(activate().ok);
    ASSERT_TRUE(spinUntil([this]() { return bulb_.sideConnected(); }, 1000));

    bulb_.dropSideConnection();
    EXPECT_TRUE(spinUntil([this]() { return !device_->hasSideChannel(); }, 2000));
    EXPECT_EQ(device_->primaryChannel()->status(), ControlChannel::Status::Ready);
    EXPECT_EQ(presence, (QList<bool>{true, false}));
}

TEST_F(SideChannelTest, TimeoutLeavesPrimaryUntouched)
{
    bulb_.setCallbackEnabled(false);

    const NegotiationResult result = activate(200);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::NegotiationTimeout);
    EXPECT_EQ(lastState_, SideChannelNegotiator::State::TimedOut);
    EXPECT_FALSE(device_->hasSideChannel());
    EXPECT_EQ(device_->primaryChannel()->status(), ControlChannel::Status::Ready);
}

TEST_F(SideChannelTest, WrongPeerAloneEndsInTimeout)
{
    bulb_.setCallbackSource(QHostAddress(QStringLiteral("127.0.0.2")));

    const NegotiationResult result = activate(400);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::NegotiationTimeout);
    EXPECT_EQ(result.rejectedPeers, 1);
    EXPECT_FALSE(device_->hasSideChannel());
}

TEST_F(SideChannelTest, ListenerKeepsWaitingPastWrongPeer)
{
    bulb_.setStrayCallbackSource(QHostAddress(QStringLiteral("127.0.0.2")));

    const NegotiationResult result = activate(2000);
    ASSERT_TRUE(result.ok) << result.error.toStdString();
    EXPECT_EQ(result.rejectedPeers, 1);
    EXPECT_EQ(lastState_, SideChannelNegotiator::State::Matched);
    ASSERT_TRUE(device_->hasSideChannel());
    EXPECT_EQ(device_->sideChannel()->remoteAddress().host, QHostAddress(QHostAddress::LocalHost));

    device_->communicate(setBrightness(60, Effect::Sudden, 30));
    EXPECT_TRUE(spinUntil([this]() { return bulb_.sideRequests().size() == 1; }, 2000));
}

TEST_F(SideChannelTest, SecondActivationIsRefused)
{
    ASSERT_TRUE(activate().ok);

    const NegotiationResult again = activate();
    EXPECT_FALSE(again.ok);
    EXPECT_EQ(again.errorKind, ErrorKind::AlreadyActive);
    EXPECT_EQ(lastState_, SideChannelNegotiator::State::Failed);
    EXPECT_EQ(bulb_.requests().size(), 1);
}

TEST(SideChannelSetupTest, UnreachablePrimaryIsNotReady)
{
    QTcpServer scratch;
    ASSERT_TRUE(scratch.listen(QHostAddress::LocalHost, 0));
    const quint16 port = scratch.serverPort();
    scratch.close();

    DeviceRecord record;
    record.info.id = QStringLiteral("0xdead");
    record.address = {QHostAddress(QHostAddress::LocalHost), port};
    Device device(record);

    SideChannelNegotiator negotiator(200, 500);
    const NegotiationResult result = negotiator.activate(device);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.errorKind, ErrorKind::NotReady);
    EXPECT_FALSE(device.hasSideChannel());
}
