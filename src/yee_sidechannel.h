#pragma once

#include <QString>

#include "yee_errors.h"

namespace yeectl {

class Device;

constexpr int kDefaultNegotiationTimeoutMs = 1000;
constexpr int kDefaultPrimaryReadyTimeoutMs = 2000;

struct NegotiationResult {
    bool ok = false;
    ErrorKind errorKind = ErrorKind::None;
    QString error;
    quint16 listenerPort = 0;
    // Connections from peers other than the target device.
    int rejectedPeers = 0;
};

// Opens a rendezvous listener, hands the device its address over the
// primary channel and adopts the device's callback connection as a
// reply-free side channel.
class SideChannelNegotiator
{
public:
    enum class State {
        Idle,
        ListenerStarted,
        Matched,
        TimedOut,
        Failed,
    };

    explicit SideChannelNegotiator(int timeoutMs = kDefaultNegotiationTimeoutMs,
                                   int primaryReadyTimeoutMs = kDefaultPrimaryReadyTimeoutMs);

    NegotiationResult activate(Device &device);

    // The device drops the side connection itself; the resulting push
    // discards the channel. Returns the request id.
    qint64 deactivate(Device &device) const;

    State state() const { return m_state; }

    static QString stateName(State state);

private:
    NegotiationResult fail(ErrorKind kind, const QString &error);

    int m_timeoutMs = kDefaultNegotiationTimeoutMs;
    int m_primaryReadyTimeoutMs = kDefaultPrimaryReadyTimeoutMs;
    State m_state = State::Idle;
};

} // namespace yeectl
