#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>
#include <QStringList>

#include "yee_codec.h"
#include "yee_errors.h"
#include "yee_model.h"

namespace yeectl {

class ControlChannel;

// One physical light: identity, last-known state and its control channels.
class Device : public QObject
{
    Q_OBJECT
public:
    explicit Device(const DeviceRecord &record, QObject *parent = nullptr);
    ~Device() override;

    QString id() const { return m_info.id; }
    const Info &info() const { return m_info; }
    const State &state() const { return m_state; }
    const DeviceAddress &address() const { return m_address; }

    ControlChannel *primaryChannel() const { return m_primary; }
    ControlChannel *sideChannel() const { return m_side; }
    bool hasSideChannel() const { return m_side != nullptr; }

    int sessionTag() const { return m_sessionTag; }
    qint64 requestCounter() const { return m_requestCounter; }

    // Sends a validated command over the active channel and returns its
    // request id, or 0 if the command is invalid. Owner thread only; calls
    // from other threads are refused with 0.
    qint64 communicate(const Command &command);

    // Installs an adopted side channel. The device takes ownership.
    void installSideChannel(ControlChannel *channel);
    void discardSideChannel();

    // Closes every channel of this device.
    void cancel();
    void flush();

    void setTraceCommunication(bool enabled);
    bool traceCommunication() const { return m_trace; }

    // Applies one decoded push; exposed for replay and tests.
    PushOutcome applyPush(const QJsonObject &properties);

signals:
    void stateChanged(const QStringList &keys);
    void propertyRejected(const QString &key, const QString &reason);
    void commandResult(qint64 requestId, const QStringList &results);
    void commandError(qint64 requestId, int code, const QString &message);
    void sideChannelChanged(bool present);
    // Undecodable lines and channel failures, tagged with their kind.
    void channelError(yeectl::ErrorKind kind, const QString &error);

private:
    qint64 nextRequestId();
    ControlChannel *channelFor(const Command &command) const;

    Info m_info;
    State m_state;
    DeviceAddress m_address;
    ControlChannel *m_primary = nullptr;
    ControlChannel *m_side = nullptr;
    int m_sessionTag = 0;
    qint64 m_requestCounter = 0;
    bool m_trace = false;
};

} // namespace yeectl
