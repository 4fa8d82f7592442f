#pragma once

#include <QAbstractSocket>
#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QJsonObject>
#include <QMutex>
#include <QObject>
#include <QStringList>

#include "yee_model.h"

class QTcpSocket;

namespace yeectl {

// Requests without a reply after this long are no longer tracked.
constexpr int kDefaultPendingExpiryMs = 30000;

// One TCP session to a device. Either dials the device or adopts an
// already-accepted inbound socket; both share the same state machine.
class ControlChannel : public QObject
{
    Q_OBJECT
public:
    enum class Status {
        Setup,
        Preparing,
        Ready,
        Waiting,
        Failed,
        Cancelled,
    };
    Q_ENUM(Status)

    ControlChannel(const DeviceAddress &remote, bool receiveLoop, QObject *parent = nullptr);
    // Takes ownership of an accepted socket.
    ControlChannel(QTcpSocket *accepted, bool receiveLoop, QObject *parent = nullptr);
    ~ControlChannel() override;

    Status status() const { return m_status; }
    bool isTerminal() const { return m_status == Status::Failed || m_status == Status::Cancelled; }
    bool receiveLoopActive() const { return m_receiving; }

    DeviceAddress remoteAddress() const { return m_remote; }
    QHostAddress localAddress() const { return m_localAddress; }
    quint16 localPort() const { return m_localPort; }

    // Best effort; transport failures surface through failed().
    // A non-zero requestId is tracked until its reply arrives.
    void send(const QByteArray &payload, qint64 requestId = 0);

    void close();

    // Hands buffered bytes to the OS without waiting for the event loop.
    void flush();

    // Blocks the caller in a local event loop until Ready or a terminal state.
    bool waitForReady(int timeoutMs);

    int pendingRequestCount() const;
    bool isPending(qint64 requestId) const;
    void setPendingExpiry(int ms) { m_pendingExpiryMs = ms; }

    static QString statusName(Status status);

signals:
    void ready();
    void cancelled();
    void failed(const QString &error);
    void statusChanged(yeectl::ControlChannel::Status status);

    void resultReceived(qint64 requestId, const QStringList &results);
    void errorReceived(qint64 requestId, int code, const QString &message);
    void propertiesPushed(const QJsonObject &properties);
    void decodeFailed(const QString &error, const QByteArray &line);

private slots:
    void onSocketStateChanged(QAbstractSocket::SocketState state);
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();
    void onBytesWritten();

private:
    void attachSocket();
    void setStatus(Status status);
    void enterReady();
    void enterFailed(const QString &error);
    void stopReceiveLoop();
    void dispatchLine(const QByteArray &line);
    void writeNow(const QByteArray &payload, qint64 requestId);
    void expirePending(qint64 now);

    QTcpSocket *m_socket = nullptr;
    DeviceAddress m_remote;
    QHostAddress m_localAddress;
    quint16 m_localPort = 0;
    Status m_status = Status::Setup;
    bool m_wantReceiveLoop = false;
    bool m_receiving = false;
    bool m_readyOnce = false;
    QByteArray m_readBuffer;

    mutable QMutex m_pendingMutex;
    QHash<qint64, qint64> m_pendingSince;
    int m_pendingExpiryMs = kDefaultPendingExpiryMs;
};

} // namespace yeectl
