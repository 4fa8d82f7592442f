#include "yee_channel.h"

#include <QDateTime>
#include <QEventLoop>
#include <QMetaObject>
#include <QMutexLocker>
#include <QPointer>
#include <QTcpSocket>
#include <QThread>
#include <QTimer>

#include "yee_codec.h"
#include "yee_logging.h"

namespace yeectl {

namespace {

bool isRecoverable(QAbstractSocket::SocketError error)
{
    switch (error) {
    case QAbstractSocket::SocketTimeoutError:
    case QAbstractSocket::TemporaryError:
        return true;
    default:
        return false;
    }
}

} // namespace

ControlChannel::ControlChannel(const DeviceAddress &remote, bool receiveLoop, QObject *parent)
    : QObject(parent)
    , m_socket(new QTcpSocket(this))
    , m_remote(remote)
    , m_wantReceiveLoop(receiveLoop)
{
    attachSocket();
    qCDebug(channelLog) << "ControlChannel dialing" << m_remote.toString();
    m_socket->connectToHost(m_remote.host, m_remote.port);
}

ControlChannel::ControlChannel(QTcpSocket *accepted, bool receiveLoop, QObject *parent)
    : QObject(parent)
    , m_socket(accepted)
    , m_wantReceiveLoop(receiveLoop)
{
    m_socket->setParent(this);
    m_remote.host = m_socket->peerAddress();
    m_remote.port = m_socket->peerPort();
    attachSocket();
    qCDebug(channelLog) << "ControlChannel adopted connection from" << m_remote.toString();

    if (m_socket->state() == QAbstractSocket::ConnectedState) {
        setStatus(Status::Preparing);
        enterReady();
    } else {
        enterFailed(QStringLiteral("adopted socket is not connected"));
    }
}

ControlChannel::~ControlChannel()
{
    if (m_socket) {
        m_socket->disconnect(this);
        m_socket->abort();
    }
}

QString ControlChannel::statusName(Status status)
{
    switch (status) {
    case Status::Setup:
        return QStringLiteral("setup");
    case Status::Preparing:
        return QStringLiteral("preparing");
    case Status::Ready:
        return QStringLiteral("ready");
    case Status::Waiting:
        return QStringLiteral("waiting");
    case Status::Failed:
        return QStringLiteral("failed");
    case Status::Cancelled:
        return QStringLiteral("cancelled");
    }
    return QStringLiteral("unknown");
}

void ControlChannel::attachSocket()
{
    connect(m_socket, &QAbstractSocket::stateChanged, this, &ControlChannel::onSocketStateChanged);
    connect(m_socket, &QAbstractSocket::errorOccurred, this, &ControlChannel::onSocketError);
    connect(m_socket, &QIODevice::bytesWritten, this, &ControlChannel::onBytesWritten);
}

void ControlChannel::setStatus(Status status)
{
    if (m_status == status)
        return;
    m_status = status;
    emit statusChanged(status);
}

void ControlChannel::enterReady()
{
    if (isTerminal())
        return;

    setStatus(Status::Ready);

    if (!m_readyOnce) {
        m_readyOnce = true;
        m_localAddress = m_socket->localAddress();
        m_localPort = m_socket->localPort();
        if (m_localAddress.isNull())
            qCWarning(channelLog) << "ControlChannel: cannot establish local address for" << m_remote.toString();
        qCInfo(channelLog) << m_remote.toString() << "ready, local" << m_localAddress.toString() << m_localPort;

        if (m_wantReceiveLoop) {
            m_receiving = true;
            connect(m_socket, &QIODevice::readyRead, this, &ControlChannel::onReadyRead);
            if (m_socket->bytesAvailable() > 0)
                onReadyRead();
        }
    }

    emit ready();
}

void ControlChannel::enterFailed(const QString &error)
{
    if (isTerminal())
        return;

    stopReceiveLoop();
    qCWarning(channelLog).noquote() << m_remote.toString() << "connection failed with error:" << error;
    setStatus(Status::Failed);
    {
        QMutexLocker locker(&m_pendingMutex);
        m_pendingSince.clear();
    }
    emit failed(error);
}

void ControlChannel::stopReceiveLoop()
{
    if (!m_receiving)
        return;
    m_receiving = false;
    disconnect(m_socket, &QIODevice::readyRead, this, &ControlChannel::onReadyRead);
}

void ControlChannel::onSocketStateChanged(QAbstractSocket::SocketState state)
{
    if (isTerminal())
        return;

    switch (state) {
    case QAbstractSocket::HostLookupState:
    case QAbstractSocket::ConnectingState:
        if (m_status == Status::Setup)
            setStatus(Status::Preparing);
        break;
    case QAbstractSocket::ConnectedState:
        enterReady();
        break;
    case QAbstractSocket::UnconnectedState:
        if (m_status != Status::Setup)
            enterFailed(m_socket->error() == QAbstractSocket::UnknownSocketError
                            ? QStringLiteral("connection closed")
                            : m_socket->errorString());
        break;
    default:
        break;
    }
}

void ControlChannel::onSocketError(QAbstractSocket::SocketError error)
{
    if (isTerminal())
        return;

    if (m_receiving) {
        qCWarning(channelLog).noquote() << "Conn receive error:" << m_remote.toString() << m_socket->errorString();
        stopReceiveLoop();
    }

    if (isRecoverable(error) && m_socket->state() != QAbstractSocket::UnconnectedState) {
        qCInfo(channelLog).noquote() << m_remote.toString() << "waiting with error:" << m_socket->errorString();
        setStatus(Status::Waiting);
        return;
    }

    enterFailed(m_socket->errorString());
}

void ControlChannel::onBytesWritten()
{
    if (m_status == Status::Waiting && m_socket->state() == QAbstractSocket::ConnectedState)
        enterReady();
}

void ControlChannel::onReadyRead()
{
    if (!m_receiving)
        return;

    m_readBuffer.append(m_socket->readAll());

    qsizetype newline = m_readBuffer.indexOf('\n');
    while (newline >= 0) {
        const QByteArray line = m_readBuffer.left(newline).trimmed();
        m_readBuffer.remove(0, newline + 1);
        if (!line.isEmpty())
            dispatchLine(line);
        // A handler may have closed the channel.
        if (!m_receiving)
            return;
        newline = m_readBuffer.indexOf('\n');
    }

    if (m_status == Status::Waiting)
        enterReady();
}

void ControlChannel::dispatchLine(const QByteArray &line)
{
    qCDebug(wireLog).noquote() << "Received from" << m_remote.toString() << ":" << QString::fromUtf8(line);

    const DecodedMessage message = decodeMessage(line);
    switch (message.kind) {
    case DecodedMessage::Kind::Result: {
        bool tracked = false;
        if (message.hasId) {
            QMutexLocker locker(&m_pendingMutex);
            tracked = m_pendingSince.remove(message.id) > 0;
        }
        if (!tracked)
            qCDebug(channelLog) << "Result for untracked request" << message.id << message.results;
        emit resultReceived(message.id, message.results);
        break;
    }
    case DecodedMessage::Kind::Error: {
        if (message.hasId) {
            QMutexLocker locker(&m_pendingMutex);
            m_pendingSince.remove(message.id);
        }
        qCWarning(channelLog).noquote() << "id:" << message.id << "Error Code" << message.errorCode << ":"
                                        << message.errorMessage;
        emit errorReceived(message.id, message.errorCode, message.errorMessage);
        break;
    }
    case DecodedMessage::Kind::Push:
        emit propertiesPushed(message.properties);
        break;
    case DecodedMessage::Kind::Invalid:
        qCWarning(codecLog).noquote() << "JSON decode error:" << message.decodeError
                                      << "Data Received:" << QString::fromUtf8(line);
        emit decodeFailed(message.decodeError, line);
        break;
    }
}

void ControlChannel::send(const QByteArray &payload, qint64 requestId)
{
    if (QThread::currentThread() != thread()) {
        QPointer<ControlChannel> self(this);
        QMetaObject::invokeMethod(
            this,
            [self, payload, requestId]() {
                if (self)
                    self->writeNow(payload, requestId);
            },
            Qt::QueuedConnection);
        return;
    }
    writeNow(payload, requestId);
}

void ControlChannel::writeNow(const QByteArray &payload, qint64 requestId)
{
    if (payload.isEmpty())
        return;

    if (isTerminal()) {
        qCWarning(channelLog) << "Send on" << statusName(m_status) << "channel to" << m_remote.toString()
                              << "dropped";
        return;
    }

    if (m_socket->write(payload) < 0) {
        enterFailed(QStringLiteral("Send error: %1").arg(m_socket->errorString()));
        return;
    }

    if (requestId != 0) {
        const qint64 now = QDateTime::currentMSecsSinceEpoch();
        QMutexLocker locker(&m_pendingMutex);
        expirePending(now);
        m_pendingSince.insert(requestId, now);
    }
    qCDebug(wireLog).noquote() << "Sent to" << m_remote.toString() << ":" << QString::fromUtf8(payload).trimmed();
}

// Caller holds m_pendingMutex.
void ControlChannel::expirePending(qint64 now)
{
    for (auto it = m_pendingSince.begin(); it != m_pendingSince.end();) {
        if (now - it.value() >= m_pendingExpiryMs) {
            qCDebug(channelLog) << "No reply to request" << it.key() << "from" << m_remote.toString();
            it = m_pendingSince.erase(it);
        } else {
            ++it;
        }
    }
}

void ControlChannel::close()
{
    if (m_status == Status::Cancelled)
        return;

    stopReceiveLoop();
    m_socket->disconnect(this);
    m_socket->abort();

    {
        QMutexLocker locker(&m_pendingMutex);
        m_pendingSince.clear();
    }

    if (m_status == Status::Failed)
        return;

    qCInfo(channelLog) << m_remote.toString() << "connection cancelled";
    setStatus(Status::Cancelled);
    emit cancelled();
}

void ControlChannel::flush()
{
    if (!isTerminal() && m_socket->state() == QAbstractSocket::ConnectedState)
        m_socket->flush();
}

bool ControlChannel::waitForReady(int timeoutMs)
{
    if (m_status == Status::Ready)
        return true;
    if (isTerminal())
        return false;

    QPointer<ControlChannel> self(this);
    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);

    connect(this, &ControlChannel::ready, &loop, &QEventLoop::quit);
    connect(this, &ControlChannel::failed, &loop, &QEventLoop::quit);
    connect(this, &ControlChannel::cancelled, &loop, &QEventLoop::quit);
    connect(this, &QObject::destroyed, &loop, &QEventLoop::quit);
    connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    timer.start(timeoutMs > 0 ? timeoutMs : 0);
    loop.exec();

    return self && self->m_status == Status::Ready;
}

int ControlChannel::pendingRequestCount() const
{
    QMutexLocker locker(&m_pendingMutex);
    return static_cast<int>(m_pendingSince.size());
}

bool ControlChannel::isPending(qint64 requestId) const
{
    QMutexLocker locker(&m_pendingMutex);
    return m_pendingSince.contains(requestId);
}

} // namespace yeectl
