#include "yee_sidechannel.h"

#include <QEventLoop>
#include <QHostAddress>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTimer>

#include "yee_channel.h"
#include "yee_codec.h"
#include "yee_device.h"
#include "yee_logging.h"

namespace yeectl {

namespace {

bool isSameHost(const QHostAddress &a, const QHostAddress &b)
{
    return a.isEqual(b, QHostAddress::ConvertV4MappedToIPv4);
}

} // namespace

SideChannelNegotiator::SideChannelNegotiator(int timeoutMs, int primaryReadyTimeoutMs)
    : m_timeoutMs(timeoutMs)
    , m_primaryReadyTimeoutMs(primaryReadyTimeoutMs)
{
}

QString SideChannelNegotiator::stateName(State state)
{
    switch (state) {
    case State::Idle:
        return QStringLiteral("idle");
    case State::ListenerStarted:
        return QStringLiteral("listener started");
    case State::Matched:
        return QStringLiteral("matched");
    case State::TimedOut:
        return QStringLiteral("timed out");
    case State::Failed:
        return QStringLiteral("failed");
    }
    return QString();
}

NegotiationResult SideChannelNegotiator::fail(ErrorKind kind, const QString &error)
{
    m_state = State::Failed;
    NegotiationResult result;
    result.errorKind = kind;
    result.error = error;
    qCWarning(sideChannelLog).noquote() << "Side channel negotiation failed:" << error;
    return result;
}

NegotiationResult SideChannelNegotiator::activate(Device &device)
{
    m_state = State::Idle;

    if (device.hasSideChannel())
        return fail(ErrorKind::AlreadyActive,
                    QStringLiteral("Already an existing side channel for %1").arg(device.id()));

    ControlChannel *primary = device.primaryChannel();
    if (!primary || !primary->waitForReady(m_primaryReadyTimeoutMs))
        return fail(ErrorKind::NotReady, QStringLiteral("Primary channel of %1 is not ready").arg(device.id()));

    const QHostAddress localHost = primary->localAddress();
    if (localHost.isNull())
        return fail(ErrorKind::SetupFailure, QStringLiteral("Local endpoint not found for %1").arg(device.id()));

    QTcpServer listener;
    if (!listener.listen(localHost, 0))
        return fail(ErrorKind::SetupFailure,
                    QStringLiteral("Listener failed on %1: %2").arg(localHost.toString(), listener.errorString()));

    m_state = State::ListenerStarted;

    NegotiationResult result;
    result.listenerPort = listener.serverPort();

    QString commandError;
    const Command activation = setMusicOn(localHost.toString(), listener.serverPort(), &commandError);
    if (!activation.isValid()) {
        listener.close();
        return fail(ErrorKind::ValidationFailure, commandError);
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    ControlChannel *adopted = nullptr;
    const QHostAddress target = device.address().host;

    QObject::connect(&listener, &QTcpServer::newConnection, &loop, [&]() {
        while (listener.hasPendingConnections()) {
            QTcpSocket *socket = listener.nextPendingConnection();
            if (!socket)
                continue;
            if (adopted || !isSameHost(socket->peerAddress(), target)) {
                if (!adopted) {
                    ++result.rejectedPeers;
                    qCWarning(sideChannelLog) << "Ignoring side channel connection from"
                                              << socket->peerAddress().toString() << "expected"
                                              << target.toString();
                }
                socket->abort();
                socket->deleteLater();
                continue;
            }
            adopted = new ControlChannel(socket, false);
            loop.quit();
        }
    });
    QObject::connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);

    qCDebug(sideChannelLog) << "Listener on" << localHost.toString() << listener.serverPort() << "for"
                            << device.id();
    device.communicate(activation);

    timer.start(m_timeoutMs);
    loop.exec();

    QObject::disconnect(&listener, nullptr, &loop, nullptr);
    listener.close();

    if (!adopted) {
        m_state = State::TimedOut;
        result.errorKind = ErrorKind::NegotiationTimeout;
        result.error = QStringLiteral("Listener: no connection from %1 within %2 ms")
                           .arg(target.toString())
                           .arg(m_timeoutMs);
        qCWarning(sideChannelLog).noquote() << result.error;
        return result;
    }

    if (adopted->isTerminal()) {
        adopted->deleteLater();
        return fail(ErrorKind::TransportFailure, QStringLiteral("Side channel connection dropped while adopting"));
    }

    device.installSideChannel(adopted);
    m_state = State::Matched;
    result.ok = true;
    qCInfo(sideChannelLog) << "Side channel established for" << device.id() << "on port" << result.listenerPort;
    return result;
}

qint64 SideChannelNegotiator::deactivate(Device &device) const
{
    return device.communicate(setMusicOff());
}

} // namespace yeectl
